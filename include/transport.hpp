#ifndef TRANSPORT_HPP
#define TRANSPORT_HPP

#include "status.hpp"

#include <ostream>
#include <string>

namespace Opkgsync {

/**
 * @class Transport
 * @brief Fetches the body behind a URL into a stream.
 *
 * The sync engine only talks to this interface; CurlTransport is the real
 * implementation and tests substitute an in-memory one.
 */
class Transport
{
public:
    virtual ~Transport() = default;

    /**
     * @brief Issues a GET for the URL and streams the response body into out.
     *
     * @param url The absolute URL to fetch.
     * @param out Sink for the response body.
     * @return ErrorKind::Transport on connection errors, HTTP status >= 400 or
     *         a failing sink.
     */
    virtual Status fetch(const std::string& url, std::ostream& out) = 0;
};

/**
 * @class CurlTransport
 * @brief libcurl based HTTP(S) transport.
 */
class CurlTransport : public Transport
{
public:
    Status fetch(const std::string& url, std::ostream& out) override;
};

/**
 * @brief Resolves a manifest-relative filename against the manifest URL.
 *
 * "http://host/feed/Packages" + "a.ipk" gives "http://host/feed/a.ipk".
 * Absolute-path references replace the path, full URLs are returned as-is,
 * and "." / ".." segments are removed.
 *
 * @param baseUrl   URL of the manifest.
 * @param reference Filename taken from the manifest.
 * @return The absolute URL of the referenced file.
 */
std::string resolveUrl(const std::string& baseUrl, const std::string& reference);

} // namespace Opkgsync

#endif // TRANSPORT_HPP
