#include "transport.hpp"
#include "utils.hpp"

#include <curl/curl.h>

#include <memory>
#include <sstream>
#include <vector>

#ifndef OPKGSYNC_VERSION
#define OPKGSYNC_VERSION "0.0.0"
#endif

namespace Opkgsync {

namespace {

const long connectTimeoutSeconds  = 15L;
const long transferTimeoutSeconds = 300L;

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

/**
 * -----------------------------------------------------------------------
 * writeCallback
 *
 * cURL write callback that forwards received data into an output stream.
 * Returning less than the chunk size makes cURL abort the transfer.
 * -----------------------------------------------------------------------
 */
size_t writeCallback(void* ptr, size_t size, size_t nmemb, void* userdata)
{
    std::ostream* out = static_cast<std::ostream*>(userdata);
    size_t totalSize  = size * nmemb;

    if (out == nullptr) {
        return 0;
    }
    out->write(static_cast<char*>(ptr), static_cast<std::streamsize>(totalSize));
    if (!out->good()) {
        log_error("Error writing to download stream");
        return 0;
    }
    return totalSize;
}

/**
 * @brief Removes "." and ".." segments from an absolute URL path.
 */
std::string removeDotSegments(const std::string& path)
{
    std::vector<std::string> segments;
    std::istringstream iss(path);
    std::string segment;
    bool trailingSlash = !path.empty() && path.back() == '/';

    while (std::getline(iss, segment, '/')) {
        if (segment.empty() || segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
            continue;
        }
        segments.push_back(segment);
    }

    // "a/." and "a/.." denote a directory
    std::size_t lastSlash = path.find_last_of('/');
    std::string last = (lastSlash == std::string::npos) ? path : path.substr(lastSlash + 1);
    if (last == "." || last == "..") {
        trailingSlash = true;
    }

    std::string result;
    for (const auto& s : segments) {
        result += "/" + s;
    }
    if (result.empty() || trailingSlash) {
        result += "/";
    }
    return result;
}

} // anonymous namespace

Status CurlTransport::fetch(const std::string& url, std::ostream& out)
{
    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return Status::failure(ErrorKind::Transport, "Failed to initialize libcurl");
    }

    const std::string userAgent = std::string("opkgsync/") + OPKGSYNC_VERSION;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, connectTimeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, transferTimeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent.c_str());

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return Status::failure(ErrorKind::Transport,
                               "Failed to fetch " + url + ": " + curl_easy_strerror(res));
    }

    long responseCode = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &responseCode);
    if (responseCode >= 400) {
        return Status::failure(ErrorKind::Transport,
                               "Failed to fetch " + url + ": server responded with code " +
                               std::to_string(responseCode));
    }

    out.flush();
    if (!out.good()) {
        return Status::failure(ErrorKind::Transport, "Failed to flush download stream for " + url);
    }
    return Status::success();
}

std::string resolveUrl(const std::string& baseUrl, const std::string& reference)
{
    if (reference.find("://") != std::string::npos) {
        return reference;
    }

    // Split the base into "scheme://authority" and the path
    std::string origin;
    std::string basePath = baseUrl;
    std::size_t schemeEnd = baseUrl.find("://");
    if (schemeEnd != std::string::npos) {
        std::size_t pathStart = baseUrl.find('/', schemeEnd + 3);
        if (pathStart == std::string::npos) {
            origin   = baseUrl;
            basePath = "/";
        } else {
            origin   = baseUrl.substr(0, pathStart);
            basePath = baseUrl.substr(pathStart);
        }
    }
    std::size_t queryStart = basePath.find_first_of("?#");
    if (queryStart != std::string::npos) {
        basePath.erase(queryStart);
    }

    if (reference.rfind("//", 0) == 0) {
        std::string scheme = (schemeEnd == std::string::npos) ? "" : baseUrl.substr(0, schemeEnd + 1);
        return scheme + reference;
    }
    if (!reference.empty() && reference[0] == '/') {
        return origin + removeDotSegments(reference);
    }

    std::size_t lastSlash = basePath.find_last_of('/');
    std::string directory = (lastSlash == std::string::npos) ? "/" : basePath.substr(0, lastSlash + 1);
    return origin + removeDotSegments(directory + reference);
}

} // namespace Opkgsync
