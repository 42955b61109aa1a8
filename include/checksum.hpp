#ifndef CHECKSUM_HPP
#define CHECKSUM_HPP

#include <istream>
#include <string>

namespace Opkgsync {

/**
 * @class Checksum
 * @brief MD5 digests of package files, computed incrementally with OpenSSL EVP.
 */
class Checksum
{
public:
    /**
     * @brief Computes the MD5 digest of everything readable from a stream.
     *
     * @param stream Input stream, read in fixed-size chunks until EOF.
     * @param digest Receives the lowercase hex digest on success.
     * @return False if the digest context could not be set up or the stream failed.
     */
    static bool md5Stream(std::istream& stream, std::string& digest);

    /**
     * @brief Computes the MD5 digest of a file.
     *
     * @param path   Path to the file.
     * @param digest Receives the lowercase hex digest on success.
     * @return False if the file cannot be opened or read.
     */
    static bool md5File(const std::string& path, std::string& digest);

    /**
     * @brief Case-insensitive comparison of two hex digests.
     */
    static bool digestsEqual(const std::string& lhs, const std::string& rhs);
};

} // namespace Opkgsync

#endif // CHECKSUM_HPP
