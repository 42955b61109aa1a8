#include "checksum.hpp"
#include "utils.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <memory>

namespace Opkgsync {

namespace {

const std::size_t readChunkSize = 4096;

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string toHex(const unsigned char* data, unsigned int length)
{
    static const char hexDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex.push_back(hexDigits[data[i] >> 4]);
        hex.push_back(hexDigits[data[i] & 0x0f]);
    }
    return hex;
}

} // anonymous namespace

bool Checksum::md5Stream(std::istream& stream, std::string& digest)
{
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        log_error("EVP_MD_CTX_new failed");
        return false;
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        log_error("EVP_DigestInit_ex MD5 failed");
        return false;
    }

    std::array<char, readChunkSize> buffer;
    while (stream) {
        stream.read(buffer.data(), buffer.size());
        std::streamsize got = stream.gcount();
        if (got > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
            log_error("EVP_DigestUpdate failed");
            return false;
        }
    }
    if (stream.bad()) {
        return false;
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLength = 0;
    if (EVP_DigestFinal_ex(ctx.get(), md, &mdLength) != 1) {
        log_error("EVP_DigestFinal_ex failed");
        return false;
    }

    digest = toHex(md, mdLength);
    return true;
}

bool Checksum::md5File(const std::string& path, std::string& digest)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        log_debug("Unable to open file for hashing: " + path);
        return false;
    }
    return md5Stream(file, digest);
}

bool Checksum::digestsEqual(const std::string& lhs, const std::string& rhs)
{
    return toLower(lhs) == toLower(rhs);
}

} // namespace Opkgsync
