#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <limits>

namespace fs = std::filesystem;

namespace Opkgsync {

/**
 * @brief Each "-v" lowers the threshold by one level; the count is clamped.
 */
LogLevel logLevelFromVerbosity(int verbosity)
{
    if (verbosity <= 0) {
        return LogLevel::Error;
    }
    if (verbosity == 1) {
        return LogLevel::Warning;
    }
    if (verbosity == 2) {
        return LogLevel::Info;
    }
    return LogLevel::Debug;
}

void trim(std::string& s)
{
    const char* whitespace = " \t\n\r\f\v";
    s.erase(0, s.find_first_not_of(whitespace));
    s.erase(s.find_last_not_of(whitespace) + 1);
}

std::string toLower(const std::string& input)
{
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool isAscii(const std::string& input)
{
    return std::all_of(input.begin(), input.end(),
                       [](char c) { return (static_cast<unsigned char>(c) & 0x80) == 0; });
}

bool parseUnsigned(const std::string& input, std::uintmax_t& value)
{
    if (input.empty()) {
        return false;
    }

    const std::uintmax_t maxValue = std::numeric_limits<std::uintmax_t>::max();
    std::uintmax_t result = 0;
    for (char c : input) {
        if (c < '0' || c > '9') {
            return false;
        }
        std::uintmax_t digit = static_cast<std::uintmax_t>(c - '0');
        if (result > (maxValue - digit) / 10) {
            return false; // overflow
        }
        result = result * 10 + digit;
    }

    value = result;
    return true;
}

bool resolveUnder(const std::string& directory,
                  const std::string& relative,
                  std::string& resolved)
{
    fs::path rel(relative);
    if (relative.empty() || rel.is_absolute() || rel.has_root_name()) {
        return false;
    }

    fs::path normal = rel.lexically_normal();
    if (normal.empty() || normal == ".") {
        return false;
    }
    // A normalized relative path that escapes starts with ".."
    if (*normal.begin() == "..") {
        return false;
    }

    resolved = (fs::path(directory) / normal).string();
    return true;
}

} // namespace Opkgsync
