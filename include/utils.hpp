#ifndef UTILS_HPP
#define UTILS_HPP

#include <cstdint>
#include <string>
#include <ostream>
#include <iostream>

// ANSI color codes for console output.
#define COLOR_RESET "\033[0m"
#define COLOR_DEBUG "\033[36m"
#define COLOR_INFO  "\033[32m"
#define COLOR_WARN  "\033[33m"
#define COLOR_ERROR "\033[31m"

namespace Opkgsync {

/**
 * @brief Severity levels understood by the logging helpers, most severe first.
 */
enum class LogLevel
{
    Error = 0,
    Warning,
    Info,
    Debug
};

/**
 * @brief Process-wide log threshold. Messages less severe than this are dropped.
 *
 * Defaults to LogLevel::Error until setLogLevel() is called.
 */
inline LogLevel& logThreshold()
{
    static LogLevel threshold = LogLevel::Error;
    return threshold;
}

/**
 * @brief Sets the process-wide log threshold. Called once from main().
 */
inline void setLogLevel(LogLevel level)
{
    logThreshold() = level;
}

/**
 * @brief Maps a "-v" count onto a log level (0 = errors only, 3+ = debug).
 */
LogLevel logLevelFromVerbosity(int verbosity);

inline bool log_enabled(LogLevel level)
{
    return static_cast<int>(level) <= static_cast<int>(logThreshold());
}

/**
 * @brief Logs a debug message to standard error with cyan coloring.
 *
 * @param message The message to log.
 */
inline void log_debug(const std::string &message)
{
    if (log_enabled(LogLevel::Debug)) {
        std::cerr << COLOR_DEBUG << "[DEBUG] " << COLOR_RESET << message << std::endl;
    }
}

/**
 * @brief Logs an informational message to standard error with green coloring.
 *
 * @param message The message to log.
 */
inline void log_message(const std::string &message)
{
    if (log_enabled(LogLevel::Info)) {
        std::cerr << COLOR_INFO << "[INFO] " << COLOR_RESET << message << std::endl;
    }
}

/**
 * @brief Logs a warning message to standard error with yellow coloring.
 *
 * @param message The warning message to log.
 */
inline void log_warning(const std::string &message)
{
    if (log_enabled(LogLevel::Warning)) {
        std::cerr << COLOR_WARN << "[WARN] " << COLOR_RESET << message << std::endl;
    }
}

/**
 * @brief Logs an error message to standard error with red coloring.
 *
 * @param message The error message to log.
 */
inline void log_error(const std::string &message)
{
    std::cerr << COLOR_ERROR << "[ERROR] " << COLOR_RESET << message << std::endl;
}

// ---------------------------------------------------------------------------
// String helpers
// ---------------------------------------------------------------------------

/**
 * @brief Removes leading and trailing whitespace from the given string.
 * @param s The string to be trimmed.
 */
void trim(std::string& s);

/**
 * @brief Returns an ASCII-lowercased copy of the input.
 */
std::string toLower(const std::string& input);

/**
 * @brief True if every byte of the input is 7-bit ASCII.
 */
bool isAscii(const std::string& input);

/**
 * @brief Parses a non-negative decimal integer.
 *
 * @param input The text to parse; must consist of digits only.
 * @param value Receives the parsed value on success.
 * @return False on empty input, non-digit characters or overflow.
 */
bool parseUnsigned(const std::string& input, std::uintmax_t& value);

/**
 * @brief Joins a manifest-relative filename onto a mirror directory.
 *
 * Rejects absolute filenames and filenames whose normalized form climbs out of
 * the directory ("../x", "a/../../x").
 *
 * @param directory The mirror directory.
 * @param relative  A filename as recorded in the manifest.
 * @param resolved  Receives the joined path on success.
 * @return True if the filename stays inside the directory.
 */
bool resolveUnder(const std::string& directory,
                  const std::string& relative,
                  std::string& resolved);

} // namespace Opkgsync

#endif // UTILS_HPP
