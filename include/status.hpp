#ifndef STATUS_HPP
#define STATUS_HPP

#include <string>
#include <utility>

namespace Opkgsync {

/**
 * @brief Category of a failure reported across a fallible boundary.
 */
enum class ErrorKind
{
    None,
    Transport,   // connection errors, HTTP status >= 400
    Filesystem,  // create/write/remove/rename failures
    Integrity    // downloaded bytes do not match the remote record
};

/**
 * @brief Outcome of a fetch, write, delete or sync step.
 */
struct Status
{
    ErrorKind   kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }

    static Status success() { return Status(); }

    static Status failure(ErrorKind kind, std::string message)
    {
        Status status;
        status.kind    = kind;
        status.message = std::move(message);
        return status;
    }
};

/**
 * @brief Human readable name of an ErrorKind, for log output.
 */
inline const char* errorKindName(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::None:       return "none";
        case ErrorKind::Transport:  return "transport";
        case ErrorKind::Filesystem: return "filesystem";
        case ErrorKind::Integrity:  return "integrity";
    }
    return "unknown";
}

} // namespace Opkgsync

#endif // STATUS_HPP
