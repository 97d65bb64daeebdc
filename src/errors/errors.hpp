#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace errors
{
    // Failure taxonomy shared by every module.
    enum class ErrorKind
    {
        None,
        Validation,         // bad input, never retried
        TransientIO,        // timeout, connection reset, engine busy
        PermanentResource,  // missing or corrupt source file
        NetworkUnavailable, // expected while offline, not a failure
        Unauthenticated,    // caller must supply a token
        Conflict,           // handed to the conflict resolver
        NotFound,
        Storage             // local store read/write failed
    };

    std::string toString(ErrorKind kind);

    // Only transient I/O is worth retrying automatically.
    bool isRetryable(ErrorKind kind);

    // Maps an HTTP status to the taxonomy. 2xx maps to None.
    ErrorKind classifyHttpStatus(long status);

    // Maps a libcurl result code (as int, to keep curl out of this header).
    ErrorKind classifyCurlCode(int curl_code);

    class SyncError : public std::runtime_error
    {
    public:
        SyncError(ErrorKind kind, const std::string &message)
            : std::runtime_error(message), kind_(kind) {}

        ErrorKind kind() const { return kind_; }

    private:
        ErrorKind kind_;
    };

    inline SyncError validationError(const std::string &message)
    {
        return SyncError(ErrorKind::Validation, message);
    }
} // namespace errors

#endif // ERRORS_HPP
