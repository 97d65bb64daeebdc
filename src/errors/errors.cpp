#include "errors.hpp"

#include <curl/curl.h>

namespace errors
{
    std::string toString(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::None:
            return "None";
        case ErrorKind::Validation:
            return "ValidationError";
        case ErrorKind::TransientIO:
            return "TransientIOError";
        case ErrorKind::PermanentResource:
            return "PermanentResourceError";
        case ErrorKind::NetworkUnavailable:
            return "NetworkUnavailable";
        case ErrorKind::Unauthenticated:
            return "Unauthenticated";
        case ErrorKind::Conflict:
            return "Conflict";
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::Storage:
            return "StorageError";
        }
        return "Unknown";
    }

    bool isRetryable(ErrorKind kind)
    {
        return kind == ErrorKind::TransientIO;
    }

    ErrorKind classifyHttpStatus(long status)
    {
        if (status >= 200 && status < 300)
            return ErrorKind::None;
        if (status == 401 || status == 403)
            return ErrorKind::Unauthenticated;
        if (status == 404)
            return ErrorKind::NotFound;
        if (status == 409)
            return ErrorKind::Conflict;
        if (status == 408 || status == 425 || status == 429 || status >= 500)
            return ErrorKind::TransientIO;
        // Remaining 4xx: the request itself is wrong, resending will not help.
        if (status >= 400)
            return ErrorKind::Validation;
        // No status at all (0) or an unexpected 1xx/3xx.
        return ErrorKind::TransientIO;
    }

    ErrorKind classifyCurlCode(int curl_code)
    {
        switch (static_cast<CURLcode>(curl_code))
        {
        case CURLE_OK:
            return ErrorKind::None;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_SSL_CONNECT_ERROR:
            return ErrorKind::TransientIO;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return ErrorKind::Validation;
        case CURLE_READ_ERROR:
        case CURLE_FILE_COULDNT_READ_FILE:
            return ErrorKind::PermanentResource;
        default:
            return ErrorKind::TransientIO;
        }
    }
} // namespace errors
