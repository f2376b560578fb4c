#ifndef BULKLOADER_ENUMS_HPP
#define BULKLOADER_ENUMS_HPP

#define BULKLOADER_PARTEXT ".blpart"

namespace bulkloader
{
    enum class TaskStatus
    {
        // The request was admitted but no attempt was issued yet.
        kPENDING,
        // An attempt (or a redirect hop of it) is running.
        kIN_FLIGHT,
        // The last attempt failed with a retriable error, waiting for the backoff delay.
        kRETRYING,
        // The resource was completely written to its destination.
        kSUCCEEDED,
        // The request finished without success.
        kFAILED,
    };

    enum class ErrorCode
    {
        // DNS resolution or TCP/TLS level failure, connection dropped mid-body
        kCONNECTION,
        // the attempt exceeded its timeout (or the body stalled)
        kTIMEOUT,
        // HTTP status other than 200, 301 or 302
        kHTTP_STATUS,
        // filesystem failure while writing the destination
        kWRITE,
        // unparsable URL, unsupported scheme or redirect without a usable Location
        kBAD_URL,
        // redirect chain longer than the configured maximum
        kTOO_MANY_REDIRECTS,
        // the whole run was interrupted before this request finished
        kINTERRUPTED,
    };

    enum class FilenameTemplate
    {
        kDEFAULT,
        kDOMAIN_PATH,
        kTIMESTAMP,
    };

    inline const char* to_string(TaskStatus status)
    {
        switch (status)
        {
            case TaskStatus::kPENDING:
                return "pending";
            case TaskStatus::kIN_FLIGHT:
                return "in-flight";
            case TaskStatus::kRETRYING:
                return "retrying";
            case TaskStatus::kSUCCEEDED:
                return "succeeded";
            case TaskStatus::kFAILED:
                return "failed";
        }
        return "unknown";
    }

    inline const char* to_string(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::kCONNECTION:
                return "connection";
            case ErrorCode::kTIMEOUT:
                return "timeout";
            case ErrorCode::kHTTP_STATUS:
                return "http-status";
            case ErrorCode::kWRITE:
                return "write";
            case ErrorCode::kBAD_URL:
                return "bad-url";
            case ErrorCode::kTOO_MANY_REDIRECTS:
                return "too-many-redirects";
            case ErrorCode::kINTERRUPTED:
                return "interrupted";
        }
        return "unknown";
    }
}

#endif
