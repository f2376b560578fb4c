#ifndef BULKLOADER_ERRORS_HPP
#define BULKLOADER_ERRORS_HPP

#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include <bulkloader/export.hpp>
#include <bulkloader/enums.hpp>

namespace bulkloader
{
    struct DownloaderError
    {
        ErrorCode code;
        std::string reason;
        // HTTP status that caused the error, 0 when the error is not status related
        long http_status = 0;

        // Connection errors and timeouts are worth another attempt, everything else is terminal.
        bool is_retriable() const noexcept
        {
            return code == ErrorCode::kCONNECTION || code == ErrorCode::kTIMEOUT;
        }

        void log() const
        {
            if (is_retriable())
            {
                spdlog::warn(reason);
            }
            else
            {
                spdlog::error(reason);
            }
        }
    };

    // Thrown for failures of libcurl itself (initialisation, options, multi handle).
    class BULKLOADER_API curl_error : public std::runtime_error
    {
    public:
        explicit curl_error(const std::string& what = "curl error")
            : std::runtime_error(what)
        {
        }
    };
}

#endif
