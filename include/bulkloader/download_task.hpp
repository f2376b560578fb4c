#ifndef BULKLOADER_DOWNLOAD_TASK_HPP
#define BULKLOADER_DOWNLOAD_TASK_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <tl/expected.hpp>

#include <bulkloader/export.hpp>
#include <bulkloader/download_request.hpp>
#include <bulkloader/enums.hpp>
#include <bulkloader/errors.hpp>
#include <bulkloader/stream_writer.hpp>
#include <bulkloader/transport.hpp>

namespace bulkloader
{
    using clock_type = std::chrono::steady_clock;

    struct BULKLOADER_API RetryPolicy
    {
        using backoff_t
            = std::function<std::chrono::milliseconds(std::size_t, std::chrono::milliseconds)>;

        // Total number of attempts per request, the first one included.
        std::size_t max_retries = 3;
        std::chrono::milliseconds base_delay = std::chrono::milliseconds(1000);
        // Delay after the failed attempt number `attempt`, linear by default.
        backoff_t backoff;

        std::chrono::milliseconds delay(std::size_t attempt) const;
    };

    struct BULKLOADER_API DownloadOptions
    {
        using writer_factory_t = std::function<std::unique_ptr<StreamWriter>(const fs::path&)>;

        std::size_t concurrency = 3;
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000);
        RetryPolicy retry;
        // Minimum advance, in percentage points, between two progress events.
        double progress_threshold = 5.0;
        // Maximum number of redirect hops per request, negative for no limit.
        int max_redirects = 10;
        // Upper bound of a single suspension of the event loop in the transport.
        std::chrono::milliseconds max_wait = std::chrono::milliseconds(1000);
        // Creates the writer of every attempt, a plain `StreamWriter` when unset.
        writer_factory_t writer_factory;
    };

    using task_outcome_t = tl::expected<std::uintmax_t, DownloaderError>;

    /** State machine downloading one request.
     *
     * kPENDING -> kIN_FLIGHT -> (kSUCCEEDED | kRETRYING | kFAILED), kRETRYING -> kIN_FLIGHT.
     * A 301/302 response re-issues the attempt against the resolved Location without
     * consuming a retry. Connection errors and timeouts are retried after
     * `retry.delay(attempt)` until `retry.max_retries` attempts were made; any other failure
     * is terminal. The partial file of a failed attempt is always removed.
     */
    class BULKLOADER_API DownloadTask : public TransferSink
    {
    public:
        DownloadTask(DownloadRequest request,
                     const DownloadOptions& options,
                     progress_callback_t progress = {});
        ~DownloadTask() override;

        DownloadTask(const DownloadTask&) = delete;
        DownloadTask& operator=(const DownloadTask&) = delete;

        // Issues the next fetch if one is due: first attempt, redirect hop, or retry whose
        // backoff elapsed.
        void advance(Transport& transport, clock_type::time_point now);

        // Stops the running fetch (if any) and fails the task with `error`.
        void abort(Transport& transport, DownloaderError error);

        // True when `advance` would issue a fetch right away.
        bool ready(clock_type::time_point now) const;

        // When the task waits for its backoff delay, the moment the delay ends.
        std::optional<clock_type::time_point> wakeup_time() const;

        bool is_terminal() const noexcept
        {
            return m_status == TaskStatus::kSUCCEEDED || m_status == TaskStatus::kFAILED;
        }

        // Bytes written to the destination on success, the terminal error otherwise.
        // Only meaningful once `is_terminal()`.
        const task_outcome_t& outcome() const noexcept
        {
            return m_outcome;
        }

        const DownloadRequest& request() const noexcept
        {
            return m_request;
        }

        TaskStatus status() const noexcept
        {
            return m_status;
        }

        std::size_t attempt() const noexcept
        {
            return m_attempt;
        }

        std::size_t redirects() const noexcept
        {
            return m_redirects;
        }

        const std::string& current_url() const noexcept
        {
            return m_current_url;
        }

        std::uintmax_t bytes_written() const noexcept
        {
            return m_bytes_written;
        }

        std::optional<std::uintmax_t> total_bytes() const noexcept
        {
            return m_total_bytes;
        }

        bool on_response(const ResponseHead& head) override;
        bool on_data(const char* buffer, std::size_t size) override;
        void on_complete(tl::expected<void, DownloaderError> result) override;

    private:
        void issue(Transport& transport);
        void handle_failure(DownloaderError error);
        void set_succeeded(std::uintmax_t bytes);
        void set_failed(DownloaderError error);
        void reset_attempt();
        void remove_destination();
        void emit_progress(bool final_event);
        void notify(const ProgressEvent& event);

        DownloadRequest m_request;
        const DownloadOptions& m_options;
        progress_callback_t m_progress;

        TaskStatus m_status = TaskStatus::kPENDING;
        std::size_t m_attempt = 1;
        std::size_t m_redirects = 0;
        std::string m_current_url;

        bool m_fetch_running = false;
        bool m_reissue = false;
        std::optional<clock_type::time_point> m_next_retry;

        // decided by the response callbacks, takes precedence over the transport result
        std::optional<DownloaderError> m_attempt_error;
        std::optional<std::string> m_redirect_url;

        std::unique_ptr<StreamWriter> m_writer;
        std::uintmax_t m_bytes_written = 0;
        std::optional<std::uintmax_t> m_total_bytes;
        std::optional<double> m_last_percent;

        task_outcome_t m_outcome;
    };
}

#endif
