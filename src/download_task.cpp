#include <algorithm>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <bulkloader/download_task.hpp>
#include <bulkloader/url.hpp>

namespace bulkloader
{
    std::chrono::milliseconds RetryPolicy::delay(std::size_t attempt) const
    {
        if (backoff)
        {
            return backoff(attempt, base_delay);
        }
        return base_delay * static_cast<long long>(attempt);
    }

    DownloadTask::DownloadTask(DownloadRequest request,
                               const DownloadOptions& options,
                               progress_callback_t progress)
        : m_request(std::move(request))
        , m_options(options)
        , m_progress(std::move(progress))
        , m_current_url(m_request.url)
    {
    }

    DownloadTask::~DownloadTask() = default;

    bool DownloadTask::ready(clock_type::time_point now) const
    {
        switch (m_status)
        {
            case TaskStatus::kPENDING:
                return true;
            case TaskStatus::kIN_FLIGHT:
                return m_reissue;
            case TaskStatus::kRETRYING:
                return !m_next_retry || m_next_retry.value() <= now;
            default:
                return false;
        }
    }

    std::optional<clock_type::time_point> DownloadTask::wakeup_time() const
    {
        if (m_status == TaskStatus::kRETRYING)
            return m_next_retry;
        return std::nullopt;
    }

    void DownloadTask::advance(Transport& transport, clock_type::time_point now)
    {
        if (!ready(now))
            return;

        if (m_status == TaskStatus::kRETRYING)
        {
            m_attempt++;
            m_next_retry.reset();
        }
        issue(transport);
    }

    void DownloadTask::issue(Transport& transport)
    {
        m_status = TaskStatus::kIN_FLIGHT;
        m_reissue = false;
        reset_attempt();

        spdlog::debug("Attempt {} for {}", m_attempt, m_current_url);
        auto started = transport.fetch(m_current_url, m_options.timeout, *this);
        if (!started)
        {
            handle_failure(std::move(started.error()));
            return;
        }
        m_fetch_running = true;
    }

    void DownloadTask::abort(Transport& transport, DownloaderError error)
    {
        if (is_terminal())
            return;

        if (m_fetch_running)
        {
            transport.abort(*this);
            m_fetch_running = false;
        }
        set_failed(std::move(error));
    }

    void DownloadTask::reset_attempt()
    {
        if (m_writer)
        {
            m_writer->discard();
            m_writer.reset();
        }
        m_attempt_error.reset();
        m_redirect_url.reset();
        m_bytes_written = 0;
        m_total_bytes.reset();
        m_last_percent.reset();
    }

    bool DownloadTask::on_response(const ResponseHead& head)
    {
        if (head.status == 301 || head.status == 302)
        {
            auto location = head.get_header("location");
            if (!location || location.value().empty())
            {
                m_attempt_error = DownloaderError{
                    ErrorCode::kBAD_URL,
                    fmt::format("HTTP {} without Location for {}", head.status, m_current_url),
                    head.status };
                return false;
            }

            auto target = URLHandler(m_current_url).resolve(location.value());
            if (!target)
            {
                m_attempt_error = std::move(target.error());
                return false;
            }
            m_redirect_url = std::move(target.value());
            // the body of the redirect is of no interest
            return false;
        }

        // status 0: protocol without status codes (file://)
        if (head.status != 200 && head.status != 0)
        {
            m_attempt_error = DownloaderError{ ErrorCode::kHTTP_STATUS,
                                               fmt::format("HTTP {}", head.status),
                                               head.status };
            return false;
        }

        m_total_bytes = head.content_length;
        if (m_options.writer_factory)
        {
            m_writer = m_options.writer_factory(m_request.destination_path);
        }
        else
        {
            m_writer = std::make_unique<StreamWriter>(m_request.destination_path);
        }

        if (auto opened = m_writer->open(); !opened)
        {
            m_attempt_error = std::move(opened.error());
            return false;
        }
        return true;
    }

    bool DownloadTask::on_data(const char* buffer, std::size_t size)
    {
        if (!m_writer)
            return false;

        if (auto written = m_writer->write(buffer, size); !written)
        {
            m_attempt_error = std::move(written.error());
            return false;
        }
        m_bytes_written += size;
        emit_progress(false);
        return true;
    }

    void DownloadTask::on_complete(tl::expected<void, DownloaderError> result)
    {
        m_fetch_running = false;

        if (m_redirect_url)
        {
            m_redirects++;
            if (m_options.max_redirects >= 0
                && m_redirects > static_cast<std::size_t>(m_options.max_redirects))
            {
                set_failed(DownloaderError{
                    ErrorCode::kTOO_MANY_REDIRECTS,
                    fmt::format("More than {} redirects for {}",
                                m_options.max_redirects,
                                m_request.url) });
                return;
            }

            spdlog::info("Redirecting to: {}", m_redirect_url.value());
            m_current_url = std::move(m_redirect_url.value());
            m_redirect_url.reset();
            // same attempt, the scheduler re-issues it right away
            m_reissue = true;
            return;
        }

        if (m_attempt_error)
        {
            DownloaderError error = std::move(m_attempt_error.value());
            m_attempt_error.reset();
            handle_failure(std::move(error));
            return;
        }

        if (!result)
        {
            handle_failure(std::move(result.error()));
            return;
        }

        if (!m_writer)
        {
            handle_failure(DownloaderError{
                ErrorCode::kCONNECTION,
                fmt::format("Transfer of {} completed without a response", m_current_url) });
            return;
        }

        auto committed = m_writer->commit();
        m_writer.reset();
        if (!committed)
        {
            handle_failure(std::move(committed.error()));
            return;
        }
        set_succeeded(committed.value());
    }

    void DownloadTask::handle_failure(DownloaderError error)
    {
        if (m_writer)
        {
            m_writer->discard();
            m_writer.reset();
        }

        if (error.is_retriable() && m_attempt < m_options.retry.max_retries)
        {
            const auto delay = m_options.retry.delay(m_attempt);
            spdlog::info("{}Retry {}/{} for {} in {} ms",
                         error.code == ErrorCode::kTIMEOUT ? "Timeout - " : "",
                         m_attempt,
                         m_options.retry.max_retries,
                         m_request.url,
                         delay.count());
            error.log();

            m_status = TaskStatus::kRETRYING;
            m_next_retry = clock_type::now() + delay;
            // every attempt starts over from the requested URL
            m_current_url = m_request.url;
            m_redirects = 0;
            return;
        }

        if (error.code == ErrorCode::kWRITE)
        {
            // a failed write leaves nothing at the destination, not even an older file
            remove_destination();
        }
        set_failed(std::move(error));
    }

    void DownloadTask::remove_destination()
    {
        std::error_code ec;
        if (fs::remove(m_request.destination_path, ec))
        {
            spdlog::info("Removed {}", m_request.destination_path.string());
        }
        else if (ec)
        {
            spdlog::error("Could not remove {}: {}",
                          m_request.destination_path.string(),
                          ec.message());
        }
    }

    void DownloadTask::set_succeeded(std::uintmax_t bytes)
    {
        m_status = TaskStatus::kSUCCEEDED;
        m_bytes_written = bytes;
        m_outcome = bytes;
        emit_progress(true);
    }

    void DownloadTask::set_failed(DownloaderError error)
    {
        if (m_writer)
        {
            m_writer->discard();
            m_writer.reset();
        }

        error.log();
        m_status = TaskStatus::kFAILED;
        m_outcome = tl::unexpected(std::move(error));
    }

    void DownloadTask::emit_progress(bool final_event)
    {
        if (!m_progress)
            return;

        ProgressEvent event{ m_request.url, m_bytes_written, m_total_bytes, std::nullopt };

        if (final_event)
        {
            if (m_total_bytes)
                event.percent = 100.0;
            notify(event);
            return;
        }

        // without a known total, only the final event is emitted
        if (!m_total_bytes || m_total_bytes.value() == 0)
            return;

        const double percent = std::min(
            100.0,
            100.0 * static_cast<double>(m_bytes_written) / static_cast<double>(m_total_bytes.value()));
        // 100% is left to the final event, emitted once the file is in place
        if (percent >= 100.0)
            return;

        const double last = m_last_percent.value_or(0.0);
        if (percent - last >= m_options.progress_threshold)
        {
            m_last_percent = percent;
            event.percent = percent;
            notify(event);
        }
    }

    // The progress sink only observes, its failures never reach the transfer.
    void DownloadTask::notify(const ProgressEvent& event)
    {
        try
        {
            m_progress(event);
        }
        catch (const std::exception& e)
        {
            spdlog::error("Progress callback failed for {}: {}", m_request.url, e.what());
        }
    }
}
