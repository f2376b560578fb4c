#include <algorithm>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <bulkloader/curl_transport.hpp>
#include <bulkloader/utils.hpp>

#include "curl_internal.hpp"

namespace bulkloader
{
    using clock_type = std::chrono::steady_clock;

    struct CurlTransport::Transfer
    {
        TransferSink* sink = nullptr;
        std::string url;
        std::unique_ptr<CURLHandle> handle;
        // connection + header receipt must happen before this point
        std::optional<clock_type::time_point> deadline;
        std::chrono::milliseconds timeout{ 0 };

        ResponseHead head;
        bool head_delivered = false;
        bool stopped_by_sink = false;
    };

    CurlTransport::CurlTransport(const Context& ctx)
        : m_ctx(ctx)
        , m_multi_handle(curl_multi_init())
    {
        if (m_multi_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL multi handle");
        }
    }

    CurlTransport::~CurlTransport()
    {
        for (auto& [handle, transfer] : m_transfers)
        {
            curl_multi_remove_handle(m_multi_handle, handle);
        }
        m_transfers.clear();
        curl_multi_cleanup(m_multi_handle);
    }

    bool CurlTransport::deliver_head(Transfer& transfer)
    {
        transfer.head_delivered = true;
        transfer.deadline.reset();

        transfer.head.status
            = transfer.handle->getinfo<long>(CURLINFO_RESPONSE_CODE).value_or(0);
        const auto length
            = transfer.handle->getinfo<curl_off_t>(CURLINFO_CONTENT_LENGTH_DOWNLOAD_T);
        if (length && length.value() >= 0)
        {
            transfer.head.content_length = static_cast<std::uintmax_t>(length.value());
        }

        spdlog::debug("Response {} for {}", transfer.head.status, transfer.url);
        return transfer.sink->on_response(transfer.head);
    }

    std::size_t CurlTransport::header_callback(char* buffer,
                                               std::size_t size,
                                               std::size_t nitems,
                                               Transfer* self)
    {
        const std::size_t ret = size * nitems;
        std::string_view header(buffer, ret);

        if (self->head_delivered)
            return ret;

        if (starts_with(header, "HTTP/"))
        {
            // new status line (after an interim response), start over
            self->head.headers.clear();
            return ret;
        }

        if (!strip(header).empty())
        {
            auto [key, value] = parse_header(header);
            if (!key.empty())
            {
                self->head.headers[key] = value;
            }
            return ret;
        }

        // blank line: end of this header block
        const long code = self->handle->getinfo<long>(CURLINFO_RESPONSE_CODE).value_or(0);
        if (code / 100 == 1)
        {
            return ret;
        }

        try
        {
            if (!deliver_head(*self))
            {
                self->stopped_by_sink = true;
                return 0;
            }
        }
        catch (const std::exception& e)
        {
            spdlog::error("Response callback failed for {}: {}", self->url, e.what());
            self->stopped_by_sink = true;
            return 0;
        }
        return ret;
    }

    std::size_t CurlTransport::write_callback(char* buffer,
                                              std::size_t size,
                                              std::size_t nitems,
                                              Transfer* self)
    {
        const std::size_t all = size * nitems;
        try
        {
            // protocols without headers (file://) start with the body
            if (!self->head_delivered && !deliver_head(*self))
            {
                self->stopped_by_sink = true;
                return 0;
            }
            if (!self->sink->on_data(buffer, all))
            {
                self->stopped_by_sink = true;
                return 0;
            }
        }
        catch (const std::exception& e)
        {
            spdlog::error("Data callback failed for {}: {}", self->url, e.what());
            self->stopped_by_sink = true;
            return 0;
        }
        return all;
    }

    tl::expected<void, DownloaderError> CurlTransport::fetch(const std::string& url,
                                                             std::chrono::milliseconds timeout,
                                                             TransferSink& sink)
    {
        auto transfer = std::make_unique<Transfer>();
        transfer->sink = &sink;
        transfer->url = url;
        transfer->timeout = timeout;
        transfer->handle = std::make_unique<CURLHandle>(m_ctx);

        CURLHandle& h = *(transfer->handle);
        h.url(url);
        if (timeout.count() > 0)
        {
            h.setopt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
            transfer->deadline = clock_type::now() + timeout;
        }

        h.setopt(CURLOPT_HEADERFUNCTION, &CurlTransport::header_callback);
        h.setopt(CURLOPT_HEADERDATA, transfer.get());
        h.setopt(CURLOPT_WRITEFUNCTION, &CurlTransport::write_callback);
        h.setopt(CURLOPT_WRITEDATA, transfer.get());

        CURL* handle = h.handle();
        const CURLMcode cm_rc = curl_multi_add_handle(m_multi_handle, handle);
        if (cm_rc != CURLM_OK)
        {
            return tl::unexpected(DownloaderError{
                ErrorCode::kCONNECTION,
                fmt::format("Could not start transfer of {}: {}", url, curl_multi_strerror(cm_rc)) });
        }

        spdlog::debug("Fetching {}", url);
        m_transfers.emplace(handle, std::move(transfer));
        return {};
    }

    void CurlTransport::abort(TransferSink& sink)
    {
        auto it = std::find_if(m_transfers.begin(),
                               m_transfers.end(),
                               [&sink](const auto& entry) { return entry.second->sink == &sink; });
        if (it == m_transfers.end())
            return;

        spdlog::debug("Aborting transfer of {}", it->second->url);
        curl_multi_remove_handle(m_multi_handle, it->first);
        m_transfers.erase(it);
    }

    std::size_t CurlTransport::in_flight() const
    {
        return m_transfers.size();
    }

    void CurlTransport::finish(CURL* handle, tl::expected<void, DownloaderError> result)
    {
        auto it = m_transfers.find(handle);
        if (it == m_transfers.end())
            return;

        // the transfer is released once the sink was told, after the handle left the multi
        std::unique_ptr<Transfer> transfer = std::move(it->second);
        m_transfers.erase(it);
        curl_multi_remove_handle(m_multi_handle, handle);

        transfer->sink->on_complete(std::move(result));
    }

    void CurlTransport::perform()
    {
        int still_running = 0;
        const CURLMcode code = curl_multi_perform(m_multi_handle, &still_running);
        if (code != CURLM_OK)
        {
            throw curl_error(curl_multi_strerror(code));
        }
    }

    bool CurlTransport::check_msgs()
    {
        bool finished_any = false;
        int msgs_in_queue;
        while (CURLMsg* msg = curl_multi_info_read(m_multi_handle, &msgs_in_queue))
        {
            if (msg->msg != CURLMSG_DONE)
            {
                // We are only interested in messages about finished transfers
                continue;
            }

            // `msg` does not survive the removal of its handle
            CURL* handle = msg->easy_handle;
            const CURLcode code = msg->data.result;

            auto it = m_transfers.find(handle);
            if (it == m_transfers.end())
                continue;
            Transfer& transfer = *(it->second);

            tl::expected<void, DownloaderError> result;
            if (transfer.stopped_by_sink)
            {
                result = tl::unexpected(DownloaderError{
                    ErrorCode::kCONNECTION,
                    fmt::format("Transfer of {} stopped by its receiver", transfer.url) });
            }
            else if (code == CURLE_OK)
            {
                // empty bodies never reach the write callback
                if (!transfer.head_delivered && !deliver_head(transfer))
                {
                    result = tl::unexpected(DownloaderError{
                        ErrorCode::kCONNECTION,
                        fmt::format("Transfer of {} stopped by its receiver", transfer.url) });
                }
            }
            else
            {
                std::string error = fmt::format("CURL error ({}): {} for {} [{}]",
                                                code,
                                                curl_easy_strerror(code),
                                                transfer.url,
                                                transfer.handle->errorbuffer());
                switch (code)
                {
                    case CURLE_OPERATION_TIMEDOUT:
                        result = tl::unexpected(
                            DownloaderError{ ErrorCode::kTIMEOUT, std::move(error) });
                        break;
                    case CURLE_URL_MALFORMAT:
                    case CURLE_UNSUPPORTED_PROTOCOL:
                        result = tl::unexpected(
                            DownloaderError{ ErrorCode::kBAD_URL, std::move(error) });
                        break;
                    default:
                        // DNS, TCP, TLS and mid-body failures
                        result = tl::unexpected(
                            DownloaderError{ ErrorCode::kCONNECTION, std::move(error) });
                }
            }

            finish(handle, std::move(result));
            finished_any = true;
        }
        return finished_any;
    }

    bool CurlTransport::check_deadlines()
    {
        const auto now = clock_type::now();
        std::vector<std::pair<CURL*, std::string>> expired;
        for (const auto& [handle, transfer] : m_transfers)
        {
            if (transfer->deadline && now >= transfer->deadline.value())
            {
                expired.emplace_back(handle,
                                     fmt::format("Request timeout after {} ms for {}",
                                                 transfer->timeout.count(),
                                                 transfer->url));
            }
        }

        for (auto& [handle, reason] : expired)
        {
            finish(handle,
                   tl::unexpected(DownloaderError{ ErrorCode::kTIMEOUT, std::move(reason) }));
        }
        return !expired.empty();
    }

    void CurlTransport::poll(std::chrono::milliseconds max_wait)
    {
        perform();
        const bool finished = check_msgs();
        const bool timed_out = check_deadlines();
        if (finished || timed_out)
            return;

        if (m_transfers.empty())
        {
            // nothing to wait on, e.g. every active request is in its backoff delay
            if (max_wait.count() > 0)
                std::this_thread::sleep_for(max_wait);
            return;
        }

        long curl_timeout = -1;
        const CURLMcode code = curl_multi_timeout(m_multi_handle, &curl_timeout);
        if (code != CURLM_OK)
        {
            throw curl_error(curl_multi_strerror(code));
        }

        auto wait = max_wait;
        if (curl_timeout >= 0)
            wait = std::min(wait, std::chrono::milliseconds(curl_timeout));

        const auto now = clock_type::now();
        for (const auto& [handle, transfer] : m_transfers)
        {
            if (transfer->deadline)
            {
                const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    transfer->deadline.value() - now);
                wait = std::min(wait, std::max(left, std::chrono::milliseconds(0)));
            }
        }

        if (wait.count() > 0)
        {
            int numfds = 0;
            const CURLMcode wait_code = curl_multi_poll(
                m_multi_handle, nullptr, 0, static_cast<int>(wait.count()), &numfds);
            if (wait_code != CURLM_OK)
            {
                throw curl_error(curl_multi_strerror(wait_code));
            }
        }

        perform();
        check_msgs();
        check_deadlines();
    }
}
