#ifndef BULKLOADER_DOWNLOADER_HPP
#define BULKLOADER_DOWNLOADER_HPP

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <vector>

#include <bulkloader/export.hpp>
#include <bulkloader/download_request.hpp>
#include <bulkloader/download_task.hpp>
#include <bulkloader/result.hpp>
#include <bulkloader/transport.hpp>

namespace bulkloader
{
    /** Runs a list of requests with at most `options.concurrency` of them active.
     *
     * Everything happens on the calling thread: the transport's `poll()` is the only place
     * where the loop suspends. A request's failure frees its slot like a success does, so
     * siblings are never affected.
     */
    class BULKLOADER_API Downloader
    {
    public:
        using interrupt_t = std::function<bool()>;

        // `transport` must outlive the downloader.
        Downloader(Transport& transport, DownloadOptions options = {});
        ~Downloader();

        Downloader(const Downloader&) = delete;
        Downloader& operator=(const Downloader&) = delete;

        void set_progress_callback(progress_callback_t callback)
        {
            m_progress = std::move(callback);
        }

        // Checked at every iteration of the event loop, a true result aborts the run.
        void set_interrupt(interrupt_t interrupt)
        {
            m_interrupt = std::move(interrupt);
        }

        const DownloadOptions& options() const noexcept
        {
            return m_options;
        }

        // Returns once every request reached a terminal outcome. A request whose destination
        // is already used by an earlier one of the list fails with `kWRITE` without starting.
        AggregateResult run(std::vector<DownloadRequest> requests);

    private:
        void admit_pending();
        bool reap_finished();
        std::chrono::milliseconds next_poll_timeout(clock_type::time_point now) const;
        void interrupt_all();
        void abort_active();

        Transport& m_transport;
        DownloadOptions m_options;
        progress_callback_t m_progress;
        interrupt_t m_interrupt;

        std::deque<DownloadRequest> m_pending;
        std::vector<std::unique_ptr<DownloadTask>> m_active;
        ResultAggregator m_aggregator;
    };
}

#endif
