#include <algorithm>
#include <set>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <bulkloader/downloader.hpp>

namespace bulkloader
{
    Downloader::Downloader(Transport& transport, DownloadOptions options)
        : m_transport(transport)
        , m_options(std::move(options))
    {
        if (m_options.concurrency < 1)
        {
            throw std::invalid_argument("concurrency limit must be at least 1");
        }
    }

    Downloader::~Downloader()
    {
        abort_active();
    }

    // The transport must not keep pointers to tasks that are going away.
    void Downloader::abort_active()
    {
        for (auto& task : m_active)
        {
            m_transport.abort(*task);
        }
        m_active.clear();
    }

    void Downloader::admit_pending()
    {
        while (m_active.size() < m_options.concurrency && !m_pending.empty())
        {
            DownloadRequest request = std::move(m_pending.front());
            m_pending.pop_front();

            spdlog::info("Starting {} -> {}", request.url, request.destination_path.string());
            m_active.push_back(
                std::make_unique<DownloadTask>(std::move(request), m_options, m_progress));
        }
    }

    bool Downloader::reap_finished()
    {
        bool reaped = false;
        auto it = m_active.begin();
        while (it != m_active.end())
        {
            DownloadTask& task = **it;
            if (!task.is_terminal())
            {
                ++it;
                continue;
            }

            if (task.status() == TaskStatus::kSUCCEEDED)
            {
                spdlog::info("Downloaded {} ({} bytes)",
                             task.request().destination_path.string(),
                             task.outcome().value());
            }
            else
            {
                spdlog::error("Failed {}: {}", task.request().url, task.outcome().error().reason);
            }

            m_aggregator.record(task.request(), task.outcome());
            it = m_active.erase(it);
            reaped = true;
        }

        if (reaped)
        {
            admit_pending();
        }
        return reaped;
    }

    std::chrono::milliseconds Downloader::next_poll_timeout(clock_type::time_point now) const
    {
        auto wait = m_options.max_wait;
        for (const auto& task : m_active)
        {
            if (task->ready(now))
            {
                return std::chrono::milliseconds(0);
            }

            if (auto wakeup = task->wakeup_time())
            {
                const auto left
                    = std::chrono::duration_cast<std::chrono::milliseconds>(wakeup.value() - now);
                // round up so that the task is due when the loop wakes up
                wait = std::min(wait, std::max(left + std::chrono::milliseconds(1),
                                               std::chrono::milliseconds(0)));
            }
        }
        return wait;
    }

    void Downloader::interrupt_all()
    {
        spdlog::info("Download interrupted");
        for (auto& task : m_active)
        {
            task->abort(m_transport,
                        DownloaderError{ ErrorCode::kINTERRUPTED, "Download interrupted" });
        }
        while (!m_pending.empty())
        {
            m_aggregator.record(m_pending.front(),
                                tl::unexpected(DownloaderError{ ErrorCode::kINTERRUPTED,
                                                                "Download interrupted" }));
            m_pending.pop_front();
        }
        // only records the aborted tasks, nothing is left to admit
        reap_finished();
    }

    AggregateResult Downloader::run(std::vector<DownloadRequest> requests)
    {
        // leftovers of a run that ended with an exception
        abort_active();
        m_pending.clear();
        m_aggregator = ResultAggregator();

        std::set<fs::path> destinations;
        for (auto& request : requests)
        {
            if (!destinations.insert(request.destination_path.lexically_normal()).second)
            {
                DownloaderError error{ ErrorCode::kWRITE,
                                       fmt::format("Destination {} is used by another request",
                                                   request.destination_path.string()) };
                error.log();
                m_aggregator.record(request, tl::unexpected(std::move(error)));
                continue;
            }
            m_pending.push_back(std::move(request));
        }

        spdlog::info("Starting download of {} files", m_pending.size());
        admit_pending();

        try
        {
            while (!m_active.empty())
            {
                if (m_interrupt && m_interrupt())
                {
                    interrupt_all();
                    break;
                }

                const auto now = clock_type::now();
                for (auto& task : m_active)
                {
                    task->advance(m_transport, now);
                }

                // freed slots were refilled, start the newcomers before suspending
                if (reap_finished())
                    continue;

                m_transport.poll(next_poll_timeout(clock_type::now()));
                reap_finished();
            }
        }
        catch (...)
        {
            abort_active();
            m_pending.clear();
            throw;
        }

        spdlog::info("All downloads finished!");
        return m_aggregator.finalize();
    }
}
