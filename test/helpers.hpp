#ifndef BULKLOADER_TEST_HELPERS_HPP
#define BULKLOADER_TEST_HELPERS_HPP

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <list>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <bulkloader/enums.hpp>
#include <bulkloader/transport.hpp>

namespace bulkloader
{
    namespace fs = std::filesystem;

    // Fresh directory below the system temporary directory, removed on destruction.
    struct TemporaryDirectory
    {
        explicit TemporaryDirectory(const std::string& name)
            : path(fs::temp_directory_path() / ("bulkloader-test-" + name))
        {
            fs::remove_all(path);
            fs::create_directories(path);
        }

        ~TemporaryDirectory()
        {
            std::error_code ec;
            fs::remove_all(path, ec);
        }

        std::vector<fs::path> entries() const
        {
            std::vector<fs::path> res;
            for (const auto& entry : fs::recursive_directory_iterator(path))
            {
                if (entry.is_regular_file())
                    res.push_back(entry.path());
            }
            return res;
        }

        fs::path path;
    };

    inline bool ends_with_partext(const fs::path& path)
    {
        const std::string name = path.filename().string();
        const std::string ext = BULKLOADER_PARTEXT;
        return name.size() > ext.size() && name.compare(name.size() - ext.size(), ext.size(), ext) == 0;
    }

    inline std::string read_file(const fs::path& path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    // Scripted outcome of a single fetch.
    struct FakeResponse
    {
        enum class Kind
        {
            kRESPONSE,
            kCONNECTION_ERROR,
            kTIMEOUT
        };

        Kind kind = Kind::kRESPONSE;
        long status = 200;
        std::map<std::string, std::string> headers;
        std::vector<std::string> chunks;
        bool announce_length = true;

        static FakeResponse ok(const std::string& body,
                               std::size_t chunk_size = 4,
                               bool announce_length = true)
        {
            FakeResponse res;
            res.announce_length = announce_length;
            for (std::size_t i = 0; i < body.size(); i += chunk_size)
            {
                res.chunks.push_back(body.substr(i, chunk_size));
            }
            res.headers["content-length"] = std::to_string(body.size());
            return res;
        }

        static FakeResponse with_status(long status)
        {
            FakeResponse res;
            res.status = status;
            res.chunks.push_back("<html>error page</html>");
            return res;
        }

        static FakeResponse redirect(long status, const std::string& location)
        {
            FakeResponse res;
            res.status = status;
            if (!location.empty())
                res.headers["location"] = location;
            res.chunks.push_back("moved");
            return res;
        }

        static FakeResponse connection_error()
        {
            FakeResponse res;
            res.kind = Kind::kCONNECTION_ERROR;
            return res;
        }

        static FakeResponse timeout()
        {
            FakeResponse res;
            res.kind = Kind::kTIMEOUT;
            return res;
        }
    };

    /** In-memory transport driven by scripts.
     * Every `poll()` moves each running transfer one step ahead: first the response head,
     * then one body chunk per poll, then the completion. The n-th fetch of a url plays the
     * n-th scripted response, the last one repeats. Unscripted urls fail to connect.
     */
    class FakeTransport : public Transport
    {
    public:
        void script(const std::string& url, std::vector<FakeResponse> responses)
        {
            m_scripts[url] = std::move(responses);
        }

        tl::expected<void, DownloaderError> fetch(const std::string& url,
                                                  std::chrono::milliseconds timeout,
                                                  TransferSink& sink) override
        {
            m_fetch_log.push_back(url);
            m_timeouts.push_back(timeout);

            FakeResponse response = FakeResponse::connection_error();
            auto it = m_scripts.find(url);
            if (it != m_scripts.end() && !it->second.empty())
            {
                const std::size_t n = m_fetch_count[url]++;
                response = it->second[std::min(n, it->second.size() - 1)];
            }

            m_running.push_back(Running{ &sink, url, std::move(response), 0 });
            m_max_in_flight = std::max(m_max_in_flight, m_running.size());
            return {};
        }

        void abort(TransferSink& sink) override
        {
            const auto before = m_running.size();
            m_running.remove_if([&sink](const Running& r) { return r.sink == &sink; });
            m_aborted += before - m_running.size();
        }

        // The poll with that number (counting from 1) throws instead of doing anything.
        void fail_poll(std::size_t number)
        {
            m_failing_poll = number;
        }

        void poll(std::chrono::milliseconds max_wait) override
        {
            m_polls++;
            m_waits.push_back(max_wait);
            if (m_polls == m_failing_poll)
            {
                throw std::runtime_error("transport failure");
            }
            if (m_running.empty())
            {
                std::this_thread::sleep_for(max_wait);
                return;
            }

            auto it = m_running.begin();
            while (it != m_running.end())
            {
                std::optional<tl::expected<void, DownloaderError>> done = step(*it);
                if (!done)
                {
                    ++it;
                    continue;
                }

                TransferSink* sink = it->sink;
                it = m_running.erase(it);
                sink->on_complete(std::move(done.value()));
            }
        }

        std::size_t in_flight() const override
        {
            return m_running.size();
        }

        const std::vector<std::string>& fetch_log() const
        {
            return m_fetch_log;
        }

        std::size_t fetches_of(const std::string& url) const
        {
            return static_cast<std::size_t>(
                std::count(m_fetch_log.begin(), m_fetch_log.end(), url));
        }

        const std::vector<std::chrono::milliseconds>& timeouts() const
        {
            return m_timeouts;
        }

        std::size_t max_in_flight() const
        {
            return m_max_in_flight;
        }

        const std::vector<std::chrono::milliseconds>& waits() const
        {
            return m_waits;
        }

        std::size_t polls() const
        {
            return m_polls;
        }

        std::size_t aborted() const
        {
            return m_aborted;
        }

    private:
        struct Running
        {
            TransferSink* sink;
            std::string url;
            FakeResponse response;
            std::size_t step;
        };

        static tl::expected<void, DownloaderError> stopped(const Running& r)
        {
            return tl::unexpected(DownloaderError{ ErrorCode::kCONNECTION,
                                                   "Transfer of " + r.url + " stopped" });
        }

        std::optional<tl::expected<void, DownloaderError>> step(Running& r)
        {
            const FakeResponse& res = r.response;
            if (res.kind == FakeResponse::Kind::kCONNECTION_ERROR)
            {
                return tl::expected<void, DownloaderError>(tl::unexpected(
                    DownloaderError{ ErrorCode::kCONNECTION, "Could not connect to " + r.url }));
            }
            if (res.kind == FakeResponse::Kind::kTIMEOUT)
            {
                return tl::expected<void, DownloaderError>(tl::unexpected(
                    DownloaderError{ ErrorCode::kTIMEOUT, "Request timeout for " + r.url }));
            }

            if (r.step == 0)
            {
                ResponseHead head;
                head.status = res.status;
                head.headers = res.headers;
                if (res.announce_length)
                {
                    auto len = head.get_header("content-length");
                    if (len)
                        head.content_length = std::stoull(len.value());
                }
                else
                {
                    head.headers.erase("content-length");
                }

                r.step++;
                if (!r.sink->on_response(head))
                    return tl::expected<void, DownloaderError>(stopped(r));
                return std::nullopt;
            }

            const std::size_t chunk = r.step - 1;
            if (chunk < res.chunks.size())
            {
                r.step++;
                const std::string& data = res.chunks[chunk];
                if (!r.sink->on_data(data.data(), data.size()))
                    return tl::expected<void, DownloaderError>(stopped(r));
                return std::nullopt;
            }
            return tl::expected<void, DownloaderError>();
        }

        std::map<std::string, std::vector<FakeResponse>> m_scripts;
        std::map<std::string, std::size_t> m_fetch_count;
        std::list<Running> m_running;
        std::vector<std::string> m_fetch_log;
        std::vector<std::chrono::milliseconds> m_timeouts;
        std::size_t m_max_in_flight = 0;
        std::vector<std::chrono::milliseconds> m_waits;
        std::size_t m_polls = 0;
        std::size_t m_failing_poll = 0;
        std::size_t m_aborted = 0;
    };
}

#endif
