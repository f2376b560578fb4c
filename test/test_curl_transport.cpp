#include <doctest/doctest.h>
#include <atomic>
#include <functional>
#include <thread>

#ifndef _WIN32
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

#include <bulkloader/context.hpp>
#include <bulkloader/curl_transport.hpp>
#include <bulkloader/downloader.hpp>

#include "helpers.hpp"

using namespace bulkloader;

namespace
{
    std::string file_url(const fs::path& path)
    {
        return "file://" + fs::absolute(path).string();
    }

    void write_file(const fs::path& path, const std::string& content)
    {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

#ifndef _WIN32
    /** HTTP server on 127.0.0.1 answering every request with a canned response.
     * Without a responder it listens but never accepts: connections complete in the
     * kernel and requests stay unanswered.
     */
    class LocalServer
    {
    public:
        using responder_t = std::function<std::string(const std::string& path)>;

        explicit LocalServer(responder_t responder = {})
            : m_responder(std::move(responder))
        {
            m_fd = ::socket(AF_INET, SOCK_STREAM, 0);
            REQUIRE(m_fd >= 0);

            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = 0;
            REQUIRE(::bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
            REQUIRE(::listen(m_fd, 16) == 0);

            socklen_t len = sizeof(addr);
            REQUIRE(::getsockname(m_fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
            m_port = ntohs(addr.sin_port);

            if (m_responder)
            {
                m_thread = std::thread([this]() { serve(); });
            }
        }

        ~LocalServer()
        {
            m_stop = true;
            if (m_thread.joinable())
                m_thread.join();
            ::close(m_fd);
        }

        std::string url(const std::string& path) const
        {
            return "http://127.0.0.1:" + std::to_string(m_port) + path;
        }

    private:
        void serve()
        {
            while (!m_stop)
            {
                pollfd pfd{ m_fd, POLLIN, 0 };
                if (::poll(&pfd, 1, 20) <= 0)
                    continue;

                const int client = ::accept(m_fd, nullptr, nullptr);
                if (client < 0)
                    continue;

                std::string request;
                char buffer[4096];
                while (request.find("\r\n\r\n") == std::string::npos)
                {
                    const ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
                    if (n <= 0)
                        break;
                    request.append(buffer, static_cast<std::size_t>(n));
                }

                // "GET <path> HTTP/1.1"
                const auto first = request.find(' ');
                const auto second = request.find(' ', first + 1);
                const std::string path = first == std::string::npos || second == std::string::npos
                                             ? std::string("/")
                                             : request.substr(first + 1, second - first - 1);

                const std::string response = m_responder(path);
                std::size_t sent = 0;
                while (sent < response.size())
                {
                    const ssize_t n
                        = ::send(client, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
                    if (n <= 0)
                        break;
                    sent += static_cast<std::size_t>(n);
                }
                ::close(client);
            }
        }

        responder_t m_responder;
        int m_fd = -1;
        int m_port = 0;
        std::atomic<bool> m_stop{ false };
        std::thread m_thread;
    };

    std::string canned(const std::string& status_line,
                       const std::string& headers,
                       const std::string& body)
    {
        return status_line + "\r\n" + headers + "Content-Length: " + std::to_string(body.size())
               + "\r\nConnection: close\r\n\r\n" + body;
    }

    // Records the events of a single fetch.
    struct RecordingSink : public TransferSink
    {
        bool on_response(const ResponseHead& h) override
        {
            head = h;
            return true;
        }

        bool on_data(const char* buffer, std::size_t size) override
        {
            body.append(buffer, size);
            return true;
        }

        void on_complete(tl::expected<void, DownloaderError> r) override
        {
            result = std::move(r);
        }

        std::optional<ResponseHead> head;
        std::string body;
        std::optional<tl::expected<void, DownloaderError>> result;
    };

    void wait_for(CurlTransport& transport,
                  const RecordingSink& sink,
                  std::chrono::milliseconds limit = std::chrono::milliseconds(10000))
    {
        const auto end = std::chrono::steady_clock::now() + limit;
        while (!sink.result && std::chrono::steady_clock::now() < end)
        {
            transport.poll(std::chrono::milliseconds(50));
        }
    }
#endif
}

TEST_SUITE("curl_transport")
{
    TEST_CASE("local_files")
    {
        Context ctx;
        TemporaryDirectory src("curl-src");
        TemporaryDirectory dst("curl-dst");

        std::string big;
        for (int i = 0; i < 50000; ++i)
        {
            big += std::to_string(i);
        }
        write_file(src.path / "big.txt", big);
        write_file(src.path / "small.txt", "small");
        write_file(src.path / "empty.txt", "");

        std::vector<DownloadRequest> requests{
            { file_url(src.path / "big.txt"), dst.path / "big.txt" },
            { file_url(src.path / "small.txt"), dst.path / "small.txt" },
            { file_url(src.path / "empty.txt"), dst.path / "empty.txt" },
        };

        std::vector<ProgressEvent> final_events;
        CurlTransport transport(ctx);
        DownloadOptions options;
        options.concurrency = 2;
        Downloader downloader(transport, options);
        downloader.set_progress_callback(
            [&final_events](const ProgressEvent& e)
            {
                if (e.percent && e.percent.value() >= 100.0)
                    final_events.push_back(e);
            });
        AggregateResult result = downloader.run(requests);

        CHECK(result.ok());
        CHECK_EQ(result.successful.size(), 3);
        CHECK_EQ(read_file(dst.path / "big.txt"), big);
        CHECK_EQ(read_file(dst.path / "small.txt"), "small");
        CHECK(fs::exists(dst.path / "empty.txt"));
        CHECK_EQ(fs::file_size(dst.path / "empty.txt"), 0);
        CHECK_EQ(dst.entries().size(), 3);
        CHECK_EQ(transport.in_flight(), 0);

        for (const auto& e : final_events)
        {
            CHECK_EQ(e.bytes_written, e.total_bytes.value());
        }
    }

    TEST_CASE("missing_file")
    {
        Context ctx;
        TemporaryDirectory src("curl-missing-src");
        TemporaryDirectory dst("curl-missing-dst");

        CurlTransport transport(ctx);
        DownloadOptions options;
        options.retry.max_retries = 2;
        options.retry.base_delay = std::chrono::milliseconds(1);
        Downloader downloader(transport, options);
        AggregateResult result = downloader.run(
            { { file_url(src.path / "does-not-exist"), dst.path / "does-not-exist" } });

        REQUIRE_EQ(result.failed.size(), 1);
        CHECK_EQ(result.failed[0].code, ErrorCode::kCONNECTION);
        CHECK(dst.entries().empty());
    }

    TEST_CASE("unsupported_protocol")
    {
        Context ctx;
        TemporaryDirectory dst("curl-protocol");

        CurlTransport transport(ctx);
        Downloader downloader(transport);
        AggregateResult result
            = downloader.run({ { "nosuchproto://example.com/x", dst.path / "x" } });

        REQUIRE_EQ(result.failed.size(), 1);
        CHECK_EQ(result.failed[0].code, ErrorCode::kBAD_URL);
    }

    TEST_CASE("throwing_progress_callback")
    {
        Context ctx;
        TemporaryDirectory src("curl-throw-src");
        TemporaryDirectory dst("curl-throw-dst");
        write_file(src.path / "observed.txt", std::string(300000, 'o'));

        CurlTransport transport(ctx);
        Downloader downloader(transport);
        downloader.set_progress_callback([](const ProgressEvent&)
                                         { throw std::runtime_error("progress sink failure"); });
        AggregateResult result = downloader.run(
            { { file_url(src.path / "observed.txt"), dst.path / "observed.txt" } });

        CHECK(result.ok());
        CHECK_EQ(fs::file_size(dst.path / "observed.txt"), 300000);
    }

#ifndef _WIN32
    TEST_CASE("header_timeout")
    {
        Context ctx;
        LocalServer silent;
        CurlTransport transport(ctx);
        RecordingSink sink;

        const auto start = std::chrono::steady_clock::now();
        REQUIRE(transport.fetch(silent.url("/never"), std::chrono::milliseconds(200), sink));
        CHECK_EQ(transport.in_flight(), 1);
        wait_for(transport, sink, std::chrono::milliseconds(5000));
        const auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(sink.result);
        REQUIRE_FALSE(sink.result.value());
        CHECK_EQ(sink.result.value().error().code, ErrorCode::kTIMEOUT);
        CHECK_FALSE(sink.head);
        CHECK(elapsed >= std::chrono::milliseconds(200));
        CHECK(elapsed < std::chrono::milliseconds(2000));
        CHECK_EQ(transport.in_flight(), 0);
    }

    TEST_CASE("interim_response_is_skipped")
    {
        Context ctx;
        LocalServer server(
            [](const std::string&)
            {
                return "HTTP/1.1 100 Continue\r\nX-Interim: yes\r\n\r\n"
                       + canned("HTTP/1.1 200 OK", "X-Final: yes\r\n", "hello");
            });
        CurlTransport transport(ctx);
        RecordingSink sink;

        REQUIRE(transport.fetch(server.url("/hello"), std::chrono::milliseconds(5000), sink));
        wait_for(transport, sink);

        REQUIRE(sink.result);
        CHECK(sink.result.value());
        REQUIRE(sink.head);
        CHECK_EQ(sink.head->status, 200);
        CHECK_EQ(sink.head->get_header("X-Final").value_or(""), "yes");
        CHECK_FALSE(sink.head->get_header("x-interim"));
        CHECK_EQ(sink.head->content_length.value_or(0), 5);
        CHECK_EQ(sink.body, "hello");
    }

    TEST_CASE("http_status_and_redirect")
    {
        Context ctx;
        TemporaryDirectory dst("curl-http");
        LocalServer server(
            [](const std::string& path)
            {
                if (path == "/old/file.txt")
                    return canned("HTTP/1.1 302 Found", "Location: ../new/file.txt\r\n", "");
                if (path == "/new/file.txt")
                    return canned("HTTP/1.1 200 OK", "", "redirected content");
                return canned("HTTP/1.1 404 Not Found", "", "not found");
            });

        CurlTransport transport(ctx);
        DownloadOptions options;
        options.retry.base_delay = std::chrono::milliseconds(1);
        Downloader downloader(transport, options);
        AggregateResult result
            = downloader.run({ { server.url("/old/file.txt"), dst.path / "file.txt" },
                               { server.url("/missing"), dst.path / "missing" } });

        REQUIRE_EQ(result.successful.size(), 1);
        CHECK_EQ(result.successful[0].url, server.url("/old/file.txt"));
        CHECK_EQ(read_file(dst.path / "file.txt"), "redirected content");

        REQUIRE_EQ(result.failed.size(), 1);
        CHECK_EQ(result.failed[0].url, server.url("/missing"));
        CHECK_EQ(result.failed[0].code, ErrorCode::kHTTP_STATUS);
        CHECK_EQ(result.failed[0].reason, "HTTP 404");
        CHECK_EQ(dst.entries().size(), 1);
        CHECK_EQ(transport.in_flight(), 0);
    }
#endif

    TEST_CASE("single_context")
    {
        Context ctx;
        CHECK_THROWS_AS(Context(), std::runtime_error);
    }
}
