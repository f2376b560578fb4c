#ifndef BULKLOADER_TRANSPORT_HPP
#define BULKLOADER_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <tl/expected.hpp>

#include <bulkloader/export.hpp>
#include <bulkloader/errors.hpp>

namespace bulkloader
{
    // Status line and headers of a response. Header names are lower case.
    struct BULKLOADER_API ResponseHead
    {
        // 0 for protocols without a status code (e.g. file://)
        long status = 0;
        std::map<std::string, std::string> headers;
        std::optional<std::uintmax_t> content_length;

        std::optional<std::string> get_header(const std::string& name) const;
    };

    /** Receiver of the events of one running fetch.
     * Events arrive in order: `on_response` once, `on_data` zero or more times, then
     * `on_complete` exactly once. Returning false from `on_response` or `on_data` stops
     * the transfer, it is then completed with an error.
     */
    class TransferSink
    {
    public:
        virtual ~TransferSink() = default;

        virtual bool on_response(const ResponseHead& head) = 0;
        virtual bool on_data(const char* buffer, std::size_t size) = 0;
        virtual void on_complete(tl::expected<void, DownloaderError> result) = 0;
    };

    /** Single attempt HTTP(S) GET primitive.
     * Does not retry and does not follow redirects. All events are delivered from inside
     * `poll()`, on the calling thread.
     */
    class BULKLOADER_API Transport
    {
    public:
        virtual ~Transport() = default;

        // Starts one GET of `url`. `timeout` covers connection establishment and header
        // receipt, when it fires the connection is torn down and the sink completes with a
        // `kTIMEOUT` error. A sink has at most one fetch running at a time.
        virtual tl::expected<void, DownloaderError> fetch(const std::string& url,
                                                          std::chrono::milliseconds timeout,
                                                          TransferSink& sink)
            = 0;

        // Tears down the fetch of `sink` without completing it. No-op if none is running.
        virtual void abort(TransferSink& sink) = 0;

        // Drives the running fetches, waiting at most `max_wait` for something to happen.
        virtual void poll(std::chrono::milliseconds max_wait) = 0;

        virtual std::size_t in_flight() const = 0;
    };
}

#endif
