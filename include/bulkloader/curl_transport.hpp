#ifndef BULKLOADER_CURL_TRANSPORT_HPP
#define BULKLOADER_CURL_TRANSPORT_HPP

#include <chrono>
#include <map>
#include <memory>

extern "C"
{
#include <curl/curl.h>
}

#include <bulkloader/export.hpp>
#include <bulkloader/context.hpp>
#include <bulkloader/transport.hpp>

namespace bulkloader
{
    class CURLHandle;

    // `Transport` running every fetch on one libcurl multi handle.
    class BULKLOADER_API CurlTransport : public Transport
    {
    public:
        explicit CurlTransport(const Context& ctx);
        ~CurlTransport() override;

        CurlTransport(const CurlTransport&) = delete;
        CurlTransport& operator=(const CurlTransport&) = delete;

        tl::expected<void, DownloaderError> fetch(const std::string& url,
                                                  std::chrono::milliseconds timeout,
                                                  TransferSink& sink) override;
        void abort(TransferSink& sink) override;
        void poll(std::chrono::milliseconds max_wait) override;
        std::size_t in_flight() const override;

    private:
        struct Transfer;

        static std::size_t header_callback(char* buffer,
                                           std::size_t size,
                                           std::size_t nitems,
                                           Transfer* self);
        static std::size_t write_callback(char* buffer,
                                          std::size_t size,
                                          std::size_t nitems,
                                          Transfer* self);
        static bool deliver_head(Transfer& transfer);

        void perform();
        bool check_msgs();
        bool check_deadlines();
        void finish(CURL* handle, tl::expected<void, DownloaderError> result);

        const Context& m_ctx;
        CURLM* m_multi_handle;
        std::map<CURL*, std::unique_ptr<Transfer>> m_transfers;
    };
}

#endif
