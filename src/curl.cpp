#include <atomic>
#include <new>

#include <spdlog/spdlog.h>

#include <bulkloader/context.hpp>

#include "curl_internal.hpp"

namespace bulkloader
{
    /**************
     * CURLHandle *
     **************/

    CURLHandle::CURLHandle(const Context& ctx)
        : m_handle(curl_easy_init())
    {
        if (m_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL handle");
        }

        // Set error buffer
        m_errorbuffer[0] = '\0';
        setopt(CURLOPT_ERRORBUFFER, m_errorbuffer);
        init_handle(ctx);
    }

    void CURLHandle::init_handle(const Context& ctx)
    {
        // redirects are followed by the download task
        setopt(CURLOPT_FOLLOWLOCATION, 0L);
        setopt(CURLOPT_NOSIGNAL, 1L);
        setopt(CURLOPT_LOW_SPEED_TIME, ctx.low_speed_time);
        setopt(CURLOPT_LOW_SPEED_LIMIT, ctx.low_speed_limit);
        setopt(CURLOPT_BUFFERSIZE, ctx.transfer_buffersize);

        if (ctx.disable_ssl)
        {
            spdlog::warn("SSL verification is disabled");
            setopt(CURLOPT_SSL_VERIFYHOST, 0L);
            setopt(CURLOPT_SSL_VERIFYPEER, 0L);

            // also disable proxy SSL verification
            setopt(CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
            setopt(CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
        }
        else
        {
            setopt(CURLOPT_SSL_VERIFYHOST, 2L);
            setopt(CURLOPT_SSL_VERIFYPEER, 1L);

            if (!ctx.ssl_ca_info.empty())
            {
                setopt(CURLOPT_CAINFO, ctx.ssl_ca_info.string());
            }
        }

        if (!ctx.user_agent.empty())
        {
            user_agent(ctx.user_agent);
        }
        add_headers(ctx.additional_httpheaders);

        if (ctx.verbosity > 1)
            setopt(CURLOPT_VERBOSE, 1L);
    }

    CURLHandle::~CURLHandle()
    {
        if (m_handle)
        {
            curl_easy_cleanup(m_handle);
        }
        if (p_headers)
        {
            curl_slist_free_all(p_headers);
        }
    }

    CURLHandle& CURLHandle::url(const std::string& url)
    {
        setopt(CURLOPT_URL, url);
        return *this;
    }

    CURLHandle& CURLHandle::user_agent(const std::string& user_agent)
    {
        setopt(CURLOPT_USERAGENT, fmt::format("{} {}", user_agent, curl_version()));
        return *this;
    }

    CURL* CURLHandle::handle()
    {
        if (p_headers)
            setopt(CURLOPT_HTTPHEADER, p_headers);
        return m_handle;
    }

    CURLHandle& CURLHandle::add_header(const std::string& header)
    {
        p_headers = curl_slist_append(p_headers, header.c_str());
        if (!p_headers)
        {
            throw std::bad_alloc();
        }
        return *this;
    }

    CURLHandle& CURLHandle::add_headers(const std::vector<std::string>& headers)
    {
        for (auto& h : headers)
        {
            add_header(h);
        }
        return *this;
    }

    namespace details
    {
        static std::atomic<bool> is_curl_setup_alive{ false };

        CURLSetup::CURLSetup()
        {
            {
                bool expected = false;
                if (!is_curl_setup_alive.compare_exchange_strong(expected, true))
                    throw std::runtime_error(
                        "bulkloader::CURLSetup created more than once - instance must be unique");
            }

            if (curl_global_init(CURL_GLOBAL_ALL) != 0)
            {
                is_curl_setup_alive = false;
                throw curl_error("failed to initialize curl");
            }
        }

        CURLSetup::~CURLSetup()
        {
            curl_global_cleanup();
            is_curl_setup_alive = false;
        }
    }
}
