#ifndef BULKLOADER_SRC_CURL_INTERNAL_HPP
#define BULKLOADER_SRC_CURL_INTERNAL_HPP

#include <string>
#include <type_traits>
#include <vector>

#include <fmt/core.h>
#include <tl/expected.hpp>

extern "C"
{
#include <curl/curl.h>
}

#include <bulkloader/export.hpp>
#include <bulkloader/context.hpp>
#include <bulkloader/errors.hpp>

namespace bulkloader
{
    // RAII owner of a curl easy handle and of its header list.
    class CURLHandle
    {
    public:
        explicit CURLHandle(const Context& ctx);
        ~CURLHandle();

        CURLHandle(const CURLHandle&) = delete;
        CURLHandle& operator=(const CURLHandle&) = delete;

        CURLHandle& url(const std::string& url);
        CURLHandle& user_agent(const std::string& user_agent);

        CURLHandle& add_header(const std::string& header);
        CURLHandle& add_headers(const std::vector<std::string>& headers);

        template <class T>
        tl::expected<T, CURLcode> getinfo(CURLINFO option);

        template <class T>
        CURLHandle& setopt(CURLoption opt, const T& val);

        // Installs the header list, must be called before handing the handle to curl.
        CURL* handle();

        const char* errorbuffer() const noexcept
        {
            return m_errorbuffer;
        }

    private:
        void init_handle(const Context& ctx);

        CURL* m_handle;
        curl_slist* p_headers = nullptr;
        char m_errorbuffer[CURL_ERROR_SIZE];
    };

    template <class T>
    CURLHandle& CURLHandle::setopt(CURLoption opt, const T& val)
    {
        CURLcode ok;
        if constexpr (std::is_same<T, std::string>())
        {
            ok = curl_easy_setopt(m_handle, opt, val.c_str());
        }
        else if constexpr (std::is_same<T, bool>())
        {
            ok = curl_easy_setopt(m_handle, opt, val ? 1L : 0L);
        }
        else
        {
            ok = curl_easy_setopt(m_handle, opt, val);
        }
        if (ok != CURLE_OK)
        {
            throw curl_error(
                fmt::format("curl: curl_easy_setopt failed {}", curl_easy_strerror(ok)));
        }
        return *this;
    }

    template <class T>
    tl::expected<T, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        T val;
        CURLcode result = curl_easy_getinfo(m_handle, option, &val);
        if (result != CURLE_OK)
            return tl::unexpected(result);
        return val;
    }
}

namespace bulkloader::details
{
    // Scoped initialization and termination of CURL.
    // This should never have more than one instance live at any time,
    // this object's constructor will throw an `std::runtime_error` if it's the case.
    class CURLSetup final
    {
    public:
        CURLSetup();
        ~CURLSetup();

        CURLSetup(CURLSetup&&) = delete;
        CURLSetup& operator=(CURLSetup&&) = delete;

        CURLSetup(const CURLSetup&) = delete;
        CURLSetup& operator=(const CURLSetup&) = delete;
    };
}
#endif
