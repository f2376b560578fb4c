#include <stdexcept>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include <bulkloader/url.hpp>

namespace bulkloader
{
    URLHandler::URLHandler(const std::string& url)
        : m_handle(curl_url())
    {
        if (m_handle == nullptr)
        {
            throw std::bad_alloc();
        }

        const CURLUcode uc = curl_url_set(m_handle, CURLUPART_URL, url.c_str(), 0);
        if (uc != CURLUE_OK)
        {
            curl_url_cleanup(m_handle);
            m_handle = nullptr;
            throw std::invalid_argument(
                fmt::format("Could not parse URL '{}': {}", url, curl_url_strerror(uc)));
        }
    }

    URLHandler::~URLHandler()
    {
        if (m_handle)
        {
            curl_url_cleanup(m_handle);
        }
    }

    URLHandler::URLHandler(const URLHandler& rhs)
        : m_handle(curl_url_dup(rhs.m_handle))
    {
        if (m_handle == nullptr)
        {
            throw std::bad_alloc();
        }
    }

    URLHandler& URLHandler::operator=(const URLHandler& rhs)
    {
        URLHandler tmp(rhs);
        std::swap(m_handle, tmp.m_handle);
        return *this;
    }

    URLHandler::URLHandler(URLHandler&& rhs) noexcept
        : m_handle(std::exchange(rhs.m_handle, nullptr))
    {
    }

    URLHandler& URLHandler::operator=(URLHandler&& rhs) noexcept
    {
        std::swap(m_handle, rhs.m_handle);
        return *this;
    }

    std::string URLHandler::get_part(CURLUPart part) const
    {
        char* value = nullptr;
        if (m_handle == nullptr || curl_url_get(m_handle, part, &value, 0) != CURLUE_OK)
        {
            return {};
        }
        std::string res(value);
        curl_free(value);
        return res;
    }

    std::string URLHandler::url() const
    {
        return get_part(CURLUPART_URL);
    }

    std::string URLHandler::scheme() const
    {
        return get_part(CURLUPART_SCHEME);
    }

    std::string URLHandler::host() const
    {
        return get_part(CURLUPART_HOST);
    }

    std::string URLHandler::path() const
    {
        return get_part(CURLUPART_PATH);
    }

    tl::expected<std::string, DownloaderError> URLHandler::resolve(
        const std::string& reference) const
    {
        // setting a relative URL on a handle holding an absolute one resolves it
        URLHandler resolved(*this);
        const CURLUcode uc = curl_url_set(resolved.m_handle, CURLUPART_URL, reference.c_str(), 0);
        if (uc != CURLUE_OK)
        {
            return tl::unexpected(DownloaderError{
                ErrorCode::kBAD_URL,
                fmt::format("Could not resolve '{}' against {}: {}",
                            reference,
                            url(),
                            curl_url_strerror(uc)) });
        }
        return resolved.url();
    }

    bool is_valid_url(const std::string& url)
    {
        try
        {
            URLHandler uh(url);
            return !uh.scheme().empty() && !uh.host().empty();
        }
        catch (const std::invalid_argument&)
        {
            return false;
        }
    }
}
