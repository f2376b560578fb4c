#ifndef BULKLOADER_URL_HPP
#define BULKLOADER_URL_HPP

#include <string>

#include <tl/expected.hpp>

extern "C"
{
#include <curl/curl.h>
}

#include <bulkloader/export.hpp>
#include <bulkloader/errors.hpp>

namespace bulkloader
{
    // Thin owner of a libcurl URL handle.
    // Construction throws `std::invalid_argument` when `url` cannot be parsed.
    class BULKLOADER_API URLHandler
    {
    public:
        explicit URLHandler(const std::string& url);
        ~URLHandler();

        URLHandler(const URLHandler&);
        URLHandler& operator=(const URLHandler&);
        URLHandler(URLHandler&&) noexcept;
        URLHandler& operator=(URLHandler&&) noexcept;

        std::string url() const;
        std::string scheme() const;
        std::string host() const;
        std::string path() const;

        // Resolves `reference` (absolute or relative, e.g. a Location header) against this URL.
        tl::expected<std::string, DownloaderError> resolve(const std::string& reference) const;

    private:
        std::string get_part(CURLUPart part) const;

        CURLU* m_handle = nullptr;
    };

    // True for absolute URLs with a scheme and a host.
    BULKLOADER_API bool is_valid_url(const std::string& url);
}

#endif
