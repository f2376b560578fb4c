#ifndef BULKLOADER_DOWNLOAD_REQUEST_HPP
#define BULKLOADER_DOWNLOAD_REQUEST_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <bulkloader/export.hpp>
#include <bulkloader/enums.hpp>

namespace bulkloader
{
    namespace fs = std::filesystem;

    struct BULKLOADER_API DownloadRequest
    {
        std::string url;
        fs::path destination_path;

        // Creates a request storing `url` inside `destination_dir`, the file name being derived
        // from the url with `name_template`.
        static DownloadRequest from_url(const std::string& url,
                                        const fs::path& destination_dir,
                                        FilenameTemplate name_template = FilenameTemplate::kDEFAULT);
    };

    // One request per url. Destinations colliding with an earlier one get a `_<n>` suffix
    // before their extension.
    BULKLOADER_API std::vector<DownloadRequest> make_requests(
        const std::vector<std::string>& urls,
        const fs::path& destination_dir,
        FilenameTemplate name_template = FilenameTemplate::kDEFAULT);

    struct ProgressEvent
    {
        std::string url;
        std::uintmax_t bytes_written = 0;
        std::optional<std::uintmax_t> total_bytes;
        std::optional<double> percent;
    };

    using progress_callback_t = std::function<void(const ProgressEvent&)>;
}

#endif
