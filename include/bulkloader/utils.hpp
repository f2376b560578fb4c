#ifndef BULKLOADER_UTILS_HPP
#define BULKLOADER_UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include <bulkloader/export.hpp>
#include <bulkloader/enums.hpp>

namespace bulkloader
{
    namespace fs = std::filesystem;

    BULKLOADER_API void install_sig_handler();
    BULKLOADER_API bool is_sig_interrupted();

    BULKLOADER_API bool starts_with(const std::string_view& str, const std::string_view& prefix);

    BULKLOADER_API std::string string_transform(const std::string_view& input,
                                                int (*functor)(int));
    BULKLOADER_API std::string to_lower(const std::string_view& input);
    BULKLOADER_API std::string_view strip(const std::string_view& input);

    BULKLOADER_API std::pair<std::string, std::string> parse_header(
        const std::string_view& header);

    BULKLOADER_API
    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split = SIZE_MAX);

    BULKLOADER_API
    std::vector<std::string> rsplit(const std::string_view& input,
                                    const std::string_view& sep,
                                    std::size_t max_split = SIZE_MAX);

    BULKLOADER_API
    void replace_all(std::string& data, const std::string& search, const std::string& replace);

    // Reads a newline separated list of URLs, skipping blank lines, `#` comments and
    // invalid URLs.
    BULKLOADER_API tl::expected<std::vector<std::string>, std::string> read_url_list(
        const fs::path& path);

    BULKLOADER_API std::optional<FilenameTemplate> parse_filename_template(
        const std::string_view& name);

    BULKLOADER_API std::string filename_from_url(const std::string& url,
                                                 FilenameTemplate name_template
                                                 = FilenameTemplate::kDEFAULT);
}

#endif
