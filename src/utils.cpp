#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <fstream>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <bulkloader/url.hpp>
#include <bulkloader/utils.hpp>

namespace bulkloader
{
    namespace
    {
        volatile std::sig_atomic_t sig_interrupted = 0;

        void on_sigint(int)
        {
            sig_interrupted = 1;
        }

        long long epoch_ms()
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }
    }

    void install_sig_handler()
    {
        sig_interrupted = 0;
        std::signal(SIGINT, on_sigint);
    }

    bool is_sig_interrupted()
    {
        return sig_interrupted != 0;
    }

    bool starts_with(const std::string_view& str, const std::string_view& prefix)
    {
        return str.size() >= prefix.size() && 0 == str.compare(0, prefix.size(), prefix);
    }

    std::string string_transform(const std::string_view& input, int (*functor)(int))
    {
        std::string res(input);
        std::transform(
            res.begin(), res.end(), res.begin(), [&](unsigned char c) { return functor(c); });
        return res;
    }

    std::string to_lower(const std::string_view& input)
    {
        return string_transform(input, std::tolower);
    }

    std::string_view strip(const std::string_view& input)
    {
        const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)); };
        std::size_t start = 0, end = input.size();
        while (start < end && is_space(input[start]))
            ++start;
        while (end > start && is_space(input[end - 1]))
            --end;
        return input.substr(start, end - start);
    }

    std::pair<std::string, std::string> parse_header(const std::string_view& header)
    {
        auto colon_idx = header.find(':');
        if (colon_idx != std::string_view::npos)
        {
            std::string_view key = header.substr(0, colon_idx);
            // removes the spaces around the value and the \r\n header ending
            std::string_view value = strip(header.substr(colon_idx + 1));
            // http headers are case insensitive!
            return std::make_pair(to_lower(strip(key)), std::string(value));
        }
        return std::make_pair(std::string(), std::string(header));
    }

    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split)
    {
        std::vector<std::string> result;
        std::size_t i = 0, j = 0, len = input.size(), n = sep.size();

        while (i + n <= len)
        {
            if (input[i] == sep[0] && input.substr(i, n) == sep)
            {
                if (max_split-- <= 0)
                    break;
                result.emplace_back(input.substr(j, i - j));
                i = j = i + n;
            }
            else
            {
                i++;
            }
        }
        result.emplace_back(input.substr(j, len - j));
        return result;
    }

    std::vector<std::string> rsplit(const std::string_view& input,
                                    const std::string_view& sep,
                                    std::size_t max_split)
    {
        if (max_split == SIZE_MAX)
            return split(input, sep, max_split);

        std::vector<std::string> result;

        std::ptrdiff_t i, j, len = static_cast<std::ptrdiff_t>(input.size()),
                             n = static_cast<std::ptrdiff_t>(sep.size());
        i = j = len;

        while (i >= n)
        {
            if (input[i - 1] == sep[n - 1] && input.substr(i - n, n) == sep)
            {
                if (max_split-- <= 0)
                {
                    break;
                }
                result.emplace_back(input.substr(i, j - i));
                i = j = i - n;
            }
            else
            {
                i--;
            }
        }
        result.emplace_back(input.substr(0, j));
        std::reverse(result.begin(), result.end());

        return result;
    }

    void replace_all(std::string& data, const std::string& search, const std::string& replace)
    {
        std::size_t pos = data.find(search);
        while (pos != std::string::npos)
        {
            data.replace(pos, search.size(), replace);
            pos = data.find(search, pos + replace.size());
        }
    }

    tl::expected<std::vector<std::string>, std::string> read_url_list(const fs::path& path)
    {
        std::ifstream infile(path);
        if (!infile)
        {
            return tl::unexpected(fmt::format("Could not open URL list {}", path.string()));
        }

        std::vector<std::string> urls;
        std::string line;
        while (std::getline(infile, line))
        {
            const auto url = strip(line);
            if (url.empty() || url.front() == '#')
                continue;

            if (!is_valid_url(std::string(url)))
            {
                spdlog::warn("Skipping invalid URL: {}", url);
                continue;
            }
            urls.emplace_back(url);
        }
        return urls;
    }

    std::optional<FilenameTemplate> parse_filename_template(const std::string_view& name)
    {
        if (name == "default")
            return FilenameTemplate::kDEFAULT;
        if (name == "domain-path")
            return FilenameTemplate::kDOMAIN_PATH;
        if (name == "timestamp")
            return FilenameTemplate::kTIMESTAMP;
        return std::nullopt;
    }

    std::string filename_from_url(const std::string& url, FilenameTemplate name_template)
    {
        URLHandler uh(url);
        const std::string path = uh.path();
        const std::string basename = rsplit(path, "/", 1).back();

        switch (name_template)
        {
            case FilenameTemplate::kDOMAIN_PATH:
            {
                std::string flat_path = path;
                replace_all(flat_path, "/", "_");
                if (starts_with(flat_path, "_"))
                    flat_path.erase(0, 1);
                return uh.host() + flat_path;
            }
            case FilenameTemplate::kTIMESTAMP:
            {
                std::string ext = fs::path(basename).extension().string();
                if (ext.empty())
                    ext = ".bin";
                return fmt::format("file_{}{}", epoch_ms(), ext);
            }
            case FilenameTemplate::kDEFAULT:
                break;
        }

        if (basename.empty())
            return fmt::format("download_{}.bin", epoch_ms());
        return basename;
    }
}
