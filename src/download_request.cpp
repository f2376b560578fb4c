#include <set>

#include <spdlog/fmt/fmt.h>

#include <bulkloader/download_request.hpp>
#include <bulkloader/utils.hpp>

namespace bulkloader
{
    namespace
    {
        // `name.ext`, then `name_1.ext`, `name_2.ext`, ... until unused
        fs::path unique_destination(const fs::path& destination, std::set<fs::path>& taken)
        {
            fs::path candidate = destination;
            for (std::size_t n = 1; !taken.insert(candidate.lexically_normal()).second; ++n)
            {
                candidate = destination.parent_path()
                            / fmt::format("{}_{}{}",
                                          destination.stem().string(),
                                          n,
                                          destination.extension().string());
            }
            return candidate;
        }
    }

    DownloadRequest DownloadRequest::from_url(const std::string& url,
                                              const fs::path& destination_dir,
                                              FilenameTemplate name_template)
    {
        return DownloadRequest{ url, destination_dir / filename_from_url(url, name_template) };
    }

    std::vector<DownloadRequest> make_requests(const std::vector<std::string>& urls,
                                               const fs::path& destination_dir,
                                               FilenameTemplate name_template)
    {
        std::vector<DownloadRequest> requests;
        requests.reserve(urls.size());
        std::set<fs::path> taken;
        for (const auto& url : urls)
        {
            DownloadRequest request = DownloadRequest::from_url(url, destination_dir, name_template);
            request.destination_path = unique_destination(request.destination_path, taken);
            requests.push_back(std::move(request));
        }
        return requests;
    }
}
