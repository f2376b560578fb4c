#ifndef BULKLOADER_RESULT_HPP
#define BULKLOADER_RESULT_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <bulkloader/export.hpp>
#include <bulkloader/download_request.hpp>
#include <bulkloader/download_task.hpp>
#include <bulkloader/enums.hpp>

namespace bulkloader
{
    namespace fs = std::filesystem;

    struct DownloadSuccess
    {
        std::string url;
        fs::path path;
        std::uintmax_t bytes = 0;
    };

    struct DownloadFailure
    {
        std::string url;
        std::string reason;
        ErrorCode code;
    };

    // Terminal outcome of every request of a run, in completion order.
    struct BULKLOADER_API AggregateResult
    {
        std::vector<DownloadSuccess> successful;
        std::vector<DownloadFailure> failed;

        bool ok() const noexcept
        {
            return failed.empty();
        }

        std::size_t size() const noexcept
        {
            return successful.size() + failed.size();
        }
    };

    BULKLOADER_API void to_json(nlohmann::json& j, const AggregateResult& result);

    // Collects the terminal outcomes of a run. `finalize()` hands the result over, the
    // aggregator cannot be used afterwards.
    class BULKLOADER_API ResultAggregator
    {
    public:
        void record(const DownloadRequest& request, const task_outcome_t& outcome);
        AggregateResult finalize();

        std::size_t recorded() const noexcept
        {
            return m_result.size();
        }

    private:
        AggregateResult m_result;
        bool m_finalized = false;
    };
}

#endif
