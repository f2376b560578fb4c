#include <stdexcept>

#include <bulkloader/result.hpp>

namespace bulkloader
{
    void ResultAggregator::record(const DownloadRequest& request, const task_outcome_t& outcome)
    {
        if (m_finalized)
        {
            throw std::logic_error("result aggregator already finalized");
        }

        if (outcome)
        {
            m_result.successful.push_back(
                DownloadSuccess{ request.url, request.destination_path, outcome.value() });
        }
        else
        {
            m_result.failed.push_back(
                DownloadFailure{ request.url, outcome.error().reason, outcome.error().code });
        }
    }

    AggregateResult ResultAggregator::finalize()
    {
        if (m_finalized)
        {
            throw std::logic_error("result aggregator already finalized");
        }
        m_finalized = true;
        return std::move(m_result);
    }

    void to_json(nlohmann::json& j, const AggregateResult& result)
    {
        j = nlohmann::json::object();
        j["successful"] = nlohmann::json::array();
        j["failed"] = nlohmann::json::array();

        for (const auto& success : result.successful)
        {
            j["successful"].push_back(
                { { "url", success.url }, { "path", success.path.string() }, { "size", success.bytes } });
        }
        for (const auto& failure : result.failed)
        {
            j["failed"].push_back({ { "url", failure.url },
                                    { "error", failure.reason },
                                    { "code", to_string(failure.code) } });
        }
    }
}
