#include <bulkloader/transport.hpp>
#include <bulkloader/utils.hpp>

namespace bulkloader
{
    std::optional<std::string> ResponseHead::get_header(const std::string& name) const
    {
        auto it = headers.find(to_lower(name));
        if (it == headers.end())
            return std::nullopt;
        return it->second;
    }
}
