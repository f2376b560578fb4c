#ifndef BULKLOADER_CONTEXT_HPP
#define BULKLOADER_CONTEXT_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <bulkloader/export.hpp>

namespace bulkloader
{
    namespace fs = std::filesystem;

    // Process wide settings of the curl based transport.
    class BULKLOADER_API Context
    {
    public:
        int verbosity = 0;

        // ssl options
        bool disable_ssl = false;
        fs::path ssl_ca_info;

        // A body that transfers less than `low_speed_limit` bytes/s during `low_speed_time`
        // seconds is reported as a timeout.
        long low_speed_time = 30L;
        long low_speed_limit = 1L;

        long transfer_buffersize = 100 * 1024;

        std::string user_agent = "bulkloader";
        std::vector<std::string> additional_httpheaders;

        void set_verbosity(int v);

        // Throws if another instance already exists: there can only be one at any time!
        Context();
        ~Context();

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;
        Context(Context&&) = delete;
        Context& operator=(Context&&) = delete;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl;  // Private implementation details
    };
}

#endif
