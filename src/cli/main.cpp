#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include <bulkloader/context.hpp>
#include <bulkloader/curl_transport.hpp>
#include <bulkloader/downloader.hpp>
#include <bulkloader/url.hpp>
#include <bulkloader/utils.hpp>

using namespace bulkloader;

struct CliOptions
{
    std::vector<std::string> urls;
    std::string url_file;
    std::string output = "./downloads";
    std::size_t concurrency = 3;
    long timeout = 30000;
    std::size_t retries = 3;
    long retry_delay = 1000;
    int max_redirects = 10;
    std::string filename_template = "default";
    std::string report;
    std::string config;
    bool disable_ssl = false;
    std::string cacert;
    std::vector<std::string> headers;
    bool verbose = false;
    bool no_progress = false;
};

static bool show_progress = true;

void
print_progress(const ProgressEvent& event)
{
    if (!show_progress || !event.total_bytes || !event.percent)
        return;

    const std::string name = rsplit(event.url, "/", 1).back();
    std::cout << fmt::format("\r{}: {:.0f}% ({:.2f}/{:.2f} MB)",
                             name,
                             event.percent.value(),
                             event.bytes_written / 1024.0 / 1024.0,
                             event.total_bytes.value() / 1024.0 / 1024.0);
    if (event.percent.value() >= 100.0)
        std::cout << "\n";
    std::cout.flush();
}

// Values of the config file are used for every option not given on the command line.
void
load_config(const std::string& file, const CLI::App& app, CliOptions& opts)
{
    spdlog::info("Loading config file {}", file);
    YAML::Node config = YAML::LoadFile(file);

    auto not_given = [&app](const std::string& name) { return app.count(name) == 0; };

    if (config["urls"] && not_given("--url"))
        opts.urls = config["urls"].as<std::vector<std::string>>();
    if (config["output"] && not_given("--output"))
        opts.output = config["output"].as<std::string>();
    if (config["concurrency"] && not_given("--concurrency"))
        opts.concurrency = config["concurrency"].as<std::size_t>();
    if (config["timeout"] && not_given("--timeout"))
        opts.timeout = config["timeout"].as<long>();
    if (config["retries"] && not_given("--retries"))
        opts.retries = config["retries"].as<std::size_t>();
    if (config["retry_delay"] && not_given("--retry-delay"))
        opts.retry_delay = config["retry_delay"].as<long>();
    if (config["max_redirects"] && not_given("--max-redirects"))
        opts.max_redirects = config["max_redirects"].as<int>();
    if (config["filename_template"] && not_given("--filename-template"))
        opts.filename_template = config["filename_template"].as<std::string>();
}

void
print_summary(const AggregateResult& result, const fs::path& output)
{
    const std::string rule(50, '=');
    std::cout << "\n" << rule << "\nDOWNLOAD SUMMARY\n" << rule << "\n";
    std::cout << "Successful: " << result.successful.size() << "\n";
    std::cout << "Failed: " << result.failed.size() << "\n";
    std::cout << "Output directory: " << fs::absolute(output).string() << "\n";

    if (!result.failed.empty())
    {
        std::cout << "\nFailed downloads:\n";
        for (const auto& failure : result.failed)
        {
            std::cout << "  - " << failure.url << ": " << failure.reason << "\n";
        }
    }
}

int
main(int argc, char** argv)
{
    CLI::App app{ "Download files from URLs with bounded concurrency and retries" };
    CliOptions opts;

    app.add_option("-u,--url", opts.urls, "URL to download (repeatable)");
    app.add_option("-f,--file", opts.url_file, "File containing URLs (one per line)");
    app.add_option("-o,--output", opts.output, "Output directory");
    app.add_option("-c,--concurrency", opts.concurrency, "Number of concurrent downloads")
        ->check(CLI::PositiveNumber);
    app.add_option("--timeout", opts.timeout, "Per attempt timeout in milliseconds");
    app.add_option("--retries", opts.retries, "Number of attempts per download")
        ->check(CLI::PositiveNumber);
    app.add_option("--retry-delay", opts.retry_delay, "Base delay between retries in milliseconds");
    app.add_option("--max-redirects", opts.max_redirects, "Maximum redirects, negative for no limit");
    app.add_option("--filename-template", opts.filename_template, "Filename generation template")
        ->check(CLI::IsMember({ "default", "domain-path", "timestamp" }));
    app.add_option("--report", opts.report, "Write a JSON report of the results");
    app.add_option("--config", opts.config, "YAML file with default options and urls");
    app.add_flag("-k", opts.disable_ssl, "Disable SSL verification");
    app.add_option("--cacert", opts.cacert, "CA bundle used to verify peers");
    app.add_option("-H,--header", opts.headers, "Additional HTTP header (repeatable)");
    app.add_flag("-v,--verbose", opts.verbose, "Enable verbose output");
    app.add_flag("--no-progress", opts.no_progress, "Do not print progress");

    CLI11_PARSE(app, argc, argv);

    try
    {
        Context ctx;
        if (opts.verbose)
        {
            ctx.set_verbosity(1);
        }
        show_progress = !opts.no_progress;
        ctx.disable_ssl = opts.disable_ssl;
        if (!opts.cacert.empty())
            ctx.ssl_ca_info = opts.cacert;
        ctx.additional_httpheaders = opts.headers;

        if (!opts.config.empty())
        {
            load_config(opts.config, app, opts);
        }

        std::vector<std::string> urls;
        for (const auto& url : opts.urls)
        {
            if (is_valid_url(url))
            {
                urls.push_back(url);
            }
            else
            {
                std::cerr << "Skipping invalid URL: " << url << std::endl;
            }
        }

        if (!opts.url_file.empty())
        {
            auto file_urls = read_url_list(opts.url_file);
            if (!file_urls)
            {
                std::cerr << "Error: " << file_urls.error() << std::endl;
                return 1;
            }
            urls.insert(urls.end(), file_urls.value().begin(), file_urls.value().end());
        }

        if (urls.empty())
        {
            std::cerr << "No URLs provided. Use --url or --file option." << std::endl;
            return 1;
        }

        const auto name_template = parse_filename_template(opts.filename_template);
        if (!name_template)
        {
            std::cerr << "Unknown filename template " << opts.filename_template << std::endl;
            return 1;
        }

        std::error_code ec;
        fs::create_directories(opts.output, ec);
        if (ec)
        {
            std::cerr << "Could not create " << opts.output << ": " << ec.message() << std::endl;
            return 1;
        }

        std::cout << "Found " << urls.size() << " URLs to download" << std::endl;

        DownloadOptions dl_options;
        dl_options.concurrency = opts.concurrency;
        dl_options.timeout = std::chrono::milliseconds(opts.timeout);
        dl_options.retry.max_retries = opts.retries;
        dl_options.retry.base_delay = std::chrono::milliseconds(opts.retry_delay);
        dl_options.max_redirects = opts.max_redirects;

        CurlTransport transport(ctx);
        Downloader downloader(transport, dl_options);
        downloader.set_progress_callback(print_progress);
        install_sig_handler();
        downloader.set_interrupt(is_sig_interrupted);

        const AggregateResult result
            = downloader.run(make_requests(urls, opts.output, name_template.value()));

        print_summary(result, opts.output);

        if (!opts.report.empty())
        {
            std::ofstream report(opts.report);
            if (!report)
            {
                std::cerr << "Could not write report " << opts.report << std::endl;
                return 1;
            }
            report << nlohmann::json(result).dump(4) << std::endl;
        }

        return result.ok() ? 0 : 1;
    }
    catch (const YAML::Exception& e)
    {
        spdlog::critical("Could not load config {}: {}", opts.config, e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Download failed: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
