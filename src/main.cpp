#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "config.hpp"
#include "errors.hpp"
#include "process_lock.hpp"
#include "sync_pipeline.hpp"

namespace
{
    constexpr const char *VERSION = "1.0.0";

    // libcurl global state for the lifetime of main()
    class CurlGlobal
    {
    public:
        CurlGlobal() : rc_(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
        ~CurlGlobal()
        {
            if (rc_ == CURLE_OK)
                curl_global_cleanup();
        }

        CurlGlobal(const CurlGlobal &) = delete;
        CurlGlobal &operator=(const CurlGlobal &) = delete;

        CURLcode result() const { return rc_; }

    private:
        CURLcode rc_;
    };
}

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v")
        {
            fmt::print("mediasync v{}\n", VERSION);
            fmt::print("Built with:\n");
            fmt::print("  - libcurl {}: HTTP/HTTPS support\n", curl_version_info(CURLVERSION_NOW)->version);
            fmt::print("  - CLI11: Command-line parsing\n");
            fmt::print("  - yaml-cpp: Configuration\n");
            fmt::print("  - spdlog: Logging\n");
            return 0;
        }
    }

    CLI::App app{"mediasync - moves media from a remote store to local storage"};

    CliOptions options;

    app.add_option("-c,--config", options.configFile,
                   "Configuration file (default: first clientconfig.yaml in ., /etc/mediasync, ~/.config/mediasync)")
        ->check(CLI::ExistingFile);

    app.add_option("-l,--lock-file", options.lockFile, "Lock file that keeps runs from overlapping")
        ->default_val(options.lockFile);

    app.add_flag("--verbose", options.verbose, "Log requests and temporary files");

    // For help display only, actual handling is done above
    app.add_flag("-v,--version", options.showVersion, "Display version information");

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    auto logger = spdlog::stderr_color_mt("mediasync");
    spdlog::set_default_logger(logger);
    spdlog::set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);

    CurlGlobal curl;
    if (curl.result() != CURLE_OK)
    {
        spdlog::critical("Can't initialize libcurl: {}", curl_easy_strerror(curl.result()));
        return 1;
    }

    try
    {
        std::optional<std::filesystem::path> configFile;
        if (options.configFile)
        {
            configFile = *options.configFile;
        }

        YamlConfigProvider configProvider(configFile);
        DefaultSyncServices services(configProvider);
        ProcessLock lock(options.lockFile);

        spdlog::info("Starting sync run");
        SyncPipeline pipeline(services);
        RunStatus status = pipeline.run(lock);

        const SyncOutcome &outcome = pipeline.outcome();
        spdlog::info("Run {}: {} file(s) downloaded, {} error(s)",
                     toString(status), outcome.files().size(), outcome.errors().size());
        return exitCode(status);
    }
    catch (const CleanupFault &e)
    {
        spdlog::critical("Filesystem in an unknown state: {}", e.what());
        return CLEANUP_FAULT_EXIT_CODE;
    }
    catch (const std::exception &e)
    {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
