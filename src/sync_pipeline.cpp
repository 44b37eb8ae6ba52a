#include "sync_pipeline.hpp"

#include <filesystem>
#include <stdexcept>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "atomic_downloader.hpp"
#include "errors.hpp"
#include "path_mapper.hpp"
#include "remote_deleter.hpp"
#include "remote_url.hpp"

namespace
{
    // Releases the run lock when the locked section is left, exceptions included
    class LockRelease
    {
    public:
        explicit LockRelease(ProcessLock &lock) : lock_(lock) {}

        ~LockRelease()
        {
            if (!lock_.release())
            {
                spdlog::warn("Can't unlock {}: {}", lock_.path().string(), lock_.getLastError());
            }
        }

        LockRelease(const LockRelease &) = delete;
        LockRelease &operator=(const LockRelease &) = delete;

    private:
        ProcessLock &lock_;
    };

    // Name reported for a downloaded file: last element of its web path
    std::string baseName(const std::string &webPath)
    {
        return std::filesystem::path(RemoteUrl::cleanPath(webPath)).filename().string();
    }
}

const char *toString(RunStatus status)
{
    switch (status)
    {
    case RunStatus::Completed:
        return "completed";
    case RunStatus::LockHeld:
        return "lock held by another run";
    case RunStatus::LockFailed:
        return "lock failed";
    case RunStatus::ConfigFailed:
        return "configuration failed";
    case RunStatus::ReporterUnavailable:
        return "reporter unavailable";
    case RunStatus::ListingFailed:
        return "listing failed";
    case RunStatus::ReportFailed:
        return "report failed";
    }
    return "unknown";
}

int exitCode(RunStatus status)
{
    switch (status)
    {
    case RunStatus::Completed:
        return 0;
    case RunStatus::LockHeld:
        return 2;
    case RunStatus::LockFailed:
        return 3;
    case RunStatus::ConfigFailed:
        return 4;
    case RunStatus::ReporterUnavailable:
        return 5;
    case RunStatus::ListingFailed:
        return 6;
    case RunStatus::ReportFailed:
        return 7;
    }
    return 1;
}

DefaultSyncServices::DefaultSyncServices(ConfigProvider &configProvider)
    : configProvider_(configProvider)
{
}

SyncConfig DefaultSyncServices::loadConfig()
{
    return configProvider_.load();
}

std::unique_ptr<HttpTransport> DefaultSyncServices::connectRemote(const SyncConfig &config)
{
    auto client = std::make_unique<HttpClient>();
    client->setBasicAuth(config.userName, config.password);
    return client;
}

std::unique_ptr<Reporter> DefaultSyncServices::connectReporter(const SyncConfig &config)
{
    telegramClient_ = std::make_unique<HttpClient>();

    auto reporter = std::make_unique<TelegramReporter>(*telegramClient_, config.telegram.token,
                                                       config.telegram.chatId);
    reporter->verify();
    return reporter;
}

SyncPipeline::SyncPipeline(SyncServices &services) : services_(services)
{
}

RunStatus SyncPipeline::run(ProcessLock &lock)
{
    outcome_ = SyncOutcome();

    bool acquired = false;
    try
    {
        acquired = lock.tryAcquire();
    }
    catch (const LockError &e)
    {
        spdlog::error("{}", e.what());
        return RunStatus::LockFailed;
    }

    if (!acquired)
    {
        spdlog::error("Can't lock {}: another run is in progress", lock.path().string());
        return RunStatus::LockHeld;
    }

    std::unique_ptr<Reporter> reporter;
    RunStatus status;
    {
        LockRelease release(lock);
        status = runLocked(reporter);
    }

    // Without a reporter there is nobody to tell, the log has it all
    if (!reporter)
    {
        return status;
    }

    try
    {
        flushReport(*reporter, outcome_);
    }
    catch (const ReportError &e)
    {
        spdlog::error("Can't deliver report: {}", e.what());
        return RunStatus::ReportFailed;
    }

    return status;
}

RunStatus SyncPipeline::runLocked(std::unique_ptr<Reporter> &reporter)
{
    SyncConfig config;
    try
    {
        config = services_.loadConfig();
    }
    catch (const ConfigError &e)
    {
        spdlog::error("Can't get configuration: {}", e.what());
        return RunStatus::ConfigFailed;
    }

    try
    {
        reporter = services_.connectReporter(config);
    }
    catch (const ReportError &e)
    {
        spdlog::error("Can't send telegram messages: {}", e.what());
        return RunStatus::ReporterUnavailable;
    }

    std::unique_ptr<HttpTransport> remote = services_.connectRemote(config);

    std::vector<RemoteFileRef> files;
    try
    {
        files = RemoteFileLister(*remote, config.remote).list();
    }
    catch (const ListingError &e)
    {
        std::string message = fmt::format("couldn't get file list: {}", e.what());
        spdlog::error("{}", message);
        outcome_.addError(SyncFailure{SyncStage::Listing, "", message});
        return RunStatus::ListingFailed;
    }

    for (const auto &file : files)
    {
        try
        {
            syncFile(file, config, *remote);
            outcome_.addFile(baseName(file.webPath));
        }
        catch (const MappingError &e)
        {
            recordFailure(SyncStage::Mapping, file, e);
        }
        catch (const DownloadError &e)
        {
            recordFailure(SyncStage::Download, file, e);
        }
        catch (const DeleteError &e)
        {
            recordFailure(SyncStage::Delete, file, e);
        }
    }

    return RunStatus::Completed;
}

void SyncPipeline::recordFailure(SyncStage stage, const RemoteFileRef &file, const SyncError &error)
{
    spdlog::warn("{} failed for {}: {}", toString(stage), file.webPath, error.what());
    outcome_.addError(SyncFailure{stage, file.webPath, error.what()});
}

void SyncPipeline::syncFile(const RemoteFileRef &file, const SyncConfig &config, HttpTransport &remote)
{
    // One cleaned path drives both the URL and the local file
    std::string webPath = RemoteUrl::cleanPath(file.webPath);

    auto localFile = PathMapper::resolve(webPath, config.rootMapping);
    if (!localFile)
    {
        throw MappingError(fmt::format("couldn't find config for remote file: {}", file.webPath));
    }

    std::string url;
    try
    {
        url = RemoteUrl::join(config.remote, webPath);
    }
    catch (const std::invalid_argument &e)
    {
        throw DownloadError(e.what());
    }

    AtomicDownloader(remote).download(url, *localFile);
    spdlog::info("Stored {} as {}", file.webPath, localFile->string());

    // The local copy stays even if the remote one can't be removed
    RemoteDeleter(remote).remove(url);
}
