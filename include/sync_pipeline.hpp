#pragma once

#include <memory>
#include <string>

#include "config.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "process_lock.hpp"
#include "remote_file_lister.hpp"
#include "reporter.hpp"
#include "sync_outcome.hpp"

/**
 * How a run ended. Every value except Completed means the run stopped early
 * or its report was lost.
 */
enum class RunStatus
{
    Completed,           // All files processed, per-file errors included
    LockHeld,            // Another run holds the lock, nothing was touched
    LockFailed,          // Lock file unusable
    ConfigFailed,        // No usable configuration
    ReporterUnavailable, // Notification channel rejected us, nothing was touched
    ListingFailed,       // Remote file list unavailable, reported
    ReportFailed         // Work done but the report was not delivered
};

const char *toString(RunStatus status);

/**
 * Process exit code for a run status.
 */
int exitCode(RunStatus status);

// Exit code when a CleanupFault escaped the run
constexpr int CLEANUP_FAULT_EXIT_CODE = 8;

/**
 * Everything a run needs from the outside world, created only once the
 * lock is held.
 */
class SyncServices
{
public:
    virtual ~SyncServices() = default;

    /**
     * @throws ConfigError
     */
    virtual SyncConfig loadConfig() = 0;

    /**
     * Transport for the remote store, authenticated with the configured credentials.
     */
    virtual std::unique_ptr<HttpTransport> connectRemote(const SyncConfig &config) = 0;

    /**
     * Ready to use notification channel.
     *
     * @throws ReportError if the channel is unusable
     */
    virtual std::unique_ptr<Reporter> connectReporter(const SyncConfig &config) = 0;
};

/**
 * Production services: YAML configuration, libcurl, Telegram.
 */
class DefaultSyncServices : public SyncServices
{
public:
    explicit DefaultSyncServices(ConfigProvider &configProvider);

    SyncConfig loadConfig() override;
    std::unique_ptr<HttpTransport> connectRemote(const SyncConfig &config) override;
    std::unique_ptr<Reporter> connectReporter(const SyncConfig &config) override;

private:
    ConfigProvider &configProvider_;

    // Unauthenticated client behind the Telegram reporter
    std::unique_ptr<HttpClient> telegramClient_;
};

/**
 * One sync run: lock, configure, list, then download, commit and delete
 * each file, and finally report.
 *
 * Files are handled one at a time. A failing file is recorded and the run
 * moves on; a failing listing ends the run. A CleanupFault is not handled
 * and leaves run() after the lock has been released.
 */
class SyncPipeline
{
public:
    explicit SyncPipeline(SyncServices &services);

    /**
     * Execute a run under lock.
     * The lock is released before the report is sent, on every path.
     *
     * @throws CleanupFault
     */
    RunStatus run(ProcessLock &lock);

    /**
     * Outcome of the last run().
     */
    const SyncOutcome &outcome() const { return outcome_; }

private:
    SyncServices &services_;
    SyncOutcome outcome_;

    /**
     * Steps between lock acquisition and lock release.
     * Leaves the reporter in reporter when one could be connected.
     */
    RunStatus runLocked(std::unique_ptr<Reporter> &reporter);

    /**
     * Map, download, commit and delete one file.
     *
     * @throws SyncError subclasses for recordable failures
     */
    void syncFile(const RemoteFileRef &file, const SyncConfig &config,
                  HttpTransport &remote);

    void recordFailure(SyncStage stage, const RemoteFileRef &file, const SyncError &error);
};
