#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "path_mapper.hpp"

/**
 * Telegram bot used for run reports.
 */
struct TelegramConfig
{
    std::string token;
    std::int64_t chatId = 0;
};

/**
 * Settings of one sync run, loaded from clientconfig.yaml.
 */
struct SyncConfig
{
    // Absolute base URL of the media store, e.g. "https://media.example.org/sync"
    std::string remote;

    // Basic auth credentials for the media store
    std::string userName;
    std::string password;

    // Evaluated in declared order, see PathMapper::resolve
    std::vector<PathMapping> rootMapping;

    TelegramConfig telegram;
};

/**
 * Command line of the mediasync executable.
 * Populated by CLI11 argument parser from command-line arguments.
 */
struct CliOptions
{
    std::optional<std::string> configFile; // Search ConfigProvider paths when unset
    std::string lockFile = "/tmp/mediasync.lock";
    bool verbose = false;
    bool showVersion = false;
};

/**
 * Source of the run configuration.
 */
class ConfigProvider
{
public:
    virtual ~ConfigProvider() = default;

    /**
     * @throws ConfigError if no valid configuration can be produced
     */
    virtual SyncConfig load() = 0;
};

/**
 * Reads the configuration from a YAML file.
 *
 * Without an explicit file, the first clientconfig.yaml (or .yml) found in
 * ".", "/etc/mediasync" and "~/.config/mediasync" is used.
 *
 * Layout:
 *   remote: https://media.example.org/sync
 *   username: alice
 *   password: secret
 *   rootmapping:
 *     - remotepath: /tv
 *       localpath: /srv/media/tv
 *   telegram:
 *     token: "123:abc"
 *     chatid: 42
 */
class YamlConfigProvider : public ConfigProvider
{
public:
    explicit YamlConfigProvider(std::optional<std::filesystem::path> configFile = std::nullopt);

    SyncConfig load() override;

    /**
     * Parse a configuration document. Exposed for tests.
     *
     * @throws ConfigError on YAML syntax errors or invalid settings
     */
    static SyncConfig parse(const std::string &yaml);

    /**
     * Directories searched for clientconfig.yaml, in priority order.
     */
    static std::vector<std::filesystem::path> searchPaths();

private:
    std::optional<std::filesystem::path> configFile_;

    std::filesystem::path locate() const;
};
