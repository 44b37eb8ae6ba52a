#include "config.hpp"

#include <cstdlib>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "errors.hpp"
#include "remote_url.hpp"

namespace YAML
{
    template <>
    struct convert<PathMapping>
    {
        static bool decode(const Node &node, PathMapping &rhs)
        {
            if (!node.IsMap() || !node["remotepath"] || !node["localpath"])
                return false;
            rhs.remotePath = node["remotepath"].as<std::string>();
            rhs.localPath = node["localpath"].as<std::string>();
            return true;
        }
    };

    template <>
    struct convert<TelegramConfig>
    {
        static bool decode(const Node &node, TelegramConfig &rhs)
        {
            if (!node.IsMap())
                return false;
            rhs.token = node["token"].as<std::string>("");
            // as<T>(fallback) would hide a malformed id, convert strictly
            if (node["chatid"])
                rhs.chatId = node["chatid"].as<std::int64_t>();
            return true;
        }
    };
}

namespace
{
    constexpr const char *CONFIG_NAME = "clientconfig";

    SyncConfig fromNode(const YAML::Node &root)
    {
        if (!root.IsMap())
        {
            throw ConfigError("configuration must be a mapping");
        }

        SyncConfig cfg;
        cfg.remote = root["remote"].as<std::string>("");
        cfg.userName = root["username"].as<std::string>("");
        cfg.password = root["password"].as<std::string>("");

        if (auto node = root["rootmapping"])
        {
            if (!node.IsSequence())
            {
                throw ConfigError("rootmapping must be a list");
            }
            for (const auto &entry : node)
            {
                try
                {
                    cfg.rootMapping.push_back(entry.as<PathMapping>());
                }
                catch (const YAML::BadConversion &)
                {
                    throw ConfigError(fmt::format(
                        "rootmapping entry {} needs both remotepath and localpath", cfg.rootMapping.size()));
                }
            }
        }

        if (auto node = root["telegram"])
        {
            try
            {
                cfg.telegram = node.as<TelegramConfig>();
            }
            catch (const YAML::BadConversion &e)
            {
                throw ConfigError(fmt::format("invalid telegram section: {}", e.what()));
            }
        }

        if (cfg.remote.empty())
        {
            throw ConfigError("remote is not set");
        }
        if (!RemoteUrl::isAbsolute(cfg.remote))
        {
            throw ConfigError(fmt::format("remote '{}' is not an absolute URL", cfg.remote));
        }

        return cfg;
    }
}

YamlConfigProvider::YamlConfigProvider(std::optional<std::filesystem::path> configFile)
    : configFile_(std::move(configFile))
{
}

std::vector<std::filesystem::path> YamlConfigProvider::searchPaths()
{
    std::vector<std::filesystem::path> paths{".", "/etc/mediasync"};

    if (const char *home = std::getenv("HOME"))
    {
        paths.emplace_back(std::filesystem::path(home) / ".config" / "mediasync");
    }
    return paths;
}

std::filesystem::path YamlConfigProvider::locate() const
{
    if (configFile_)
    {
        return *configFile_;
    }

    for (const auto &dir : searchPaths())
    {
        for (const char *ext : {".yaml", ".yml"})
        {
            std::filesystem::path candidate = dir / (std::string(CONFIG_NAME) + ext);
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec))
            {
                return candidate;
            }
        }
    }

    throw ConfigError(fmt::format("no {}.yaml found in ., /etc/mediasync or ~/.config/mediasync",
                                  CONFIG_NAME));
}

SyncConfig YamlConfigProvider::load()
{
    std::filesystem::path path = locate();
    spdlog::debug("Reading configuration from {}", path.string());

    try
    {
        return fromNode(YAML::LoadFile(path.string()));
    }
    catch (const YAML::Exception &e)
    {
        throw ConfigError(fmt::format("can't read {}: {}", path.string(), e.what()));
    }
}

SyncConfig YamlConfigProvider::parse(const std::string &yaml)
{
    try
    {
        return fromNode(YAML::Load(yaml));
    }
    catch (const YAML::Exception &e)
    {
        throw ConfigError(fmt::format("invalid configuration: {}", e.what()));
    }
}
