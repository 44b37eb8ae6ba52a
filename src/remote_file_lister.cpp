#include "remote_file_lister.hpp"

#include <memory>
#include <stdexcept>

#include <fmt/core.h>
#include <json/json.h>
#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "remote_url.hpp"

RemoteFileLister::RemoteFileLister(HttpTransport &transport, std::string remote)
    : transport_(transport), remote_(std::move(remote))
{
}

std::vector<RemoteFileRef> RemoteFileLister::list()
{
    std::string url;
    try
    {
        url = RemoteUrl::join(remote_, "/fileinfo");
    }
    catch (const std::invalid_argument &e)
    {
        throw ListingError(e.what());
    }

    std::string body;
    if (!fetchString(transport_, url, body))
    {
        throw ListingError(fmt::format("failed to get fileinfo: {}", transport_.getLastError()));
    }

    std::vector<RemoteFileRef> files = parse(body);
    spdlog::info("Remote store lists {} file(s)", files.size());
    return files;
}

std::vector<RemoteFileRef> RemoteFileLister::parse(const std::string &body)
{
    // Strict: no comments, no trailing data after the array
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors))
    {
        throw ListingError(fmt::format("couldn't parse json: {}", errors));
    }

    if (!root.isArray())
    {
        throw ListingError("couldn't parse json: fileinfo is not an array");
    }

    std::vector<RemoteFileRef> files;
    files.reserve(root.size());

    for (Json::ArrayIndex i = 0; i < root.size(); ++i)
    {
        const Json::Value &entry = root[i];
        if (!entry.isObject() || !entry.isMember("web_path") || !entry["web_path"].isString())
        {
            throw ListingError(
                fmt::format("couldn't parse json: entry {} has no string web_path", i));
        }
        files.push_back(RemoteFileRef{entry["web_path"].asString()});
    }

    return files;
}
