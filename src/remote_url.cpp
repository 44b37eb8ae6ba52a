#include "remote_url.hpp"

#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <curl/curl.h>
#include <fmt/core.h>

namespace
{
    using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

    // Frees strings returned by curl_url_get
    struct CurlStringDeleter
    {
        void operator()(char *p) const { curl_free(p); }
    };
    using CurlString = std::unique_ptr<char, CurlStringDeleter>;

    UrlHandle parse(const std::string &url, CURLUcode &rc)
    {
        UrlHandle handle(curl_url(), curl_url_cleanup);
        if (!handle)
        {
            rc = CURLUE_OUT_OF_MEMORY;
            return handle;
        }
        rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0);
        return handle;
    }

    CurlString getPart(CURLU *handle, CURLUPart part, unsigned int flags, CURLUcode &rc)
    {
        char *value = nullptr;
        rc = curl_url_get(handle, part, &value, flags);
        return CurlString(value);
    }
}

bool RemoteUrl::isAbsolute(const std::string &url)
{
    CURLUcode rc;
    UrlHandle handle = parse(url, rc);
    if (rc != CURLUE_OK)
    {
        return false;
    }

    CurlString host = getPart(handle.get(), CURLUPART_HOST, 0, rc);
    return rc == CURLUE_OK && host && *host.get() != '\0';
}

std::string RemoteUrl::cleanPath(const std::string &path)
{
    std::vector<std::string> segments;
    std::istringstream stream(path);
    std::string segment;

    while (std::getline(stream, segment, '/'))
    {
        if (segment.empty() || segment == ".")
        {
            continue;
        }
        if (segment == "..")
        {
            // ".." at the root stays at the root
            if (!segments.empty())
            {
                segments.pop_back();
            }
            continue;
        }
        segments.push_back(segment);
    }

    std::string cleaned;
    for (const auto &s : segments)
    {
        cleaned += '/';
        cleaned += s;
    }
    return cleaned.empty() ? "/" : cleaned;
}

std::string RemoteUrl::join(const std::string &base, const std::string &subPath)
{
    CURLUcode rc;
    UrlHandle handle = parse(base, rc);
    if (rc != CURLUE_OK)
    {
        throw std::invalid_argument(
            fmt::format("can't parse remote '{}': {}", base, curl_url_strerror(rc)));
    }

    // Work on the decoded path so existing escapes are not encoded twice
    CurlString basePath = getPart(handle.get(), CURLUPART_PATH, CURLU_URLDECODE, rc);
    if (rc != CURLUE_OK || !basePath)
    {
        throw std::invalid_argument(
            fmt::format("can't read path of remote '{}': {}", base, curl_url_strerror(rc)));
    }

    std::string joined = cleanPath(std::string(basePath.get()) + "/" + subPath);

    rc = curl_url_set(handle.get(), CURLUPART_PATH, joined.c_str(), CURLU_URLENCODE);
    if (rc != CURLUE_OK)
    {
        throw std::invalid_argument(
            fmt::format("can't set path '{}' on remote '{}': {}", joined, base, curl_url_strerror(rc)));
    }

    CurlString url = getPart(handle.get(), CURLUPART_URL, 0, rc);
    if (rc != CURLUE_OK || !url)
    {
        throw std::invalid_argument(
            fmt::format("can't build URL from remote '{}': {}", base, curl_url_strerror(rc)));
    }
    return std::string(url.get());
}
