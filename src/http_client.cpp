#include "http_client.hpp"

#include <stdexcept>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

bool fetchString(HttpTransport &transport, const std::string &url, std::string &out)
{
    out.clear();
    return transport.get(url, [&out](const char *data, size_t size)
                         {
                             out.append(data, size);
                             return true;
                         });
}

HttpClient::HttpClient() : curl_(curl_easy_init(), curl_easy_cleanup)
{
    if (!curl_)
    {
        lastError_ = "Failed to initialized CURL (out of memory or library error)";
        throw std::runtime_error(lastError_);
    }
}

// Destructor: unique_ptr handles cleanup automatically
HttpClient::~HttpClient() = default;

void HttpClient::setBasicAuth(const std::string &userName, const std::string &password)
{
    useAuth_ = true;
    userName_ = userName;
    password_ = password;
}

// Static callback: libcurl calls this with chunks of downloaded data
size_t HttpClient::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    size_t totalSize = size * nmemb;

    // userdata is the BodySink of the running request
    auto *sink = static_cast<const BodySink *>(userdata);

    try
    {
        if (!(*sink)(ptr, totalSize))
        {
            return 0; // Abort transfer, curl reports CURLE_WRITE_ERROR
        }
    }
    catch (const std::exception &e)
    {
        // Exceptions must not unwind through libcurl
        spdlog::debug("Response sink failed: {}", e.what());
        return 0;
    }

    return totalSize;
}

void HttpClient::prepare(const std::string &url)
{
    // Start every request from a clean option set; the connection cache survives the reset
    curl_easy_reset(curl_.get());

    curl_easy_setopt(curl_.get(), CURLOPT_URL, url.c_str());

    // Some servers block requests without a user agent
    curl_easy_setopt(curl_.get(), CURLOPT_USERAGENT, "mediasync/1.0");

    curl_easy_setopt(curl_.get(), CURLOPT_SSL_VERIFYPEER, 1L); // Verify server certificate
    curl_easy_setopt(curl_.get(), CURLOPT_SSL_VERIFYHOST, 2L); // Verify hostname matches cert

    curl_easy_setopt(curl_.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_.get(), CURLOPT_MAXREDIRS, 5L);

    if (useAuth_)
    {
        curl_easy_setopt(curl_.get(), CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl_.get(), CURLOPT_USERNAME, userName_.c_str());
        curl_easy_setopt(curl_.get(), CURLOPT_PASSWORD, password_.c_str());
    }
}

bool HttpClient::perform(const char *method, const std::string &url)
{
    spdlog::debug("{} {}", method, url);

    // Truncated bodies (Content-Length mismatch) end with CURLE_PARTIAL_FILE
    CURLcode res = curl_easy_perform(curl_.get());
    if (res != CURLE_OK && res != CURLE_HTTP_RETURNED_ERROR)
    {
        lastError_ = fmt::format("{} {} failed: {}", method, url, curl_easy_strerror(res));
        return false;
    }

    long httpCode = 0;
    curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &httpCode);

    if (httpCode < 200 || httpCode >= 300)
    {
        lastError_ = fmt::format("{} {} failed: HTTP error {}: {}",
                                 method, url, httpCode, getHttpStatusText(httpCode));
        return false;
    }

    lastError_.clear();
    return true;
}

bool HttpClient::get(const std::string &url, const BodySink &sink)
{
    prepare(url);

    curl_easy_setopt(curl_.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, &sink);

    // Do not hand error pages to the sink
    curl_easy_setopt(curl_.get(), CURLOPT_FAILONERROR, 1L);

    return perform("GET", url);
}

bool HttpClient::del(const std::string &url)
{
    prepare(url);

    BodySink discard = [](const char *, size_t)
    { return true; };

    curl_easy_setopt(curl_.get(), CURLOPT_CUSTOMREQUEST, "DELETE");
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, &discard);

    return perform("DELETE", url);
}

bool HttpClient::postJson(const std::string &url, const std::string &body, std::string &response)
{
    prepare(url);

    response.clear();
    BodySink collect = [&response](const char *data, size_t size)
    {
        response.append(data, size);
        return true;
    };

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"), curl_slist_free_all);
    if (!headers)
    {
        lastError_ = "Failed to allocate request headers";
        return false;
    }

    curl_easy_setopt(curl_.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl_.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl_.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, &collect);

    bool ok = perform("POST", url);

    // The header list dies with this scope, keep the handle from pointing at it
    curl_easy_setopt(curl_.get(), CURLOPT_HTTPHEADER, nullptr);
    return ok;
}

// Helper: Get human-readable HTTP status text
std::string HttpClient::getHttpStatusText(long code) const
{
    switch (code)
    {
    case 200:
        return "OK";
    case 204:
        return "No Content";
    case 301:
        return "Moved Permanently";
    case 302:
        return "Found";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 409:
        return "Conflict";
    case 429:
        return "Too Many Requests";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    default:
        return "Unknown Status";
    }
}
