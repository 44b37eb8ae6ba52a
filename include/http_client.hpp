#pragma once

#include <string>
#include <memory>
#include <functional>
#include <curl/curl.h>

/**
 * Receives response body chunks as they arrive.
 * Return false to abort the transfer.
 */
using BodySink = std::function<bool(const char *data, size_t size)>;

/**
 * Minimal HTTP surface the sync pipeline needs.
 * All methods return true on a completed request with a 2xx status.
 * On failure they return false and getLastError() describes why.
 */
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    /**
     * GET a URL and stream the body into sink.
     */
    virtual bool get(const std::string &url, const BodySink &sink) = 0;

    /**
     * DELETE a URL. The response body is discarded.
     */
    virtual bool del(const std::string &url) = 0;

    /**
     * POST a JSON document and collect the response body.
     *
     * @param url Target URL
     * @param body Serialized JSON request body
     * @param response Receives the response body (also on HTTP error statuses)
     */
    virtual bool postJson(const std::string &url, const std::string &body, std::string &response) = 0;

    virtual std::string getLastError() const = 0;
};

/**
 * GET a URL into a string.
 */
bool fetchString(HttpTransport &transport, const std::string &url, std::string &out);

/**
 * HTTP client using libcurl.
 * Uses RAII to manage CURL handle lifecycle.
 */
class HttpClient : public HttpTransport
{
public:
    HttpClient();
    ~HttpClient() override;

    // CURL handles aren't copyable
    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    HttpClient(HttpClient &&) noexcept = default;
    HttpClient &operator=(HttpClient &&) noexcept = default;

    /**
     * Send HTTP basic authentication with every following request.
     */
    void setBasicAuth(const std::string &userName, const std::string &password);

    bool get(const std::string &url, const BodySink &sink) override;
    bool del(const std::string &url) override;
    bool postJson(const std::string &url, const std::string &body, std::string &response) override;

    std::string getLastError() const override { return lastError_; }

private:
    // CURL handle with custom deleter (RAII pattern)
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;

    std::string lastError_;

    bool useAuth_ = false;
    std::string userName_;
    std::string password_;

    /**
     * Reset the handle and apply options shared by every request
     * (user agent, TLS verification, redirects, credentials).
     */
    void prepare(const std::string &url);

    /**
     * Run the prepared request and check both the CURL result and the HTTP status.
     *
     * @param method Verb used in error messages
     * @param url Target URL, used in error messages
     */
    bool perform(const char *method, const std::string &url);

    /**
     * Static callback for libcurl to hand over downloaded data.
     * userdata is the BodySink for the current request.
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    /**
     * Get human-readable HTTP status text for a status code.
     *
     * @param code HTTP status code (e.g., 200, 404, 500)
     * @return Descriptive text for the status code
     */
    std::string getHttpStatusText(long code) const;
};
