#pragma once

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "http_client.hpp"

/**
 * Scratch directory removed with everything in it at the end of a test.
 */
class TempDir
{
public:
    TempDir()
    {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = std::filesystem::temp_directory_path() /
                ("mediasync-test-" + std::to_string(gen()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return path_; }

    std::filesystem::path operator/(const std::string &name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline std::string readFile(const std::filesystem::path &path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline void writeFile(const std::filesystem::path &path, const std::string &content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

// Names of all entries directly inside dir
inline std::vector<std::string> listDir(const std::filesystem::path &dir)
{
    std::vector<std::string> names;
    for (const auto &entry : std::filesystem::directory_iterator(dir))
    {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

/**
 * Move directory aside to movedTo and leave a symlink pointing at itself in
 * its place, so any path below it fails to resolve with ELOOP.
 */
inline void replaceWithSymlinkLoop(const std::filesystem::path &directory, const std::filesystem::path &movedTo)
{
    std::filesystem::rename(directory, movedTo);
    std::filesystem::create_symlink(directory.filename(), directory);
}

/**
 * Canned response for a GET.
 */
struct FakeResponse
{
    std::string body;

    // Bytes delivered before the transfer breaks; npos for a complete transfer
    size_t failAfter = std::string::npos;

    std::string error = "connection reset";
};

/**
 * In-memory HttpTransport. Unknown GET URLs answer 404, DELETEs succeed
 * unless listed in failingDeletes.
 */
class FakeTransport : public HttpTransport
{
public:
    std::map<std::string, FakeResponse> responses;
    std::vector<std::string> failingDeletes;

    // Invoked between body chunks, to look at the filesystem mid-transfer
    std::function<void()> midTransfer;

    // POST handling
    bool postOk = true;
    std::string postResponse = R"({"ok":true,"result":{}})";
    std::vector<std::string> postedBodies;

    // "GET <url>", "DELETE <url>", "POST <url>" in call order
    std::vector<std::string> calls;

    static constexpr size_t CHUNK = 4;

    bool get(const std::string &url, const BodySink &sink) override
    {
        calls.push_back("GET " + url);

        auto it = responses.find(url);
        if (it == responses.end())
        {
            lastError_ = "GET " + url + " failed: HTTP error 404: Not Found";
            return false;
        }

        const FakeResponse &response = it->second;
        size_t limit = std::min(response.failAfter, response.body.size());

        for (size_t pos = 0; pos < limit; pos += CHUNK)
        {
            size_t n = std::min(CHUNK, limit - pos);
            if (!sink(response.body.data() + pos, n))
            {
                lastError_ = "GET " + url + " failed: Failed writing received data to disk/application";
                return false;
            }
            if (midTransfer)
            {
                midTransfer();
            }
        }

        if (response.failAfter != std::string::npos)
        {
            lastError_ = "GET " + url + " failed: " + response.error;
            return false;
        }
        return true;
    }

    bool del(const std::string &url) override
    {
        calls.push_back("DELETE " + url);

        if (std::find(failingDeletes.begin(), failingDeletes.end(), url) != failingDeletes.end())
        {
            lastError_ = "DELETE " + url + " failed: HTTP error 500: Internal Server Error";
            return false;
        }
        return true;
    }

    bool postJson(const std::string &url, const std::string &body, std::string &response) override
    {
        calls.push_back("POST " + url);
        postedBodies.push_back(body);
        response = postResponse;
        if (!postOk)
        {
            lastError_ = "POST " + url + " failed: HTTP error 400: Bad Request";
        }
        return postOk;
    }

    std::string getLastError() const override { return lastError_; }

private:
    std::string lastError_;
};
