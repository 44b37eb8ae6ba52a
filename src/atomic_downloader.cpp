#include "atomic_downloader.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <fmt/core.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include "errors.hpp"

namespace fs = std::filesystem;

AtomicDownloader::AtomicDownloader(HttpTransport &transport) : transport_(transport)
{
}

void AtomicDownloader::download(const std::string &url, const fs::path &destination)
{
    // 1. Ensure destination directory exists
    ensureDirectoryExists(destination);

    // 2. Pick a temporary name on the same filesystem as the destination
    fs::path tempPath = makeTempPath(destination);
    spdlog::debug("Downloading {} via {}", url, tempPath.string());

    // 3. Open the temporary file; nothing to clean up if this fails
    std::ofstream outFile(tempPath, std::ios::binary | std::ios::trunc);
    if (!outFile)
    {
        throw DownloadError(fmt::format("couldn't create file {}: {}", tempPath.string(), std::strerror(errno)));
    }

    try
    {
        // 4. Stream the body into the temporary file
        fetchTo(url, outFile, tempPath);

        // 5. Commit: the only write that ever touches destination
        std::error_code ec;
        fs::rename(tempPath, destination, ec);
        if (ec)
        {
            throw DownloadError(fmt::format("couldn't rename {} to {}: {}",
                                            tempPath.string(), destination.string(), ec.message()));
        }
    }
    catch (const std::exception &)
    {
        // 6. Never leave a temporary file behind
        discardTempFile(tempPath);
        throw;
    }
}

void AtomicDownloader::fetchTo(const std::string &url, std::ofstream &outFile, const fs::path &tempPath)
{
    bool ok = transport_.get(url, [&outFile](const char *data, size_t size)
                             {
                                 outFile.write(data, static_cast<std::streamsize>(size));
                                 return outFile.good(); // Abort transfer if write fails
                             });

    // Close before rename or cleanup, in both outcomes
    outFile.close();

    if (!ok)
    {
        throw DownloadError(fmt::format("failed downloading {}: {}", url, transport_.getLastError()));
    }
    if (outFile.fail())
    {
        throw DownloadError(fmt::format("failed to close {}", tempPath.string()));
    }
}

void AtomicDownloader::discardTempFile(const fs::path &tempPath)
{
    std::error_code ec;
    fs::file_status status = fs::symlink_status(tempPath, ec);

    // Already gone
    if (status.type() == fs::file_type::not_found)
    {
        return;
    }
    if (ec)
    {
        throw CleanupFault(fmt::format("can't inspect temporary file {}: {}",
                                       tempPath.string(), ec.message()));
    }

    if (!fs::remove(tempPath, ec) && ec)
    {
        spdlog::warn("Couldn't remove temporary file {}: {}", tempPath.string(), ec.message());
    }
}

void AtomicDownloader::ensureDirectoryExists(const fs::path &filePath)
{
    auto directory = filePath.parent_path();

    // File in current dir, nothing to create
    if (directory.empty())
    {
        return;
    }

    // Create one level at a time so every new directory gets 0775 regardless of umask
    fs::path current;
    for (const auto &part : directory)
    {
        current /= part;

        std::error_code ec;
        if (fs::is_directory(current, ec))
        {
            continue;
        }

        bool created = fs::create_directory(current, ec);
        if (ec)
        {
            throw DownloadError(fmt::format("couldn't create dir {}: {}", current.string(), ec.message()));
        }
        if (!created)
        {
            // Created concurrently, or in the way as a non-directory
            if (!fs::is_directory(current, ec))
            {
                throw DownloadError(fmt::format("couldn't create dir {}: not a directory", current.string()));
            }
            continue;
        }

        fs::permissions(current,
                        fs::perms::owner_all | fs::perms::group_all |
                            fs::perms::others_read | fs::perms::others_exec,
                        ec);
        if (ec)
        {
            throw DownloadError(fmt::format("couldn't set permissions on {}: {}", current.string(), ec.message()));
        }
    }
}

fs::path AtomicDownloader::makeTempPath(const fs::path &destination)
{
    std::vector<unsigned char> suffix(SUFFIX_BYTES);
    if (RAND_bytes(suffix.data(), static_cast<int>(suffix.size())) != 1)
    {
        throw DownloadError(fmt::format("couldn't generate postfix: OpenSSL error {}", ERR_get_error()));
    }

    std::string name = fmt::format(".{}.{}", destination.filename().string(), toHex(suffix));
    return destination.parent_path() / name;
}

std::string AtomicDownloader::toHex(const std::vector<unsigned char> &data)
{
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');

    for (unsigned char byte : data)
    {
        oss << std::setw(2) << static_cast<unsigned int>(byte);
    }

    return oss.str();
}
