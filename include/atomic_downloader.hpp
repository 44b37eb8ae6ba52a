#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "http_client.hpp"

/**
 * Downloads a remote file so that the destination path only ever holds
 * a complete file.
 *
 * The body is streamed into a hidden temporary file next to the destination
 * and renamed into place once fully written. Rename within one directory is
 * atomic, so readers see either the old file (or nothing) or the new one.
 */
class AtomicDownloader
{
public:
    explicit AtomicDownloader(HttpTransport &transport);

    /**
     * Download url to destination.
     *
     * @param url Remote file URL
     * @param destination Final local path
     * @throws DownloadError if the directory, temp file, transfer or rename fails;
     *         the temporary file is removed and destination is untouched
     * @throws CleanupFault if the temporary file's state can't be determined
     *         while cleaning up after a failure
     */
    void download(const std::string &url, const std::filesystem::path &destination);

    /**
     * Temporary file used while downloading to destination:
     * ".<filename>.<16 hex digits>" in the destination's directory.
     *
     * @throws DownloadError if no random suffix can be generated
     */
    static std::filesystem::path makeTempPath(const std::filesystem::path &destination);

    // Random bytes in a temporary file suffix
    static constexpr size_t SUFFIX_BYTES = 8;

private:
    HttpTransport &transport_;

    /**
     * Create the destination's parent directories with mode 0775.
     *
     * @throws DownloadError on failure
     */
    static void ensureDirectoryExists(const std::filesystem::path &filePath);

    /**
     * Stream url into the opened temporary file and close it.
     */
    void fetchTo(const std::string &url, std::ofstream &outFile, const std::filesystem::path &tempPath);

    /**
     * Remove a leftover temporary file. A missing file is fine.
     *
     * @throws CleanupFault if the file can't be inspected
     */
    static void discardTempFile(const std::filesystem::path &tempPath);

    /**
     * Convert binary data to an uppercase hex string.
     * Example: {0x01, 0xFF} -> "01FF"
     */
    static std::string toHex(const std::vector<unsigned char> &data);
};
