#pragma once

#include <string>

/**
 * URL helpers for the remote media store.
 * Parsing and encoding are delegated to libcurl's URL API.
 */
class RemoteUrl
{
public:
    /**
     * Check that a URL is absolute (has both a scheme and a host).
     *
     * @param url URL to check
     * @return true if libcurl parses it as an absolute URL with a host
     */
    static bool isAbsolute(const std::string &url);

    /**
     * Append a path to the path of a base URL.
     * The joined path is cleaned lexically (duplicate slashes, "." and "..")
     * and characters that are not valid in a URL path are percent-encoded.
     *
     * Example: join("https://host/media/", "/a/b c.mp4") -> "https://host/media/a/b%20c.mp4"
     *
     * @param base Absolute base URL
     * @param subPath Path to append
     * @return The joined URL
     * @throws std::invalid_argument if base is not a valid URL
     */
    static std::string join(const std::string &base, const std::string &subPath);

    /**
     * Lexically clean a slash separated path, always returning an absolute path.
     * Example: "//a/./b/../c/" -> "/a/c"
     */
    static std::string cleanPath(const std::string &path);
};
