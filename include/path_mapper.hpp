#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * Substitution rule from a remote path prefix to a local directory.
 */
struct PathMapping
{
    std::string remotePath;
    std::string localPath;
};

/**
 * Maps remote web paths onto the local filesystem.
 */
class PathMapper
{
public:
    /**
     * Resolve the local destination of a remote file.
     *
     * Every mapping whose remotePath is a prefix of webPath produces a candidate
     * by replacing that prefix with localPath. Mappings are evaluated in declared
     * order and the LAST matching one wins. This is not a longest-prefix match:
     * with {"/tv", "/a"} then {"/tv/shows", "/b"}, "/tv/shows/x.mkv" maps to
     * "/b/x.mkv", but with the order reversed it maps to "/a/shows/x.mkv".
     *
     * The result is lexically normalised. Callers pass a cleaned webPath
     * (RemoteUrl::cleanPath) so the local file matches the fetched URL.
     *
     * @param webPath Remote path as returned by the listing endpoint
     * @param mappings Configured mappings, in declared order
     * @return Local path, or std::nullopt if no mapping matches
     */
    static std::optional<std::filesystem::path> resolve(const std::string &webPath,
                                                        const std::vector<PathMapping> &mappings);
};
