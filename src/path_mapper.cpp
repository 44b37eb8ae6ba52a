#include "path_mapper.hpp"

std::optional<std::filesystem::path> PathMapper::resolve(const std::string &webPath,
                                                         const std::vector<PathMapping> &mappings)
{
    std::optional<std::filesystem::path> localFile;

    // No early exit: a later match overrides an earlier one
    for (const auto &mapping : mappings)
    {
        if (webPath.compare(0, mapping.remotePath.size(), mapping.remotePath) == 0)
        {
            localFile = std::filesystem::path(mapping.localPath + webPath.substr(mapping.remotePath.size()))
                            .lexically_normal();
        }
    }

    return localFile;
}
