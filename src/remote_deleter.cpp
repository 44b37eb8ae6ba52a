#include "remote_deleter.hpp"

#include <fmt/core.h>

#include "errors.hpp"

RemoteDeleter::RemoteDeleter(HttpTransport &transport) : transport_(transport)
{
}

void RemoteDeleter::remove(const std::string &url)
{
    if (!transport_.del(url))
    {
        throw DeleteError(fmt::format("failed to delete {}: {}", url, transport_.getLastError()));
    }
}
