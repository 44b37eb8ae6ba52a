#pragma once

#include <string>

#include "http_client.hpp"

/**
 * Removes files from the remote store once they are safely stored locally.
 */
class RemoteDeleter
{
public:
    explicit RemoteDeleter(HttpTransport &transport);

    /**
     * Issue DELETE on the file's URL. The response body is ignored.
     *
     * @throws DeleteError on transport failure or HTTP error status
     */
    void remove(const std::string &url);

private:
    HttpTransport &transport_;
};
