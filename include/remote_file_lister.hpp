#pragma once

#include <string>
#include <vector>

#include "http_client.hpp"

/**
 * A file offered by the remote store, identified by its web path.
 */
struct RemoteFileRef
{
    std::string webPath;
};

/**
 * Fetches the list of files waiting on the remote store.
 */
class RemoteFileLister
{
public:
    /**
     * @param transport Authenticated transport for the remote store
     * @param remote Base URL of the remote store
     */
    RemoteFileLister(HttpTransport &transport, std::string remote);

    /**
     * GET {remote}/fileinfo and decode the JSON array of {"web_path": string}.
     *
     * @return Files in the order the store listed them
     * @throws ListingError on transport failure, HTTP error status or malformed body
     */
    std::vector<RemoteFileRef> list();

    /**
     * Decode a fileinfo response body. Exposed for tests.
     *
     * @throws ListingError if the body is not an array of objects with a string web_path
     */
    static std::vector<RemoteFileRef> parse(const std::string &body);

private:
    HttpTransport &transport_;
    std::string remote_;
};
