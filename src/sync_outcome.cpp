#include "sync_outcome.hpp"

const char *toString(SyncStage stage)
{
    switch (stage)
    {
    case SyncStage::Listing:
        return "listing";
    case SyncStage::Mapping:
        return "mapping";
    case SyncStage::Download:
        return "download";
    case SyncStage::Delete:
        return "delete";
    }
    return "unknown";
}
