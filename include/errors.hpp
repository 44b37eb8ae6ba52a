#pragma once

#include <stdexcept>

/**
 * Base class of every error the sync pipeline knows how to handle.
 * Per-file processing catches SyncError, records it and moves on.
 */
class SyncError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Configuration file missing, unreadable or invalid
class ConfigError : public SyncError
{
public:
    using SyncError::SyncError;
};

// Lock file could not be opened or locked for a reason other than contention
class LockError : public SyncError
{
public:
    using SyncError::SyncError;
};

class ListingError : public SyncError
{
public:
    using SyncError::SyncError;
};

// No path mapping matches a remote file
class MappingError : public SyncError
{
public:
    using SyncError::SyncError;
};

class DownloadError : public SyncError
{
public:
    using SyncError::SyncError;
};

class DeleteError : public SyncError
{
public:
    using SyncError::SyncError;
};

// Notification could not be delivered
class ReportError : public SyncError
{
public:
    using SyncError::SyncError;
};

/**
 * The state of a temporary download file could not be determined during cleanup.
 * Not a SyncError: nothing below main() is allowed to catch it.
 */
class CleanupFault : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};
