#pragma once

#include <filesystem>
#include <string>

/**
 * Advisory lock file that keeps two sync runs from overlapping.
 *
 * Uses flock(2) on a fixed path, so a lock held by a crashed process is
 * released by the kernel. The holder writes its PID into the file.
 * Locks conflict per open file, so two ProcessLock objects on the same path
 * exclude each other even inside one process.
 */
class ProcessLock
{
public:
    explicit ProcessLock(std::filesystem::path path);

    // Releases the lock if still held
    ~ProcessLock();

    ProcessLock(const ProcessLock &) = delete;
    ProcessLock &operator=(const ProcessLock &) = delete;

    /**
     * Try to take the lock without blocking.
     *
     * @return true if acquired, false if another holder has it
     * @throws LockError if the lock file can't be opened or locked
     */
    bool tryAcquire();

    /**
     * Drop the lock. Safe to call when not held.
     *
     * @return false if unlocking failed, see getLastError()
     */
    bool release() noexcept;

    bool isHeld() const { return fd_ >= 0; }

    const std::filesystem::path &path() const { return path_; }

    std::string getLastError() const { return lastError_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
    std::string lastError_;
};
