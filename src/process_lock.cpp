#include "process_lock.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "errors.hpp"

ProcessLock::ProcessLock(std::filesystem::path path) : path_(std::move(path))
{
}

ProcessLock::~ProcessLock()
{
    if (isHeld() && !release())
    {
        spdlog::warn("Can't unlock {}: {}", path_.string(), lastError_);
    }
}

bool ProcessLock::tryAcquire()
{
    if (isHeld())
    {
        return true;
    }

    int fd = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd == -1)
    {
        throw LockError(fmt::format("can't open lock file {}: {}", path_.string(), std::strerror(errno)));
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) != 0)
    {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK || err == EAGAIN)
        {
            return false;
        }
        throw LockError(fmt::format("can't lock {}: {}", path_.string(), std::strerror(err)));
    }

    fd_ = fd;

    // Record the holder for operators, the lock itself does not depend on it
    std::string pid = fmt::format("{}\n", ::getpid());
    if (::ftruncate(fd_, 0) != 0 || ::write(fd_, pid.data(), pid.size()) != static_cast<ssize_t>(pid.size()))
    {
        spdlog::debug("Couldn't record PID in {}: {}", path_.string(), std::strerror(errno));
    }

    return true;
}

bool ProcessLock::release() noexcept
{
    if (!isHeld())
    {
        return true;
    }

    bool ok = true;

    // Leave the file in place: unlinking would let a waiter lock an orphaned inode
    if (::ftruncate(fd_, 0) != 0)
    {
        lastError_ = std::strerror(errno);
        ok = false;
    }
    if (::flock(fd_, LOCK_UN) != 0)
    {
        lastError_ = std::strerror(errno);
        ok = false;
    }
    if (::close(fd_) != 0)
    {
        lastError_ = std::strerror(errno);
        ok = false;
    }

    fd_ = -1;
    return ok;
}
