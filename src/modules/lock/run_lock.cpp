// modules/lock/run_lock.cpp
#include "modules/lock/run_lock.h"
#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <sys/file.h>
#include <unistd.h>

namespace hostprov {

namespace fs = std::filesystem;

RunLock::RunLock(const fs::path& path, Logger& logger) : path_(path), logger_(logger) {
    if (path_.has_parent_path()) {
        ensure_directory(path_.parent_path(), fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
    }

    FileDescriptor fd(::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0640));
    if (!fd.valid()) {
        throw StorageError("Failed to open lock file " + path_.string() + ": " + errno_message(errno));
    }

    if (::flock(fd.get(), LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        if (err == EWOULDBLOCK) {
            auto holder = read_holder(path_);
            std::string message = "Another provisioning run holds " + path_.string();
            if (holder) message += " (PID " + std::to_string(*holder) + ")";
            throw RunLockError(message, holder);
        }
        throw StorageError("Failed to lock " + path_.string() + ": " + errno_message(err));
    }

    // Replace any stale PID left by a crashed holder
    if (::ftruncate(fd.get(), 0) != 0) {
        throw StorageError("Failed to reset lock file " + path_.string() + ": " + errno_message(errno));
    }
    write_all(fd.get(), std::to_string(::getpid()) + "\n", "lock file " + path_.string());

    fd_ = std::move(fd);
    logger_.debug("Acquired run lock " + path_.string());
}

RunLock::~RunLock() {
    if (!fd_.valid()) return;
    // Clear the PID before releasing so a reader never sees a released lock with our PID
    if (::ftruncate(fd_.get(), 0) != 0) {
        logger_.warning("Failed to clear lock file " + path_.string());
    }
    ::flock(fd_.get(), LOCK_UN);
    fd_.reset();
    logger_.debug("Released run lock " + path_.string());
}

std::optional<pid_t> RunLock::read_holder(const fs::path& path) {
    std::ifstream file(path);
    long pid = 0;
    if (file >> pid && pid > 0) {
        return static_cast<pid_t>(pid);
    }
    return std::nullopt;
}

} // namespace hostprov
