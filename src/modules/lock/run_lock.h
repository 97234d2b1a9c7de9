// modules/lock/run_lock.h
#ifndef HOSTPROV_MODULES_LOCK_RUN_LOCK_H
#define HOSTPROV_MODULES_LOCK_RUN_LOCK_H

#include "hostprov/core/types.h"
#include "common/logging/logger.h"
#include "common/utils/file_ops.h"
#include <filesystem>
#include <optional>
#include <sys/types.h>

namespace hostprov {

class RunLockError : public ProvisionError {
public:
    RunLockError(const std::string& message, std::optional<pid_t> holder)
        : ProvisionError(ErrorKind::STORAGE, message), holder_(holder) {}
    std::optional<pid_t> holder() const noexcept { return holder_; }

private:
    std::optional<pid_t> holder_;
};

// One provisioning run per host. Holds an exclusive flock on the lock file for
// its lifetime; the kernel drops the lock if the process dies.
class RunLock {
public:
    // Throws RunLockError when another process holds the lock, StorageError on I/O failure
    explicit RunLock(const std::filesystem::path& path, Logger& logger = Logger::null());
    ~RunLock();

    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

    const std::filesystem::path& path() const { return path_; }

    // PID recorded in the lock file, if readable
    static std::optional<pid_t> read_holder(const std::filesystem::path& path);

private:
    std::filesystem::path path_;
    Logger& logger_;
    FileDescriptor fd_;
};

} // namespace hostprov

#endif // HOSTPROV_MODULES_LOCK_RUN_LOCK_H
