// common/utils/file_ops.h
#ifndef HOSTPROV_COMMON_UTILS_FILE_OPS_H
#define HOSTPROV_COMMON_UTILS_FILE_OPS_H

#include <filesystem>
#include <string>

namespace hostprov {

// RAII owner of a POSIX file descriptor
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor();

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void reset(int fd = -1);

private:
    int fd_ = -1;
};

// Creates the directory chain and applies perms to the leaf; throws StorageError
void ensure_directory(const std::filesystem::path& dir, std::filesystem::perms perms);

// Writes every byte (retrying short writes / EINTR); throws StorageError naming `what`
void write_all(int fd, const std::string& data, const std::string& what);

// fsync on the file and, for freshly created entries, on the containing directory
void sync_fd(int fd, const std::string& what);
void sync_directory(const std::filesystem::path& dir);

std::string current_hostname();
std::string current_user();

// strerror(errno) wrapper
std::string errno_message(int err);

} // namespace hostprov

#endif // HOSTPROV_COMMON_UTILS_FILE_OPS_H
