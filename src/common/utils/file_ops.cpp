// common/utils/file_ops.cpp
#include "common/utils/file_ops.h"
#include "hostprov/core/types.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <pwd.h>
#include <unistd.h>
#include <vector>

namespace hostprov {

namespace fs = std::filesystem;

FileDescriptor::~FileDescriptor() {
    reset();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        reset(other.fd_);
        other.fd_ = -1;
    }
    return *this;
}

void FileDescriptor::reset(int fd) {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

namespace {

// strerror_r is the XSI int-returning variant or the GNU char*-returning one
const char* strerror_text(int rc, const char* buf) {
    return rc == 0 ? buf : "Unknown error";
}

const char* strerror_text(const char* text, const char*) {
    return text;
}

} // namespace

std::string errno_message(int err) {
    char buf[256] = {0};
    return strerror_text(::strerror_r(err, buf, sizeof(buf)), buf);
}

void ensure_directory(const fs::path& dir, fs::perms perms) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) {
            throw StorageError("Failed to create directory " + dir.string() + ": " + ec.message());
        }
    } else if (!fs::is_directory(dir, ec)) {
        throw StorageError("Not a directory: " + dir.string());
    }
    fs::permissions(dir, perms, fs::perm_options::replace, ec);
    // Permission tightening is best effort on filesystems that ignore modes
}

void write_all(int fd, const std::string& data, const std::string& what) {
    const char* ptr = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw StorageError("Write failed for " + what + ": " + errno_message(errno));
        }
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }
}

void sync_fd(int fd, const std::string& what) {
    if (::fsync(fd) != 0 && errno != EINVAL) {
        throw StorageError("fsync failed for " + what + ": " + errno_message(errno));
    }
}

void sync_directory(const fs::path& dir) {
    FileDescriptor fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (fd.valid()) {
        ::fsync(fd.get());
    }
}

std::string current_hostname() {
    char buf[256] = {0};
    if (::gethostname(buf, sizeof(buf) - 1) != 0) {
        return "unknown";
    }
    return buf;
}

std::string current_user() {
    const long hint = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    std::vector<char> buf(hint > 0 ? static_cast<size_t>(hint) : 1024);
    passwd pwd{};
    passwd* found = nullptr;
    if (::getpwuid_r(::geteuid(), &pwd, buf.data(), buf.size(), &found) == 0 && found) {
        return found->pw_name;
    }
    if (const char* env = std::getenv("USER")) {
        return env;
    }
    return "unknown";
}

} // namespace hostprov
