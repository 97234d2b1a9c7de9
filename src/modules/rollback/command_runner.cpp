// modules/rollback/command_runner.cpp
#include "modules/rollback/command_runner.h"
#include "hostprov/core/types.h"
#include "common/utils/file_ops.h"
#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hostprov {

namespace {

void append_limited(std::string& dst, const char* src, ssize_t n, size_t limit, bool& truncated) {
    if (n <= 0) return;
    const size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    const size_t take = std::min<size_t>(static_cast<size_t>(n), avail);
    dst.append(src, take);
    if (take < static_cast<size_t>(n)) {
        truncated = true;
    }
}

constexpr int kPollIntervalMs = 20;

// Reads until the pipe would block. Returns false once the write side is closed.
bool drain(int fd, char* buf, size_t size, CommandResult& result, size_t limit) {
    for (;;) {
        const ssize_t n = ::read(fd, buf, size);
        if (n > 0) {
            append_limited(result.output, buf, n, limit, result.truncated);
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

} // namespace

CommandResult PosixCommandRunner::run(const std::string& command) {
    CommandResult result;

    int pipe_fds[2];
    // O_CLOEXEC keeps the pipe out of children forked concurrently by other workers
    if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
        throw ExecutionError("Failed to create pipe: " + errno_message(errno));
    }
    FileDescriptor read_end(pipe_fds[0]);
    FileDescriptor write_end(pipe_fds[1]);

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw ExecutionError("Failed to fork for command: " + errno_message(errno));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2(write_end.get(), STDOUT_FILENO);
        ::dup2(write_end.get(), STDERR_FILENO);
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }

    write_end.reset();
    ::fcntl(read_end.get(), F_SETFL, O_NONBLOCK);

    // Read while the shell runs. Background children may inherit the pipe and
    // keep it open, so the shell's exit ends the capture, not EOF.
    char buf[4096];
    int status = 0;
    bool exited = false;
    bool eof = false;
    while (!exited) {
        if (!eof) {
            pollfd pfd{read_end.get(), POLLIN, 0};
            const int ready = ::poll(&pfd, 1, kPollIntervalMs);
            if (ready < 0 && errno != EINTR) {
                eof = true;
            } else if (ready > 0) {
                eof = !drain(read_end.get(), buf, sizeof(buf), result, max_output_bytes_);
            }
        }

        const pid_t w = ::waitpid(pid, &status, eof ? 0 : WNOHANG);
        if (w == pid) {
            exited = true;
        } else if (w < 0 && errno != EINTR) {
            throw ExecutionError("waitpid failed: " + errno_message(errno));
        }
    }

    // Whatever the shell wrote before exiting is already buffered
    if (!eof) {
        drain(read_end.get(), buf, sizeof(buf), result, max_output_bytes_);
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

} // namespace hostprov
