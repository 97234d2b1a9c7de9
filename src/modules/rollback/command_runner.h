// modules/rollback/command_runner.h
#ifndef HOSTPROV_MODULES_ROLLBACK_COMMAND_RUNNER_H
#define HOSTPROV_MODULES_ROLLBACK_COMMAND_RUNNER_H

#include <cstddef>
#include <string>

namespace hostprov {

struct CommandResult {
    int exit_code = -1;   // 128 + signal for signalled children, 127 if the shell could not start
    std::string output;   // stdout and stderr interleaved, truncated at the runner's limit
    bool truncated = false;

    bool succeeded() const { return exit_code == 0; }
};

// Executes one shell command line. Implementations must be callable from several threads.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CommandResult run(const std::string& command) = 0;
};

// fork + /bin/sh -c, output captured through a pipe
class PosixCommandRunner : public CommandRunner {
public:
    explicit PosixCommandRunner(size_t max_output_bytes = 64 * 1024)
        : max_output_bytes_(max_output_bytes) {}

    CommandResult run(const std::string& command) override;

private:
    size_t max_output_bytes_;
};

} // namespace hostprov

#endif // HOSTPROV_MODULES_ROLLBACK_COMMAND_RUNNER_H
