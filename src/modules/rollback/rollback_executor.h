// modules/rollback/rollback_executor.h
#ifndef HOSTPROV_MODULES_ROLLBACK_ROLLBACK_EXECUTOR_H
#define HOSTPROV_MODULES_ROLLBACK_ROLLBACK_EXECUTOR_H

#include "modules/transaction/transaction_log.h"
#include "modules/rollback/command_runner.h"
#include "common/logging/logger.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace hostprov {

struct RollbackFailure {
    TransactionEntry entry;
    std::string error;
};

struct RollbackReport {
    size_t attempted = 0;
    size_t succeeded = 0;
    std::vector<RollbackFailure> failed;
    bool marker_written = false;
    std::string marker_error;

    // Every attempted entry was compensated
    bool clean() const { return failed.empty(); }
    // The pass is on record; without a marker the next pass replays the same entries
    bool recorded() const { return attempted == 0 || marker_written; }
    std::string summary() const;
    nlohmann::json to_json() const;
};

// Action text of the terminal marker, e.g. "[rollback] 2/3 entries rolled back (from offset 120)"
std::string rollback_marker_action(size_t succeeded, size_t attempted, LogPosition from);

// Offset a marker says it covered, nullopt for entries that are not markers
std::optional<uint64_t> rollback_marker_floor(const TransactionEntry& entry);

// Replays rollback commands newest first. Best-effort: a failing command is
// reported and the pass continues with the next entry.
class RollbackExecutor {
public:
    RollbackExecutor(TransactionLog& log, CommandRunner& runner, Logger& logger = Logger::null());

    // Compensates entries at or after `from`. Entries already covered by an
    // earlier marker are not replayed again, which makes a second pass a no-op.
    RollbackReport execute(LogPosition from = LogPosition{});

    // SIGPIPE from a rollback pipeline is benign
    static bool is_success_exit(int exit_code) { return exit_code == 0 || exit_code == 141; }

private:
    TransactionLog& log_;
    CommandRunner& runner_;
    Logger& logger_;
};

} // namespace hostprov

#endif // HOSTPROV_MODULES_ROLLBACK_ROLLBACK_EXECUTOR_H
