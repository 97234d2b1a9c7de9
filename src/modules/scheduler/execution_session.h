// modules/scheduler/execution_session.h
#ifndef HOSTPROV_MODULES_SCHEDULER_EXECUTION_SESSION_H
#define HOSTPROV_MODULES_SCHEDULER_EXECUTION_SESSION_H

#include "hostprov/core/module.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace hostprov {

// Final per-module record of one run
struct ModuleReport {
    ModuleId id;
    ModuleState state = ModuleState::PENDING;
    ErrorKind kind = ErrorKind::NONE;
    std::string message;
    std::vector<FieldError> details;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;
    std::chrono::milliseconds duration{0};

    nlohmann::json to_json() const;
};

// Drives one module through PENDING -> ... -> terminal state. Owns no state of its
// own; one session is shared by all workers of a run.
class ExecutionSession {
public:
    ExecutionSession(const Context& config,
                     Logger& logger,
                     CheckpointStore& checkpoints,
                     TransactionLog& transactions,
                     CommandRunner& runner,
                     const std::vector<PhaseObserver*>& observers);

    // Never throws: module exceptions become FAILED/BLOCKED outcomes, checkpoint
    // I/O failures become FAILED with ErrorKind::STORAGE.
    ModuleReport execute_module(const ModuleDescriptor& descriptor, bool force, bool dry_run);

private:
    void notify_status(const ModuleId& id, ModuleState state);
    void notify_start(const ModuleDescriptor& descriptor);
    void notify_end(const ModuleReport& report);

    const Context& config_;
    Logger& logger_;
    CheckpointStore& checkpoints_;
    TransactionLog& transactions_;
    CommandRunner& runner_;
    const std::vector<PhaseObserver*>& observers_;
};

} // namespace hostprov

#endif // HOSTPROV_MODULES_SCHEDULER_EXECUTION_SESSION_H
