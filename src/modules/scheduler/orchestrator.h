// modules/scheduler/orchestrator.h
#ifndef HOSTPROV_MODULES_SCHEDULER_ORCHESTRATOR_H
#define HOSTPROV_MODULES_SCHEDULER_ORCHESTRATOR_H

#include "hostprov/core/module.h"
#include "modules/registry/module_registry.h"
#include "modules/rollback/rollback_executor.h"
#include "modules/scheduler/execution_session.h"
#include <atomic>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hostprov {

struct RunOptions {
    bool dry_run = false;
    bool force_all = false;
    std::set<ModuleId> force;          // re-run these even if checkpointed
    size_t max_parallel = 4;           // worker threads per batch
    const std::atomic<bool>* cancel = nullptr;  // checked between batches

    bool forces(const ModuleId& id) const { return force_all || force.count(id) > 0; }
};

struct RunReport {
    std::string run_id;
    bool success = false;
    bool dry_run = false;
    ExitCode exit_code = ExitCode::SUCCESS;
    std::optional<ModuleId> failed_module;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error_message;
    bool cancelled = false;
    std::vector<ModuleReport> modules;   // plan order, every registered module
    std::optional<RollbackReport> rollback;
    ExecutionPlan plan;
    LogPosition log_start;
    size_t transactions_recorded = 0;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;

    const ModuleReport* find(const ModuleId& id) const;
    size_t count(ModuleState state) const;
    nlohmann::json to_json() const;
};

// Walks the plan batch by batch with a barrier between batches. On the first
// BLOCKED or FAILED module no further work is launched; a rollback of this run's
// transactions follows when anything was changed.
class Orchestrator {
public:
    Orchestrator(ModuleRegistry& registry,
                 CheckpointStore& checkpoints,
                 TransactionLog& transactions,
                 CommandRunner& runner,
                 Logger& logger = Logger::null());

    void add_observer(PhaseObserver* observer);
    void set_config(Context config) { config_ = std::move(config); }

    // Throws ConfigurationError (bad graph, unknown forced id) before anything runs.
    RunReport run(const RunOptions& options = RunOptions{});

private:
    void run_batch(const Batch& batch, const RunOptions& options, ExecutionSession& session,
                   RunReport& report, std::vector<ModuleId>& completed);

    ModuleRegistry& registry_;
    CheckpointStore& checkpoints_;
    TransactionLog& transactions_;
    CommandRunner& runner_;
    Logger& logger_;
    Context config_ = Context::object();
    std::vector<PhaseObserver*> observers_;
};

ExitCode exit_code_for(ErrorKind kind);
// Operator rollback: an unrecorded pass is a storage failure, a failed command an execution failure
ExitCode exit_code_for(const RollbackReport& report);

} // namespace hostprov

#endif // HOSTPROV_MODULES_SCHEDULER_ORCHESTRATOR_H
