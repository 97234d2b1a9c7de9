// include/hostprov/core/module.h
#ifndef HOSTPROV_CORE_MODULE_H
#define HOSTPROV_CORE_MODULE_H

#include "hostprov/core/types.h"
#include "common/logging/logger.h"
#include "modules/checkpoint/checkpoint_store.h"
#include "modules/transaction/transaction_log.h"
#include "modules/rollback/command_runner.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hostprov {

// Everything a module may touch while it runs. Checkpoints are read-only for modules:
// only the orchestrator writes them.
struct ModuleContext {
    ModuleId module_id;
    const Context& config;
    bool dry_run = false;
    Logger& logger;
    const CheckpointStore& checkpoints;
    TransactionLog& transactions;
    CommandRunner& runner;
};

// Capability contract of one provisioning step
class ProvisionModule {
public:
    virtual ~ProvisionModule() = default;

    // Must not change the host. A failure blocks this module and everything after it.
    virtual Outcome check_prerequisites(const ModuleContext& ctx) = 0;

    // Records a transaction before each undoable effect. Never writes checkpoints.
    virtual Outcome execute(ModuleContext& ctx) = 0;
};

struct ModuleDescriptor {
    ModuleId id;
    std::vector<ModuleId> dependencies;
    std::optional<std::string> parallel_group;
    std::shared_ptr<ProvisionModule> impl;
    std::optional<std::chrono::seconds> expected_duration;  // advisory, read by the monitor
};

// Phase events from the orchestrator. Called from worker threads; implementations
// must return quickly and never throw.
class PhaseObserver {
public:
    virtual ~PhaseObserver() = default;

    virtual void on_phase_start(const ModuleId& id, std::optional<std::chrono::seconds> expected) = 0;
    virtual void on_phase_end(const ModuleId& id, ModuleState state,
                              std::chrono::milliseconds duration, const std::string& message) = 0;
    virtual void on_status(const ModuleId& id, ModuleState state) { (void)id; (void)state; }
};

} // namespace hostprov

#endif // HOSTPROV_CORE_MODULE_H
