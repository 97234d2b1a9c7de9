// modules/scheduler/execution_session.cpp
#include "modules/scheduler/execution_session.h"

namespace hostprov {

nlohmann::json ModuleReport::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["state"] = to_string(state);
    if (kind != ErrorKind::NONE) {
        j["error_kind"] = to_string(kind);
    }
    if (!message.empty()) {
        j["message"] = message;
    }
    if (!details.empty()) {
        j["details"] = nlohmann::json::array();
        for (const auto& d : details) {
            j["details"].push_back({{"field", d.field}, {"reason", d.reason}});
        }
    }
    if (started_at) j["started_at"] = format_utc_timestamp(*started_at);
    if (finished_at) j["finished_at"] = format_utc_timestamp(*finished_at);
    j["duration_ms"] = duration.count();
    return j;
}

ExecutionSession::ExecutionSession(const Context& config,
                                   Logger& logger,
                                   CheckpointStore& checkpoints,
                                   TransactionLog& transactions,
                                   CommandRunner& runner,
                                   const std::vector<PhaseObserver*>& observers)
    : config_(config),
      logger_(logger),
      checkpoints_(checkpoints),
      transactions_(transactions),
      runner_(runner),
      observers_(observers) {}

void ExecutionSession::notify_status(const ModuleId& id, ModuleState state) {
    for (auto* observer : observers_) {
        observer->on_status(id, state);
    }
}

void ExecutionSession::notify_start(const ModuleDescriptor& descriptor) {
    for (auto* observer : observers_) {
        observer->on_phase_start(descriptor.id, descriptor.expected_duration);
    }
}

void ExecutionSession::notify_end(const ModuleReport& report) {
    for (auto* observer : observers_) {
        observer->on_phase_end(report.id, report.state, report.duration, report.message);
    }
}

ModuleReport ExecutionSession::execute_module(const ModuleDescriptor& descriptor, bool force, bool dry_run) {
    ModuleReport report;
    report.id = descriptor.id;
    notify_status(report.id, ModuleState::PENDING);

    // 1. Checkpoint gate
    try {
        if (checkpoints_.exists(descriptor.id)) {
            if (!force) {
                report.state = ModuleState::SKIPPED;
                report.message = "Checkpoint present";
                logger_.info("Skipping " + descriptor.id + " (already completed)");
                notify_status(report.id, report.state);
                return report;
            }
            if (!dry_run) {
                checkpoints_.remove(descriptor.id);
                logger_.info("Forcing re-run of " + descriptor.id + ", checkpoint removed");
            }
        }
    } catch (const ProvisionError& e) {
        report.state = ModuleState::FAILED;
        report.kind = ErrorKind::STORAGE;
        report.message = std::string("Checkpoint access failed: ") + e.what();
        logger_.error(descriptor.id + ": " + report.message);
        notify_status(report.id, report.state);
        return report;
    }

    ModuleContext ctx{descriptor.id, config_, dry_run, logger_, checkpoints_, transactions_, runner_};

    const auto steady_start = std::chrono::steady_clock::now();
    report.started_at = std::chrono::system_clock::now();
    notify_start(descriptor);

    auto finish = [&](ModuleState state, const Outcome& outcome) {
        report.state = state;
        report.kind = outcome.kind;
        report.message = outcome.message;
        report.details = outcome.details;
        report.finished_at = std::chrono::system_clock::now();
        report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - steady_start);
        notify_status(report.id, state);
        notify_end(report);
        return report;
    };

    // 2. Prerequisites
    report.state = ModuleState::CHECKING;
    notify_status(report.id, report.state);
    Outcome check;
    try {
        check = descriptor.impl->check_prerequisites(ctx);
    } catch (const std::exception& e) {
        check = Outcome::prerequisite_failed(std::string("Prerequisite check threw: ") + e.what());
    }
    if (!check.success) {
        if (check.kind == ErrorKind::NONE) check.kind = ErrorKind::PREREQUISITE;
        logger_.error(descriptor.id + " blocked: " + check.describe());
        return finish(ModuleState::BLOCKED, check);
    }

    if (dry_run) {
        logger_.info("[DRY-RUN] Would execute " + descriptor.id);
        return finish(ModuleState::PLANNED, Outcome::ok("Prerequisites passed"));
    }

    // 3. Execute
    report.state = ModuleState::RUNNING;
    notify_status(report.id, report.state);
    logger_.info("Running " + descriptor.id);
    Outcome result;
    try {
        result = descriptor.impl->execute(ctx);
    } catch (const StorageError& e) {
        result = Outcome::execution_failed(e.what());
        result.kind = ErrorKind::STORAGE;
    } catch (const std::exception& e) {
        result = Outcome::execution_failed(std::string("Module threw: ") + e.what());
    }
    if (!result.success) {
        if (result.kind == ErrorKind::NONE) result.kind = ErrorKind::EXECUTION;
        logger_.error(descriptor.id + " failed: " + result.describe());
        return finish(ModuleState::FAILED, result);
    }

    // 4. Remember completion. Losing this write is worse than the module failing.
    try {
        checkpoints_.create(descriptor.id);
    } catch (const ProvisionError& e) {
        Outcome storage = Outcome::execution_failed(std::string("Failed to write checkpoint: ") + e.what());
        storage.kind = ErrorKind::STORAGE;
        logger_.fatal(descriptor.id + ": " + storage.message);
        return finish(ModuleState::FAILED, storage);
    }

    logger_.info("Completed " + descriptor.id);
    return finish(ModuleState::COMPLETED, result);
}

} // namespace hostprov
