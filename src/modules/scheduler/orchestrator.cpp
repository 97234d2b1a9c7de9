// modules/scheduler/orchestrator.cpp
#include "modules/scheduler/orchestrator.h"
#include <algorithm>
#include <mutex>
#include <thread>

namespace hostprov {

ExitCode exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:          return ExitCode::SUCCESS;
        case ErrorKind::CONFIGURATION: return ExitCode::CONFIGURATION_ERROR;
        case ErrorKind::PREREQUISITE:  return ExitCode::PREREQUISITE_BLOCKED;
        case ErrorKind::STORAGE:       return ExitCode::STORAGE_ERROR;
        case ErrorKind::ARGUMENT:      return ExitCode::USAGE;
        case ErrorKind::EXECUTION:
        case ErrorKind::ROLLBACK:      break;
    }
    return ExitCode::EXECUTION_FAILED;
}

ExitCode exit_code_for(const RollbackReport& report) {
    if (!report.recorded()) return ExitCode::STORAGE_ERROR;
    if (!report.clean()) return ExitCode::EXECUTION_FAILED;
    return ExitCode::SUCCESS;
}

const ModuleReport* RunReport::find(const ModuleId& id) const {
    for (const auto& m : modules) {
        if (m.id == id) return &m;
    }
    return nullptr;
}

size_t RunReport::count(ModuleState state) const {
    return static_cast<size_t>(std::count_if(modules.begin(), modules.end(),
                                             [state](const ModuleReport& m) { return m.state == state; }));
}

nlohmann::json RunReport::to_json() const {
    nlohmann::json j;
    j["run_id"] = run_id;
    j["success"] = success;
    j["dry_run"] = dry_run;
    j["exit_code"] = static_cast<int>(exit_code);
    if (failed_module) {
        j["failed_module"] = *failed_module;
    }
    if (error_kind != ErrorKind::NONE) {
        j["error_kind"] = to_string(error_kind);
        j["error_message"] = error_message;
    }
    if (cancelled) j["cancelled"] = true;
    if (started_at) j["started_at"] = format_utc_timestamp(*started_at);
    if (finished_at) j["finished_at"] = format_utc_timestamp(*finished_at);
    j["plan"] = plan.to_json();
    j["modules"] = nlohmann::json::array();
    for (const auto& m : modules) {
        j["modules"].push_back(m.to_json());
    }
    j["log_start_offset"] = log_start.offset;
    j["transactions_recorded"] = transactions_recorded;
    if (rollback) {
        j["rollback"] = rollback->to_json();
    }
    return j;
}

Orchestrator::Orchestrator(ModuleRegistry& registry,
                           CheckpointStore& checkpoints,
                           TransactionLog& transactions,
                           CommandRunner& runner,
                           Logger& logger)
    : registry_(registry),
      checkpoints_(checkpoints),
      transactions_(transactions),
      runner_(runner),
      logger_(logger) {}

void Orchestrator::add_observer(PhaseObserver* observer) {
    if (observer) observers_.push_back(observer);
}

RunReport Orchestrator::run(const RunOptions& options) {
    if (options.max_parallel == 0) {
        throw ConfigurationError("max_parallel must be at least 1");
    }

    RunReport report;
    report.dry_run = options.dry_run;
    report.started_at = std::chrono::system_clock::now();

    // Recomputed on every run; nothing is carried over from earlier invocations
    report.plan = registry_.plan();
    for (const auto& id : options.force) {
        if (!registry_.contains(id)) {
            throw ConfigurationError("Cannot force unknown module: " + id, {id});
        }
    }
    for (const auto& batch : report.plan.batches) {
        for (const auto& id : batch) {
            ModuleReport pending;
            pending.id = id;
            report.modules.push_back(std::move(pending));
        }
    }

    report.log_start = transactions_.position();
    logger_.info("Execution plan: " + std::to_string(report.plan.module_count()) + " module(s) in " +
                 std::to_string(report.plan.batches.size()) + " batch(es)" +
                 (options.dry_run ? " [DRY-RUN]" : ""));

    ExecutionSession session(config_, logger_, checkpoints_, transactions_, runner_, observers_);
    std::vector<ModuleId> completed;

    for (size_t b = 0; b < report.plan.batches.size(); ++b) {
        if (options.cancel && options.cancel->load()) {
            report.cancelled = true;
            logger_.warning("Run cancelled before batch " + std::to_string(b + 1));
            break;
        }
        const auto& batch = report.plan.batches[b];
        std::string names;
        for (const auto& id : batch) names += (names.empty() ? "" : ", ") + id;
        logger_.debug("Batch " + std::to_string(b + 1) + "/" + std::to_string(report.plan.batches.size()) +
                      ": " + names);

        run_batch(batch, options, session, report, completed);
        if (report.failed_module) {
            logger_.error("Stopping after batch " + std::to_string(b + 1) + ": " + *report.failed_module +
                          " did not complete");
            break;
        }
    }

    const bool appended = transactions_.position().offset > report.log_start.offset;
    if (appended) {
        for (const auto& entry : transactions_.entries_reverse(report.log_start)) {
            if (!entry.is_rollback_marker()) ++report.transactions_recorded;
        }
    }

    if (report.failed_module) {
        const bool any_failed = report.count(ModuleState::FAILED) > 0;
        if (!options.dry_run && (any_failed || appended)) {
            logger_.warning("Rolling back this run's transactions");
            RollbackExecutor executor(transactions_, runner_, logger_);
            report.rollback = executor.execute(report.log_start);

            // Their effects were just undone, so the markers would lie
            for (const auto& id : completed) {
                try {
                    checkpoints_.remove(id);
                } catch (const StorageError& e) {
                    logger_.error("Failed to clear checkpoint for rolled back module " + id + ": " + e.what());
                }
                for (auto& m : report.modules) {
                    if (m.id == id) m.message = "Completed, then rolled back";
                }
            }
            if (!report.rollback->clean() || !report.rollback->recorded()) {
                logger_.error("Rollback degraded: " + report.rollback->summary());
            }
        }
        report.success = false;
        report.exit_code = exit_code_for(report.error_kind);
    } else if (report.cancelled) {
        report.success = false;
        report.error_kind = ErrorKind::EXECUTION;
        report.error_message = "Run cancelled";
        report.exit_code = ExitCode::EXECUTION_FAILED;
    } else {
        report.success = true;
        report.exit_code = ExitCode::SUCCESS;
    }

    report.finished_at = std::chrono::system_clock::now();
    logger_.info("Run finished: " + std::to_string(report.count(ModuleState::COMPLETED)) + " completed, " +
                 std::to_string(report.count(ModuleState::SKIPPED)) + " skipped, " +
                 std::to_string(report.count(ModuleState::PLANNED)) + " planned, " +
                 std::to_string(report.count(ModuleState::BLOCKED)) + " blocked, " +
                 std::to_string(report.count(ModuleState::FAILED)) + " failed");
    return report;
}

void Orchestrator::run_batch(const Batch& batch, const RunOptions& options, ExecutionSession& session,
                             RunReport& report, std::vector<ModuleId>& completed) {
    std::mutex mutex;
    std::atomic<size_t> next{0};
    std::atomic<bool> halted{false};

    auto worker = [&]() {
        for (;;) {
            if (halted.load()) return;
            const size_t i = next.fetch_add(1);
            if (i >= batch.size()) return;

            const ModuleDescriptor& descriptor = registry_.get(batch[i]);
            ModuleReport result = session.execute_module(descriptor, options.forces(descriptor.id),
                                                          options.dry_run);

            std::lock_guard<std::mutex> lock(mutex);
            if (result.state == ModuleState::COMPLETED) {
                completed.push_back(result.id);
            }
            if ((result.state == ModuleState::BLOCKED || result.state == ModuleState::FAILED) &&
                !report.failed_module) {
                report.failed_module = result.id;
                report.error_kind = result.kind;
                report.error_message = result.message;
                halted = true;
            }
            for (auto& m : report.modules) {
                if (m.id == result.id) {
                    m = std::move(result);
                    break;
                }
            }
        }
    };

    const size_t workers = std::min(options.max_parallel, batch.size());
    if (workers <= 1) {
        worker();
        return;
    }
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t t = 0; t < workers; ++t) {
        threads.emplace_back(worker);
    }
    // Barrier: the batch ends when every launched member is terminal
    for (auto& th : threads) {
        th.join();
    }
}

} // namespace hostprov
