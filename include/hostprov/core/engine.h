// include/hostprov/core/engine.h
#ifndef HOSTPROV_CORE_ENGINE_H
#define HOSTPROV_CORE_ENGINE_H

#include "hostprov/core/module.h"
#include "modules/config/config_loader.h"
#include "modules/registry/module_registry.h"
#include "modules/scheduler/orchestrator.h"
#include "modules/trace/trace_exporter.h"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace hostprov {

// Wires the store, the log, the registry and the orchestrator for one state directory
class ProvisionEngine {
public:
    static std::unique_ptr<ProvisionEngine> from_manifest_file(const std::filesystem::path& path,
                                                               EngineConfig config,
                                                               Logger& logger = Logger::null());
    static std::unique_ptr<ProvisionEngine> from_manifest(const std::string& yaml,
                                                          EngineConfig config,
                                                          Logger& logger = Logger::null());

    explicit ProvisionEngine(EngineConfig config,
                             Logger& logger = Logger::null(),
                             std::shared_ptr<CommandRunner> runner = nullptr);

    void register_module(ModuleDescriptor descriptor);

    // Defaults for module configuration; EngineConfig::vars overrides them key by key
    void set_default_vars(Context vars) { default_vars_ = std::move(vars); }

    // Never throws for graph or storage problems: they come back as a failed report
    // with the matching exit code. max_parallel is taken from the configuration.
    // Writes sessions/run-<id>.json unless dry-running.
    RunReport run(RunOptions options = RunOptions{});

    // Compensates every transaction in the log not already rolled back, then
    // clears all checkpoints. Operator action, never run implicitly.
    RollbackReport rollback();

    nlohmann::json status() const;
    std::filesystem::path archive_log(const std::filesystem::path& destination = {});

    std::vector<TraceRecord> get_last_traces() const { return last_traces_; }
    std::optional<std::filesystem::path> last_report_path() const { return last_report_path_; }

    const EngineConfig& config() const { return config_; }
    ModuleRegistry& registry() { return registry_; }
    CheckpointStore& checkpoints() { return checkpoints_; }
    TransactionLog& transactions() { return transactions_; }

private:
    Context effective_vars() const;
    void write_session_record(const RunReport& report, const TraceExporter& traces);

    EngineConfig config_;
    Logger& logger_;
    std::shared_ptr<CommandRunner> runner_;
    ModuleRegistry registry_;
    CheckpointStore checkpoints_;
    TransactionLog transactions_;
    Context default_vars_ = Context::object();
    std::vector<TraceRecord> last_traces_;
    std::optional<std::filesystem::path> last_report_path_;
};

// "YYYYmmdd-HHMMSS-mmm" in UTC
std::string make_run_id(std::chrono::system_clock::time_point tp);

} // namespace hostprov

#endif // HOSTPROV_CORE_ENGINE_H
