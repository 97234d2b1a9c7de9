// src/core/engine.cpp
#include "hostprov/core/engine.h"
#include "modules/manifest/manifest_loader.h"
#include "modules/monitor/performance_monitor.h"
#include "modules/rollback/rollback_executor.h"
#include "common/utils/file_ops.h"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace hostprov {

namespace fs = std::filesystem;

std::string make_run_id(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    oss << std::put_time(&tm, "%Y%m%d-%H%M%S") << "-" << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

std::unique_ptr<ProvisionEngine> ProvisionEngine::from_manifest_file(const fs::path& path,
                                                                     EngineConfig config,
                                                                     Logger& logger) {
    Manifest manifest = ManifestLoader::load_file(path);
    auto engine = std::make_unique<ProvisionEngine>(std::move(config), logger);
    engine->set_default_vars(std::move(manifest.vars));
    for (auto& d : manifest.modules) {
        engine->register_module(std::move(d));
    }
    logger.debug("Loaded " + std::to_string(engine->registry().size()) + " module(s) from " + path.string());
    return engine;
}

std::unique_ptr<ProvisionEngine> ProvisionEngine::from_manifest(const std::string& yaml,
                                                                EngineConfig config,
                                                                Logger& logger) {
    Manifest manifest = ManifestLoader::load_string(yaml);
    auto engine = std::make_unique<ProvisionEngine>(std::move(config), logger);
    engine->set_default_vars(std::move(manifest.vars));
    for (auto& d : manifest.modules) {
        engine->register_module(std::move(d));
    }
    return engine;
}

ProvisionEngine::ProvisionEngine(EngineConfig config, Logger& logger, std::shared_ptr<CommandRunner> runner)
    : config_(std::move(config)),
      logger_(logger),
      runner_(runner ? std::move(runner) : std::make_shared<PosixCommandRunner>()),
      checkpoints_(config_.checkpoint_dir(), logger),
      transactions_(config_.transaction_log_path(), logger) {}

void ProvisionEngine::register_module(ModuleDescriptor descriptor) {
    registry_.register_module(std::move(descriptor));
}

Context ProvisionEngine::effective_vars() const {
    Context vars = default_vars_.is_object() ? default_vars_ : Context::object();
    vars.merge_patch(config_.vars);
    return vars;
}

RunReport ProvisionEngine::run(RunOptions options) {
    options.max_parallel = config_.max_parallel;
    const auto started = std::chrono::system_clock::now();
    const std::string run_id = make_run_id(started);

    TraceExporter traces("run-" + run_id);
    MonitorSettings monitor_settings = config_.monitor_settings();
    if (options.dry_run) {
        monitor_settings.metrics_file.clear();
    }
    PerformanceMonitor monitor(monitor_settings, logger_);

    Orchestrator orchestrator(registry_, checkpoints_, transactions_, *runner_, logger_);
    orchestrator.set_config(effective_vars());
    orchestrator.add_observer(&traces);
    orchestrator.add_observer(&monitor);

    RunReport report;
    monitor.start();
    try {
        report = orchestrator.run(options);
    } catch (const ConfigurationError& e) {
        logger_.error(std::string("Configuration error: ") + e.what());
        report = RunReport{};
        report.error_kind = ErrorKind::CONFIGURATION;
        report.error_message = e.what();
        if (!e.modules().empty()) report.failed_module = e.modules().front();
        report.exit_code = ExitCode::CONFIGURATION_ERROR;
    } catch (const StorageError& e) {
        logger_.fatal(std::string("Storage error: ") + e.what());
        report = RunReport{};
        report.error_kind = ErrorKind::STORAGE;
        report.error_message = e.what();
        report.exit_code = ExitCode::STORAGE_ERROR;
    }
    monitor.stop();

    report.run_id = run_id;
    report.dry_run = options.dry_run;
    if (!report.started_at) report.started_at = started;
    if (!report.finished_at) report.finished_at = std::chrono::system_clock::now();
    last_traces_ = traces.get_traces();

    if (!options.dry_run) {
        write_session_record(report, traces);
    }
    return report;
}

void ProvisionEngine::write_session_record(const RunReport& report, const TraceExporter& traces) {
    const fs::path dir = config_.sessions_dir();
    try {
        ensure_directory(dir, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
        // Never overwrite an earlier run's record
        std::error_code ec;
        fs::path file = dir / ("run-" + report.run_id + ".json");
        for (int n = 2; fs::exists(file, ec); ++n) {
            file = dir / ("run-" + report.run_id + "-" + std::to_string(n) + ".json");
        }
        nlohmann::json record = report.to_json();
        record["trace"] = traces.to_json();
        record["config"] = config_.to_json();
        std::ofstream out(file);
        if (!out.is_open()) {
            throw StorageError("Cannot open " + file.string());
        }
        out << record.dump(2) << "\n";
        last_report_path_ = file;
        logger_.debug("Run report written to " + file.string());
    } catch (const StorageError& e) {
        // The run's own state is already durable; only the summary is lost
        logger_.error(std::string("Failed to write run report: ") + e.what());
    }
}

RollbackReport ProvisionEngine::rollback() {
    RollbackExecutor executor(transactions_, *runner_, logger_);
    RollbackReport report = executor.execute();
    const size_t cleared = checkpoints_.clear_all();
    const std::string text = "Full rollback finished (" + report.summary() + "), " + std::to_string(cleared) +
                             " checkpoint(s) cleared";
    if (report.recorded()) {
        logger_.info(text);
    } else {
        logger_.error(text);
    }
    return report;
}

nlohmann::json ProvisionEngine::status() const {
    nlohmann::json j;
    j["state_dir"] = config_.state_dir.string();
    const auto present = checkpoints_.list();
    j["checkpoints"] = nlohmann::json::array();
    for (const auto& id : present) {
        nlohmann::json item{{"id", id}};
        if (auto cp = checkpoints_.get(id)) {
            item["created_at"] = format_utc_timestamp(cp->created_at);
            item["hostname"] = cp->hostname;
            item["user"] = cp->user;
        }
        j["checkpoints"].push_back(std::move(item));
    }

    j["modules"] = nlohmann::json::array();
    for (const auto& m : registry_.modules()) {
        j["modules"].push_back({{"id", m.id}, {"completed", present.count(m.id) > 0}});
    }

    const LogValidation validation = transactions_.validate();
    j["transactions"] = {
        {"path", transactions_.path().string()},
        {"count", transactions_.count()},
        {"valid", validation.valid}
    };
    if (validation.first_bad_line) {
        j["transactions"]["first_bad_line"] = *validation.first_bad_line;
        j["transactions"]["reason"] = validation.reason;
    }
    return j;
}

fs::path ProvisionEngine::archive_log(const fs::path& destination) {
    return transactions_.archive(destination);
}

} // namespace hostprov
