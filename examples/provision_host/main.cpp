// main.cpp
#include <atomic>
#include <csignal>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include "hostprov/core/engine.h"
#include "modules/lock/run_lock.h"

namespace {

std::atomic<bool> g_cancel{false};

void handle_signal(int) {
    g_cancel.store(true);
}

struct CliOptions {
    std::optional<std::string> config_file;
    std::optional<std::string> state_dir;
    std::optional<std::string> log_level;
    std::optional<std::string> manifest;
    bool dry_run = false;
    bool yes = false;
    bool force_all = false;
    std::set<std::string> force;
    bool rollback = false;
    bool status = false;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--config FILE] [--state-dir DIR] [--dry-run] [--yes]\n"
                 "       [--force[=ID]] [--rollback] [--status] [--log-level LVL] MANIFEST\n";
}

// Returns false on a usage error
bool parse_args(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value_of = [&](const std::string& flag) -> std::optional<std::string> {
            if (arg.rfind(flag + "=", 0) == 0) return arg.substr(flag.size() + 1);
            if (arg == flag && i + 1 < argc) return std::string(argv[++i]);
            return std::nullopt;
        };

        if (arg == "--dry-run") {
            opts.dry_run = true;
        } else if (arg == "--yes" || arg == "-y") {
            opts.yes = true;
        } else if (arg == "--rollback") {
            opts.rollback = true;
        } else if (arg == "--status") {
            opts.status = true;
        } else if (arg == "--force") {
            opts.force_all = true;
        } else if (arg.rfind("--force=", 0) == 0) {
            const std::string id = arg.substr(8);
            if (id.empty()) return false;
            opts.force.insert(id);
        } else if (arg.rfind("--config", 0) == 0) {
            if (!(opts.config_file = value_of("--config"))) return false;
        } else if (arg.rfind("--state-dir", 0) == 0) {
            if (!(opts.state_dir = value_of("--state-dir"))) return false;
        } else if (arg.rfind("--log-level", 0) == 0) {
            if (!(opts.log_level = value_of("--log-level"))) return false;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else if (!opts.manifest) {
            opts.manifest = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return false;
        }
    }
    if (opts.rollback && opts.status) return false;
    // A run needs the module list; status and rollback work on the state directory alone
    return opts.manifest || opts.rollback || opts.status;
}

bool confirm(const std::string& question) {
    std::cout << question << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    return answer == "y" || answer == "Y" || answer == "yes";
}

void print_summary(const hostprov::RunReport& report) {
    using hostprov::ModuleState;
    std::cout << "\n=== Run " << report.run_id << (report.dry_run ? " (dry run)" : "") << " ===\n";
    for (const auto& m : report.modules) {
        std::cout << "  " << m.id << ": " << hostprov::to_string(m.state);
        if (!m.message.empty()) std::cout << " - " << m.message;
        std::cout << "\n";
        for (const auto& d : m.details) {
            std::cout << "      " << d.field << ": " << d.reason << "\n";
        }
    }
    std::cout << "Completed: " << report.count(ModuleState::COMPLETED)
              << ", skipped: " << report.count(ModuleState::SKIPPED)
              << ", planned: " << report.count(ModuleState::PLANNED)
              << ", blocked: " << report.count(ModuleState::BLOCKED)
              << ", failed: " << report.count(ModuleState::FAILED) << "\n";
    if (report.failed_module) {
        std::cerr << "[ERROR] " << *report.failed_module << ": " << report.error_message << "\n";
    } else if (!report.success) {
        std::cerr << "[ERROR] " << report.error_message << "\n";
    }
    if (report.rollback) {
        std::cout << "Rollback: " << report.rollback->summary() << "\n";
        for (const auto& f : report.rollback->failed) {
            std::cerr << "  [rollback failed] " << f.entry.action << ": " << f.error << "\n";
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace hostprov;

    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return static_cast<int>(ExitCode::USAGE);
    }

    EngineConfig config;
    try {
        config = ConfigLoader::load(opts.config_file);
    } catch (const ConfigurationError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return static_cast<int>(ExitCode::CONFIGURATION_ERROR);
    }
    if (opts.state_dir) config.state_dir = *opts.state_dir;
    if (opts.log_level) {
        auto level = parse_log_level(*opts.log_level);
        if (!level) {
            std::cerr << "Invalid log level: " << *opts.log_level << "\n";
            return static_cast<int>(ExitCode::USAGE);
        }
        config.log_level = *level;
    }

    Logger logger(config.log_level);
    try {
        if (config.log_file) logger.set_log_file(config.log_file->string());

        std::unique_ptr<ProvisionEngine> engine =
            opts.manifest ? ProvisionEngine::from_manifest_file(*opts.manifest, config, logger)
                          : std::make_unique<ProvisionEngine>(config, logger);

        if (opts.status) {
            std::cout << engine->status().dump(2) << std::endl;
            return static_cast<int>(ExitCode::SUCCESS);
        }

        if (opts.rollback) {
            if (!opts.yes && !confirm("Roll back every recorded transaction in " + config.state_dir.string() + "?")) {
                std::cout << "Aborted.\n";
                return static_cast<int>(ExitCode::SUCCESS);
            }
            RunLock lock(config.lock_path(), logger);
            RollbackReport report = engine->rollback();
            std::cout << "Rollback: " << report.summary() << "\n";
            if (!report.marker_error.empty()) {
                std::cerr << "Rollback marker not written: " << report.marker_error << "\n";
            }
            return static_cast<int>(exit_code_for(report));
        }

        // Fail fast on graph problems before asking anything
        const ExecutionPlan plan = engine->registry().plan();

        if (!opts.dry_run && !opts.yes) {
            std::cout << "About to provision " << plan.module_count() << " module(s) in "
                      << plan.batches.size() << " batch(es) using state in " << config.state_dir << "\n";
            if (!confirm("Continue?")) {
                std::cout << "Aborted.\n";
                return static_cast<int>(ExitCode::SUCCESS);
            }
        }

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        RunOptions run_options;
        run_options.dry_run = opts.dry_run;
        run_options.force_all = opts.force_all;
        run_options.force = opts.force;
        run_options.cancel = &g_cancel;

        std::optional<RunLock> lock;
        if (!opts.dry_run) lock.emplace(config.lock_path(), logger);

        RunReport report = engine->run(run_options);
        print_summary(report);
        if (auto path = engine->last_report_path()) {
            std::cout << "Report: " << path->string() << "\n";
        }
        return static_cast<int>(report.exit_code);

    } catch (const RunLockError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return static_cast<int>(ExitCode::LOCK_HELD);
    } catch (const ConfigurationError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return static_cast<int>(ExitCode::CONFIGURATION_ERROR);
    } catch (const StorageError& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return static_cast<int>(ExitCode::STORAGE_ERROR);
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return static_cast<int>(ExitCode::EXECUTION_FAILED);
    }
}
