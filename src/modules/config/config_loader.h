// modules/config/config_loader.h
#ifndef HOSTPROV_MODULES_CONFIG_CONFIG_LOADER_H
#define HOSTPROV_MODULES_CONFIG_CONFIG_LOADER_H

#include "hostprov/core/types.h"
#include "common/logging/logger.h"
#include "modules/monitor/performance_monitor.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hostprov {

struct EngineConfig {
    std::filesystem::path state_dir = "/var/lib/hostprov";
    LogLevel log_level = LogLevel::INFO;
    std::optional<std::filesystem::path> log_file;
    size_t max_parallel = 4;
    std::chrono::milliseconds sample_interval{1000};
    double warn_ratio = 1.5;
    double critical_ratio = 2.0;
    Context vars = Context::object();   // handed to modules as ModuleContext::config

    std::vector<std::filesystem::path> sources;   // layers that were applied, in order

    std::filesystem::path checkpoint_dir() const { return state_dir / "checkpoints"; }
    std::filesystem::path transaction_log_path() const { return state_dir / "transactions.log"; }
    std::filesystem::path sessions_dir() const { return state_dir / "sessions"; }
    std::filesystem::path lock_path() const { return state_dir / "provision.lock"; }
    std::filesystem::path metrics_path() const { return state_dir / "metrics" / "phase-timing.jsonl"; }

    MonitorSettings monitor_settings() const;
    nlohmann::json to_json() const;
};

// Layered YAML configuration: defaults, /etc/hostprov/config.yaml, ~/.hostprov.yaml,
// then an explicit file. Later layers win; "vars" maps are merged key by key.
class ConfigLoader {
public:
    static constexpr size_t kMaxParallelLimit = 64;

    // Missing optional layers are skipped; a missing explicit file is a ConfigurationError
    static EngineConfig load(const std::optional<std::filesystem::path>& explicit_file = std::nullopt,
                             Logger& logger = Logger::null());

    // Applies the given layers in order on top of the defaults. Missing files are skipped.
    static EngineConfig load_layers(const std::vector<std::filesystem::path>& layers,
                                    Logger& logger = Logger::null());

    static std::vector<std::filesystem::path> default_layers();

    // Throws ConfigurationError naming the offending key
    static void apply(EngineConfig& config, const nlohmann::json& layer, const std::string& source);
    static void check(const EngineConfig& config);
};

} // namespace hostprov

#endif // HOSTPROV_MODULES_CONFIG_CONFIG_LOADER_H
