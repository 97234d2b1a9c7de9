// modules/config/config_loader.cpp
#include "modules/config/config_loader.h"
#include "common/utils/yaml_json.h"
#include <cstdlib>

namespace hostprov {

namespace fs = std::filesystem;

namespace {

[[noreturn]] void bad_value(const std::string& key, const std::string& expected, const std::string& source) {
    throw ConfigurationError("Invalid value for '" + key + "' in " + source + ": expected " + expected);
}

int64_t integer_in_range(const nlohmann::json& value, const std::string& key, int64_t min, int64_t max,
                         const std::string& source) {
    if (!value.is_number_integer()) {
        bad_value(key, "an integer", source);
    }
    const auto n = value.get<int64_t>();
    if (n < min || n > max) {
        bad_value(key, "a value between " + std::to_string(min) + " and " + std::to_string(max), source);
    }
    return n;
}

double positive_number(const nlohmann::json& value, const std::string& key, const std::string& source) {
    if (!value.is_number()) {
        bad_value(key, "a number", source);
    }
    const double d = value.get<double>();
    if (d <= 0.0) {
        bad_value(key, "a positive number", source);
    }
    return d;
}

std::string non_empty_string(const nlohmann::json& value, const std::string& key, const std::string& source) {
    if (!value.is_string() || value.get<std::string>().empty()) {
        bad_value(key, "a non-empty string", source);
    }
    return value.get<std::string>();
}

} // namespace

MonitorSettings EngineConfig::monitor_settings() const {
    MonitorSettings s;
    s.sample_interval = sample_interval;
    s.warn_ratio = warn_ratio;
    s.critical_ratio = critical_ratio;
    s.metrics_file = metrics_path();
    return s;
}

nlohmann::json EngineConfig::to_json() const {
    nlohmann::json j;
    j["state_dir"] = state_dir.string();
    j["max_parallel"] = max_parallel;
    if (log_file) j["log_file"] = log_file->string();
    j["monitor"] = {
        {"sample_interval_ms", sample_interval.count()},
        {"warn_ratio", warn_ratio},
        {"critical_ratio", critical_ratio}
    };
    j["vars"] = vars;
    j["sources"] = nlohmann::json::array();
    for (const auto& s : sources) j["sources"].push_back(s.string());
    return j;
}

std::vector<fs::path> ConfigLoader::default_layers() {
    std::vector<fs::path> layers{"/etc/hostprov/config.yaml"};
    if (const char* home = std::getenv("HOME")) {
        if (*home) layers.push_back(fs::path(home) / ".hostprov.yaml");
    }
    return layers;
}

EngineConfig ConfigLoader::load(const std::optional<fs::path>& explicit_file, Logger& logger) {
    auto layers = default_layers();
    if (explicit_file) {
        std::error_code ec;
        if (!fs::is_regular_file(*explicit_file, ec)) {
            throw ConfigurationError("Configuration file not found: " + explicit_file->string());
        }
        layers.push_back(*explicit_file);
    }
    return load_layers(layers, logger);
}

EngineConfig ConfigLoader::load_layers(const std::vector<fs::path>& layers, Logger& logger) {
    EngineConfig config;
    for (const auto& path : layers) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            logger.debug("Config file not found: " + path.string());
            continue;
        }
        const nlohmann::json layer = load_yaml_file(path);
        apply(config, layer, path.string());
        config.sources.push_back(path);
        logger.debug("Configuration loaded from " + path.string());
    }
    check(config);
    return config;
}

void ConfigLoader::apply(EngineConfig& config, const nlohmann::json& layer, const std::string& source) {
    if (layer.is_null()) {
        return;  // empty file
    }
    if (!layer.is_object()) {
        throw ConfigurationError("Configuration in " + source + " must be a mapping");
    }

    for (auto it = layer.begin(); it != layer.end(); ++it) {
        const std::string& key = it.key();
        const auto& value = it.value();

        if (key == "state_dir") {
            config.state_dir = non_empty_string(value, key, source);
        } else if (key == "log_level") {
            auto level = value.is_string() ? parse_log_level(value.get<std::string>()) : std::nullopt;
            if (!level) bad_value(key, "one of debug, info, warning, error, fatal, off", source);
            config.log_level = *level;
        } else if (key == "log_file") {
            if (value.is_null()) {
                config.log_file.reset();
            } else {
                config.log_file = non_empty_string(value, key, source);
            }
        } else if (key == "max_parallel") {
            config.max_parallel = static_cast<size_t>(
                integer_in_range(value, key, 1, static_cast<int64_t>(kMaxParallelLimit), source));
        } else if (key == "monitor") {
            if (!value.is_object()) bad_value(key, "a mapping", source);
            for (auto m = value.begin(); m != value.end(); ++m) {
                const std::string sub = "monitor." + m.key();
                if (m.key() == "sample_interval_ms") {
                    config.sample_interval = std::chrono::milliseconds(
                        integer_in_range(m.value(), sub, 10, 3'600'000, source));
                } else if (m.key() == "warn_ratio") {
                    config.warn_ratio = positive_number(m.value(), sub, source);
                } else if (m.key() == "critical_ratio") {
                    config.critical_ratio = positive_number(m.value(), sub, source);
                } else {
                    throw ConfigurationError("Unknown configuration key '" + sub + "' in " + source);
                }
            }
        } else if (key == "vars") {
            if (value.is_null()) continue;
            if (!value.is_object()) bad_value(key, "a mapping", source);
            config.vars.merge_patch(value);
        } else {
            throw ConfigurationError("Unknown configuration key '" + key + "' in " + source);
        }
    }
}

void ConfigLoader::check(const EngineConfig& config) {
    if (config.critical_ratio < config.warn_ratio) {
        throw ConfigurationError("monitor.critical_ratio (" + std::to_string(config.critical_ratio) +
                                 ") must not be below monitor.warn_ratio (" +
                                 std::to_string(config.warn_ratio) + ")");
    }
    if (config.max_parallel < 1 || config.max_parallel > kMaxParallelLimit) {
        throw ConfigurationError("max_parallel must be between 1 and " + std::to_string(kMaxParallelLimit));
    }
}

} // namespace hostprov
