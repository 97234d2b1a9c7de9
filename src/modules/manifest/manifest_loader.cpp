// modules/manifest/manifest_loader.cpp
#include "modules/manifest/manifest_loader.h"
#include "common/utils/yaml_json.h"
#include <set>

namespace hostprov {

namespace {

const std::set<std::string> kModuleKeys = {
    "id", "depends_on", "parallel_group", "expected_duration_sec",
    "requires", "requires_checkpoints", "check", "steps"
};
const std::set<std::string> kStepKeys = {"action", "run", "rollback"};

[[noreturn]] void invalid(const std::string& where, const std::string& what) {
    throw ConfigurationError(where + ": " + what);
}

std::string required_string(const nlohmann::json& obj, const std::string& key, const std::string& where) {
    if (!obj.contains(key)) invalid(where, "missing '" + key + "'");
    const auto& v = obj.at(key);
    if (!v.is_string() || v.get<std::string>().empty()) invalid(where, "'" + key + "' must be a non-empty string");
    return v.get<std::string>();
}

std::optional<std::string> optional_string(const nlohmann::json& obj, const std::string& key,
                                           const std::string& where) {
    if (!obj.contains(key) || obj.at(key).is_null()) return std::nullopt;
    const auto& v = obj.at(key);
    if (!v.is_string()) invalid(where, "'" + key + "' must be a string");
    return v.get<std::string>();
}

// Accepts a single string or a list of strings
std::vector<std::string> string_list(const nlohmann::json& obj, const std::string& key, const std::string& where) {
    std::vector<std::string> out;
    if (!obj.contains(key) || obj.at(key).is_null()) return out;
    const auto& v = obj.at(key);
    if (v.is_string()) {
        out.push_back(v.get<std::string>());
        return out;
    }
    if (!v.is_array()) invalid(where, "'" + key + "' must be a list of strings");
    for (const auto& item : v) {
        if (!item.is_string() || item.get<std::string>().empty()) {
            invalid(where, "'" + key + "' must contain only non-empty strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

void reject_unknown_keys(const nlohmann::json& obj, const std::set<std::string>& allowed, const std::string& where) {
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!allowed.count(it.key())) invalid(where, "unknown field '" + it.key() + "'");
    }
}

} // namespace

Manifest ManifestLoader::load_file(const std::filesystem::path& path) {
    return from_json(load_yaml_file(path), path.string());
}

Manifest ManifestLoader::load_string(const std::string& yaml, const std::string& source_name) {
    return from_json(load_yaml_string(yaml, source_name), source_name);
}

Manifest ManifestLoader::from_json(const nlohmann::json& doc, const std::string& source_name) {
    if (!doc.is_object()) {
        invalid(source_name, "manifest must be a mapping with a 'modules' list");
    }
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (it.key() != "modules" && it.key() != "vars") {
            invalid(source_name, "unknown top-level field '" + it.key() + "'");
        }
    }

    Manifest manifest;
    if (doc.contains("vars") && !doc["vars"].is_null()) {
        if (!doc["vars"].is_object()) invalid(source_name, "'vars' must be a mapping");
        manifest.vars = doc["vars"];
    }

    if (!doc.contains("modules") || doc["modules"].is_null()) {
        return manifest;  // empty manifest: nothing to do
    }
    const auto& modules = doc["modules"];
    if (!modules.is_array()) {
        invalid(source_name, "'modules' must be a list");
    }
    for (size_t i = 0; i < modules.size(); ++i) {
        manifest.modules.push_back(parse_module(modules[i], i, source_name));
    }
    return manifest;
}

ModuleDescriptor ManifestLoader::parse_module(const nlohmann::json& entry, size_t index, const std::string& source) {
    std::string where = source + ": modules[" + std::to_string(index) + "]";
    if (!entry.is_object()) invalid(where, "module entry must be a mapping");

    ModuleDescriptor d;
    d.id = required_string(entry, "id", where);
    where += " (" + d.id + ")";
    reject_unknown_keys(entry, kModuleKeys, where);

    d.dependencies = string_list(entry, "depends_on", where);
    d.parallel_group = optional_string(entry, "parallel_group", where);

    if (entry.contains("expected_duration_sec") && !entry["expected_duration_sec"].is_null()) {
        const auto& v = entry["expected_duration_sec"];
        if (!v.is_number_integer() || v.get<int64_t>() <= 0) {
            invalid(where, "'expected_duration_sec' must be a positive integer");
        }
        d.expected_duration = std::chrono::seconds(v.get<int64_t>());
    }

    CommandModuleSpec spec;
    spec.required_values = string_list(entry, "requires", where);
    spec.required_checkpoints = string_list(entry, "requires_checkpoints", where);
    spec.check = optional_string(entry, "check", where);

    if (entry.contains("steps") && !entry["steps"].is_null()) {
        const auto& steps = entry["steps"];
        if (!steps.is_array()) invalid(where, "'steps' must be a list");
        for (size_t s = 0; s < steps.size(); ++s) {
            spec.steps.push_back(parse_step(steps[s], where + ".steps[" + std::to_string(s) + "]", d.id, s));
        }
    }

    d.impl = std::make_shared<CommandModule>(std::move(spec));
    return d;
}

CommandStep ManifestLoader::parse_step(const nlohmann::json& entry, const std::string& where, const ModuleId& id,
                                       size_t index) {
    if (!entry.is_object()) invalid(where, "step must be a mapping");
    reject_unknown_keys(entry, kStepKeys, where);

    CommandStep step;
    step.run = required_string(entry, "run", where);
    step.action = optional_string(entry, "action", where)
                      .value_or(id + " step " + std::to_string(index + 1));
    step.rollback = optional_string(entry, "rollback", where).value_or("");

    if (step.action.empty() || step.action.find_first_of("|\n\r") != std::string::npos) {
        invalid(where, "'action' must be a non-empty single line without '|'");
    }
    if (step.action.rfind(kRollbackMarkerPrefix, 0) == 0) {
        invalid(where, std::string("'action' must not start with the reserved prefix '") +
                           kRollbackMarkerPrefix + "'");
    }
    if (step.rollback.find_first_of("\n\r") != std::string::npos) {
        invalid(where, "'rollback' must be a single line");
    }
    return step;
}

} // namespace hostprov
