// modules/manifest/manifest_loader.h
#ifndef HOSTPROV_MODULES_MANIFEST_MANIFEST_LOADER_H
#define HOSTPROV_MODULES_MANIFEST_MANIFEST_LOADER_H

#include "hostprov/core/module.h"
#include "modules/manifest/command_module.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace hostprov {

struct Manifest {
    std::vector<ModuleDescriptor> modules;   // file order = registration order
    Context vars = Context::object();        // defaults, overridden by configuration vars
};

// Reads the static module list (YAML). Structure errors throw ConfigurationError
// naming the entry and field; graph checks are left to ModuleRegistry.
class ManifestLoader {
public:
    static Manifest load_file(const std::filesystem::path& path);
    static Manifest load_string(const std::string& yaml, const std::string& source_name = "<manifest>");
    static Manifest from_json(const nlohmann::json& doc, const std::string& source_name);

private:
    static ModuleDescriptor parse_module(const nlohmann::json& entry, size_t index, const std::string& source);
    static CommandStep parse_step(const nlohmann::json& entry, const std::string& where, const ModuleId& id,
                                  size_t index);
};

} // namespace hostprov

#endif // HOSTPROV_MODULES_MANIFEST_MANIFEST_LOADER_H
