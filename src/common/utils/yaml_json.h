// common/utils/yaml_json.h
#ifndef HOSTPROV_COMMON_UTILS_YAML_JSON_H
#define HOSTPROV_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <string>

namespace hostprov {

// Plain scalars become bool/null/integer/float where they parse as such;
// quoted scalars always stay strings.
nlohmann::json yaml_to_json(const YAML::Node& node);

// Parse + convert; YAML syntax errors become ConfigurationError naming the source
nlohmann::json load_yaml_string(const std::string& text, const std::string& source_name = "<string>");
nlohmann::json load_yaml_file(const std::filesystem::path& path);

} // namespace hostprov

#endif // HOSTPROV_COMMON_UTILS_YAML_JSON_H
