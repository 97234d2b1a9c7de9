// modules/registry/module_registry.h
#ifndef HOSTPROV_MODULES_REGISTRY_MODULE_REGISTRY_H
#define HOSTPROV_MODULES_REGISTRY_MODULE_REGISTRY_H

#include "hostprov/core/module.h"
#include <nlohmann/json.hpp>
#include <unordered_map>
#include <vector>

namespace hostprov {

// Modules that may run concurrently
using Batch = std::vector<ModuleId>;

struct ExecutionPlan {
    std::vector<Batch> batches;

    size_t module_count() const;
    bool empty() const { return batches.empty(); }
    nlohmann::json to_json() const;
};

// Static dependency graph. Descriptors are immutable once registered.
class ModuleRegistry {
public:
    // Throws ConfigurationError on an empty, malformed or duplicate id, or a missing impl
    void register_module(ModuleDescriptor descriptor);

    // Throws ConfigurationError for unresolved dependencies or a cycle.
    // Cycle errors name the members in order, e.g. "a -> b -> a".
    void validate() const;

    // validate(), then batches built by repeatedly taking ready modules.
    // A ready module with a parallel_group takes every ready member of that group along;
    // ties go to registration order.
    ExecutionPlan plan() const;

    const ModuleDescriptor& get(const ModuleId& id) const;
    bool contains(const ModuleId& id) const { return index_.count(id) > 0; }
    size_t size() const { return modules_.size(); }
    const std::vector<ModuleDescriptor>& modules() const { return modules_; }

private:
    void check_dependencies_resolve() const;
    void check_acyclic() const;

    std::vector<ModuleDescriptor> modules_;           // registration order
    std::unordered_map<ModuleId, size_t> index_;      // id -> position in modules_
};

} // namespace hostprov

#endif // HOSTPROV_MODULES_REGISTRY_MODULE_REGISTRY_H
