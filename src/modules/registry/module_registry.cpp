// modules/registry/module_registry.cpp
#include "modules/registry/module_registry.h"
#include <algorithm>
#include <functional>
#include <unordered_set>

namespace hostprov {

size_t ExecutionPlan::module_count() const {
    size_t n = 0;
    for (const auto& batch : batches) n += batch.size();
    return n;
}

nlohmann::json ExecutionPlan::to_json() const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& batch : batches) {
        j.push_back(batch);
    }
    return j;
}

void ModuleRegistry::register_module(ModuleDescriptor descriptor) {
    if (descriptor.id.empty()) {
        throw ConfigurationError("Module id must not be empty");
    }
    if (!CheckpointStore::is_valid_id(descriptor.id)) {
        throw ConfigurationError("Invalid module id: '" + descriptor.id + "'", {descriptor.id});
    }
    if (index_.count(descriptor.id)) {
        throw ConfigurationError("Duplicate module id: " + descriptor.id, {descriptor.id});
    }
    if (!descriptor.impl) {
        throw ConfigurationError("Module has no implementation: " + descriptor.id, {descriptor.id});
    }

    // Repeated dependency ids collapse to the first occurrence
    std::unordered_set<ModuleId> seen;
    std::vector<ModuleId> deps;
    for (auto& dep : descriptor.dependencies) {
        if (seen.insert(dep).second) deps.push_back(std::move(dep));
    }
    descriptor.dependencies = std::move(deps);

    index_[descriptor.id] = modules_.size();
    modules_.push_back(std::move(descriptor));
}

const ModuleDescriptor& ModuleRegistry::get(const ModuleId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw ConfigurationError("Unknown module: " + id, {id});
    }
    return modules_[it->second];
}

void ModuleRegistry::validate() const {
    check_dependencies_resolve();
    check_acyclic();
}

void ModuleRegistry::check_dependencies_resolve() const {
    for (const auto& m : modules_) {
        std::vector<ModuleId> missing;
        for (const auto& dep : m.dependencies) {
            if (!index_.count(dep)) missing.push_back(dep);
        }
        if (!missing.empty()) {
            std::string list;
            for (const auto& dep : missing) {
                if (!list.empty()) list += ", ";
                list += dep;
            }
            std::vector<ModuleId> involved{m.id};
            involved.insert(involved.end(), missing.begin(), missing.end());
            throw ConfigurationError("Module '" + m.id + "' depends on unknown module(s): " + list,
                                     std::move(involved));
        }
    }
}

void ModuleRegistry::check_acyclic() const {
    enum class Mark { NEW, ACTIVE, DONE };
    std::vector<Mark> mark(modules_.size(), Mark::NEW);
    std::vector<size_t> stack;

    std::function<void(size_t)> visit = [&](size_t i) {
        mark[i] = Mark::ACTIVE;
        stack.push_back(i);
        for (const auto& dep : modules_[i].dependencies) {
            const size_t j = index_.at(dep);
            if (mark[j] == Mark::ACTIVE) {
                auto from = std::find(stack.begin(), stack.end(), j);
                std::vector<ModuleId> members;
                std::string path;
                for (auto it = from; it != stack.end(); ++it) {
                    members.push_back(modules_[*it].id);
                    path += modules_[*it].id + " -> ";
                }
                path += modules_[j].id;
                throw ConfigurationError("Dependency cycle detected: " + path, std::move(members));
            }
            if (mark[j] == Mark::NEW) {
                visit(j);
            }
        }
        stack.pop_back();
        mark[i] = Mark::DONE;
    };

    for (size_t i = 0; i < modules_.size(); ++i) {
        if (mark[i] == Mark::NEW) visit(i);
    }
}

ExecutionPlan ModuleRegistry::plan() const {
    validate();

    // In-degree and reverse edges (dependency -> dependents), as in a Kahn walk
    std::vector<size_t> in_degree(modules_.size(), 0);
    std::vector<std::vector<size_t>> dependents(modules_.size());
    for (size_t i = 0; i < modules_.size(); ++i) {
        for (const auto& dep : modules_[i].dependencies) {
            dependents[index_.at(dep)].push_back(i);
            ++in_degree[i];
        }
    }

    ExecutionPlan plan;
    std::vector<bool> planned(modules_.size(), false);
    size_t remaining = modules_.size();

    while (remaining > 0) {
        std::vector<size_t> ready;
        for (size_t i = 0; i < modules_.size(); ++i) {
            if (!planned[i] && in_degree[i] == 0) ready.push_back(i);
        }
        // validate() rules this out; kept so a bug cannot spin forever
        if (ready.empty()) {
            throw ConfigurationError("Dependency graph has no ready module; cycle suspected");
        }

        std::vector<size_t> members;
        const auto& group = modules_[ready.front()].parallel_group;
        if (group) {
            for (size_t i : ready) {
                if (modules_[i].parallel_group == group) members.push_back(i);
            }
        } else {
            members.push_back(ready.front());
        }

        Batch batch;
        for (size_t i : members) {
            planned[i] = true;
            --remaining;
            batch.push_back(modules_[i].id);
        }
        for (size_t i : members) {
            for (size_t d : dependents[i]) --in_degree[d];
        }
        plan.batches.push_back(std::move(batch));
    }
    return plan;
}

} // namespace hostprov
