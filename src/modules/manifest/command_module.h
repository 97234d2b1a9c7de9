// modules/manifest/command_module.h
#ifndef HOSTPROV_MODULES_MANIFEST_COMMAND_MODULE_H
#define HOSTPROV_MODULES_MANIFEST_COMMAND_MODULE_H

#include "hostprov/core/module.h"
#include <optional>
#include <string>
#include <vector>

namespace hostprov {

struct CommandStep {
    std::string action;     // log description, rendered
    std::string run;        // forward command, rendered
    std::string rollback;   // compensating command; empty means nothing to undo
};

struct CommandModuleSpec {
    std::vector<std::string> required_values;     // dotted config keys ("user.name")
    std::vector<ModuleId> required_checkpoints;
    std::optional<std::string> check;             // side-effect free command, must exit 0
    std::vector<CommandStep> steps;
};

// Shell-backed module built from a manifest entry. Every string is an inja template
// rendered against the module's configuration.
class CommandModule : public ProvisionModule {
public:
    explicit CommandModule(CommandModuleSpec spec) : spec_(std::move(spec)) {}

    Outcome check_prerequisites(const ModuleContext& ctx) override;

    // Records each step's transaction before its command runs, then stops at the
    // first failing step.
    Outcome execute(ModuleContext& ctx) override;

    const CommandModuleSpec& spec() const { return spec_; }

private:
    static Context template_context(const ModuleContext& ctx);
    static std::vector<CommandStep> render_steps(const std::vector<CommandStep>& steps, const Context& tpl);

    CommandModuleSpec spec_;
};

// Looks up "a.b.c" in a JSON object; nullptr when any segment is missing
const nlohmann::json* find_dotted(const nlohmann::json& root, const std::string& dotted_key);

} // namespace hostprov

#endif // HOSTPROV_MODULES_MANIFEST_COMMAND_MODULE_H
