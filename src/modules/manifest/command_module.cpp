// modules/manifest/command_module.cpp
#include "modules/manifest/command_module.h"
#include "common/utils/template_renderer.h"

namespace hostprov {

namespace {

// Last part of a command's output, enough to explain a failure in one log line
std::string output_tail(const std::string& output, size_t max_chars = 400) {
    std::string tail = output.size() > max_chars ? "..." + output.substr(output.size() - max_chars) : output;
    while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r')) {
        tail.pop_back();
    }
    return tail;
}

} // namespace

const nlohmann::json* find_dotted(const nlohmann::json& root, const std::string& dotted_key) {
    const nlohmann::json* node = &root;
    size_t start = 0;
    while (start <= dotted_key.size()) {
        const size_t dot = dotted_key.find('.', start);
        const std::string part = dotted_key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!node->is_object()) return nullptr;
        auto it = node->find(part);
        if (it == node->end()) return nullptr;
        node = &*it;
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return node;
}

Context CommandModule::template_context(const ModuleContext& ctx) {
    Context tpl = ctx.config.is_object() ? ctx.config : Context::object();
    tpl["module_id"] = ctx.module_id;
    return tpl;
}

std::vector<CommandStep> CommandModule::render_steps(const std::vector<CommandStep>& steps, const Context& tpl) {
    std::vector<CommandStep> rendered;
    rendered.reserve(steps.size());
    for (const auto& step : steps) {
        rendered.push_back({InjaTemplateRenderer::render(step.action, tpl),
                            InjaTemplateRenderer::render(step.run, tpl),
                            InjaTemplateRenderer::render(step.rollback, tpl)});
    }
    return rendered;
}

Outcome CommandModule::check_prerequisites(const ModuleContext& ctx) {
    std::vector<FieldError> problems;

    for (const auto& key : spec_.required_values) {
        const nlohmann::json* value = find_dotted(ctx.config, key);
        if (!value || value->is_null() || (value->is_string() && value->get<std::string>().empty())) {
            problems.push_back({key, "required value is missing"});
        }
    }
    for (const auto& id : spec_.required_checkpoints) {
        if (!ctx.checkpoints.exists(id)) {
            problems.push_back({"checkpoint:" + id, "module has not completed"});
        }
    }

    // Surface template problems now rather than halfway through execute
    const Context tpl = template_context(ctx);
    for (size_t i = 0; i < spec_.steps.size(); ++i) {
        try {
            auto step = render_steps({spec_.steps[i]}, tpl).front();
            if (step.action.find_first_of("|\n\r") != std::string::npos) {
                problems.push_back({"steps[" + std::to_string(i) + "].action",
                                    "must not contain '|' or line breaks after rendering"});
            }
            if (step.action.rfind(kRollbackMarkerPrefix, 0) == 0) {
                problems.push_back({"steps[" + std::to_string(i) + "].action",
                                    "must not start with the reserved rollback marker prefix"});
            }
        } catch (const ConfigurationError& e) {
            problems.push_back({"steps[" + std::to_string(i) + "]", e.what()});
        }
    }

    if (!problems.empty()) {
        return Outcome::prerequisite_failed("Prerequisites not met for " + ctx.module_id, std::move(problems));
    }

    if (spec_.check) {
        const std::string check_command = InjaTemplateRenderer::render(*spec_.check, tpl);
        ctx.logger.debug(ctx.module_id + ": checking '" + check_command + "'");
        CommandResult result = ctx.runner.run(check_command);
        if (!result.succeeded()) {
            return Outcome::prerequisite_failed("Check failed for " + ctx.module_id + ": '" + check_command +
                                                "' exited with " + std::to_string(result.exit_code));
        }
    }
    return Outcome::ok();
}

Outcome CommandModule::execute(ModuleContext& ctx) {
    const auto steps = render_steps(spec_.steps, template_context(ctx));

    for (size_t i = 0; i < steps.size(); ++i) {
        const auto& step = steps[i];
        const std::string label = "[" + std::to_string(i + 1) + "/" + std::to_string(steps.size()) + "] ";

        if (!step.rollback.empty()) {
            ctx.transactions.record(step.action, step.rollback);
        }
        ctx.logger.info(ctx.module_id + " " + label + step.action);

        CommandResult result = ctx.runner.run(step.run);
        if (!result.succeeded()) {
            std::string message = "Step " + std::to_string(i + 1) + " ('" + step.action + "') failed with exit code " +
                                  std::to_string(result.exit_code);
            const std::string tail = output_tail(result.output);
            if (!tail.empty()) {
                message += ": " + tail;
            }
            return Outcome::execution_failed(message);
        }
    }
    return Outcome::ok(std::to_string(steps.size()) + " step(s) applied");
}

} // namespace hostprov
