// tests/test_module_registry.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/registry/module_registry.h"
#include "test_support.h"
#include <algorithm>

using namespace hostprov;
using namespace hostprov::testing;

namespace {

std::shared_ptr<ScriptedModule> noop() {
    return std::make_shared<ScriptedModule>();
}

size_t batch_index(const ExecutionPlan& plan, const ModuleId& id) {
    for (size_t i = 0; i < plan.batches.size(); ++i) {
        const auto& b = plan.batches[i];
        if (std::find(b.begin(), b.end(), id) != b.end()) return i;
    }
    return plan.batches.size();
}

} // namespace

TEST_CASE("An empty registry plans nothing", "[registry]") {
    ModuleRegistry registry;
    ExecutionPlan plan = registry.plan();
    REQUIRE(plan.empty());
    REQUIRE(plan.module_count() == 0);
}

TEST_CASE("Registration rejects bad descriptors", "[registry]") {
    ModuleRegistry registry;
    registry.register_module(make_module("system-prep", {}, noop()));

    REQUIRE_THROWS_AS(registry.register_module(make_module("system-prep", {}, noop())), ConfigurationError);
    REQUIRE_THROWS_AS(registry.register_module(make_module("", {}, noop())), ConfigurationError);
    REQUIRE_THROWS_AS(registry.register_module(make_module("bad/id", {}, noop())), ConfigurationError);
    REQUIRE_THROWS_AS(registry.register_module(make_module("no-impl", {}, nullptr)), ConfigurationError);
    REQUIRE(registry.size() == 1);
}

TEST_CASE("Repeated dependencies collapse", "[registry]") {
    ModuleRegistry registry;
    registry.register_module(make_module("a", {}, noop()));
    registry.register_module(make_module("b", {"a", "a"}, noop()));
    REQUIRE(registry.get("b").dependencies == std::vector<ModuleId>{"a"});
    REQUIRE_THROWS_AS(registry.get("missing"), ConfigurationError);
}

TEST_CASE("Unresolved dependencies are named", "[registry]") {
    ModuleRegistry registry;
    registry.register_module(make_module("desktop-env", {"system-prep", "drivers"}, noop()));
    registry.register_module(make_module("system-prep", {}, noop()));

    try {
        registry.validate();
        FAIL("validate() accepted an unresolved dependency");
    } catch (const ConfigurationError& e) {
        REQUIRE(std::string(e.what()).find("drivers") != std::string::npos);
        REQUIRE(e.modules() == std::vector<ModuleId>{"desktop-env", "drivers"});
    }
    REQUIRE_THROWS_AS(registry.plan(), ConfigurationError);
}

TEST_CASE("Cycles are reported with their members", "[registry]") {
    ModuleRegistry registry;
    registry.register_module(make_module("a", {"b"}, noop()));
    registry.register_module(make_module("b", {"a"}, noop()));
    registry.register_module(make_module("c", {}, noop()));

    try {
        registry.plan();
        FAIL("plan() accepted a cycle");
    } catch (const ConfigurationError& e) {
        REQUIRE(std::string(e.what()) == "Dependency cycle detected: a -> b -> a");
        auto members = e.modules();
        std::sort(members.begin(), members.end());
        REQUIRE(members == std::vector<ModuleId>{"a", "b"});
    }
}

TEST_CASE("A module depending on itself is a cycle", "[registry]") {
    ModuleRegistry registry;
    registry.register_module(make_module("loop", {"loop"}, noop()));
    try {
        registry.validate();
        FAIL("validate() accepted a self dependency");
    } catch (const ConfigurationError& e) {
        REQUIRE(e.modules() == std::vector<ModuleId>{"loop"});
    }
}

TEST_CASE("A dependency chain plans one module per batch", "[registry]") {
    ModuleRegistry registry;
    registry.register_module(make_module("system-prep", {}, noop()));
    registry.register_module(make_module("desktop-env", {"system-prep"}, noop()));
    registry.register_module(make_module("rdp-server", {"desktop-env"}, noop()));

    ExecutionPlan plan = registry.plan();
    REQUIRE(plan.batches == std::vector<Batch>{{"system-prep"}, {"desktop-env"}, {"rdp-server"}});
    REQUIRE(plan.to_json().dump() == R"([["system-prep"],["desktop-env"],["rdp-server"]])");
}

TEST_CASE("Ready members of a parallel group share a batch", "[registry]") {
    ModuleRegistry registry;
    registry.register_module(make_module("base", {}, noop()));
    registry.register_module(make_module("x", {"base"}, noop(), "tools"));
    registry.register_module(make_module("y", {"base"}, noop(), "tools"));
    registry.register_module(make_module("z", {"x", "y"}, noop()));

    ExecutionPlan plan = registry.plan();
    REQUIRE(plan.batches == std::vector<Batch>{{"base"}, {"x", "y"}, {"z"}});
}

TEST_CASE("A group member waits for its own dependencies", "[registry]") {
    ModuleRegistry registry;
    registry.register_module(make_module("base", {}, noop()));
    registry.register_module(make_module("early", {}, noop(), "tools"));
    registry.register_module(make_module("late", {"base"}, noop(), "tools"));

    ExecutionPlan plan = registry.plan();
    REQUIRE(plan.batches == std::vector<Batch>{{"base"}, {"early", "late"}});
}

TEST_CASE("Independent ungrouped modules follow registration order", "[registry]") {
    ModuleRegistry registry;
    registry.register_module(make_module("c", {}, noop()));
    registry.register_module(make_module("a", {}, noop()));
    registry.register_module(make_module("b", {}, noop()));

    ExecutionPlan plan = registry.plan();
    REQUIRE(plan.batches == std::vector<Batch>{{"c"}, {"a"}, {"b"}});
}

TEST_CASE("Every dependency lands in an earlier batch", "[registry]") {
    ModuleRegistry registry;
    registry.register_module(make_module("system-prep", {}, noop()));
    registry.register_module(make_module("desktop-env", {"system-prep"}, noop()));
    registry.register_module(make_module("rdp-server", {"desktop-env"}, noop()));
    registry.register_module(make_module("dev-tools", {"system-prep"}, noop(), "apps"));
    registry.register_module(make_module("browsers", {"desktop-env"}, noop(), "apps"));
    registry.register_module(make_module("ide-vscode", {"desktop-env", "dev-tools"}, noop(), "apps"));
    registry.register_module(make_module("finalize", {"rdp-server", "browsers", "ide-vscode"}, noop()));

    ExecutionPlan plan = registry.plan();
    REQUIRE(plan.module_count() == registry.size());
    for (const auto& m : registry.modules()) {
        const size_t mine = batch_index(plan, m.id);
        REQUIRE(mine < plan.batches.size());
        for (const auto& dep : m.dependencies) {
            REQUIRE(batch_index(plan, dep) < mine);
        }
    }
}
