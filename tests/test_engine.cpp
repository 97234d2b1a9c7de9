// tests/test_engine.cpp
#include <catch2/catch_test_macros.hpp>
#include "hostprov/core/engine.h"
#include "test_support.h"

using namespace hostprov;
using namespace hostprov::testing;
namespace fs = std::filesystem;

namespace {

// Three modules that create files under {{ work }}; "web" fails when {{ fail_web }} is set
const char* kHostManifest = R"(
vars:
  fail_web: "0"
modules:
  - id: base
    steps:
      - action: "Created directory {{ work }}/etc"
        run: "mkdir -p '{{ work }}/etc'"
        rollback: "rm -rf '{{ work }}/etc'"
  - id: app
    depends_on: [base]
    requires: [work]
    steps:
      - action: "Created file {{ work }}/etc/app.conf"
        run: "echo enabled > '{{ work }}/etc/app.conf'"
        rollback: "rm -f '{{ work }}/etc/app.conf'"
  - id: web
    depends_on: [app]
    steps:
      - action: "Created file {{ work }}/etc/web.conf"
        run: "touch '{{ work }}/etc/web.conf'"
        rollback: "rm -f '{{ work }}/etc/web.conf'"
      - action: "Checked web flag"
        run: "test {{ fail_web }} = 0"
)";

EngineConfig config_for(const TempStateDir& dir) {
    EngineConfig config;
    config.state_dir = dir / "state";
    config.vars = {{"work", (dir / "work").string()}};
    config.sample_interval = std::chrono::milliseconds(20);
    return config;
}

} // namespace

TEST_CASE("A manifest provisions the host end to end", "[engine]") {
    TempStateDir dir;
    auto engine = ProvisionEngine::from_manifest(kHostManifest, config_for(dir));

    RunReport report = engine->run();

    REQUIRE(report.success);
    REQUIRE(report.exit_code == ExitCode::SUCCESS);
    REQUIRE(report.count(ModuleState::COMPLETED) == 3);
    REQUIRE(fs::exists(dir / "work" / "etc" / "app.conf"));
    REQUIRE(fs::exists(dir / "work" / "etc" / "web.conf"));
    REQUIRE(engine->checkpoints().list() == std::set<ModuleId>{"app", "base", "web"});
    REQUIRE(engine->transactions().count() == 3);

    REQUIRE(engine->get_last_traces().size() == 3);
    auto session = engine->last_report_path();
    REQUIRE(session.has_value());
    auto json = nlohmann::json::parse(read_file(*session));
    REQUIRE(json["success"] == true);
    REQUIRE(json["trace"].size() == 3);
    REQUIRE(json["modules"].size() == 3);

    // Timing records for every executed phase
    REQUIRE(read_lines(engine->config().metrics_path()).size() == 3);

    // Nothing left to do
    RunReport again = engine->run();
    REQUIRE(again.count(ModuleState::SKIPPED) == 3);
    REQUIRE(engine->transactions().count() == 3);
}

TEST_CASE("A failing module undoes this run's changes on the host", "[engine]") {
    TempStateDir dir;
    EngineConfig config = config_for(dir);
    config.vars["fail_web"] = "1";
    auto engine = ProvisionEngine::from_manifest(kHostManifest, config);

    RunReport report = engine->run();

    REQUIRE_FALSE(report.success);
    REQUIRE(report.exit_code == ExitCode::EXECUTION_FAILED);
    REQUIRE(report.failed_module == std::optional<ModuleId>("web"));
    REQUIRE(report.find("web")->message.find("Step 2 ('Checked web flag') failed with exit code 1") == 0);
    REQUIRE(report.rollback.has_value());
    REQUIRE(report.rollback->attempted == 3);
    REQUIRE(report.rollback->clean());

    REQUIRE_FALSE(fs::exists(dir / "work" / "etc"));
    REQUIRE(engine->checkpoints().list().empty());

    // The log keeps its history plus the marker; a full rollback has nothing left
    REQUIRE(engine->transactions().count() == 4);
    RollbackReport full = engine->rollback();
    REQUIRE(full.attempted == 0);
}

TEST_CASE("Manifest vars are defaults that configuration overrides", "[engine]") {
    TempStateDir dir;
    EngineConfig config = config_for(dir);
    auto engine = ProvisionEngine::from_manifest(kHostManifest, config);
    REQUIRE(engine->run().success);

    TempStateDir other;
    EngineConfig failing = config_for(other);
    failing.vars["fail_web"] = "1";
    auto second = ProvisionEngine::from_manifest(kHostManifest, failing);
    REQUIRE(second->run().failed_module == std::optional<ModuleId>("web"));
}

TEST_CASE("Dry run writes no state", "[engine]") {
    TempStateDir dir;
    auto engine = ProvisionEngine::from_manifest(kHostManifest, config_for(dir));

    RunOptions options;
    options.dry_run = true;
    RunReport report = engine->run(options);

    REQUIRE(report.success);
    REQUIRE(report.count(ModuleState::PLANNED) == 3);
    REQUIRE_FALSE(fs::exists(dir / "work"));
    REQUIRE_FALSE(engine->last_report_path().has_value());
    REQUIRE_FALSE(fs::exists(engine->config().sessions_dir()));
    REQUIRE(engine->transactions().count() == 0);
    REQUIRE(engine->checkpoints().list().empty());
}

TEST_CASE("Graph errors come back as configuration failures", "[engine]") {
    TempStateDir dir;
    auto engine = ProvisionEngine::from_manifest(R"(
modules:
  - id: a
    depends_on: [b]
  - id: b
    depends_on: [a]
)", config_for(dir));

    RunReport report = engine->run();
    REQUIRE_FALSE(report.success);
    REQUIRE(report.exit_code == ExitCode::CONFIGURATION_ERROR);
    REQUIRE(report.error_kind == ErrorKind::CONFIGURATION);
    REQUIRE(report.error_message.find("Dependency cycle detected") != std::string::npos);
    REQUIRE(engine->transactions().count() == 0);
}

TEST_CASE("Operator rollback undoes everything and clears checkpoints", "[engine]") {
    TempStateDir dir;
    auto engine = ProvisionEngine::from_manifest(kHostManifest, config_for(dir));
    REQUIRE(engine->run().success);
    REQUIRE(fs::exists(dir / "work" / "etc" / "web.conf"));

    RollbackReport report = engine->rollback();
    REQUIRE(report.attempted == 3);
    REQUIRE(report.clean());
    REQUIRE_FALSE(fs::exists(dir / "work" / "etc"));
    REQUIRE(engine->checkpoints().list().empty());

    // Modules run again from scratch afterwards
    REQUIRE(engine->run().count(ModuleState::COMPLETED) == 3);
}

TEST_CASE("Status reports checkpoints and log health", "[engine]") {
    TempStateDir dir;
    auto engine = ProvisionEngine::from_manifest(kHostManifest, config_for(dir));
    engine->checkpoints().create("base");
    engine->transactions().record("Created x", "rm -f x");

    auto status = engine->status();
    REQUIRE(status["checkpoints"].size() == 1);
    REQUIRE(status["checkpoints"][0]["id"] == "base");
    REQUIRE(status["modules"].size() == 3);
    REQUIRE(status["modules"][0]["completed"] == true);
    REQUIRE(status["modules"][1]["completed"] == false);
    REQUIRE(status["transactions"]["count"] == 1);
    REQUIRE(status["transactions"]["valid"] == true);

    std::ofstream(engine->transactions().path(), std::ios::app) << "broken line\n";
    auto degraded = engine->status();
    REQUIRE(degraded["transactions"]["valid"] == false);
    REQUIRE(degraded["transactions"]["first_bad_line"] == 2);

    const fs::path archived = engine->archive_log();
    REQUIRE(fs::exists(archived));
}

TEST_CASE("Run ids are UTC millisecond stamps", "[engine]") {
    const auto tp = std::chrono::system_clock::from_time_t(0);
    REQUIRE(make_run_id(tp) == "19700101-000000-000");
    REQUIRE(make_run_id(tp + std::chrono::milliseconds(61234)) == "19700101-000101-234");
}

TEST_CASE("Back-to-back runs keep separate session records", "[engine]") {
    TempStateDir dir;
    EngineConfig config = config_for(dir);
    config.vars["fail_web"] = "1";
    auto engine = ProvisionEngine::from_manifest(kHostManifest, config);

    RunReport failed = engine->run();
    REQUIRE(failed.rollback.has_value());
    const auto first = engine->last_report_path();
    engine->run();
    const auto second = engine->last_report_path();

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->string() != second->string());
    auto kept = nlohmann::json::parse(read_file(*first));
    REQUIRE(kept.contains("rollback"));

    size_t records = 0;
    for (const auto& entry : fs::directory_iterator(engine->config().sessions_dir())) {
        if (entry.path().extension() == ".json") ++records;
    }
    REQUIRE(records == 2);
}

TEST_CASE("Shell commands report output and exit status", "[engine][runner]") {
    PosixCommandRunner runner;

    CommandResult ok = runner.run("echo hello; echo oops >&2");
    REQUIRE(ok.succeeded());
    REQUIRE(ok.output.find("hello") != std::string::npos);
    REQUIRE(ok.output.find("oops") != std::string::npos);

    REQUIRE(runner.run("exit 3").exit_code == 3);
    REQUIRE(runner.run("kill -TERM $$").exit_code == 128 + 15);
    REQUIRE(runner.run("read line").exit_code != 0);

    PosixCommandRunner small(8);
    CommandResult clipped = small.run("echo 0123456789abcdef");
    REQUIRE(clipped.truncated);
    REQUIRE(clipped.output == "01234567");
}

TEST_CASE("Background children do not hold the runner open", "[engine][runner]") {
    PosixCommandRunner runner;

    const auto started = std::chrono::steady_clock::now();
    CommandResult result = runner.run("sleep 5 & echo started");
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.succeeded());
    REQUIRE(result.output.find("started") != std::string::npos);
    REQUIRE(elapsed < std::chrono::seconds(3));
}
