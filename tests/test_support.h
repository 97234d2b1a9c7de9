// tests/test_support.h
#ifndef HOSTPROV_TESTS_TEST_SUPPORT_H
#define HOSTPROV_TESTS_TEST_SUPPORT_H

#include "hostprov/core/module.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace hostprov::testing {

// Fresh state directory per test case, removed afterwards
struct TempStateDir {
    std::filesystem::path path;

    TempStateDir() {
        static std::atomic<unsigned> counter{0};
        std::random_device rd;
        path = std::filesystem::temp_directory_path() /
               ("hostprov-test-" + std::to_string(::getpid()) + "-" + std::to_string(rd()) + "-" +
                std::to_string(counter++));
        std::filesystem::create_directories(path);
    }

    ~TempStateDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempStateDir(const TempStateDir&) = delete;
    TempStateDir& operator=(const TempStateDir&) = delete;

    std::filesystem::path operator/(const std::string& name) const { return path / name; }
};

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

inline std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

inline void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

// Captures every command; exit codes scripted per exact command text
class RecordingCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::string& command) override {
        std::lock_guard<std::mutex> lock(mutex_);
        commands_.push_back(command);
        CommandResult result;
        auto it = exit_codes_.find(command);
        result.exit_code = it != exit_codes_.end() ? it->second : default_exit_;
        return result;
    }

    void set_exit_code(const std::string& command, int code) {
        std::lock_guard<std::mutex> lock(mutex_);
        exit_codes_[command] = code;
    }

    void set_default_exit_code(int code) {
        std::lock_guard<std::mutex> lock(mutex_);
        default_exit_ = code;
    }

    std::vector<std::string> commands() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        commands_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> commands_;
    std::map<std::string, int> exit_codes_;
    int default_exit_ = 0;
};

// Module with programmable behaviour. execute() records `transactions` in order,
// then waits `delay`, then fails if `fail_execute` is set.
class ScriptedModule : public ProvisionModule {
public:
    Outcome prerequisite = Outcome::ok();
    std::vector<std::pair<std::string, std::string>> transactions;
    bool fail_execute = false;
    std::string failure_message = "scripted failure";
    std::chrono::milliseconds delay{0};
    std::function<void(ModuleContext&)> on_execute;

    std::atomic<int> check_calls{0};
    std::atomic<int> execute_calls{0};

    Outcome check_prerequisites(const ModuleContext&) override {
        ++check_calls;
        return prerequisite;
    }

    Outcome execute(ModuleContext& ctx) override {
        ++execute_calls;
        if (on_execute) on_execute(ctx);
        for (const auto& [action, rollback] : transactions) {
            ctx.transactions.record(action, rollback);
        }
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        if (fail_execute) return Outcome::execution_failed(failure_message);
        return Outcome::ok();
    }
};

inline ModuleDescriptor make_module(const ModuleId& id,
                                    std::vector<ModuleId> deps,
                                    std::shared_ptr<ProvisionModule> impl,
                                    std::optional<std::string> group = std::nullopt) {
    ModuleDescriptor d;
    d.id = id;
    d.dependencies = std::move(deps);
    d.impl = std::move(impl);
    d.parallel_group = std::move(group);
    return d;
}

} // namespace hostprov::testing

#endif // HOSTPROV_TESTS_TEST_SUPPORT_H
