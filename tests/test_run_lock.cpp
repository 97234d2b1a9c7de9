// tests/test_run_lock.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/lock/run_lock.h"
#include "test_support.h"

using namespace hostprov;
using namespace hostprov::testing;

TEST_CASE("Only one run lock can be held", "[lock]") {
    TempStateDir dir;
    const auto path = dir / "state" / "provision.lock";

    {
        RunLock first(path);
        REQUIRE(RunLock::read_holder(path) == std::optional<pid_t>(::getpid()));

        try {
            RunLock second(path);
            FAIL("second lock acquired while the first is held");
        } catch (const RunLockError& e) {
            REQUIRE(e.holder() == std::optional<pid_t>(::getpid()));
            REQUIRE(e.kind() == ErrorKind::STORAGE);
            REQUIRE(std::string(e.what()).find("PID " + std::to_string(::getpid())) != std::string::npos);
        }
    }

    // Released on destruction, and the PID is cleared
    REQUIRE_FALSE(RunLock::read_holder(path).has_value());
    RunLock again(path);
    REQUIRE(RunLock::read_holder(path) == std::optional<pid_t>(::getpid()));
}

TEST_CASE("A stale PID is replaced", "[lock]") {
    TempStateDir dir;
    const auto path = dir / "provision.lock";
    write_file(path, "999999\n");

    RunLock lock(path);
    REQUIRE(read_file(path) == std::to_string(::getpid()) + "\n");
}
