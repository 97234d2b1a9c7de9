// tests/test_transaction_log.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/transaction/transaction_log.h"
#include "test_support.h"
#include <regex>
#include <thread>

using namespace hostprov;
using namespace hostprov::testing;
namespace fs = std::filesystem;

namespace {

std::vector<TransactionEntry> collect(ReverseView view) {
    std::vector<TransactionEntry> out;
    for (const auto& e : view) out.push_back(e);
    return out;
}

} // namespace

TEST_CASE("record appends timestamp|action|rollback_command lines", "[transaction]") {
    TempStateDir dir;
    TransactionLog log(dir / "transactions.log");

    log.record_package_install("vim");
    log.record("Created file: /etc/motd", "rm -f /etc/motd");

    auto lines = read_lines(dir / "transactions.log");
    REQUIRE(lines.size() == 2);
    const std::regex shape(R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z\|Installed package: vim\|apt-get remove -y 'vim'$)");
    REQUIRE(std::regex_match(lines[0], shape));
    REQUIRE(log.count() == 2);
    REQUIRE(log.validate().valid);
}

TEST_CASE("record rejects unusable fields", "[transaction]") {
    TempStateDir dir;
    TransactionLog log(dir / "transactions.log");

    REQUIRE_THROWS_AS(log.record("", "rm -f x"), ArgumentError);
    REQUIRE_THROWS_AS(log.record("Created x", ""), ArgumentError);
    REQUIRE_THROWS_AS(log.record("a|b", "true"), ArgumentError);
    REQUIRE_THROWS_AS(log.record("two\nlines", "true"), ArgumentError);
    REQUIRE_THROWS_AS(log.record("ok", "echo a\necho b"), ArgumentError);
    REQUIRE(log.count() == 0);
}

TEST_CASE("record refuses actions that look like rollback markers", "[transaction]") {
    TempStateDir dir;
    TransactionLog log(dir / "transactions.log");

    log.record_package_install("vim");
    REQUIRE_THROWS_AS(log.record("[rollback] stale cache cleanup (from offset 0)", "rm -rf /var/cache/x"),
                      ArgumentError);
    REQUIRE_THROWS_AS(log.record("[rollback] done", "true"), ArgumentError);
    log.record_user_create("dev");

    // The prefix only counts at the start of the action
    log.record("Cleared [rollback] cache", "true");

    auto entries = collect(log.entries_reverse());
    REQUIRE(entries.size() == 3);
    for (const auto& e : entries) {
        REQUIRE_FALSE(e.is_rollback_marker());
    }
}

TEST_CASE("rollback commands may contain pipes", "[transaction]") {
    TempStateDir dir;
    TransactionLog log(dir / "transactions.log");
    log.record("Configured sysctl", "sysctl -a | grep vm || true");

    auto entries = collect(log.entries_reverse());
    REQUIRE(entries.size() == 1);
    REQUIRE_FALSE(entries[0].malformed);
    REQUIRE(entries[0].action == "Configured sysctl");
    REQUIRE(entries[0].rollback_command == "sysctl -a | grep vm || true");
}

TEST_CASE("entries_reverse yields newest first with line numbers", "[transaction]") {
    TempStateDir dir;
    TransactionLog log(dir / "transactions.log");
    log.record("A", "undo-a");
    log.record("B", "undo-b");
    log.record("C", "undo-c");

    auto entries = collect(log.entries_reverse());
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].action == "C");
    REQUIRE(entries[1].action == "B");
    REQUIRE(entries[2].action == "A");
    REQUIRE(entries[0].line_number == 3);
    REQUIRE(entries[2].line_number == 1);
    REQUIRE(entries[2].offset == 0);

    // Recomputed on each call
    REQUIRE(collect(log.entries_reverse()).size() == 3);
}

TEST_CASE("A reverse view is bounded by the size at creation", "[transaction]") {
    TempStateDir dir;
    TransactionLog log(dir / "transactions.log");
    log.record("A", "undo-a");
    log.record("B", "undo-b");

    ReverseView view = log.entries_reverse();
    log.record("C", "undo-c");

    std::vector<std::string> seen;
    for (const auto& e : view) seen.push_back(e.action);
    REQUIRE(seen == std::vector<std::string>{"B", "A"});
}

TEST_CASE("entries_reverse from a position covers only later entries", "[transaction]") {
    TempStateDir dir;
    TransactionLog log(dir / "transactions.log");
    log.record("old-1", "undo-1");
    log.record("old-2", "undo-2");
    const LogPosition pos = log.position();
    log.record("new-1", "undo-3");
    log.record("new-2", "undo-4");

    auto entries = collect(log.entries_reverse(pos));
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].action == "new-2");
    REQUIRE(entries[1].action == "new-1");
    REQUIRE(entries[1].line_number == 3);
}

TEST_CASE("Reverse reading crosses block boundaries", "[transaction]") {
    TempStateDir dir;
    TransactionLog log(dir / "transactions.log");
    const std::string padding(150, 'x');
    for (int i = 0; i < 300; ++i) {
        log.record("step " + std::to_string(i) + " " + padding, "undo " + std::to_string(i));
    }

    auto entries = collect(log.entries_reverse());
    REQUIRE(entries.size() == 300);
    for (int i = 0; i < 300; ++i) {
        const auto& e = entries[static_cast<size_t>(i)];
        REQUIRE_FALSE(e.malformed);
        REQUIRE(e.rollback_command == "undo " + std::to_string(299 - i));
        REQUIRE(e.line_number == static_cast<size_t>(300 - i));
    }
}

TEST_CASE("validate names the first malformed line", "[transaction]") {
    TempStateDir dir;
    TransactionLog log(dir / "transactions.log");
    log.record("A", "undo-a");
    {
        std::ofstream out(dir / "transactions.log", std::ios::app);
        out << "garbage without separators\n";
        out << "not-a-time|B|undo-b\n";
    }
    log.record("C", "undo-c");

    auto v = log.validate();
    REQUIRE_FALSE(v.valid);
    REQUIRE(v.first_bad_line == 2);
    REQUIRE(v.line_count == 4);

    auto entries = collect(log.entries_reverse());
    REQUIRE(entries.size() == 4);
    REQUIRE(entries[1].malformed);
    REQUIRE(entries[2].malformed);
    REQUIRE(entries[2].raw == "garbage without separators");
}

TEST_CASE("Concurrent records never interleave", "[transaction][concurrency]") {
    TempStateDir dir;
    TransactionLog log(dir / "transactions.log");

    auto writer = [&log](const std::string& who) {
        for (int i = 0; i < 50; ++i) {
            log.record(who + " action " + std::to_string(i), "undo " + who + " " + std::to_string(i));
        }
    };
    std::thread t1(writer, "first");
    std::thread t2(writer, "second");
    t1.join();
    t2.join();

    REQUIRE(log.count() == 100);
    REQUIRE(log.validate().valid);
    auto lines = read_lines(dir / "transactions.log");
    REQUIRE(lines.size() == 100);
    for (const auto& line : lines) {
        auto e = parse_transaction_line(line, 1, 0);
        REQUIRE_FALSE(e.malformed);
    }
}

TEST_CASE("Log file and directory permissions are restrictive", "[transaction]") {
    TempStateDir dir;
    TransactionLog log(dir / "state" / "transactions.log");
    log.init();

    const auto file_perms = fs::status(dir / "state" / "transactions.log").permissions();
    REQUIRE((file_perms & fs::perms::others_all) == fs::perms::none);
    REQUIRE((file_perms & fs::perms::group_write) == fs::perms::none);
    const auto dir_perms = fs::status(dir / "state").permissions();
    REQUIRE((dir_perms & fs::perms::others_all) == fs::perms::none);
}

TEST_CASE("archive copies and clear truncates", "[transaction]") {
    TempStateDir dir;
    TransactionLog log(dir / "transactions.log");
    log.record("A", "undo-a");
    log.record("B", "undo-b");

    const fs::path archived = log.archive(dir / "archive" / "run1.log");
    REQUIRE(read_lines(archived).size() == 2);
    REQUIRE(log.count() == 2);

    log.clear();
    REQUIRE(log.count() == 0);
    REQUIRE(log.position().offset == 0);

    log.record("C", "undo-c");
    auto lines = read_lines(dir / "transactions.log");
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("|C|undo-c") != std::string::npos);
}

TEST_CASE("A missing log reads as empty", "[transaction]") {
    TempStateDir dir;
    TransactionLog log(dir / "never-created.log");

    REQUIRE(log.count() == 0);
    REQUIRE(log.position().offset == 0);
    REQUIRE(collect(log.entries_reverse()).empty());
    REQUIRE(log.validate().valid);
    REQUIRE_THROWS_AS(log.archive(), StorageError);
}

TEST_CASE("Typed helpers quote their arguments", "[transaction]") {
    TempStateDir dir;
    TransactionLog log(dir / "transactions.log");
    log.record_file_create("/tmp/it's here");
    log.record_service_enable("xrdp");
    log.record_user_create("devuser");

    auto entries = collect(log.entries_reverse());
    REQUIRE(entries[2].rollback_command == "rm -f '/tmp/it'\\''s here'");
    REQUIRE(entries[1].rollback_command == "systemctl disable 'xrdp' && systemctl stop 'xrdp'");
    REQUIRE(entries[0].action == "Created user: devuser");
}
