// modules/rollback/rollback_executor.cpp
#include "modules/rollback/rollback_executor.h"
#include <algorithm>
#include <regex>

namespace hostprov {

std::string RollbackReport::summary() const {
    std::string text = std::to_string(attempted) + " attempted, " + std::to_string(succeeded) + " succeeded, " +
                       std::to_string(failed.size()) + " failed";
    if (!recorded()) {
        text += ", marker not written";
    }
    return text;
}

nlohmann::json RollbackReport::to_json() const {
    nlohmann::json j;
    j["attempted"] = attempted;
    j["succeeded"] = succeeded;
    j["marker_written"] = marker_written;
    if (!marker_error.empty()) {
        j["marker_error"] = marker_error;
    }
    j["failed"] = nlohmann::json::array();
    for (const auto& f : failed) {
        nlohmann::json item;
        item["line"] = f.entry.line_number;
        item["action"] = f.entry.malformed ? f.entry.raw : f.entry.action;
        item["rollback_command"] = f.entry.rollback_command;
        item["error"] = f.error;
        j["failed"].push_back(std::move(item));
    }
    return j;
}

std::string rollback_marker_action(size_t succeeded, size_t attempted, LogPosition from) {
    return kRollbackMarkerPrefix + std::to_string(succeeded) + "/" + std::to_string(attempted) +
           " entries rolled back (from offset " + std::to_string(from.offset) + ")";
}

std::optional<uint64_t> rollback_marker_floor(const TransactionEntry& entry) {
    if (!entry.is_rollback_marker()) {
        return std::nullopt;
    }
    static const std::regex floor_re(R"(\(from offset ([0-9]+)\)$)");
    std::smatch m;
    if (std::regex_search(entry.action, m, floor_re)) {
        return std::stoull(m[1].str());
    }
    // A bare marker covers only itself
    return entry.offset;
}

RollbackExecutor::RollbackExecutor(TransactionLog& log, CommandRunner& runner, Logger& logger)
    : log_(log), runner_(runner), logger_(logger) {}

RollbackReport RollbackExecutor::execute(LogPosition from) {
    RollbackReport report;
    logger_.info("Starting rollback from log offset " + std::to_string(from.offset));

    // Entries at or above covered_floor were compensated by an earlier pass
    std::optional<uint64_t> covered_floor;

    for (const auto& entry : log_.entries_reverse(from)) {
        if (auto floor = rollback_marker_floor(entry)) {
            covered_floor = covered_floor ? std::min(*covered_floor, *floor) : *floor;
            continue;
        }
        if (covered_floor && entry.offset >= *covered_floor) {
            continue;
        }

        ++report.attempted;
        if (entry.malformed) {
            logger_.error("Skipping malformed transaction at line " + std::to_string(entry.line_number) +
                          ": " + entry.error);
            report.failed.push_back({entry, "malformed entry: " + entry.error});
            continue;
        }

        logger_.info("Rolling back: " + entry.action);
        try {
            CommandResult result = runner_.run(entry.rollback_command);
            if (is_success_exit(result.exit_code)) {
                ++report.succeeded;
            } else {
                std::string error = "exit code " + std::to_string(result.exit_code);
                if (!result.output.empty()) {
                    error += ": " + result.output;
                }
                logger_.warning("Rollback command failed for '" + entry.action + "' (" + error + ")");
                report.failed.push_back({entry, error});
            }
        } catch (const ProvisionError& e) {
            logger_.warning("Rollback command could not run for '" + entry.action + "': " + e.what());
            report.failed.push_back({entry, e.what()});
        }
    }

    if (report.attempted == 0) {
        logger_.info("Nothing to roll back");
        return report;
    }

    try {
        log_.record_marker(rollback_marker_action(report.succeeded, report.attempted, from));
        report.marker_written = true;
    } catch (const StorageError& e) {
        report.marker_error = e.what();
        logger_.error("Failed to append rollback marker, a later pass will replay these entries: " +
                      report.marker_error);
    }

    if (report.clean() && report.recorded()) {
        logger_.info("Rollback complete: " + report.summary());
    } else {
        logger_.warning("Rollback degraded: " + report.summary());
    }
    return report;
}

} // namespace hostprov
