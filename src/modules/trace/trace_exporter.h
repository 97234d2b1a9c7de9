// modules/trace/trace_exporter.h
#ifndef HOSTPROV_MODULES_TRACE_TRACE_EXPORTER_H
#define HOSTPROV_MODULES_TRACE_TRACE_EXPORTER_H

#include "hostprov/core/module.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hostprov {

struct TraceRecord {
    std::string trace_id;
    ModuleId module_id;
    std::chrono::system_clock::time_point start_time;
    std::optional<std::chrono::system_clock::time_point> end_time;
    std::string status;   // "running" until the phase ends, then the terminal state
    std::optional<std::string> message;
    std::optional<std::chrono::seconds> expected_duration;
    std::chrono::milliseconds duration{0};
};

// Keeps one record per executed phase; SKIPPED modules never open a phase.
class TraceExporter : public PhaseObserver {
public:
    explicit TraceExporter(std::string trace_id = "t-default") : trace_id_(std::move(trace_id)) {}

    void on_phase_start(const ModuleId& id, std::optional<std::chrono::seconds> expected) override;
    void on_phase_end(const ModuleId& id, ModuleState state,
                      std::chrono::milliseconds duration, const std::string& message) override;

    std::vector<TraceRecord> get_traces() const;
    void clear_traces();
    void set_trace_id(std::string trace_id);

    nlohmann::json to_json() const;

private:
    mutable std::mutex mutex_;
    std::vector<TraceRecord> traces_;
    std::string trace_id_;
};

} // namespace hostprov

#endif // HOSTPROV_MODULES_TRACE_TRACE_EXPORTER_H
