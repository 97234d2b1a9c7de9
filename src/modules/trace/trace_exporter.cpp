// modules/trace/trace_exporter.cpp
#include "modules/trace/trace_exporter.h"
#include <algorithm>

namespace hostprov {

void TraceExporter::on_phase_start(const ModuleId& id, std::optional<std::chrono::seconds> expected) {
    TraceRecord record;
    record.module_id = id;
    record.start_time = std::chrono::system_clock::now();
    record.status = "running";
    record.expected_duration = expected;

    std::lock_guard<std::mutex> lock(mutex_);
    record.trace_id = trace_id_;
    traces_.push_back(std::move(record));
}

void TraceExporter::on_phase_end(const ModuleId& id, ModuleState state,
                                 std::chrono::milliseconds duration, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Find the corresponding start record
    auto it = std::find_if(traces_.rbegin(), traces_.rend(),
                           [&id](const TraceRecord& r) { return r.module_id == id && r.status == "running"; });
    if (it == traces_.rend()) {
        return;
    }
    it->end_time = std::chrono::system_clock::now();
    it->status = to_string(state);
    it->duration = duration;
    if (!message.empty()) {
        it->message = message;
    }
}

std::vector<TraceRecord> TraceExporter::get_traces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_;
}

void TraceExporter::clear_traces() {
    std::lock_guard<std::mutex> lock(mutex_);
    traces_.clear();
}

void TraceExporter::set_trace_id(std::string trace_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    trace_id_ = std::move(trace_id);
}

nlohmann::json TraceExporter::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : get_traces()) {
        nlohmann::json j;
        j["trace_id"] = r.trace_id;
        j["module"] = r.module_id;
        j["start_time"] = format_utc_timestamp(r.start_time);
        if (r.end_time) j["end_time"] = format_utc_timestamp(*r.end_time);
        j["status"] = r.status;
        j["duration_ms"] = r.duration.count();
        if (r.expected_duration) j["expected_duration_sec"] = r.expected_duration->count();
        if (r.message) j["message"] = *r.message;
        arr.push_back(std::move(j));
    }
    return arr;
}

} // namespace hostprov
