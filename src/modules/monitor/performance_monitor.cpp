// modules/monitor/performance_monitor.cpp
#include "modules/monitor/performance_monitor.h"
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>

namespace hostprov {

namespace {

std::string format_seconds(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << seconds << "s";
    return oss.str();
}

} // namespace

PerformanceMonitor::PerformanceMonitor(MonitorSettings settings, Logger& logger)
    : settings_(std::move(settings)), logger_(logger) {}

PerformanceMonitor::~PerformanceMonitor() {
    stop();
}

void PerformanceMonitor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) {
        logger_.warning("Performance monitor already running");
        return;
    }
    stop_requested_ = false;
    thread_ = std::thread(&PerformanceMonitor::loop, this);
    logger_.debug("Performance monitor started (interval " +
                  std::to_string(settings_.sample_interval.count()) + "ms)");
}

void PerformanceMonitor::stop() {
    std::deque<Event> leftovers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        if (!thread_.joinable()) {
            leftovers.swap(queue_);
        }
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
        logger_.debug("Performance monitor stopped");
    } else if (!leftovers.empty()) {
        process(leftovers);
    }
    if (metrics_.is_open()) {
        metrics_.flush();
    }
}

bool PerformanceMonitor::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thread_.joinable() && !stop_requested_;
}

void PerformanceMonitor::on_phase_start(const ModuleId& id, std::optional<std::chrono::seconds> expected) {
    Event event;
    event.is_start = true;
    event.id = id;
    event.expected = expected;
    event.at = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

void PerformanceMonitor::on_phase_end(const ModuleId& id, ModuleState state,
                                      std::chrono::milliseconds duration, const std::string& message) {
    (void)message;
    Event event;
    event.is_start = false;
    event.id = id;
    event.state = state;
    event.duration = duration;
    event.at = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

PerformanceMonitor::Severity PerformanceMonitor::classify(double elapsed_sec, double expected_sec,
                                                          double warn_ratio, double critical_ratio) {
    if (expected_sec <= 0.0) {
        return Severity::NONE;
    }
    const double ratio = elapsed_sec / expected_sec;
    if (ratio >= critical_ratio) return Severity::CRITICAL;
    if (ratio >= warn_ratio) return Severity::WARNING;
    return Severity::NONE;
}

size_t PerformanceMonitor::alerts_raised() const {
    return alerts_.load();
}

size_t PerformanceMonitor::records_written() const {
    return records_.load();
}

void PerformanceMonitor::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        cv_.wait_for(lock, settings_.sample_interval,
                     [this] { return stop_requested_ || !queue_.empty(); });
        std::deque<Event> events;
        events.swap(queue_);
        const bool stopping = stop_requested_;
        lock.unlock();

        process(events);
        check_overruns(std::chrono::steady_clock::now());

        lock.lock();
        if (stopping && queue_.empty()) {
            break;
        }
    }
}

void PerformanceMonitor::process(std::deque<Event>& events) {
    for (const auto& event : events) {
        if (event.is_start) {
            in_flight_[event.id] = InFlight{event.at, event.expected, Severity::NONE};
            continue;
        }

        auto it = in_flight_.find(event.id);
        const InFlight* flight = it != in_flight_.end() ? &it->second : nullptr;
        if (flight && flight->expected) {
            const double elapsed = std::chrono::duration<double>(event.duration).count();
            const double expected = static_cast<double>(flight->expected->count());
            const Severity severity = classify(elapsed, expected, settings_.warn_ratio, settings_.critical_ratio);
            if (severity > flight->reported) {
                alert(event.id, severity, elapsed, expected);
            }
        }
        write_record(event, flight);
        if (it != in_flight_.end()) {
            in_flight_.erase(it);
        }
    }
}

void PerformanceMonitor::check_overruns(std::chrono::steady_clock::time_point now) {
    for (auto& [id, flight] : in_flight_) {
        if (!flight.expected) continue;
        const double elapsed = std::chrono::duration<double>(now - flight.started).count();
        const double expected = static_cast<double>(flight.expected->count());
        const Severity severity = classify(elapsed, expected, settings_.warn_ratio, settings_.critical_ratio);
        if (severity > flight.reported) {
            alert(id, severity, elapsed, expected);
            flight.reported = severity;
        }
    }
}

void PerformanceMonitor::alert(const ModuleId& id, Severity severity, double elapsed_sec, double expected_sec) {
    std::ostringstream ratio;
    ratio << std::fixed << std::setprecision(2) << (elapsed_sec / expected_sec) << "x";
    const std::string text = "Phase '" + id + "' exceeded expected duration: " + format_seconds(elapsed_sec) +
                             " vs " + format_seconds(expected_sec) + " (" + ratio.str() + ")";
    if (severity == Severity::CRITICAL) {
        logger_.error(text);
    } else {
        logger_.warning(text);
    }
    ++alerts_;
}

void PerformanceMonitor::write_record(const Event& event, const InFlight* flight) {
    if (settings_.metrics_file.empty() || metrics_disabled_) {
        return;
    }
    if (!metrics_.is_open()) {
        std::error_code ec;
        if (settings_.metrics_file.has_parent_path()) {
            std::filesystem::create_directories(settings_.metrics_file.parent_path(), ec);
        }
        metrics_.open(settings_.metrics_file, std::ios::out | std::ios::app);
        if (!metrics_.is_open()) {
            // Timing output is advisory; losing it never affects the run
            logger_.warning("Cannot write phase timing to " + settings_.metrics_file.string());
            metrics_disabled_ = true;
            return;
        }
    }

    nlohmann::json line;
    line["timestamp"] = format_utc_timestamp(std::chrono::system_clock::now());
    line["phase"] = event.id;
    line["duration_sec"] = std::chrono::duration<double>(event.duration).count();
    line["status"] = to_string(event.state);
    if (flight && flight->expected) {
        line["expected_sec"] = flight->expected->count();
    }
    metrics_ << line.dump() << "\n";
    metrics_.flush();
    ++records_;
}

} // namespace hostprov
