// modules/monitor/performance_monitor.h
#ifndef HOSTPROV_MODULES_MONITOR_PERFORMANCE_MONITOR_H
#define HOSTPROV_MODULES_MONITOR_PERFORMANCE_MONITOR_H

#include "hostprov/core/module.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

namespace hostprov {

struct MonitorSettings {
    std::chrono::milliseconds sample_interval{1000};
    double warn_ratio = 1.5;
    double critical_ratio = 2.0;
    std::filesystem::path metrics_file;   // JSON lines; empty disables file output
};

// Advisory phase timing. Observer callbacks only enqueue; a background thread
// consumes the queue, checks running phases against their expected duration on
// every tick and appends finished phases to the metrics file.
class PerformanceMonitor : public PhaseObserver {
public:
    enum class Severity { NONE, WARNING, CRITICAL };

    explicit PerformanceMonitor(MonitorSettings settings, Logger& logger = Logger::null());
    ~PerformanceMonitor() override;

    PerformanceMonitor(const PerformanceMonitor&) = delete;
    PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

    void start();
    // Drains pending events, then joins the thread. Safe to call more than once.
    void stop();
    bool running() const;

    void on_phase_start(const ModuleId& id, std::optional<std::chrono::seconds> expected) override;
    void on_phase_end(const ModuleId& id, ModuleState state,
                      std::chrono::milliseconds duration, const std::string& message) override;

    static Severity classify(double elapsed_sec, double expected_sec, double warn_ratio, double critical_ratio);

    size_t alerts_raised() const;
    size_t records_written() const;

private:
    struct Event {
        bool is_start = true;
        ModuleId id;
        std::optional<std::chrono::seconds> expected;
        ModuleState state = ModuleState::PENDING;
        std::chrono::milliseconds duration{0};
        std::chrono::steady_clock::time_point at;
    };

    struct InFlight {
        std::chrono::steady_clock::time_point started;
        std::optional<std::chrono::seconds> expected;
        Severity reported = Severity::NONE;
    };

    void loop();
    void process(std::deque<Event>& events);
    void check_overruns(std::chrono::steady_clock::time_point now);
    void alert(const ModuleId& id, Severity severity, double elapsed_sec, double expected_sec);
    void write_record(const Event& event, const InFlight* flight);

    MonitorSettings settings_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    bool stop_requested_ = false;
    std::thread thread_;

    // Touched only by the consumer (the monitor thread, or stop() when it never started)
    std::map<ModuleId, InFlight> in_flight_;
    std::ofstream metrics_;
    bool metrics_disabled_ = false;

    std::atomic<size_t> alerts_{0};
    std::atomic<size_t> records_{0};
};

} // namespace hostprov

#endif // HOSTPROV_MODULES_MONITOR_PERFORMANCE_MONITOR_H
