// src/core/types.cpp
#include "hostprov/core/types.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace hostprov {

std::string to_string(ModuleState state) {
    switch (state) {
        case ModuleState::PENDING:   return "pending";
        case ModuleState::SKIPPED:   return "skipped";
        case ModuleState::CHECKING:  return "checking";
        case ModuleState::BLOCKED:   return "blocked";
        case ModuleState::RUNNING:   return "running";
        case ModuleState::COMPLETED: return "completed";
        case ModuleState::FAILED:    return "failed";
        case ModuleState::PLANNED:   return "planned";
    }
    return "unknown";
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:          return "none";
        case ErrorKind::CONFIGURATION: return "ConfigurationError";
        case ErrorKind::PREREQUISITE:  return "PrerequisiteError";
        case ErrorKind::EXECUTION:     return "ExecutionError";
        case ErrorKind::ROLLBACK:      return "RollbackError";
        case ErrorKind::STORAGE:       return "StorageError";
        case ErrorKind::ARGUMENT:      return "ArgumentError";
    }
    return "unknown";
}

bool is_terminal(ModuleState state) {
    switch (state) {
        case ModuleState::SKIPPED:
        case ModuleState::BLOCKED:
        case ModuleState::COMPLETED:
        case ModuleState::FAILED:
        case ModuleState::PLANNED:
            return true;
        default:
            return false;
    }
}

Outcome Outcome::ok(std::string message) {
    Outcome o;
    o.message = std::move(message);
    return o;
}

Outcome Outcome::prerequisite_failed(std::string message, std::vector<FieldError> details) {
    Outcome o;
    o.success = false;
    o.kind = ErrorKind::PREREQUISITE;
    o.message = std::move(message);
    o.details = std::move(details);
    return o;
}

Outcome Outcome::execution_failed(std::string message) {
    Outcome o;
    o.success = false;
    o.kind = ErrorKind::EXECUTION;
    o.message = std::move(message);
    return o;
}

std::string Outcome::describe() const {
    if (details.empty()) return message;
    std::ostringstream oss;
    oss << message << " (";
    for (size_t i = 0; i < details.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << details[i].field << ": " << details[i].reason;
    }
    oss << ")";
    return oss.str();
}

std::string format_utc_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_utc_timestamp(const std::string& text) {
    if (text.size() != 20 || text.back() != 'Z') return std::nullopt;
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (iss.fail()) return std::nullopt;
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}

} // namespace hostprov
