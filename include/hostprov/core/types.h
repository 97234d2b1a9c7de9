// include/hostprov/core/types.h
#ifndef HOSTPROV_CORE_TYPES_H
#define HOSTPROV_CORE_TYPES_H

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hostprov {

// Resolved configuration handed to modules, same representation the loaders produce.
using Context = nlohmann::json;

// Stable module identifier, e.g. "system-prep"
using ModuleId = std::string;

// Per-module lifecycle
enum class ModuleState : uint8_t {
    PENDING,
    SKIPPED,    // checkpoint already present
    CHECKING,
    BLOCKED,    // prerequisite failure, terminal
    RUNNING,
    COMPLETED,  // checkpoint written, terminal
    FAILED,     // execute failure, terminal, triggers rollback
    PLANNED     // dry-run only: prerequisites passed, execute not called
};

enum class ErrorKind : uint8_t {
    NONE,
    CONFIGURATION,
    PREREQUISITE,
    EXECUTION,
    ROLLBACK,
    STORAGE,
    ARGUMENT
};

enum class ExitCode : int {
    SUCCESS = 0,
    EXECUTION_FAILED = 1,
    CONFIGURATION_ERROR = 2,
    PREREQUISITE_BLOCKED = 3,
    STORAGE_ERROR = 4,
    LOCK_HELD = 5,
    USAGE = 64
};

std::string to_string(ModuleState state);
std::string to_string(ErrorKind kind);
bool is_terminal(ModuleState state);

// Structured reason reported by the validation collaborator
struct FieldError {
    std::string field;
    std::string reason;
};

// Result of a module capability call
struct Outcome {
    bool success = true;
    ErrorKind kind = ErrorKind::NONE;
    std::string message;
    std::vector<FieldError> details;

    static Outcome ok(std::string message = {});
    static Outcome prerequisite_failed(std::string message, std::vector<FieldError> details = {});
    static Outcome execution_failed(std::string message);

    // "message (field: reason; ...)"
    std::string describe() const;
};

// --- Error taxonomy ---

class ProvisionError : public std::runtime_error {
public:
    ProvisionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ConfigurationError : public ProvisionError {
public:
    explicit ConfigurationError(const std::string& message, std::vector<ModuleId> modules = {})
        : ProvisionError(ErrorKind::CONFIGURATION, message), modules_(std::move(modules)) {}
    // Module ids participating in the problem (cycle members, unresolved references)
    const std::vector<ModuleId>& modules() const noexcept { return modules_; }

private:
    std::vector<ModuleId> modules_;
};

class PrerequisiteError : public ProvisionError {
public:
    explicit PrerequisiteError(const std::string& message)
        : ProvisionError(ErrorKind::PREREQUISITE, message) {}
};

class ExecutionError : public ProvisionError {
public:
    explicit ExecutionError(const std::string& message)
        : ProvisionError(ErrorKind::EXECUTION, message) {}
};

class RollbackError : public ProvisionError {
public:
    explicit RollbackError(const std::string& message)
        : ProvisionError(ErrorKind::ROLLBACK, message) {}
};

class StorageError : public ProvisionError {
public:
    explicit StorageError(const std::string& message)
        : ProvisionError(ErrorKind::STORAGE, message) {}
};

class ArgumentError : public ProvisionError {
public:
    explicit ArgumentError(const std::string& message)
        : ProvisionError(ErrorKind::ARGUMENT, message) {}
};

// UTC ISO-8601 "YYYY-mm-ddTHH:MM:SSZ"
std::string format_utc_timestamp(std::chrono::system_clock::time_point tp);
std::optional<std::chrono::system_clock::time_point> parse_utc_timestamp(const std::string& text);

} // namespace hostprov

#endif // HOSTPROV_CORE_TYPES_H
