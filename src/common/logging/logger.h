// common/logging/logger.h
#ifndef HOSTPROV_COMMON_LOGGING_LOGGER_H
#define HOSTPROV_COMMON_LOGGING_LOGGER_H

#include <fstream>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace hostprov {

enum class LogLevel : int {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    FATAL = 4,
    OFF = 5
};

std::optional<LogLevel> parse_log_level(const std::string& text);

// Console + optional file logger shared by the engine and every module of a run.
// Lines look like "[2026-01-01 10:00:00] [INFO] message" and are redacted before output.
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::INFO, std::ostream* console = nullptr);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Appends to the file in addition to the console; throws StorageError if it cannot be opened
    void set_log_file(const std::string& path);
    void set_level(LogLevel level);
    LogLevel level() const;

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);
    void log(LogLevel level, const std::string& message);

    // Replaces passwords, tokens, keys and URL credentials with [REDACTED]
    static std::string redact(const std::string& text);

    // Logger that discards everything (tests, dry library use)
    static Logger& null();

private:
    mutable std::mutex mutex_;
    LogLevel level_;
    std::ostream* console_; // nullptr -> std::cerr
    std::ofstream file_;
};

} // namespace hostprov

#endif // HOSTPROV_COMMON_LOGGING_LOGGER_H
