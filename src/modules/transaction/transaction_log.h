// modules/transaction/transaction_log.h
#ifndef HOSTPROV_MODULES_TRANSACTION_TRANSACTION_LOG_H
#define HOSTPROV_MODULES_TRANSACTION_TRANSACTION_LOG_H

#include "hostprov/core/types.h"
#include "common/logging/logger.h"
#include "common/utils/file_ops.h"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>

namespace hostprov {

// Actions starting with this prefix are rollback markers, never undoable effects
inline constexpr const char* kRollbackMarkerPrefix = "[rollback] ";

// Byte offset into the log. Offsets returned by position() are always line boundaries.
struct LogPosition {
    uint64_t offset = 0;
};

// One line of the log: "timestamp|action|rollback_command"
struct TransactionEntry {
    std::string timestamp;
    std::string action;
    std::string rollback_command;
    size_t line_number = 0;   // 1-based
    uint64_t offset = 0;      // byte offset of the line start
    bool malformed = false;
    std::string raw;          // set for malformed lines
    std::string error;

    // Terminal marker appended after each rollback pass
    bool is_rollback_marker() const;
};

struct LogValidation {
    bool valid = true;
    size_t line_count = 0;
    std::optional<size_t> first_bad_line;
    std::string reason;
};

// Parses one line (without its newline). Never throws; a bad line comes back malformed.
TransactionEntry parse_transaction_line(const std::string& line, size_t line_number, uint64_t offset);

// Lazy most-recent-first walk over [from, end) where end is the file size when
// the view was created. Reads the file backwards in fixed-size blocks.
class ReverseView {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = TransactionEntry;
        using difference_type = std::ptrdiff_t;
        using pointer = const TransactionEntry*;
        using reference = const TransactionEntry&;

        iterator() = default;
        explicit iterator(ReverseView* view);

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++();
        bool operator==(const iterator& other) const { return view_ == other.view_; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        ReverseView* view_ = nullptr;
        std::optional<TransactionEntry> current_;
    };

    ReverseView(const std::filesystem::path& path, LogPosition from);

    ReverseView(const ReverseView&) = delete;
    ReverseView& operator=(const ReverseView&) = delete;
    ReverseView(ReverseView&&) = default;
    ReverseView& operator=(ReverseView&&) = default;

    // Next entry going backwards, nullopt once `from` is reached
    std::optional<TransactionEntry> next();

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    uint64_t end_offset() const { return end_; }

private:
    bool load_block();

    static constexpr size_t kBlockSize = 4096;

    std::ifstream file_;
    uint64_t from_ = 0;
    uint64_t end_ = 0;
    uint64_t buf_start_ = 0;   // file offset of buffer_[0]
    uint64_t line_end_ = 0;    // exclusive end of the unread region
    std::string buffer_;
    size_t next_line_number_ = 0;
};

// Append-only record of undoable effects. Safe to share between worker threads.
class TransactionLog {
public:
    explicit TransactionLog(std::filesystem::path path, Logger& logger = Logger::null());

    TransactionLog(const TransactionLog&) = delete;
    TransactionLog& operator=(const TransactionLog&) = delete;

    // Creates the parent directory (0750) and the file (0640). Called lazily by record().
    void init();

    // Appends one line in a single write on an O_APPEND descriptor.
    // Throws ArgumentError on empty fields, '|' or newline in action, newline in the command,
    // and on actions that start with the reserved "[rollback] " marker prefix.
    void record(const std::string& action, const std::string& rollback_command);

    void record_package_install(const std::string& package);
    void record_file_create(const std::string& file);
    void record_dir_create(const std::string& dir);
    void record_file_modify(const std::string& file, const std::string& backup);
    void record_user_create(const std::string& username);
    void record_service_enable(const std::string& service);
    void record_config_change(const std::string& description, const std::string& restore_command);

    ReverseView entries_reverse(LogPosition from = LogPosition{}) const;

    // Non-blank lines currently in the log
    size_t count() const;
    LogPosition position() const;
    LogValidation validate() const;

    // Copies the log to destination (default "<log>.backup"). Throws StorageError.
    std::filesystem::path archive(const std::filesystem::path& destination = {}) const;
    void clear();

    const std::filesystem::path& path() const { return path_; }

private:
    friend class RollbackExecutor;

    // Terminal marker of a rollback pass; the only writer of "[rollback] " actions
    void record_marker(const std::string& action);
    void append(const std::string& action, const std::string& rollback_command);
    void open_locked();

    std::filesystem::path path_;
    Logger& logger_;
    mutable std::mutex mutex_;
    FileDescriptor fd_;
};

// Single-quotes a value for /bin/sh
std::string shell_quote(const std::string& value);

} // namespace hostprov

#endif // HOSTPROV_MODULES_TRANSACTION_TRANSACTION_LOG_H
