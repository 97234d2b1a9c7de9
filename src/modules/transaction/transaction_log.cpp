// modules/transaction/transaction_log.cpp
#include "modules/transaction/transaction_log.h"
#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace hostprov {

namespace fs = std::filesystem;

namespace {


TransactionEntry malformed_entry(const std::string& line, size_t line_number, uint64_t offset,
                                 std::string error) {
    TransactionEntry e;
    e.line_number = line_number;
    e.offset = offset;
    e.malformed = true;
    e.raw = line;
    e.error = std::move(error);
    return e;
}

uint64_t file_size_or_zero(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

} // namespace

bool TransactionEntry::is_rollback_marker() const {
    return !malformed && action.rfind(kRollbackMarkerPrefix, 0) == 0;
}

TransactionEntry parse_transaction_line(const std::string& line, size_t line_number, uint64_t offset) {
    const auto first = line.find('|');
    const auto second = first == std::string::npos ? std::string::npos : line.find('|', first + 1);
    if (second == std::string::npos) {
        return malformed_entry(line, line_number, offset, "expected timestamp|action|rollback_command");
    }

    TransactionEntry e;
    e.line_number = line_number;
    e.offset = offset;
    e.timestamp = line.substr(0, first);
    e.action = line.substr(first + 1, second - first - 1);
    // The rollback command keeps any further '|' characters
    e.rollback_command = line.substr(second + 1);

    if (!parse_utc_timestamp(e.timestamp)) {
        return malformed_entry(line, line_number, offset, "invalid timestamp '" + e.timestamp + "'");
    }
    if (e.action.empty() || e.rollback_command.empty()) {
        return malformed_entry(line, line_number, offset, "empty action or rollback command");
    }
    return e;
}

// --- ReverseView ---

ReverseView::iterator::iterator(ReverseView* view) : view_(view) {
    ++(*this);
}

ReverseView::iterator& ReverseView::iterator::operator++() {
    current_ = view_ ? view_->next() : std::nullopt;
    if (!current_) {
        view_ = nullptr;
    }
    return *this;
}

ReverseView::ReverseView(const fs::path& path, LogPosition from) {
    file_.open(path, std::ios::in | std::ios::binary);
    if (!file_.is_open()) {
        return;
    }
    file_.seekg(0, std::ios::end);
    const auto size = file_.tellg();
    end_ = size > 0 ? static_cast<uint64_t>(size) : 0;
    from_ = std::min(from.offset, end_);
    buf_start_ = end_;
    line_end_ = end_;

    // Absolute line numbers need the count of lines before end_
    file_.seekg(0, std::ios::beg);
    char block[kBlockSize];
    uint64_t remaining = end_;
    char last = '\n';
    while (remaining > 0 && file_) {
        const auto want = static_cast<std::streamsize>(std::min<uint64_t>(kBlockSize, remaining));
        file_.read(block, want);
        const auto got = file_.gcount();
        if (got <= 0) break;
        next_line_number_ += static_cast<size_t>(std::count(block, block + got, '\n'));
        last = block[got - 1];
        remaining -= static_cast<uint64_t>(got);
    }
    if (end_ > 0 && last != '\n') {
        ++next_line_number_;
    }
    file_.clear();
}

bool ReverseView::load_block() {
    if (!file_.is_open() || buf_start_ <= from_) {
        return false;
    }
    const auto n = static_cast<size_t>(std::min<uint64_t>(kBlockSize, buf_start_ - from_));
    buf_start_ -= n;
    std::string chunk(n, '\0');
    file_.seekg(static_cast<std::streamoff>(buf_start_), std::ios::beg);
    file_.read(chunk.data(), static_cast<std::streamsize>(n));
    if (static_cast<size_t>(file_.gcount()) != n) {
        throw StorageError("Transaction log shrank while being read");
    }
    buffer_.insert(0, chunk);
    return true;
}

std::optional<TransactionEntry> ReverseView::next() {
    while (line_end_ > from_) {
        if (buf_start_ == line_end_ && !load_block()) {
            break;
        }
        size_t content_end = static_cast<size_t>(line_end_ - buf_start_);
        if (buffer_[content_end - 1] == '\n') {
            --content_end;
        }

        size_t start = 0;
        for (;;) {
            const auto pos = content_end == 0 ? std::string::npos : buffer_.rfind('\n', content_end - 1);
            if (pos != std::string::npos) {
                start = pos + 1;
                break;
            }
            const size_t before = buffer_.size();
            if (!load_block()) {
                start = 0;
                break;
            }
            content_end += buffer_.size() - before;
        }

        std::string line = buffer_.substr(start, content_end - start);
        const uint64_t line_offset = buf_start_ + start;
        const size_t line_number = next_line_number_ > 0 ? next_line_number_-- : 0;
        line_end_ = line_offset;
        buffer_.resize(start);

        if (line.empty()) {
            continue;
        }
        return parse_transaction_line(line, line_number, line_offset);
    }
    return std::nullopt;
}

// --- TransactionLog ---

TransactionLog::TransactionLog(fs::path path, Logger& logger)
    : path_(std::move(path)), logger_(logger) {}

void TransactionLog::init() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_locked();
}

void TransactionLog::open_locked() {
    if (fd_.valid()) {
        return;
    }
    if (path_.has_parent_path()) {
        ensure_directory(path_.parent_path(),
                         fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
    }
    FileDescriptor fd(::open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0640));
    if (!fd.valid()) {
        throw StorageError("Failed to open transaction log " + path_.string() + ": " + errno_message(errno));
    }
    ::fchmod(fd.get(), 0640);
    fd_ = std::move(fd);
    logger_.debug("Transaction log: " + path_.string());
}

void TransactionLog::record(const std::string& action, const std::string& rollback_command) {
    if (action.empty() || rollback_command.empty()) {
        throw ArgumentError("Transaction record requires both action and rollback command");
    }
    if (action.find_first_of("|\n\r") != std::string::npos) {
        throw ArgumentError("Transaction action must not contain '|' or line breaks: " + action);
    }
    if (rollback_command.find_first_of("\n\r") != std::string::npos) {
        throw ArgumentError("Rollback command must be a single line: " + action);
    }
    if (action.rfind(kRollbackMarkerPrefix, 0) == 0) {
        throw ArgumentError("Transaction action must not start with the reserved rollback marker prefix: " +
                            action);
    }
    append(action, rollback_command);
}

void TransactionLog::record_marker(const std::string& action) {
    if (action.rfind(kRollbackMarkerPrefix, 0) != 0 || action.find_first_of("|\n\r") != std::string::npos) {
        throw ArgumentError("Not a rollback marker: " + action);
    }
    append(action, "true");
}

void TransactionLog::append(const std::string& action, const std::string& rollback_command) {
    const std::string line = format_utc_timestamp(std::chrono::system_clock::now()) + "|" +
                             action + "|" + rollback_command + "\n";
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_locked();
        write_all(fd_.get(), line, "transaction log " + path_.string());
    }
    logger_.debug("Transaction recorded: " + action);
}

void TransactionLog::record_package_install(const std::string& package) {
    record("Installed package: " + package, "apt-get remove -y " + shell_quote(package));
}

void TransactionLog::record_file_create(const std::string& file) {
    record("Created file: " + file, "rm -f " + shell_quote(file));
}

void TransactionLog::record_dir_create(const std::string& dir) {
    record("Created directory: " + dir, "rm -rf " + shell_quote(dir));
}

void TransactionLog::record_file_modify(const std::string& file, const std::string& backup) {
    record("Modified file: " + file, "cp " + shell_quote(backup) + " " + shell_quote(file));
}

void TransactionLog::record_user_create(const std::string& username) {
    record("Created user: " + username, "userdel -r " + shell_quote(username));
}

void TransactionLog::record_service_enable(const std::string& service) {
    const std::string quoted = shell_quote(service);
    record("Enabled service: " + service, "systemctl disable " + quoted + " && systemctl stop " + quoted);
}

void TransactionLog::record_config_change(const std::string& description, const std::string& restore_command) {
    record("Configuration: " + description, restore_command);
}

ReverseView TransactionLog::entries_reverse(LogPosition from) const {
    return ReverseView(path_, from);
}

size_t TransactionLog::count() const {
    std::ifstream file(path_);
    size_t n = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) ++n;
    }
    return n;
}

LogPosition TransactionLog::position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return LogPosition{file_size_or_zero(path_)};
}

LogValidation TransactionLog::validate() const {
    LogValidation result;
    std::ifstream file(path_, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return result;
    }
    std::string line;
    size_t line_number = 0;
    uint64_t offset = 0;
    while (std::getline(file, line)) {
        ++line_number;
        const uint64_t line_offset = offset;
        offset += line.size() + 1;
        if (line.empty()) continue;
        ++result.line_count;
        if (result.first_bad_line) continue;
        auto entry = parse_transaction_line(line, line_number, line_offset);
        if (entry.malformed) {
            result.valid = false;
            result.first_bad_line = line_number;
            result.reason = entry.error;
            logger_.error("Transaction log format error at line " + std::to_string(line_number) +
                          ": " + entry.error);
        }
    }
    return result;
}

fs::path TransactionLog::archive(const fs::path& destination) const {
    const fs::path target = destination.empty() ? fs::path(path_.string() + ".backup") : destination;
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        throw StorageError("Transaction log not found, cannot archive: " + path_.string());
    }
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }
    fs::copy_file(path_, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw StorageError("Failed to archive transaction log to " + target.string() + ": " + ec.message());
    }
    logger_.info("Transaction log archived to: " + target.string());
    return target;
}

void TransactionLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return;
    }
    if (::truncate(path_.c_str(), 0) != 0) {
        throw StorageError("Failed to clear transaction log: " + errno_message(errno));
    }
    logger_.info("Transaction log cleared");
}

std::string shell_quote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

} // namespace hostprov
