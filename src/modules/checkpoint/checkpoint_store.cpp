// modules/checkpoint/checkpoint_store.cpp
#include "modules/checkpoint/checkpoint_store.h"
#include "common/utils/file_ops.h"
#include <atomic>
#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <regex>
#include <sstream>
#include <unistd.h>

namespace hostprov {

namespace fs = std::filesystem;

namespace {

constexpr const char* kExtension = ".checkpoint";

std::atomic<unsigned long> g_temp_counter{0};

} // namespace

nlohmann::json Checkpoint::to_json() const {
    return nlohmann::json{
        {"checkpoint_name", module_id},
        {"created_at", format_utc_timestamp(created_at)},
        {"hostname", hostname},
        {"user", user}
    };
}

CheckpointStore::CheckpointStore(fs::path directory, Logger& logger)
    : directory_(std::move(directory)), logger_(logger) {}

void CheckpointStore::init() {
    ensure_directory(directory_, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
}

bool CheckpointStore::is_valid_id(const ModuleId& id) {
    static const std::regex pattern("^[A-Za-z0-9][A-Za-z0-9._-]*$");
    return !id.empty() && id.size() <= 128 && std::regex_match(id, pattern);
}

void CheckpointStore::require_valid_id(const ModuleId& id) const {
    if (!is_valid_id(id)) {
        throw ArgumentError("Invalid checkpoint name: '" + id + "'");
    }
}

fs::path CheckpointStore::path_for(const ModuleId& id) const {
    return directory_ / (id + kExtension);
}

bool CheckpointStore::exists(const ModuleId& id) const {
    if (!is_valid_id(id)) return false;
    std::error_code ec;
    return fs::is_regular_file(path_for(id), ec);
}

void CheckpointStore::create(const ModuleId& id) {
    require_valid_id(id);
    init();

    const fs::path final_path = path_for(id);
    if (exists(id)) {
        logger_.debug("Checkpoint already present: " + id);
        return;
    }

    Checkpoint marker{id, std::chrono::system_clock::now(), current_hostname(), current_user()};
    const std::string body = marker.to_json().dump(2) + "\n";

    std::ostringstream tmp_name;
    tmp_name << "." << id << ".tmp." << ::getpid() << "." << g_temp_counter.fetch_add(1);
    const fs::path tmp_path = directory_ / tmp_name.str();

    {
        FileDescriptor fd(::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0640));
        if (!fd.valid()) {
            throw StorageError("Failed to write checkpoint '" + id + "': " + errno_message(errno));
        }
        try {
            write_all(fd.get(), body, "checkpoint " + id);
            sync_fd(fd.get(), "checkpoint " + id);
        } catch (...) {
            ::unlink(tmp_path.c_str());
            throw;
        }
    }

    // link() refuses to replace an existing name, which keeps markers monotonic
    if (::link(tmp_path.c_str(), final_path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        if (err == EEXIST) {
            logger_.debug("Checkpoint already present: " + id);
            return;
        }
        throw StorageError("Failed to publish checkpoint '" + id + "': " + errno_message(err));
    }
    ::unlink(tmp_path.c_str());
    sync_directory(directory_);
    logger_.debug("Checkpoint created: " + id);
}

bool CheckpointStore::remove(const ModuleId& id) {
    require_valid_id(id);
    std::error_code ec;
    const bool removed = fs::remove(path_for(id), ec);
    if (ec) {
        throw StorageError("Failed to remove checkpoint '" + id + "': " + ec.message());
    }
    if (removed) {
        logger_.debug("Checkpoint cleared: " + id);
    } else {
        logger_.debug("Checkpoint not found: " + id);
    }
    return removed;
}

std::set<ModuleId> CheckpointStore::list() const {
    std::set<ModuleId> ids;
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        return ids;
    }
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file()) continue;
        const fs::path& p = entry.path();
        if (p.extension() != kExtension) continue;
        std::string stem = p.stem().string();
        if (is_valid_id(stem)) {
            ids.insert(std::move(stem));
        }
    }
    if (ec) {
        throw StorageError("Failed to list checkpoints in " + directory_.string() + ": " + ec.message());
    }
    return ids;
}

std::optional<Checkpoint> CheckpointStore::get(const ModuleId& id) const {
    if (!exists(id)) return std::nullopt;

    std::ifstream file(path_for(id));
    if (!file.is_open()) return std::nullopt;

    Checkpoint cp;
    cp.module_id = id;
    try {
        nlohmann::json j;
        file >> j;
        auto created = parse_utc_timestamp(j.value("created_at", ""));
        if (!created) return std::nullopt;
        cp.created_at = *created;
        cp.hostname = j.value("hostname", "");
        cp.user = j.value("user", "");
    } catch (const nlohmann::json::exception& e) {
        logger_.warning("Unreadable checkpoint '" + id + "': " + e.what());
        return std::nullopt;
    }
    return cp;
}

bool CheckpointStore::validate(const ModuleId& id) const {
    if (!exists(id)) {
        logger_.warning("Checkpoint file not found: " + id);
        return false;
    }
    std::ifstream file(path_for(id));
    if (!file.is_open()) {
        logger_.error("Checkpoint file not readable: " + id);
        return false;
    }
    try {
        nlohmann::json j;
        file >> j;
        for (const char* field : {"checkpoint_name", "created_at"}) {
            if (!j.contains(field) || !j[field].is_string()) {
                logger_.error(std::string("Checkpoint missing required field: ") + field);
                return false;
            }
        }
        return j["checkpoint_name"].get<std::string>() == id &&
               parse_utc_timestamp(j["created_at"].get<std::string>()).has_value();
    } catch (const nlohmann::json::exception& e) {
        logger_.error("Checkpoint '" + id + "' is corrupt: " + e.what());
        return false;
    }
}

size_t CheckpointStore::clear_all() {
    size_t removed = 0;
    for (const auto& id : list()) {
        if (remove(id)) ++removed;
    }
    if (removed > 0) {
        logger_.info("Cleared " + std::to_string(removed) + " checkpoint(s)");
    }
    return removed;
}

size_t CheckpointStore::remove_older_than(std::chrono::seconds age) {
    const auto cutoff = std::chrono::system_clock::now() - age;
    size_t removed = 0;
    for (const auto& id : list()) {
        auto cp = get(id);
        if (cp && cp->created_at < cutoff && remove(id)) {
            ++removed;
        }
    }
    if (removed > 0) {
        logger_.info("Cleaned up " + std::to_string(removed) + " old checkpoint(s)");
    }
    return removed;
}

} // namespace hostprov
