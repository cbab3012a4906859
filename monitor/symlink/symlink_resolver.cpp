#include "symlink_resolver.h"
#include "core/logger/logger.h"
#include "core/utils/path_utils.h"
#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace fsmon {

SymlinkResolver::SymlinkResolver(int max_depth)
    : max_depth_(max_depth < 1 ? 1 : max_depth) {
}

std::string SymlinkResolver::read_link(const std::string& path) {
    std::error_code ec;
    fs::path target = fs::read_symlink(path, ec);
    if (ec) {
        return "";
    }
    return target.generic_string();
}

Result<SymlinkRecord> SymlinkResolver::resolve(const std::string& path) const {
    std::error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);
    if (ec || !fs::exists(status)) {
        return Err<SymlinkRecord>(ErrorCode::FileNotFound, "No such file: " + path);
    }
    if (!fs::is_symlink(status)) {
        return Err<SymlinkRecord>(ErrorCode::NotASymlink, "Not a symlink: " + path);
    }

    SymlinkRecord record;
    record.path = core::PathUtils::normalize(path);
    record.target = read_link(path);

    std::set<std::string> visited{record.path};
    std::string current = record.path;
    int depth = 0;

    while (true) {
        status = fs::symlink_status(current, ec);
        if (ec || !fs::is_symlink(status)) {
            // End of chain, possibly dangling
            break;
        }

        if (++depth > max_depth_) {
            return Err<SymlinkRecord>(ErrorCode::CircularSymlink,
                "Symlink chain longer than " + std::to_string(max_depth_) + " hops: " + path);
        }

        std::string text = read_link(current);
        if (text.empty()) {
            return Err<SymlinkRecord>(ErrorCode::PermissionDenied, "Cannot read link: " + current);
        }

        std::string next = core::PathUtils::resolve(text, core::PathUtils::parent(current));
        if (!visited.insert(next).second) {
            return Err<SymlinkRecord>(ErrorCode::CircularSymlink,
                "Symlink cycle through " + next + ": " + path);
        }
        current = next;
    }

    record.final_target = current;
    record.resolution_depth = depth;
    return record;
}

Result<SymlinkRecord> SymlinkResolver::track(const std::string& path) {
    auto result = resolve(path);
    std::string key = core::PathUtils::normalize(path);

    std::lock_guard<std::mutex> lock(mutex_);
    if (result) {
        records_[key] = result.value();
        excluded_.erase(key);
    } else if (result.error().code == ErrorCode::CircularSymlink) {
        FSMON_LOG_WARN("SymlinkResolver", result.error().message + ", excluding until it changes");
        records_.erase(key);
        excluded_[key] = read_link(path);
    }
    return result;
}

void SymlinkResolver::forget(const std::string& path) {
    std::string key = core::PathUtils::normalize(path);
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(key);
    excluded_.erase(key);
}

std::optional<TargetChange> SymlinkResolver::check_target_change(const std::string& path) {
    std::string key = core::PathUtils::normalize(path);
    std::string old_target;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto rec = records_.find(key);
        if (rec != records_.end()) {
            old_target = rec->second.target;
        } else {
            auto ex = excluded_.find(key);
            if (ex == excluded_.end()) {
                return std::nullopt;
            }
            old_target = ex->second;
        }
    }

    std::string new_target = read_link(path);
    if (new_target.empty() || new_target == old_target) {
        return std::nullopt;
    }

    auto result = track(path);
    if (!result && result.error().code != ErrorCode::CircularSymlink) {
        return std::nullopt;
    }
    return TargetChange{old_target, new_target};
}

std::optional<SymlinkRecord> SymlinkResolver::record(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(core::PathUtils::normalize(path));
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SymlinkResolver::is_tracked(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.count(core::PathUtils::normalize(path)) > 0;
}

bool SymlinkResolver::is_excluded(const std::string& path) {
    std::string key = core::PathUtils::normalize(path);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = excluded_.find(key);
    if (it == excluded_.end()) {
        return false;
    }
    if (read_link(path) != it->second) {
        excluded_.erase(it);
        return false;
    }
    return true;
}

size_t SymlinkResolver::tracked_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace fsmon
