#include "watch_registry.h"
#include "core/logger/logger.h"
#include "core/metrics/metrics_collector.h"
#include "core/utils/path_utils.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace fsmon {

WatchRegistry::WatchRegistry(size_t max_watches, WatcherOpener opener)
    : max_watches_(max_watches)
    , opener_(std::move(opener)) {
}

WatchRegistry::~WatchRegistry() {
    clear();
}

Result<void> WatchRegistry::acquire(const std::string& directory, ListenerId listener) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = directories_.find(directory);
    if (it != directories_.end()) {
        it->second.listeners.insert(listener);
        return Ok();
    }

    if (directories_.size() >= max_watches_) {
        FSMON_LOG_WARN("WatchRegistry", "Watch limit of " + std::to_string(max_watches_) +
                       " reached, refusing " + directory);
        return Err(ErrorCode::WatchLimitExceeded,
                   "max_watches (" + std::to_string(max_watches_) + ") reached watching " + directory);
    }

    auto watcher = opener_ ? opener_(directory) : nullptr;
    if (!watcher) {
        return Result<void>(open_failure(directory));
    }

    FSMON_LOG_DEBUG("WatchRegistry", "Watching " + directory + " (" + watcher->backend_name() + ")");

    WatchedDirectory entry;
    entry.watcher = std::move(watcher);
    entry.listeners.insert(listener);
    directories_.emplace(directory, std::move(entry));

    core::MetricsCollector::instance().increment_watches_created();
    return Ok();
}

void WatchRegistry::release(const std::string& directory, ListenerId listener) {
    std::unique_ptr<watchers::IWatcher> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = directories_.find(directory);
        if (it == directories_.end()) {
            return;
        }
        it->second.listeners.erase(listener);
        if (!it->second.listeners.empty()) {
            return;
        }
        retired = std::move(it->second.watcher);
        directories_.erase(it);
    }

    // Joining the watcher thread happens outside the registry lock
    if (retired) {
        retired->stop();
    }
    core::MetricsCollector::instance().increment_watches_removed();
    FSMON_LOG_DEBUG("WatchRegistry", "Stopped watching " + directory);
}

std::vector<std::string> WatchRegistry::release_all(ListenerId listener) {
    std::vector<std::string> released;
    std::vector<std::unique_ptr<watchers::IWatcher>> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = directories_.begin(); it != directories_.end();) {
            if (it->second.listeners.erase(listener) > 0) {
                released.push_back(it->first);
            }
            if (it->second.listeners.empty()) {
                retired.push_back(std::move(it->second.watcher));
                it = directories_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& watcher : retired) {
        if (watcher) {
            watcher->stop();
        }
        core::MetricsCollector::instance().increment_watches_removed();
    }
    return released;
}

void WatchRegistry::release_subtree(const std::string& directory) {
    std::vector<std::unique_ptr<watchers::IWatcher>> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = directories_.begin(); it != directories_.end();) {
            if (core::PathUtils::is_within(it->first, directory)) {
                FSMON_LOG_DEBUG("WatchRegistry", "Directory removed, dropping watch on " + it->first);
                retired.push_back(std::move(it->second.watcher));
                it = directories_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& watcher : retired) {
        if (watcher) {
            watcher->stop();
        }
        core::MetricsCollector::instance().increment_watches_removed();
    }
}

std::vector<ListenerId> WatchRegistry::listeners_for(const std::string& directory) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = directories_.find(directory);
    if (it == directories_.end()) {
        return {};
    }
    return std::vector<ListenerId>(it->second.listeners.begin(), it->second.listeners.end());
}

size_t WatchRegistry::reference_count(const std::string& directory) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = directories_.find(directory);
    return it == directories_.end() ? 0 : it->second.listeners.size();
}

size_t WatchRegistry::watch_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return directories_.size();
}

bool WatchRegistry::is_watched(const std::string& directory) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return directories_.count(directory) > 0;
}

std::vector<std::string> WatchRegistry::watched_directories() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(directories_.size());
    for (const auto& [path, entry] : directories_) {
        result.push_back(path);
    }
    return result;
}

std::vector<std::string> WatchRegistry::directories_for(ListenerId listener) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [path, entry] : directories_) {
        if (entry.listeners.count(listener) > 0) {
            result.push_back(path);
        }
    }
    return result;
}

std::string WatchRegistry::backend_for(const std::string& directory) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = directories_.find(directory);
    if (it == directories_.end() || !it->second.watcher) {
        return "";
    }
    return it->second.watcher->backend_name();
}

void WatchRegistry::clear() {
    std::map<std::string, WatchedDirectory> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retired.swap(directories_);
    }
    for (auto& [path, entry] : retired) {
        if (entry.watcher) {
            entry.watcher->stop();
        }
        core::MetricsCollector::instance().increment_watches_removed();
    }
}

Error WatchRegistry::open_failure(const std::string& directory) const {
    std::error_code ec;
    fs::file_status status = fs::status(directory, ec);
    if (!fs::exists(status)) {
        return Error{ErrorCode::FileNotFound, "No such directory: " + directory};
    }
    if (!fs::is_directory(status)) {
        return Error{ErrorCode::NotADirectory, "Not a directory: " + directory};
    }
    fs::directory_iterator listing(directory, ec);
    if (ec == std::errc::permission_denied) {
        return Error{ErrorCode::PermissionDenied, "Permission denied: " + directory};
    }
    return Error{ErrorCode::WatchCreationFailed, "No backend could watch " + directory};
}

} // namespace fsmon
