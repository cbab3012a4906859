#ifndef FSMON_WATCH_REGISTRY_H
#define FSMON_WATCH_REGISTRY_H

#include "core/include/Result.h"
#include "watchers/watcher_common/iwatcher.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace fsmon {

using ListenerId = uint64_t;

/**
 * @brief WatchRegistry - the only owner of platform watchers
 *
 * Maps each watched directory to {watcher, listener set}. The reference
 * count of a directory is the size of its listener set, so a directory
 * shared by N listeners has exactly one watcher and a count of N.
 * All mutations are serialized by one mutex.
 */
class WatchRegistry {
public:
    /**
     * @brief Starts a watcher on a directory, nullptr on failure
     */
    using WatcherOpener = std::function<std::unique_ptr<watchers::IWatcher>(const std::string&)>;

    WatchRegistry(size_t max_watches, WatcherOpener opener);
    ~WatchRegistry();

    WatchRegistry(const WatchRegistry&) = delete;
    WatchRegistry& operator=(const WatchRegistry&) = delete;

    /**
     * @brief Add listener to the directory's set, creating the watch if needed
     *
     * Acquiring a directory the listener already holds changes nothing.
     *
     * @return WatchLimitExceeded when a new watch would exceed max_watches;
     *         FileNotFound, NotADirectory, PermissionDenied or
     *         WatchCreationFailed when no backend can watch the directory
     */
    Result<void> acquire(const std::string& directory, ListenerId listener);

    /**
     * @brief Remove listener from the directory's set
     *
     * The watch is stopped and removed when the set becomes empty.
     */
    void release(const std::string& directory, ListenerId listener);

    /**
     * @brief Release every directory held by listener
     *
     * @return Directories that were released
     */
    std::vector<std::string> release_all(ListenerId listener);

    /**
     * @brief Release directory and everything beneath it for every listener
     */
    void release_subtree(const std::string& directory);

    std::vector<ListenerId> listeners_for(const std::string& directory) const;
    size_t reference_count(const std::string& directory) const;
    size_t watch_count() const;
    bool is_watched(const std::string& directory) const;
    std::vector<std::string> watched_directories() const;
    std::vector<std::string> directories_for(ListenerId listener) const;

    /**
     * @brief Backend serving directory, empty when unwatched
     */
    std::string backend_for(const std::string& directory) const;

    size_t max_watches() const { return max_watches_; }

    /**
     * @brief Stop every watcher and empty the registry
     */
    void clear();

private:
    struct WatchedDirectory {
        std::unique_ptr<watchers::IWatcher> watcher;
        std::set<ListenerId> listeners;
    };

    Error open_failure(const std::string& directory) const;

    size_t max_watches_;
    WatcherOpener opener_;

    mutable std::mutex mutex_;
    std::map<std::string, WatchedDirectory> directories_;
};

} // namespace fsmon

#endif // FSMON_WATCH_REGISTRY_H
