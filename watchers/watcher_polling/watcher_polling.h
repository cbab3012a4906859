#ifndef FSMON_WATCHER_POLLING_H
#define FSMON_WATCHER_POLLING_H

#include "watchers/watcher_common/iwatcher.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace fsmon {
namespace watchers {

/**
 * @brief Portable watcher that diffs periodic directory snapshots
 *
 * Used when no native backend exists or when the native backend refuses
 * a directory (exhausted inotify watches, network file systems).
 */
class WatcherPolling : public IWatcher {
public:
    /**
     * @param interval Time between two snapshots
     * @param batch_size Entries read before checking for shutdown
     */
    explicit WatcherPolling(std::chrono::milliseconds interval = std::chrono::milliseconds(1000),
                            size_t batch_size = 1000);
    ~WatcherPolling() override;

    WatcherPolling(const WatcherPolling&) = delete;
    WatcherPolling& operator=(const WatcherPolling&) = delete;

    bool start(const std::string& path) override;
    void stop() override;
    bool is_running() const override;
    std::string get_watched_path() const override;
    const char* backend_name() const override { return "polling"; }

    std::chrono::milliseconds interval() const { return interval_; }

private:
    struct Entry {
        int64_t mtime_ns{0};
        uintmax_t size{0};
        bool is_directory{false};
        bool is_symlink{false};
        std::string link_target;

        bool same_kind(const Entry& other) const {
            return is_directory == other.is_directory && is_symlink == other.is_symlink;
        }
        bool operator==(const Entry& other) const {
            return mtime_ns == other.mtime_ns && size == other.size &&
                   same_kind(other) && link_target == other.link_target;
        }
        bool operator!=(const Entry& other) const { return !(*this == other); }
    };

    using Snapshot = std::map<std::string, Entry>;

    void poll_loop();

    /**
     * @brief Read the directory; nullopt when it cannot be read or on shutdown
     */
    std::optional<Snapshot> take_snapshot();

    void diff_and_emit(const Snapshot& before, const Snapshot& after);

    std::chrono::milliseconds interval_;
    size_t batch_size_;

    std::atomic<bool> running_;
    std::string watch_path_;
    Snapshot snapshot_;
    bool lost_;                             // WATCH_LOST already reported

    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread poll_thread_;
};

} // namespace watchers
} // namespace fsmon

#endif // FSMON_WATCHER_POLLING_H
