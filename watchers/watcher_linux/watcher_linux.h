#ifndef FSMON_WATCHER_LINUX_H
#define FSMON_WATCHER_LINUX_H

#include "watchers/watcher_common/iwatcher.h"
#include <string>
#include <atomic>
#include <memory>

struct inotify_event;

namespace fsmon {
namespace watchers {

class InotifyInstance;

/**
 * @brief Linux file system watcher using inotify
 *
 * Each WatcherLinux covers one directory, non-recursively, so the registry
 * can share watches between listeners. All watchers of the process add
 * their watch descriptor to one shared inotify instance, whose thread
 * routes every event to the watcher owning its wd.
 */
class WatcherLinux : public IWatcher {
public:
    WatcherLinux();
    ~WatcherLinux() override;

    WatcherLinux(const WatcherLinux&) = delete;
    WatcherLinux& operator=(const WatcherLinux&) = delete;

    bool start(const std::string& path) override;
    void stop() override;
    bool is_running() const override;
    std::string get_watched_path() const override;
    const char* backend_name() const override { return "inotify"; }

    /**
     * @brief Check whether inotify can be used on this host
     */
    static bool is_supported();

    /**
     * @brief Number of live inotify instances in this process (0 or 1)
     */
    static size_t instance_count();

private:
    friend class InotifyInstance;

    std::shared_ptr<InotifyInstance> instance_;
    int watch_descriptor_;                  // wd of the watched directory
    std::atomic<bool> running_;             // Running state
    std::string watch_path_;                // Directory being watched

    /**
     * @brief Translate one inotify event into an FsEvent
     *
     * Runs on the shared instance's thread.
     */
    void process_event(const ::inotify_event* event);
};

} // namespace watchers
} // namespace fsmon

#endif // FSMON_WATCHER_LINUX_H
