#ifndef FSMON_WATCHER_MACOS_H
#define FSMON_WATCHER_MACOS_H

#include "watchers/watcher_common/iwatcher.h"
#include <atomic>
#include <string>

namespace fsmon {
namespace watchers {

/**
 * @brief macOS file system watcher using FSEvents
 *
 * FSEvents streams always cover a whole subtree; only events for direct
 * children of the watched directory are forwarded.
 */
class WatcherMacOS : public IWatcher {
public:
    WatcherMacOS();
    ~WatcherMacOS() override;

    WatcherMacOS(const WatcherMacOS&) = delete;
    WatcherMacOS& operator=(const WatcherMacOS&) = delete;

    bool start(const std::string& path) override;
    void stop() override;
    bool is_running() const override;
    std::string get_watched_path() const override;
    const char* backend_name() const override { return "fsevents"; }

    static bool is_supported();

    /**
     * @brief Handle one item-level FSEvents notification
     */
    void handle_native_event(const char* native_path, uint32_t flags);

private:
    std::atomic<bool> running_;
    std::string watch_path_;
    std::string real_path_;     // FSEvents reports paths with symlinks resolved
    void* stream_;              // FSEventStreamRef
    void* queue_;               // dispatch_queue_t
};

} // namespace watchers
} // namespace fsmon

#endif // FSMON_WATCHER_MACOS_H
