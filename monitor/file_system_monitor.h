#ifndef FSMON_FILE_SYSTEM_MONITOR_H
#define FSMON_FILE_SYSTEM_MONITOR_H

#include "core/include/Result.h"
#include "monitor/listener.h"
#include "monitor/monitor_config.h"
#include "monitor/registry/watch_registry.h"
#include "monitor/watch_handle.h"
#include <functional>
#include <memory>
#include <string>

namespace fsmon {

class SymlinkResolver;

/**
 * @brief Starts a watcher on a directory, nullptr on failure
 *
 * sink must be installed as on_event before the watcher starts.
 */
using WatcherSource = std::function<std::unique_ptr<watchers::IWatcher>(const std::string& directory,
                                                                        const watchers::EventSink& sink)>;

/**
 * @brief FileSystemMonitor - register listeners, receive debounced events
 *
 * Usage:
 * @code
 * FileSystemMonitor monitor(config);
 * monitor.start();
 * auto handle = monitor.register_listener(std::make_shared<MyListener>("docs/*.md"));
 * if (!handle) {
 *     FSMON_LOG_ERROR("App", handle.error().message);
 * }
 * @endcode
 *
 * Threads: one dispatcher, one delivery thread for listener callbacks and
 * one thread per watched directory. register_listener and
 * unregister_listener may be called from any thread, including from inside
 * a callback; stop() must not be called from a callback.
 */
class FileSystemMonitor {
public:
    explicit FileSystemMonitor(const MonitorConfig& config = MonitorConfig());

    /**
     * @brief Construct with a custom watcher source instead of the platform factory
     */
    FileSystemMonitor(const MonitorConfig& config, WatcherSource source);

    ~FileSystemMonitor();

    FileSystemMonitor(const FileSystemMonitor&) = delete;
    FileSystemMonitor& operator=(const FileSystemMonitor&) = delete;

    /**
     * @brief Start the dispatcher and delivery threads
     *
     * @return MonitorDisabled when fs_monitor.enabled is false,
     *         InvalidConfig when a setting is out of range
     */
    Result<void> start();

    /**
     * @brief Stop all threads, drop pending events, deactivate every handle
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Register a listener and report its pre-existing matches as created
     *
     * @return InvalidPattern, WatchLimitExceeded, NotADirectory,
     *         PermissionDenied, MonitorDisabled, NotRunning or InvalidArgument
     */
    Result<std::shared_ptr<WatchHandle>> register_listener(std::shared_ptr<IFileSystemListener> listener);

    /**
     * @brief Stop delivering to listener; pending events are dropped
     *
     * Idempotent. When this returns no callback of the listener is running
     * (unless called from that callback) and none will run again.
     */
    void unregister_listener(const std::shared_ptr<IFileSystemListener>& listener);

    size_t listener_count() const;
    size_t watch_count() const;

    const MonitorConfig& config() const;
    const WatchRegistry& registry() const;
    SymlinkResolver& symlinks();

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace fsmon

#endif // FSMON_FILE_SYSTEM_MONITOR_H
