#ifndef FSMON_EVENT_DISPATCHER_H
#define FSMON_EVENT_DISPATCHER_H

#include "monitor/dispatch/debouncer.h"
#include "monitor/dispatch/event_queue.h"
#include "monitor/dispatch/listener_table.h"
#include "monitor/fs_event.h"
#include "monitor/monitor_config.h"
#include "monitor/pattern/path_filter.h"
#include "monitor/registry/watch_registry.h"
#include "monitor/symlink/symlink_resolver.h"
#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <thread>

namespace fsmon {

/**
 * @brief EventDispatcher - the single consumer of the shared event queue
 *
 * For each raw event: classify it once into a logical kind, find the
 * listeners of the event's directory, drop ignored paths and listeners
 * whose pattern or filter rejects the path, and hand the event to the
 * debouncer for every remaining listener.
 *
 * Directory creation and deletion are also reported through hooks so the
 * monitor can extend or shrink recursive watches. A watcher whose own
 * directory disappeared is reported through the watch-lost hook.
 */
class EventDispatcher {
public:
    using DirectoryHook = std::function<void(const std::string&)>;

    EventDispatcher(EventQueue& queue,
                    WatchRegistry& registry,
                    SymlinkResolver& resolver,
                    Debouncer& debouncer,
                    ListenerTable& listeners,
                    const PathFilter& filter,
                    bool follow_symlinks);
    ~EventDispatcher();

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    void set_directory_hooks(DirectoryHook on_created, DirectoryHook on_deleted);
    void set_watch_lost_hook(DirectoryHook on_lost);

    /**
     * @brief Start the consumer thread at the given priority
     */
    void start(ThreadPriority priority = ThreadPriority::Normal);
    void stop();
    bool is_running() const { return running_; }

    /**
     * @brief Run one raw event through the pipeline on the calling thread
     */
    void process(const watchers::FsEvent& raw);

    /**
     * @brief Map a raw event to its logical kind
     *
     * Updates symlink tracking. Returns nullopt for events listeners never
     * see (directory metadata changes, unchanged link targets).
     */
    std::optional<FileSystemEvent> classify(const watchers::FsEvent& raw);

    /**
     * @brief Apply a scheduling priority to the calling thread
     */
    static bool apply_thread_priority(ThreadPriority priority);

private:
    void dispatch_loop();
    void route(const FileSystemEvent& event);

    EventQueue& queue_;
    WatchRegistry& registry_;
    SymlinkResolver& resolver_;
    Debouncer& debouncer_;
    ListenerTable& listeners_;
    const PathFilter& filter_;
    bool follow_symlinks_;

    DirectoryHook on_directory_created_;
    DirectoryHook on_directory_deleted_;
    DirectoryHook on_watch_lost_;

    ThreadPriority priority_;
    std::atomic<bool> running_;
    std::thread dispatch_thread_;
};

} // namespace fsmon

#endif // FSMON_EVENT_DISPATCHER_H
