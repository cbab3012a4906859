#ifndef FSMON_IWATCHER_H
#define FSMON_IWATCHER_H

#include <string>
#include <functional>
#include <cstdint>

namespace fsmon {
namespace watchers {

/**
 * @brief Raw file system event types
 *
 * Renames are reported as DELETED for the old name and CREATED for the
 * new one.
 */
enum class FsEventType {
    CREATED,        // New file/directory/symlink created
    MODIFIED,       // File content, metadata or link target changed
    DELETED,        // File/directory/symlink deleted
    WATCH_LOST      // The watched directory itself was deleted or moved away
};

/**
 * @brief Raw file system event
 *
 * Every backend normalises its native notifications to this shape.
 */
struct FsEvent {
    FsEventType type;
    std::string path;           // Absolute path of the affected entry
    uint64_t timestamp;         // Event timestamp (ms since epoch)
    bool is_directory;          // True if event is for a directory
    bool is_symlink;            // True if event is for a symbolic link

    FsEvent()
        : type(FsEventType::MODIFIED)
        , timestamp(0)
        , is_directory(false)
        , is_symlink(false) {}

    FsEvent(FsEventType t, const std::string& p, bool dir = false, bool link = false)
        : type(t)
        , path(p)
        , timestamp(current_time_ms())
        , is_directory(dir)
        , is_symlink(link) {}

    static uint64_t current_time_ms();
};

using EventSink = std::function<void(const FsEvent&)>;

/**
 * @brief IWatcher - File system watcher interface
 *
 * One instance watches exactly one directory, non-recursively. Backends:
 * - Linux: inotify
 * - macOS: FSEvents
 * - Windows: ReadDirectoryChangesW
 * - Anywhere: periodic snapshot polling
 *
 * The watch registry owns every instance and wires on_event to the
 * dispatcher's shared queue.
 */
class IWatcher {
public:
    virtual ~IWatcher() = default;

    /**
     * @brief Event sink
     *
     * Called from the watcher's own thread for each detected change. Set it
     * before start(); it must not stop watchers.
     */
    EventSink on_event;

    /**
     * @brief Start watching a directory
     *
     * @param path Directory path to watch
     * @return true if started successfully
     */
    virtual bool start(const std::string& path) = 0;

    /**
     * @brief Stop watching
     *
     * Stops monitoring, joins the watcher thread and releases resources.
     */
    virtual void stop() = 0;

    /**
     * @brief Check if watcher is running
     */
    virtual bool is_running() const = 0;

    /**
     * @brief Get watched path
     */
    virtual std::string get_watched_path() const = 0;

    /**
     * @brief Backend name ("inotify", "fsevents", "rdcw", "polling")
     */
    virtual const char* backend_name() const = 0;

protected:
    void emit(const FsEvent& event) {
        if (on_event) {
            on_event(event);
        }
    }
};

/**
 * @brief Convert FsEventType to string
 */
inline const char* event_type_to_string(FsEventType type) {
    switch (type) {
        case FsEventType::CREATED: return "CREATED";
        case FsEventType::MODIFIED: return "MODIFIED";
        case FsEventType::DELETED: return "DELETED";
        case FsEventType::WATCH_LOST: return "WATCH_LOST";
        default: return "INVALID";
    }
}

} // namespace watchers
} // namespace fsmon

#endif // FSMON_IWATCHER_H
