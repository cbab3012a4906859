#ifndef FSMON_WATCH_HANDLE_H
#define FSMON_WATCH_HANDLE_H

#include "monitor/registry/watch_registry.h"
#include <memory>
#include <string>
#include <vector>

namespace fsmon {

/**
 * @brief What a WatchHandle needs from the monitor that issued it
 */
class IWatchHandleOwner {
public:
    virtual ~IWatchHandleOwner() = default;

    virtual std::vector<std::string> watched_paths(ListenerId id) const = 0;
    virtual bool is_listener_active(ListenerId id) const = 0;
    virtual void unregister(ListenerId id) = 0;
};

/**
 * @brief WatchHandle - caller's view of one registration
 *
 * Owns no resources. Holds a weak reference to the monitor, so a handle
 * outliving its monitor simply reports inactive.
 */
class WatchHandle {
public:
    WatchHandle(std::weak_ptr<IWatchHandleOwner> owner, ListenerId id, std::string pattern);

    /**
     * @brief Directories currently watched for this listener, sorted
     */
    std::vector<std::string> list_watched_paths() const;

    bool is_active() const;

    /**
     * @brief Same as FileSystemMonitor::unregister_listener; idempotent
     */
    void unregister();

    ListenerId id() const { return id_; }
    const std::string& pattern() const { return pattern_; }

private:
    std::weak_ptr<IWatchHandleOwner> owner_;
    ListenerId id_;
    std::string pattern_;
};

} // namespace fsmon

#endif // FSMON_WATCH_HANDLE_H
