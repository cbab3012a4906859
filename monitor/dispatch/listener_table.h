#ifndef FSMON_LISTENER_TABLE_H
#define FSMON_LISTENER_TABLE_H

#include "monitor/listener.h"
#include "monitor/pattern/path_pattern.h"
#include "monitor/registry/watch_registry.h"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace fsmon {

/**
 * @brief Per-listener lifecycle
 *
 * Unregistered -> Registering -> Active -> Unregistering -> Removed.
 * Events are dispatched only while Active.
 */
enum class ListenerState {
    Unregistered,
    Registering,
    Active,
    Unregistering,
    Removed
};

const char* listener_state_to_string(ListenerState state);

/**
 * @brief What the monitor knows about one registered listener
 */
struct ListenerEntry {
    ListenerEntry(ListenerId listener_id,
                  std::shared_ptr<IFileSystemListener> l,
                  PathPattern p,
                  std::chrono::milliseconds delay)
        : id(listener_id)
        , listener(std::move(l))
        , pattern(std::move(p))
        , debounce(delay) {}

    const ListenerId id;
    const std::shared_ptr<IFileSystemListener> listener;
    const PathPattern pattern;
    const std::chrono::milliseconds debounce;
    std::atomic<ListenerState> state{ListenerState::Unregistered};

    bool is_active() const { return state == ListenerState::Active; }
};

/**
 * @brief ListenerTable - id and identity lookup of registered listeners
 */
class ListenerTable {
public:
    ListenerTable();

    /**
     * @brief Create an entry in state Registering with a fresh id
     *
     * @return nullptr when this listener object is already registered
     */
    std::shared_ptr<ListenerEntry> add(std::shared_ptr<IFileSystemListener> listener,
                                       PathPattern pattern,
                                       std::chrono::milliseconds debounce);

    std::shared_ptr<ListenerEntry> find(ListenerId id) const;
    std::shared_ptr<ListenerEntry> find(const IFileSystemListener* listener) const;

    void remove(ListenerId id);

    size_t size() const;
    std::vector<std::shared_ptr<ListenerEntry>> entries() const;

private:
    mutable std::mutex mutex_;
    std::map<ListenerId, std::shared_ptr<ListenerEntry>> entries_;
    ListenerId next_id_;
};

} // namespace fsmon

#endif // FSMON_LISTENER_TABLE_H
