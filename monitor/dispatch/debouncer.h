#ifndef FSMON_DEBOUNCER_H
#define FSMON_DEBOUNCER_H

#include "monitor/fs_event.h"
#include "monitor/registry/watch_registry.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace fsmon {

/**
 * @brief Latest state of one (listener, path) debounce slot
 */
struct PendingEvent {
    ListenerId listener{0};
    FileSystemEvent event;
    std::chrono::steady_clock::time_point first_seen;
    std::chrono::steady_clock::time_point deadline;
    size_t count{0};
};

/**
 * @brief Debouncer - per-(listener, path) deferred delivery
 *
 * Every new event for a slot replaces its state and restarts the slot's
 * timer. Coalescing:
 * - a pending creation absorbs later modifications (and keeps the newest
 *   link target for symlinks)
 * - a deletion always wins
 * - consecutive target changes keep the oldest old_target
 * - anything else: last write wins
 *
 * A zero delay still goes through the timer thread, so delivery order
 * per slot never depends on the delay.
 */
class Debouncer {
public:
    using OutputCallback = std::function<void(const PendingEvent&)>;

    struct Stats {
        uint64_t events_received{0};
        uint64_t events_coalesced{0};
        uint64_t events_emitted{0};
        uint64_t events_dropped{0};
    };

    Debouncer();
    ~Debouncer();

    Debouncer(const Debouncer&) = delete;
    Debouncer& operator=(const Debouncer&) = delete;

    /**
     * @brief Start the timer thread
     *
     * @param callback Invoked from the timer thread once per expired slot
     */
    void start(OutputCallback callback);

    /**
     * @brief Stop the timer thread; pending events are dropped
     */
    void stop();

    bool is_running() const { return running_; }

    /**
     * @brief Place or replace the slot for (listener, event.path)
     */
    void add(ListenerId listener, const FileSystemEvent& event, std::chrono::milliseconds delay);

    /**
     * @brief Add several events for one listener under a single lock
     */
    void add_batch(ListenerId listener, const std::vector<FileSystemEvent>& events,
                   std::chrono::milliseconds delay);

    /**
     * @brief Discard every pending slot of listener
     *
     * @return Number of events dropped
     */
    size_t drop_listener(ListenerId listener);

    size_t pending_count() const;
    size_t pending_count(ListenerId listener) const;

    Stats get_stats() const;

    /**
     * @brief Merge incoming into pending
     */
    static void coalesce(FileSystemEvent& pending, const FileSystemEvent& incoming);

private:
    using Key = std::pair<ListenerId, std::string>;

    void add_locked(ListenerId listener, const FileSystemEvent& event,
                    std::chrono::steady_clock::time_point now,
                    std::chrono::milliseconds delay);
    void process_loop();

    OutputCallback output_callback_;
    std::atomic<bool> running_{false};
    std::thread process_thread_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<Key, PendingEvent> pending_;
    Stats stats_;
};

} // namespace fsmon

#endif // FSMON_DEBOUNCER_H
