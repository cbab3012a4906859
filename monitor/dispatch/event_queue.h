#ifndef FSMON_EVENT_QUEUE_H
#define FSMON_EVENT_QUEUE_H

#include "watchers/watcher_common/iwatcher.h"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <vector>

namespace fsmon {

/**
 * @brief EventQueue - shared channel from every watcher to the dispatcher
 *
 * Multiple producers (one per watcher thread), one consumer. Holds at
 * most capacity events; further events are dropped and counted until the
 * consumer catches up.
 */
class EventQueue {
public:
    static constexpr size_t kDefaultCapacity = 100000;

    explicit EventQueue(size_t capacity = kDefaultCapacity);
    ~EventQueue();

    /**
     * @brief Append an event, false when closed or full
     */
    bool enqueue(const watchers::FsEvent& event);

    /**
     * @brief Non-blocking dequeue
     */
    bool dequeue(watchers::FsEvent& event);

    /**
     * @brief Wait up to timeout for events and take up to max_items of them
     *
     * Returns an empty batch on timeout or once the queue is closed.
     */
    std::vector<watchers::FsEvent> dequeue_batch(std::chrono::milliseconds timeout,
                                                 size_t max_items = 100);

    /**
     * @brief Wake the consumer; later enqueues are discarded
     */
    void close();

    /**
     * @brief Accept events again after close()
     */
    void reopen();

    bool is_empty() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }

    /**
     * @brief Events refused because the queue was full
     */
    size_t dropped() const;

private:
    std::queue<watchers::FsEvent> queue_;
    size_t capacity_;
    size_t dropped_;
    bool overflowing_;
    bool closed_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
};

} // namespace fsmon

#endif // FSMON_EVENT_QUEUE_H
