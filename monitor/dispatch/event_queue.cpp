#include "event_queue.h"
#include "core/logger/logger.h"
#include "core/metrics/metrics_collector.h"

namespace fsmon {

EventQueue::EventQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity)
    , dropped_(0)
    , overflowing_(false)
    , closed_(false) {
}

EventQueue::~EventQueue() = default;

bool EventQueue::enqueue(const watchers::FsEvent& event) {
    bool dropped = false;
    bool first_drop = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (queue_.size() >= capacity_) {
            ++dropped_;
            dropped = true;
            first_drop = !overflowing_;
            overflowing_ = true;
        } else {
            queue_.push(event);
        }
    }

    if (dropped) {
        core::MetricsCollector::instance().increment_events_dropped();
        if (first_drop) {
            FSMON_LOG_WARN("EventQueue", "Event queue full (" + std::to_string(capacity_) +
                           " events), dropping events until the dispatcher catches up");
        }
        return false;
    }

    core::MetricsCollector::instance().increment_raw_events();
    condition_.notify_one();
    return true;
}

bool EventQueue::dequeue(watchers::FsEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return false;
    }
    event = std::move(queue_.front());
    queue_.pop();
    if (queue_.empty()) {
        overflowing_ = false;
    }
    return true;
}

std::vector<watchers::FsEvent> EventQueue::dequeue_batch(std::chrono::milliseconds timeout,
                                                         size_t max_items) {
    std::vector<watchers::FsEvent> batch;
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
    if (closed_) {
        return batch;
    }

    while (!queue_.empty() && batch.size() < max_items) {
        batch.push_back(std::move(queue_.front()));
        queue_.pop();
    }
    if (queue_.empty()) {
        overflowing_ = false;
    }
    return batch;
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        std::queue<watchers::FsEvent>().swap(queue_);
    }
    condition_.notify_all();
}

void EventQueue::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
}

bool EventQueue::is_empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

size_t EventQueue::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace fsmon
