#include "debouncer.h"
#include "core/logger/logger.h"
#include "core/metrics/metrics_collector.h"
#include <algorithm>

namespace fsmon {

Debouncer::Debouncer() = default;

Debouncer::~Debouncer() {
    stop();
}

void Debouncer::start(OutputCallback callback) {
    if (running_) {
        return;
    }
    output_callback_ = std::move(callback);

    running_ = true;
    process_thread_ = std::thread(&Debouncer::process_loop, this);

    FSMON_LOG_DEBUG("Debouncer", "Debouncer started");
}

void Debouncer::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();

    if (process_thread_.joinable()) {
        process_thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_.empty()) {
        FSMON_LOG_DEBUG("Debouncer", "Dropping " + std::to_string(pending_.size()) +
                        " pending events on shutdown");
        stats_.events_dropped += pending_.size();
        for (size_t i = 0; i < pending_.size(); ++i) {
            core::MetricsCollector::instance().increment_events_dropped();
        }
        pending_.clear();
    }
}

void Debouncer::coalesce(FileSystemEvent& pending, const FileSystemEvent& incoming) {
    pending.timestamp = incoming.timestamp;

    if (is_deleted_kind(incoming.kind)) {
        pending.kind = incoming.kind;
        pending.target = incoming.target;
        pending.old_target.clear();
        return;
    }

    if (is_created_kind(pending.kind) &&
        (incoming.kind == FsEventKind::FILE_MODIFIED ||
         incoming.kind == FsEventKind::SYMLINK_TARGET_CHANGED)) {
        // Keep as created, with the newest link target
        if (incoming.kind == FsEventKind::SYMLINK_TARGET_CHANGED) {
            pending.target = incoming.target;
        }
        return;
    }

    if (pending.kind == FsEventKind::SYMLINK_TARGET_CHANGED &&
        incoming.kind == FsEventKind::SYMLINK_TARGET_CHANGED) {
        pending.target = incoming.target;
        return;
    }

    pending = incoming;
}

void Debouncer::add(ListenerId listener, const FileSystemEvent& event, std::chrono::milliseconds delay) {
    auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        add_locked(listener, event, now, delay);
    }
    cv_.notify_one();
}

void Debouncer::add_batch(ListenerId listener, const std::vector<FileSystemEvent>& events,
                          std::chrono::milliseconds delay) {
    if (events.empty()) {
        return;
    }
    auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& event : events) {
            add_locked(listener, event, now, delay);
        }
    }
    cv_.notify_one();
}

void Debouncer::add_locked(ListenerId listener, const FileSystemEvent& event,
                           std::chrono::steady_clock::time_point now,
                           std::chrono::milliseconds delay) {
    stats_.events_received++;

    Key key(listener, event.path);
    auto it = pending_.find(key);
    if (it != pending_.end()) {
        coalesce(it->second.event, event);
        it->second.deadline = now + delay;
        it->second.count++;
        stats_.events_coalesced++;
        core::MetricsCollector::instance().increment_events_coalesced();
        return;
    }

    PendingEvent pending;
    pending.listener = listener;
    pending.event = event;
    pending.first_seen = now;
    pending.deadline = now + delay;
    pending.count = 1;
    pending_.emplace(std::move(key), std::move(pending));
}

size_t Debouncer::drop_listener(ListenerId listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = 0;
    auto it = pending_.lower_bound(Key(listener, std::string()));
    while (it != pending_.end() && it->first.first == listener) {
        it = pending_.erase(it);
        ++dropped;
    }
    stats_.events_dropped += dropped;
    for (size_t i = 0; i < dropped; ++i) {
        core::MetricsCollector::instance().increment_events_dropped();
    }
    return dropped;
}

size_t Debouncer::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t Debouncer::pending_count(ListenerId listener) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    auto it = pending_.lower_bound(Key(listener, std::string()));
    while (it != pending_.end() && it->first.first == listener) {
        ++count;
        ++it;
    }
    return count;
}

Debouncer::Stats Debouncer::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void Debouncer::process_loop() {
    while (running_) {
        std::vector<PendingEvent> to_emit;

        {
            std::unique_lock<std::mutex> lock(mutex_);

            if (pending_.empty()) {
                cv_.wait(lock, [this]() {
                    return !running_ || !pending_.empty();
                });
            } else {
                auto earliest = std::min_element(pending_.begin(), pending_.end(),
                    [](const auto& a, const auto& b) {
                        return a.second.deadline < b.second.deadline;
                    })->second.deadline;
                cv_.wait_until(lock, earliest);
            }

            if (!running_) break;

            auto now = std::chrono::steady_clock::now();
            for (auto it = pending_.begin(); it != pending_.end();) {
                if (it->second.deadline <= now) {
                    to_emit.push_back(std::move(it->second));
                    it = pending_.erase(it);
                } else {
                    ++it;
                }
            }
            stats_.events_emitted += to_emit.size();
        }

        std::sort(to_emit.begin(), to_emit.end(), [](const PendingEvent& a, const PendingEvent& b) {
            return a.deadline < b.deadline;
        });

        // Emit events outside lock
        for (const auto& pending : to_emit) {
            if (output_callback_) {
                output_callback_(pending);
            }
        }
    }
}

} // namespace fsmon
