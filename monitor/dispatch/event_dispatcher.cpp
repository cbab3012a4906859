#include "event_dispatcher.h"
#include "core/logger/logger.h"
#include "core/metrics/metrics_collector.h"
#include "core/utils/path_utils.h"

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef NOGDI
#define NOGDI
#endif
#include <windows.h>
#elif defined(__linux__)
#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#endif

namespace fsmon {

using watchers::FsEvent;
using watchers::FsEventType;

EventDispatcher::EventDispatcher(EventQueue& queue,
                                 WatchRegistry& registry,
                                 SymlinkResolver& resolver,
                                 Debouncer& debouncer,
                                 ListenerTable& listeners,
                                 const PathFilter& filter,
                                 bool follow_symlinks)
    : queue_(queue)
    , registry_(registry)
    , resolver_(resolver)
    , debouncer_(debouncer)
    , listeners_(listeners)
    , filter_(filter)
    , follow_symlinks_(follow_symlinks)
    , priority_(ThreadPriority::Normal)
    , running_(false) {
}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::set_directory_hooks(DirectoryHook on_created, DirectoryHook on_deleted) {
    on_directory_created_ = std::move(on_created);
    on_directory_deleted_ = std::move(on_deleted);
}

void EventDispatcher::set_watch_lost_hook(DirectoryHook on_lost) {
    on_watch_lost_ = std::move(on_lost);
}

void EventDispatcher::start(ThreadPriority priority) {
    if (running_) {
        return;
    }
    priority_ = priority;
    running_ = true;
    dispatch_thread_ = std::thread(&EventDispatcher::dispatch_loop, this);
}

void EventDispatcher::stop() {
    running_ = false;
    if (dispatch_thread_.joinable()) {
        dispatch_thread_.join();
    }
}

void EventDispatcher::dispatch_loop() {
    if (priority_ != ThreadPriority::Normal) {
        apply_thread_priority(priority_);
    }
    FSMON_LOG_DEBUG("EventDispatcher", "Dispatch loop started");

    while (running_) {
        auto batch = queue_.dequeue_batch(std::chrono::milliseconds(100));
        for (const auto& raw : batch) {
            if (!running_) {
                break;
            }
            try {
                process(raw);
            } catch (const std::exception& e) {
                FSMON_LOG_ERROR("EventDispatcher", "Failed to process event for " + raw.path + ": " + e.what());
            }
        }
    }

    FSMON_LOG_DEBUG("EventDispatcher", "Dispatch loop ended");
}

void EventDispatcher::process(const FsEvent& raw) {
    FsEvent normalized = raw;
    normalized.path = core::PathUtils::normalize(raw.path);

    if (normalized.type == FsEventType::WATCH_LOST) {
        FSMON_LOG_DEBUG("EventDispatcher", "Watch lost on " + normalized.path);
        if (on_watch_lost_) {
            on_watch_lost_(normalized.path);
        }
        return;
    }

    auto event = classify(normalized);
    if (!event) {
        return;
    }

    bool is_directory = event->kind == FsEventKind::DIRECTORY_CREATED ||
                        event->kind == FsEventKind::DIRECTORY_DELETED;
    if (filter_.should_ignore(event->path, is_directory)) {
        FSMON_LOG_TRACE("EventDispatcher", "Ignored " + event->path);
        return;
    }

    route(*event);

    if (event->kind == FsEventKind::DIRECTORY_CREATED && on_directory_created_) {
        on_directory_created_(event->path);
    } else if (event->kind == FsEventKind::DIRECTORY_DELETED && on_directory_deleted_) {
        on_directory_deleted_(event->path);
    }
}

std::optional<FileSystemEvent> EventDispatcher::classify(const FsEvent& raw) {
    FileSystemEvent event;
    event.path = raw.path;
    event.timestamp = raw.timestamp;

    auto known_link = resolver_.record(raw.path);
    bool is_symlink = raw.is_symlink || (raw.type == FsEventType::DELETED && known_link.has_value());

    if (is_symlink) {
        switch (raw.type) {
            case FsEventType::CREATED: {
                event.target = SymlinkResolver::read_link(raw.path);
                if (follow_symlinks_) {
                    auto tracked = resolver_.track(raw.path);
                    if (!tracked) {
                        FSMON_LOG_DEBUG("EventDispatcher", "Untracked link " + raw.path + ": " +
                                        tracked.error().message);
                    }
                    if (known_link && known_link->target != event.target) {
                        event.kind = FsEventKind::SYMLINK_TARGET_CHANGED;
                        event.old_target = known_link->target;
                        return event;
                    }
                }
                event.kind = FsEventKind::SYMLINK_CREATED;
                return event;
            }
            case FsEventType::DELETED:
                // The record stays so a re-created link can be compared
                event.kind = FsEventKind::SYMLINK_DELETED;
                event.target = known_link ? known_link->target : "";
                return event;
            case FsEventType::MODIFIED: {
                if (!follow_symlinks_) {
                    return std::nullopt;
                }
                auto change = resolver_.check_target_change(raw.path);
                if (change) {
                    event.kind = FsEventKind::SYMLINK_TARGET_CHANGED;
                    event.old_target = change->old_target;
                    event.target = change->new_target;
                    return event;
                }
                if (!known_link && !resolver_.is_excluded(raw.path)) {
                    auto tracked = resolver_.track(raw.path);
                    if (!tracked) {
                        FSMON_LOG_DEBUG("EventDispatcher", "Untracked link " + raw.path + ": " +
                                        tracked.error().message);
                    }
                }
                return std::nullopt;
            }
            case FsEventType::WATCH_LOST:
                return std::nullopt;
        }
        return std::nullopt;
    }

    bool is_directory = raw.is_directory ||
                        (raw.type == FsEventType::DELETED && registry_.is_watched(raw.path));

    if (is_directory) {
        switch (raw.type) {
            case FsEventType::CREATED:
                event.kind = FsEventKind::DIRECTORY_CREATED;
                return event;
            case FsEventType::DELETED:
                event.kind = FsEventKind::DIRECTORY_DELETED;
                return event;
            case FsEventType::MODIFIED:
            case FsEventType::WATCH_LOST:
                return std::nullopt;
        }
        return std::nullopt;
    }

    switch (raw.type) {
        case FsEventType::CREATED:
            if (known_link) {
                resolver_.forget(raw.path);
            }
            event.kind = FsEventKind::FILE_CREATED;
            return event;
        case FsEventType::MODIFIED:
            event.kind = FsEventKind::FILE_MODIFIED;
            return event;
        case FsEventType::DELETED:
            event.kind = FsEventKind::FILE_DELETED;
            return event;
        case FsEventType::WATCH_LOST:
            return std::nullopt;
    }
    return std::nullopt;
}

void EventDispatcher::route(const FileSystemEvent& event) {
    std::string directory = core::PathUtils::parent(event.path);

    for (ListenerId id : registry_.listeners_for(directory)) {
        auto entry = listeners_.find(id);
        if (!entry || !entry->is_active()) {
            continue;
        }
        if (!entry->pattern.matches(event.path)) {
            continue;
        }

        bool accepted = false;
        try {
            accepted = entry->listener->filter(event.path);
        } catch (const std::exception& e) {
            FSMON_LOG_ERROR("EventDispatcher", "Listener filter threw for " + event.path + ": " + e.what());
            core::MetricsCollector::instance().increment_callback_errors();
        }
        if (!accepted) {
            continue;
        }

        FSMON_LOG_TRACE("EventDispatcher", std::string(event_kind_to_string(event.kind)) + " " +
                        event.path + " -> listener " + std::to_string(id));
        debouncer_.add(id, event, entry->debounce);
    }
}

bool EventDispatcher::apply_thread_priority(ThreadPriority priority) {
#if defined(_WIN32)
    int level = THREAD_PRIORITY_NORMAL;
    if (priority == ThreadPriority::Low) level = THREAD_PRIORITY_BELOW_NORMAL;
    if (priority == ThreadPriority::High) level = THREAD_PRIORITY_ABOVE_NORMAL;
    if (!SetThreadPriority(GetCurrentThread(), level)) {
        FSMON_LOG_WARN("EventDispatcher", "SetThreadPriority failed: " + std::to_string(GetLastError()));
        return false;
    }
    return true;
#elif defined(__linux__)
    int nice_value = 0;
    if (priority == ThreadPriority::Low) nice_value = 10;
    if (priority == ThreadPriority::High) nice_value = -5;
    pid_t tid = static_cast<pid_t>(syscall(SYS_gettid));
    if (setpriority(PRIO_PROCESS, static_cast<id_t>(tid), nice_value) != 0) {
        FSMON_LOG_WARN("EventDispatcher", std::string("Cannot set dispatcher priority to ") +
                       thread_priority_to_string(priority) + ": " + strerror(errno));
        return false;
    }
    return true;
#else
    FSMON_LOG_DEBUG("EventDispatcher", std::string("Thread priority ") +
                    thread_priority_to_string(priority) + " not supported on this platform");
    return false;
#endif
}

} // namespace fsmon
