#include "watcher_polling.h"
#include "core/logger/logger.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace fsmon {
namespace watchers {

WatcherPolling::WatcherPolling(std::chrono::milliseconds interval, size_t batch_size)
    : interval_(interval)
    , batch_size_(batch_size == 0 ? 1 : batch_size)
    , running_(false)
    , lost_(false) {
}

WatcherPolling::~WatcherPolling() {
    stop();
}

bool WatcherPolling::start(const std::string& path) {
    if (running_) {
        return false;
    }

    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        FSMON_LOG_WARN("WatcherPolling", "Not a directory: " + path);
        return false;
    }

    watch_path_ = path;
    lost_ = false;
    running_ = true;

    auto initial = take_snapshot();
    if (!initial) {
        running_ = false;
        FSMON_LOG_WARN("WatcherPolling", "Cannot read directory: " + path);
        return false;
    }
    snapshot_ = std::move(*initial);

    poll_thread_ = std::thread(&WatcherPolling::poll_loop, this);

    FSMON_LOG_DEBUG("WatcherPolling", "Polling " + path + " every " +
                    std::to_string(interval_.count()) + "ms");
    return true;
}

void WatcherPolling::stop() {
    bool was_running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_running = running_.exchange(false);
    }
    cv_.notify_all();

    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }

    if (was_running) {
        FSMON_LOG_DEBUG("WatcherPolling", "Stopped polling directory: " + watch_path_);
    }
}

bool WatcherPolling::is_running() const {
    return running_;
}

std::string WatcherPolling::get_watched_path() const {
    return watch_path_;
}

void WatcherPolling::poll_loop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, interval_, [this] { return !running_; });
        }
        if (!running_) {
            break;
        }

        auto current = take_snapshot();
        if (!current) {
            std::error_code ec;
            if (running_ && !lost_ && !fs::is_directory(watch_path_, ec)) {
                lost_ = true;
                FSMON_LOG_DEBUG("WatcherPolling", "Watched directory went away: " + watch_path_);
                emit(FsEvent(FsEventType::WATCH_LOST, watch_path_, true));
            }
            continue;
        }
        lost_ = false;

        diff_and_emit(snapshot_, *current);
        snapshot_ = std::move(*current);
    }
}

std::optional<WatcherPolling::Snapshot> WatcherPolling::take_snapshot() {
    std::error_code ec;
    fs::directory_iterator it(watch_path_, ec);
    if (ec) {
        return std::nullopt;
    }

    Snapshot snapshot;
    size_t in_batch = 0;

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return std::nullopt;
        }

        if (++in_batch >= batch_size_) {
            in_batch = 0;
            if (!running_) {
                return std::nullopt;
            }
            std::this_thread::yield();
        }

        const fs::directory_entry& de = *it;
        Entry entry;
        std::error_code entry_ec;

        entry.is_symlink = de.is_symlink(entry_ec);
        if (entry.is_symlink) {
            fs::path target = fs::read_symlink(de.path(), entry_ec);
            if (!entry_ec) {
                entry.link_target = target.generic_string();
            }
        } else {
            entry.is_directory = de.is_directory(entry_ec);
            if (!entry.is_directory) {
                entry.size = de.file_size(entry_ec);
                if (entry_ec) {
                    entry.size = 0;
                }
            }
        }

        auto mtime = fs::last_write_time(de.path(), entry_ec);
        if (!entry_ec) {
            entry.mtime_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                mtime.time_since_epoch()).count();
        }

        snapshot.emplace(de.path().filename().string(), std::move(entry));
    }

    return snapshot;
}

void WatcherPolling::diff_and_emit(const Snapshot& before, const Snapshot& after) {
    auto full_path = [this](const std::string& name) {
        std::string p = watch_path_;
        if (p.empty() || p.back() != '/') {
            p += '/';
        }
        return p + name;
    };

    for (const auto& [name, old_entry] : before) {
        auto it = after.find(name);
        if (it == after.end()) {
            emit(FsEvent(FsEventType::DELETED, full_path(name),
                         old_entry.is_directory, old_entry.is_symlink));
            continue;
        }

        const Entry& new_entry = it->second;
        if (!old_entry.same_kind(new_entry)) {
            emit(FsEvent(FsEventType::DELETED, full_path(name),
                         old_entry.is_directory, old_entry.is_symlink));
            emit(FsEvent(FsEventType::CREATED, full_path(name),
                         new_entry.is_directory, new_entry.is_symlink));
        } else if (old_entry != new_entry && !new_entry.is_directory) {
            emit(FsEvent(FsEventType::MODIFIED, full_path(name),
                         new_entry.is_directory, new_entry.is_symlink));
        }
    }

    for (const auto& [name, new_entry] : after) {
        if (before.find(name) == before.end()) {
            emit(FsEvent(FsEventType::CREATED, full_path(name),
                         new_entry.is_directory, new_entry.is_symlink));
        }
    }
}

} // namespace watchers
} // namespace fsmon
