#include "file_system_monitor.h"
#include "core/logger/logger.h"
#include "core/metrics/metrics_collector.h"
#include "core/utils/path_utils.h"
#include "monitor/dispatch/debouncer.h"
#include "monitor/dispatch/event_dispatcher.h"
#include "monitor/dispatch/event_queue.h"
#include "monitor/dispatch/listener_table.h"
#include "monitor/pattern/path_filter.h"
#include "monitor/symlink/symlink_resolver.h"
#include "watchers/watcher_factory/watcher_factory.h"
#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace fsmon {

namespace {

FilterOptions filter_options(const MonitorConfig& config) {
    FilterOptions options;
    options.project_root = config.resolved_project_root();
    options.ignore_patterns = config.ignore_patterns;
    options.use_gitignore = config.use_gitignore;
    options.ignore_log_files = config.ignore_log_files;
    return options;
}

WatcherSource platform_source(const MonitorConfig& config) {
    watchers::WatcherOptions options;
    options.force_polling = config.force_polling;
    options.poll_interval = config.poll_interval;
    options.scan_batch_size = config.directory_scan_batch_size;

    watchers::WatcherFactory factory(options);
    return [factory](const std::string& directory, const watchers::EventSink& sink) {
        return factory.open(directory, sink);
    };
}

// Every watcher feeds the monitor's queue from its first event on
WatchRegistry::WatcherOpener queue_opener(WatcherSource source, EventQueue& queue) {
    return [source = std::move(source), &queue](const std::string& directory) {
        return source(directory, [&queue](const watchers::FsEvent& event) {
            queue.enqueue(event);
        });
    };
}

}

class FileSystemMonitor::Impl : public IWatchHandleOwner {
public:
    Impl(const MonitorConfig& config, WatcherSource source)
        : config_(config)
        , project_root_(config.resolved_project_root())
        , filter_(filter_options(config))
        , queue_(config.max_queued_events)
        , resolver_(config.symlink_max_depth)
        , registry_(static_cast<size_t>(config.max_watches),
                    queue_opener(source ? std::move(source) : platform_source(config), queue_))
        , dispatcher_(queue_, registry_, resolver_, debouncer_, listeners_, filter_,
                      config.follow_symlinks)
        , running_(false)
        , delivering_(0) {
        dispatcher_.set_directory_hooks(
            [this](const std::string& dir) { on_directory_created(dir); },
            [this](const std::string& dir) { on_directory_deleted(dir); });
        dispatcher_.set_watch_lost_hook([this](const std::string& dir) { on_watch_lost(dir); });
    }

    ~Impl() override {
        stop();
    }

    Result<void> start();
    void stop();
    bool is_running() const { return running_; }

    Result<std::shared_ptr<ListenerEntry>> register_listener(std::shared_ptr<IFileSystemListener> listener);

    std::vector<std::string> watched_paths(ListenerId id) const override;
    bool is_listener_active(ListenerId id) const override;
    void unregister(ListenerId id) override;

    const MonitorConfig& config() const { return config_; }
    const WatchRegistry& registry() const { return registry_; }
    SymlinkResolver& resolver() { return resolver_; }
    const ListenerTable& listeners() const { return listeners_; }

private:
    /**
     * @brief Directory that must be watched for root, or an error
     */
    Result<std::string> watchable_root(const WatchRoot& root) const;

    /**
     * @brief dir plus every subdirectory the pattern may match beneath
     */
    std::vector<std::string> expand_tree(const ListenerEntry& entry, const std::string& dir) const;

    /**
     * @brief Report matching entries of dirs to entry as created
     */
    void bootstrap_scan(const ListenerEntry& entry, const std::vector<std::string>& dirs);

    void on_directory_created(const std::string& dir);
    void on_directory_deleted(const std::string& dir);

    void on_watch_lost(const std::string& dir);

    /**
     * @brief Drop the watches on dir and below after it vanished
     *
     * Listeners that watch the parent pick the directory up again from the
     * parent's creation event. Every other listener is re-armed on the
     * nearest existing ancestor of its root.
     */
    void drop_directory(const std::string& dir, const char* reason);

    void deliver(const PendingEvent& pending);
    void invoke(const ListenerEntry& entry, const FileSystemEvent& event);

    MonitorConfig config_;
    std::string project_root_;
    PathFilter filter_;
    EventQueue queue_;
    SymlinkResolver resolver_;
    Debouncer debouncer_;
    ListenerTable listeners_;
    WatchRegistry registry_;
    EventDispatcher dispatcher_;

    std::atomic<bool> running_;
    std::mutex lifecycle_mutex_;

    // Serializes watch topology changes (registration, unregistration,
    // directory hooks) so a directory is never acquired for a listener
    // that is already being released.
    std::mutex topology_mutex_;

    std::mutex delivery_mutex_;
    std::condition_variable delivery_cv_;
    ListenerId delivering_;
    std::thread::id delivery_thread_;
};

Result<void> FileSystemMonitor::Impl::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) {
        return Ok();
    }
    if (!config_.enabled) {
        FSMON_LOG_INFO("FileSystemMonitor", "File system monitor disabled by configuration");
        return Err(ErrorCode::MonitorDisabled, "fs_monitor.enabled is false");
    }
    auto valid = config_.validate();
    if (!valid) {
        return valid;
    }

    queue_.reopen();
    debouncer_.start([this](const PendingEvent& pending) { deliver(pending); });
    dispatcher_.start(config_.thread_priority);
    running_ = true;

    FSMON_LOG_INFO("FileSystemMonitor", std::string("File system monitor started (backend: ") +
                   (config_.force_polling ? "polling" : watchers::WatcherFactory::native_backend_name()) +
                   ", project root: " + project_root_ + ")");
    return Ok();
}

void FileSystemMonitor::Impl::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.exchange(false)) {
        return;
    }

    for (const auto& entry : listeners_.entries()) {
        entry->state = ListenerState::Unregistering;
    }

    dispatcher_.stop();
    queue_.close();
    debouncer_.stop();
    {
        std::lock_guard<std::mutex> topology(topology_mutex_);
        registry_.clear();
    }

    for (const auto& entry : listeners_.entries()) {
        entry->state = ListenerState::Removed;
        listeners_.remove(entry->id);
    }

    FSMON_LOG_INFO("FileSystemMonitor", "File system monitor stopped");
}

Result<std::string> FileSystemMonitor::Impl::watchable_root(const WatchRoot& root) const {
    std::error_code ec;
    std::string dir = root.path;

    while (true) {
        fs::file_status status = fs::status(dir, ec);
        if (fs::exists(status)) {
            if (!fs::is_directory(status)) {
                return Err<std::string>(ErrorCode::NotADirectory, "Not a directory: " + dir);
            }
            if (dir != root.path) {
                FSMON_LOG_DEBUG("FileSystemMonitor", root.path + " does not exist yet, watching " + dir);
            }
            return dir;
        }
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return Err<std::string>(ErrorCode::PermissionDenied, "Cannot access " + dir + ": " + ec.message());
        }

        std::string parent = core::PathUtils::parent(dir);
        if (parent == dir) {
            return Err<std::string>(ErrorCode::FileNotFound, "No existing ancestor of " + root.path);
        }
        dir = parent;
    }
}

std::vector<std::string> FileSystemMonitor::Impl::expand_tree(const ListenerEntry& entry,
                                                              const std::string& dir) const {
    std::vector<std::string> dirs{dir};
    if (!entry.pattern.may_match_under(dir)) {
        return dirs;
    }

    std::vector<std::string> stack{dir};
    while (!stack.empty()) {
        std::string current = stack.back();
        stack.pop_back();

        std::error_code ec;
        fs::directory_iterator it(current, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            FSMON_LOG_DEBUG("FileSystemMonitor", "Cannot list " + current + ": " + ec.message());
            continue;
        }

        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                break;
            }
            std::error_code entry_ec;
            if (it->is_symlink(entry_ec) || !it->is_directory(entry_ec)) {
                continue;
            }

            std::string sub = core::PathUtils::normalize(it->path().generic_string());
            if (filter_.should_ignore(sub, true) || !entry.pattern.may_match_under(sub)) {
                continue;
            }
            dirs.push_back(sub);
            stack.push_back(sub);
        }
    }
    return dirs;
}

void FileSystemMonitor::Impl::bootstrap_scan(const ListenerEntry& entry, const std::vector<std::string>& dirs) {
    std::vector<FileSystemEvent> batch;
    batch.reserve(config_.directory_scan_batch_size);
    size_t reported = 0;

    auto flush = [&]() {
        reported += batch.size();
        debouncer_.add_batch(entry.id, batch, entry.debounce);
        batch.clear();
    };

    for (const auto& dir : dirs) {
        std::error_code ec;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            continue;
        }

        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                break;
            }
            std::string path = core::PathUtils::normalize(it->path().generic_string());
            if (!entry.pattern.matches(path)) {
                continue;
            }

            std::error_code entry_ec;
            FileSystemEvent event;
            event.path = path;
            event.timestamp = watchers::FsEvent::current_time_ms();

            bool is_directory = false;
            if (it->is_symlink(entry_ec)) {
                event.kind = FsEventKind::SYMLINK_CREATED;
                event.target = SymlinkResolver::read_link(path);
                if (config_.follow_symlinks) {
                    auto tracked = resolver_.track(path);
                    if (!tracked) {
                        FSMON_LOG_DEBUG("FileSystemMonitor", "Untracked link " + path + ": " +
                                        tracked.error().message);
                    }
                }
            } else if (it->is_directory(entry_ec)) {
                event.kind = FsEventKind::DIRECTORY_CREATED;
                is_directory = true;
            } else {
                event.kind = FsEventKind::FILE_CREATED;
            }

            if (filter_.should_ignore(path, is_directory)) {
                continue;
            }

            bool accepted = false;
            try {
                accepted = entry.listener->filter(path);
            } catch (const std::exception& e) {
                FSMON_LOG_ERROR("FileSystemMonitor", "Listener filter threw for " + path + ": " + e.what());
                core::MetricsCollector::instance().increment_callback_errors();
            }
            if (!accepted) {
                continue;
            }

            batch.push_back(std::move(event));
            if (batch.size() >= config_.directory_scan_batch_size) {
                flush();
            }
        }
    }
    flush();

    FSMON_LOG_DEBUG("FileSystemMonitor", "Bootstrap scan for listener " + std::to_string(entry.id) +
                    " reported " + std::to_string(reported) + " existing entries");
}

Result<std::shared_ptr<ListenerEntry>> FileSystemMonitor::Impl::register_listener(
        std::shared_ptr<IFileSystemListener> listener) {
    using R = std::shared_ptr<ListenerEntry>;

    if (!config_.enabled) {
        return Err<R>(ErrorCode::MonitorDisabled, "fs_monitor.enabled is false");
    }
    if (!running_) {
        return Err<R>(ErrorCode::NotRunning, "Monitor is not running");
    }
    if (!listener) {
        return Err<R>(ErrorCode::InvalidArgument, "Listener is null");
    }

    auto pattern = PathPattern::compile(listener->path_pattern(), project_root_);
    if (!pattern) {
        return Result<R>(pattern.error());
    }

    auto delay = listener->debounce_delay().value_or(config_.default_debounce);
    if (delay.count() < 0) {
        return Err<R>(ErrorCode::InvalidArgument, "Negative debounce delay");
    }

    auto entry = listeners_.add(listener, std::move(pattern.value()), delay);
    if (!entry) {
        return Err<R>(ErrorCode::InvalidArgument, "Listener is already registered");
    }

    std::vector<std::string> dirs;
    {
        std::lock_guard<std::mutex> topology(topology_mutex_);

        for (const auto& root : entry->pattern.minimal_dirs()) {
            auto dir = watchable_root(root);
            if (!dir) {
                registry_.release_all(entry->id);
                listeners_.remove(entry->id);
                entry->state = ListenerState::Removed;
                return Result<R>(dir.error());
            }

            for (const auto& sub : expand_tree(*entry, dir.value())) {
                auto acquired = registry_.acquire(sub, entry->id);
                if (!acquired) {
                    FSMON_LOG_WARN("FileSystemMonitor", "Registration of " + entry->pattern.pattern() +
                                   " failed: " + acquired.error().message);
                    registry_.release_all(entry->id);
                    listeners_.remove(entry->id);
                    entry->state = ListenerState::Removed;
                    return Result<R>(acquired.error());
                }
                dirs.push_back(sub);
            }
        }

        ListenerState expected = ListenerState::Registering;
        if (!entry->state.compare_exchange_strong(expected, ListenerState::Active)) {
            return Err<R>(ErrorCode::InvalidArgument, "Listener was unregistered during registration");
        }
    }

    FSMON_LOG_INFO("FileSystemMonitor", "Registered listener " + std::to_string(entry->id) + " for " +
                   entry->pattern.resolved() + " (" + std::to_string(dirs.size()) + " directories)");

    bootstrap_scan(*entry, dirs);
    return entry;
}

void FileSystemMonitor::Impl::unregister(ListenerId id) {
    auto entry = listeners_.find(id);
    if (!entry) {
        return;
    }

    ListenerState state = entry->state;
    while (state == ListenerState::Registering || state == ListenerState::Active) {
        if (entry->state.compare_exchange_weak(state, ListenerState::Unregistering)) {
            break;
        }
    }
    if (state != ListenerState::Registering && state != ListenerState::Active) {
        return;
    }

    {
        std::lock_guard<std::mutex> topology(topology_mutex_);
        registry_.release_all(id);
    }

    size_t dropped = debouncer_.drop_listener(id);

    {
        std::unique_lock<std::mutex> lock(delivery_mutex_);
        if (delivery_thread_ != std::this_thread::get_id()) {
            delivery_cv_.wait(lock, [this, id] { return delivering_ != id; });
        }
    }

    entry->state = ListenerState::Removed;
    listeners_.remove(id);

    FSMON_LOG_INFO("FileSystemMonitor", "Unregistered listener " + std::to_string(id) +
                   (dropped > 0 ? " (" + std::to_string(dropped) + " pending events dropped)" : ""));
}

std::vector<std::string> FileSystemMonitor::Impl::watched_paths(ListenerId id) const {
    auto entry = listeners_.find(id);
    if (!entry || !entry->is_active()) {
        return {};
    }
    return registry_.directories_for(id);
}

bool FileSystemMonitor::Impl::is_listener_active(ListenerId id) const {
    auto entry = listeners_.find(id);
    return entry && entry->is_active();
}

void FileSystemMonitor::Impl::on_directory_created(const std::string& dir) {
    if (filter_.should_ignore(dir, true)) {
        return;
    }

    std::string parent = core::PathUtils::parent(dir);
    for (ListenerId id : registry_.listeners_for(parent)) {
        auto entry = listeners_.find(id);
        if (!entry || !entry->pattern.may_match_under(dir)) {
            continue;
        }

        std::vector<std::string> added;
        {
            std::lock_guard<std::mutex> topology(topology_mutex_);
            if (!entry->is_active()) {
                continue;
            }
            for (const auto& sub : expand_tree(*entry, dir)) {
                auto acquired = registry_.acquire(sub, id);
                if (!acquired) {
                    FSMON_LOG_WARN("FileSystemMonitor", "Cannot extend watch to " + sub + ": " +
                                   acquired.error().message);
                    core::MetricsCollector::instance().increment_watch_errors();
                    continue;
                }
                added.push_back(sub);
            }
        }

        // Entries created before the new watch started
        bootstrap_scan(*entry, added);
    }
}

void FileSystemMonitor::Impl::on_directory_deleted(const std::string& dir) {
    drop_directory(dir, "was deleted");
}

void FileSystemMonitor::Impl::on_watch_lost(const std::string& dir) {
    drop_directory(dir, "went away");
}

void FileSystemMonitor::Impl::drop_directory(const std::string& dir, const char* reason) {
    const std::string parent = core::PathUtils::parent(dir);
    std::vector<std::pair<std::shared_ptr<ListenerEntry>, std::vector<std::string>>> rearmed;

    {
        std::lock_guard<std::mutex> topology(topology_mutex_);
        const std::vector<ListenerId> watching = registry_.listeners_for(dir);
        if (watching.empty()) {
            return;
        }
        const std::vector<ListenerId> parent_watchers =
            parent == dir ? std::vector<ListenerId>() : registry_.listeners_for(parent);

        registry_.release_subtree(dir);

        for (ListenerId id : watching) {
            auto entry = listeners_.find(id);
            if (!entry || !entry->is_active()) {
                continue;
            }
            // The parent's watcher reports the directory when it comes back
            if (std::find(parent_watchers.begin(), parent_watchers.end(), id) != parent_watchers.end()) {
                continue;
            }

            FSMON_LOG_WARN("FileSystemMonitor", "Watched directory " + dir + " " + reason +
                           ", re-arming listener " + std::to_string(id) + " (" + entry->pattern.pattern() + ")");

            std::vector<std::string> added;
            for (const auto& root : entry->pattern.minimal_dirs()) {
                if (!core::PathUtils::is_within(root.path, dir) && !core::PathUtils::is_within(dir, root.path)) {
                    continue;
                }
                auto target = watchable_root(root);
                if (!target) {
                    FSMON_LOG_WARN("FileSystemMonitor", "Cannot re-arm listener " + std::to_string(id) + ": " +
                                   target.error().message);
                    core::MetricsCollector::instance().increment_watch_errors();
                    continue;
                }
                for (const auto& sub : expand_tree(*entry, target.value())) {
                    auto acquired = registry_.acquire(sub, id);
                    if (!acquired) {
                        FSMON_LOG_WARN("FileSystemMonitor", "Cannot re-arm watch on " + sub + ": " +
                                       acquired.error().message);
                        core::MetricsCollector::instance().increment_watch_errors();
                        continue;
                    }
                    added.push_back(sub);
                }
            }
            rearmed.emplace_back(std::move(entry), std::move(added));
        }
    }

    // Entries created while the directory was unwatched
    for (const auto& [entry, dirs] : rearmed) {
        bootstrap_scan(*entry, dirs);
    }
}

void FileSystemMonitor::Impl::deliver(const PendingEvent& pending) {
    auto entry = listeners_.find(pending.listener);
    {
        std::lock_guard<std::mutex> lock(delivery_mutex_);
        delivery_thread_ = std::this_thread::get_id();
        if (!entry || !entry->is_active()) {
            core::MetricsCollector::instance().increment_events_dropped();
            return;
        }
        delivering_ = pending.listener;
    }

    invoke(*entry, pending.event);

    {
        std::lock_guard<std::mutex> lock(delivery_mutex_);
        delivering_ = 0;
    }
    delivery_cv_.notify_all();
}

void FileSystemMonitor::Impl::invoke(const ListenerEntry& entry, const FileSystemEvent& event) {
    IFileSystemListener& listener = *entry.listener;
    try {
        switch (event.kind) {
            case FsEventKind::FILE_CREATED:
                listener.on_file_created(event.path);
                break;
            case FsEventKind::FILE_MODIFIED:
                listener.on_file_modified(event.path);
                break;
            case FsEventKind::FILE_DELETED:
                listener.on_file_deleted(event.path);
                break;
            case FsEventKind::DIRECTORY_CREATED:
                listener.on_directory_created(event.path);
                break;
            case FsEventKind::DIRECTORY_DELETED:
                listener.on_directory_deleted(event.path);
                break;
            case FsEventKind::SYMLINK_CREATED:
                listener.on_symlink_created(event.path, event.target);
                break;
            case FsEventKind::SYMLINK_DELETED:
                listener.on_symlink_deleted(event.path);
                break;
            case FsEventKind::SYMLINK_TARGET_CHANGED:
                listener.on_symlink_target_changed(event.path, event.old_target, event.target);
                break;
        }
        core::MetricsCollector::instance().increment_events_dispatched();
    } catch (const std::exception& e) {
        FSMON_LOG_ERROR("FileSystemMonitor", std::string("Listener ") + std::to_string(entry.id) + " threw in " +
                        event_kind_to_string(event.kind) + " for " + event.path + ": " + e.what());
        core::MetricsCollector::instance().increment_callback_errors();
    } catch (...) {
        FSMON_LOG_ERROR("FileSystemMonitor", std::string("Listener ") + std::to_string(entry.id) +
                        " threw a non-standard exception in " + event_kind_to_string(event.kind) +
                        " for " + event.path);
        core::MetricsCollector::instance().increment_callback_errors();
    }
}

// FileSystemMonitor

FileSystemMonitor::FileSystemMonitor(const MonitorConfig& config)
    : impl_(std::make_shared<Impl>(config, nullptr)) {
}

FileSystemMonitor::FileSystemMonitor(const MonitorConfig& config, WatcherSource source)
    : impl_(std::make_shared<Impl>(config, std::move(source))) {
}

FileSystemMonitor::~FileSystemMonitor() {
    impl_->stop();
}

Result<void> FileSystemMonitor::start() {
    return impl_->start();
}

void FileSystemMonitor::stop() {
    impl_->stop();
}

bool FileSystemMonitor::is_running() const {
    return impl_->is_running();
}

Result<std::shared_ptr<WatchHandle>> FileSystemMonitor::register_listener(
        std::shared_ptr<IFileSystemListener> listener) {
    auto entry = impl_->register_listener(std::move(listener));
    if (!entry) {
        return Result<std::shared_ptr<WatchHandle>>(entry.error());
    }
    return std::make_shared<WatchHandle>(std::weak_ptr<IWatchHandleOwner>(impl_),
                                         entry.value()->id, entry.value()->pattern.pattern());
}

void FileSystemMonitor::unregister_listener(const std::shared_ptr<IFileSystemListener>& listener) {
    if (!listener) {
        return;
    }
    auto entry = impl_->listeners().find(listener.get());
    if (entry) {
        impl_->unregister(entry->id);
    }
}

size_t FileSystemMonitor::listener_count() const {
    return impl_->listeners().size();
}

size_t FileSystemMonitor::watch_count() const {
    return impl_->registry().watch_count();
}

const MonitorConfig& FileSystemMonitor::config() const {
    return impl_->config();
}

const WatchRegistry& FileSystemMonitor::registry() const {
    return impl_->registry();
}

SymlinkResolver& FileSystemMonitor::symlinks() {
    return impl_->resolver();
}

} // namespace fsmon
