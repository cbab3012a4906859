#include "monitor/file_system_monitor.h"
#include "monitor/symlink/symlink_resolver.h"
#include "core/metrics/metrics_collector.h"
#include "watchers/watcher_linux/watcher_linux.h"
#include "MockWatchers.h"
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

using namespace fsmon;
using namespace fsmon::test;
using watchers::FsEvent;
using watchers::FsEventType;
using namespace std::chrono_literals;

namespace {

template<typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return predicate();
}

class SinkCheckingWatcher : public FakeWatcher {
public:
    explicit SinkCheckingWatcher(std::atomic<int>& started_without_sink)
        : started_without_sink_(started_without_sink) {}

    bool start(const std::string& path) override {
        if (!on_event) {
            started_without_sink_++;
        }
        return FakeWatcher::start(path);
    }

private:
    std::atomic<int>& started_without_sink_;
};

class ThrowingListener : public BaseFileSystemListener {
public:
    explicit ThrowingListener(std::string pattern)
        : BaseFileSystemListener(std::move(pattern), std::chrono::milliseconds(10)) {}

    void on_file_created(const std::string&) override {
        throw std::runtime_error("listener failure");
    }
};

}

class FileSystemMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.project_root = dir_.path();
        config_.use_gitignore = false;
        config_.default_debounce = 20ms;
    }

    FileSystemMonitor& start_monitor() {
        monitor_ = std::make_unique<FileSystemMonitor>(config_, pool_.source());
        auto started = monitor_->start();
        EXPECT_TRUE(started.ok());
        return *monitor_;
    }

    std::shared_ptr<WatchHandle> register_ok(const std::shared_ptr<IFileSystemListener>& listener) {
        auto handle = monitor_->register_listener(listener);
        EXPECT_TRUE(handle.ok()) << (handle.ok() ? "" : handle.error().message);
        return handle.ok() ? handle.value() : nullptr;
    }

    TempDir dir_;
    FakeWatcherPool pool_;
    MonitorConfig config_;
    std::unique_ptr<FileSystemMonitor> monitor_;
};

TEST_F(FileSystemMonitorTest, DisabledMonitorRefusesToStart) {
    config_.enabled = false;
    FileSystemMonitor monitor(config_, pool_.source());

    auto started = monitor.start();
    ASSERT_FALSE(started.ok());
    EXPECT_EQ(started.error().code, ErrorCode::MonitorDisabled);
    EXPECT_FALSE(monitor.is_running());

    auto handle = monitor.register_listener(std::make_shared<RecordingListener>("*.txt"));
    ASSERT_FALSE(handle.ok());
    EXPECT_EQ(handle.error().code, ErrorCode::MonitorDisabled);
}

TEST_F(FileSystemMonitorTest, InvalidConfigRefusesToStart) {
    config_.max_watches = 0;
    FileSystemMonitor monitor(config_, pool_.source());
    auto started = monitor.start();
    ASSERT_FALSE(started.ok());
    EXPECT_EQ(started.error().code, ErrorCode::InvalidConfig);
}

TEST_F(FileSystemMonitorTest, RegisterBeforeStartIsRejected) {
    FileSystemMonitor monitor(config_, pool_.source());
    auto handle = monitor.register_listener(std::make_shared<RecordingListener>("*.txt"));
    ASSERT_FALSE(handle.ok());
    EXPECT_EQ(handle.error().code, ErrorCode::NotRunning);
}

TEST_F(FileSystemMonitorTest, InvalidArgumentsAreRejected) {
    FileSystemMonitor& monitor = start_monitor();

    auto null_listener = monitor.register_listener(nullptr);
    ASSERT_FALSE(null_listener.ok());
    EXPECT_EQ(null_listener.error().code, ErrorCode::InvalidArgument);

    auto bad_pattern = monitor.register_listener(std::make_shared<RecordingListener>("src/a**b/*.txt"));
    ASSERT_FALSE(bad_pattern.ok());
    EXPECT_EQ(bad_pattern.error().code, ErrorCode::InvalidPattern);

    auto negative = monitor.register_listener(std::make_shared<RecordingListener>("*.txt", -5ms));
    ASSERT_FALSE(negative.ok());
    EXPECT_EQ(negative.error().code, ErrorCode::InvalidArgument);

    auto listener = std::make_shared<RecordingListener>("*.txt");
    ASSERT_NE(register_ok(listener), nullptr);
    auto duplicate = monitor.register_listener(listener);
    ASSERT_FALSE(duplicate.ok());
    EXPECT_EQ(duplicate.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(monitor.listener_count(), 1u);
}

TEST_F(FileSystemMonitorTest, ExistingMatchesAreReportedAsCreated) {
    dir_.write("a.txt");
    dir_.write("b.txt");
    dir_.write("c.txt");
    dir_.write("d.md");
    start_monitor();

    auto listener = std::make_shared<RecordingListener>("*.txt");
    ASSERT_NE(register_ok(listener), nullptr);
    ASSERT_TRUE(listener->wait_for(3));
    std::this_thread::sleep_for(150ms);

    EXPECT_EQ(listener->events().size(), 3u);
    EXPECT_EQ(listener->count("file_created"), 3u);
    EXPECT_EQ(listener->count("file_created", dir_.sub("a.txt")), 1u);
    EXPECT_EQ(listener->count("file_created", dir_.sub("d.md")), 0u);
}

TEST_F(FileSystemMonitorTest, ListenersShareOneWatch) {
    FileSystemMonitor& monitor = start_monitor();
    auto txt = std::make_shared<RecordingListener>("*.txt");
    auto md = std::make_shared<RecordingListener>("*.md");
    auto txt_handle = register_ok(txt);
    auto md_handle = register_ok(md);
    ASSERT_NE(txt_handle, nullptr);
    ASSERT_NE(md_handle, nullptr);

    EXPECT_EQ(monitor.watch_count(), 1u);
    EXPECT_EQ(pool_.created(), 1u);
    EXPECT_EQ(monitor.registry().reference_count(dir_.path()), 2u);

    auto paths = txt_handle->list_watched_paths();
    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(paths[0], dir_.path());
    EXPECT_EQ(txt_handle->pattern(), "*.txt");

    monitor.unregister_listener(txt);
    EXPECT_FALSE(txt_handle->is_active());
    EXPECT_TRUE(txt_handle->list_watched_paths().empty());
    EXPECT_EQ(monitor.registry().reference_count(dir_.path()), 1u);

    md_handle->unregister();
    EXPECT_FALSE(md_handle->is_active());
    EXPECT_EQ(monitor.watch_count(), 0u);
    EXPECT_EQ(monitor.listener_count(), 0u);

    // Idempotent
    md_handle->unregister();
    monitor.unregister_listener(md);
}

TEST_F(FileSystemMonitorTest, BurstIsDebouncedToOneCallback) {
    start_monitor();
    auto listener = std::make_shared<RecordingListener>("*.txt", 100ms);
    ASSERT_NE(register_ok(listener), nullptr);

    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(pool_.inject(dir_.path(), FsEvent(FsEventType::MODIFIED, dir_.sub("a.txt"))));
    }
    ASSERT_TRUE(listener->wait_for(1));
    std::this_thread::sleep_for(250ms);

    auto events = listener->events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, "file_modified");
    EXPECT_EQ(events[0].path, dir_.sub("a.txt"));
}

TEST_F(FileSystemMonitorTest, CreateThenModifyIsReportedAsCreate) {
    start_monitor();
    auto listener = std::make_shared<RecordingListener>("*.txt", 100ms);
    ASSERT_NE(register_ok(listener), nullptr);

    pool_.inject(dir_.path(), FsEvent(FsEventType::CREATED, dir_.sub("new.txt")));
    pool_.inject(dir_.path(), FsEvent(FsEventType::MODIFIED, dir_.sub("new.txt")));
    ASSERT_TRUE(listener->wait_for(1));
    std::this_thread::sleep_for(200ms);

    ASSERT_EQ(listener->events().size(), 1u);
    EXPECT_EQ(listener->events()[0].kind, "file_created");
}

TEST_F(FileSystemMonitorTest, PendingEventsAreDroppedOnUnregister) {
    FileSystemMonitor& monitor = start_monitor();
    auto listener = std::make_shared<RecordingListener>("*.txt", 300ms);
    ASSERT_NE(register_ok(listener), nullptr);

    ASSERT_TRUE(pool_.inject(dir_.path(), FsEvent(FsEventType::MODIFIED, dir_.sub("a.txt"))));
    std::this_thread::sleep_for(50ms);
    monitor.unregister_listener(listener);

    std::this_thread::sleep_for(500ms);
    EXPECT_TRUE(listener->events().empty());
}

TEST_F(FileSystemMonitorTest, ThrowingListenerDoesNotAffectOthers) {
    start_monitor();
    auto before = core::MetricsCollector::instance().snapshot().callback_errors;

    auto thrower = std::make_shared<ThrowingListener>("*.txt");
    auto recorder = std::make_shared<RecordingListener>("*.txt", 10ms);
    ASSERT_NE(register_ok(thrower), nullptr);
    ASSERT_NE(register_ok(recorder), nullptr);

    pool_.inject(dir_.path(), FsEvent(FsEventType::CREATED, dir_.sub("a.txt")));
    pool_.inject(dir_.path(), FsEvent(FsEventType::CREATED, dir_.sub("b.txt")));
    ASSERT_TRUE(recorder->wait_for(2));
    EXPECT_TRUE(eventually([&] {
        return core::MetricsCollector::instance().snapshot().callback_errors >= before + 2;
    }));
}

TEST_F(FileSystemMonitorTest, WatchLimitRollsBackRegistration) {
    dir_.mkdir("a");
    dir_.mkdir("b");
    config_.max_watches = 2;
    FileSystemMonitor& monitor = start_monitor();

    auto handle = monitor.register_listener(std::make_shared<RecordingListener>("**/*.txt"));
    ASSERT_FALSE(handle.ok());
    EXPECT_EQ(handle.error().code, ErrorCode::WatchLimitExceeded);
    EXPECT_EQ(monitor.watch_count(), 0u);
    EXPECT_EQ(monitor.listener_count(), 0u);

    // A pattern needing a single directory still fits
    auto flat = monitor.register_listener(std::make_shared<RecordingListener>("a/*.txt"));
    EXPECT_TRUE(flat.ok());
}

TEST_F(FileSystemMonitorTest, FileInPlaceOfDirectoryIsNotADirectory) {
    dir_.write("plain.txt");
    FileSystemMonitor& monitor = start_monitor();
    auto handle = monitor.register_listener(std::make_shared<RecordingListener>("plain.txt/*.md"));
    ASSERT_FALSE(handle.ok());
    EXPECT_EQ(handle.error().code, ErrorCode::NotADirectory);
}

TEST_F(FileSystemMonitorTest, MissingRootWatchesNearestAncestor) {
    FileSystemMonitor& monitor = start_monitor();
    auto listener = std::make_shared<RecordingListener>("future/*.txt");
    ASSERT_NE(register_ok(listener), nullptr);
    EXPECT_TRUE(monitor.registry().is_watched(dir_.path()));

    std::string future = dir_.mkdir("future");
    pool_.inject(dir_.path(), FsEvent(FsEventType::CREATED, future, true));
    ASSERT_TRUE(eventually([&] { return monitor.registry().is_watched(future); }));

    pool_.inject(future, FsEvent(FsEventType::CREATED, future + "/x.txt"));
    ASSERT_TRUE(listener->wait_for(1));
    EXPECT_EQ(listener->count("file_created", future + "/x.txt"), 1u);
}

TEST_F(FileSystemMonitorTest, RecursivePatternWatchesNewSubdirectories) {
    dir_.mkdir("sub");
    FileSystemMonitor& monitor = start_monitor();
    auto listener = std::make_shared<RecordingListener>("**/*.txt");
    auto handle = register_ok(listener);
    ASSERT_NE(handle, nullptr);
    EXPECT_EQ(handle->list_watched_paths().size(), 2u);

    std::string nested = dir_.mkdir("sub/nested");
    dir_.write("sub/nested/early.txt");
    pool_.inject(dir_.sub("sub"), FsEvent(FsEventType::CREATED, nested, true));
    ASSERT_TRUE(eventually([&] { return monitor.registry().is_watched(nested); }));

    // Entries created before the watch existed are reported by the scan
    ASSERT_TRUE(listener->wait_for(1));
    EXPECT_EQ(listener->count("file_created", nested + "/early.txt"), 1u);
}

TEST_F(FileSystemMonitorTest, DeletedDirectoryDropsItsWatches) {
    dir_.mkdir("sub/deep");
    FileSystemMonitor& monitor = start_monitor();
    auto listener = std::make_shared<RecordingListener>("**");
    ASSERT_NE(register_ok(listener), nullptr);
    ASSERT_TRUE(monitor.registry().is_watched(dir_.sub("sub/deep")));
    ASSERT_TRUE(listener->wait_for(2));
    listener->clear();

    fs::remove_all(dir_.sub("sub"));
    pool_.inject(dir_.path(), FsEvent(FsEventType::DELETED, dir_.sub("sub")));

    ASSERT_TRUE(listener->wait_for(1));
    EXPECT_EQ(listener->count("directory_deleted", dir_.sub("sub")), 1u);
    EXPECT_TRUE(eventually([&] { return !monitor.registry().is_watched(dir_.sub("sub")); }));
    EXPECT_FALSE(monitor.registry().is_watched(dir_.sub("sub/deep")));
    EXPECT_TRUE(monitor.registry().is_watched(dir_.path()));
}

TEST_F(FileSystemMonitorTest, SymlinkEventsCarryTargets) {
    FileSystemMonitor& monitor = start_monitor();
    auto listener = std::make_shared<RecordingListener>("*", 10ms);
    ASSERT_NE(register_ok(listener), nullptr);

    dir_.write("one.data");
    dir_.write("two.data");
    std::string link = dir_.sub("current");
    fs::create_symlink("one.data", link);
    pool_.inject(dir_.path(), FsEvent(FsEventType::CREATED, link, false, true));
    ASSERT_TRUE(eventually([&] { return listener->count("symlink_created", link) == 1; }));
    EXPECT_TRUE(monitor.symlinks().is_tracked(link));

    fs::remove(link);
    fs::create_symlink("two.data", link);
    pool_.inject(dir_.path(), FsEvent(FsEventType::MODIFIED, link, false, true));
    ASSERT_TRUE(eventually([&] { return listener->count("symlink_target_changed", link) == 1; }));

    for (const auto& event : listener->events()) {
        if (event.kind == "symlink_created") {
            EXPECT_EQ(event.new_target, "one.data");
        } else if (event.kind == "symlink_target_changed") {
            EXPECT_EQ(event.old_target, "one.data");
            EXPECT_EQ(event.new_target, "two.data");
        }
    }
}

namespace {

class SelfRemovingListener : public RecordingListener {
public:
    SelfRemovingListener() : RecordingListener("*.txt", std::chrono::milliseconds(10)) {}

    void on_file_created(const std::string& path) override {
        RecordingListener::on_file_created(path);
        if (on_first) {
            auto hook = std::move(on_first);
            on_first = nullptr;
            hook();
        }
    }

    std::function<void()> on_first;
};

}

TEST_F(FileSystemMonitorTest, ListenerMayUnregisterFromCallback) {
    FileSystemMonitor& monitor = start_monitor();
    auto listener = std::make_shared<SelfRemovingListener>();
    auto handle = register_ok(listener);
    ASSERT_NE(handle, nullptr);
    listener->on_first = [handle] { handle->unregister(); };

    pool_.inject(dir_.path(), FsEvent(FsEventType::CREATED, dir_.sub("a.txt")));
    ASSERT_TRUE(listener->wait_for(1));
    ASSERT_TRUE(eventually([&] { return !handle->is_active(); }));
    EXPECT_EQ(monitor.listener_count(), 0u);
}

TEST_F(FileSystemMonitorTest, StopDeactivatesHandles) {
    FileSystemMonitor& monitor = start_monitor();
    auto handle = register_ok(std::make_shared<RecordingListener>("*.txt"));
    ASSERT_NE(handle, nullptr);
    EXPECT_TRUE(handle->is_active());

    monitor.stop();
    EXPECT_FALSE(monitor.is_running());
    EXPECT_FALSE(handle->is_active());
    EXPECT_EQ(monitor.watch_count(), 0u);

    // Restartable
    ASSERT_TRUE(monitor.start().ok());
    EXPECT_NE(register_ok(std::make_shared<RecordingListener>("*.txt")), nullptr);
}

TEST_F(FileSystemMonitorTest, HandleOutlivesMonitor) {
    start_monitor();
    auto handle = register_ok(std::make_shared<RecordingListener>("*.txt"));
    ASSERT_NE(handle, nullptr);
    monitor_.reset();
    EXPECT_FALSE(handle->is_active());
    EXPECT_TRUE(handle->list_watched_paths().empty());
    handle->unregister();
}

TEST_F(FileSystemMonitorTest, PollingBackendEndToEnd) {
    config_.force_polling = true;
    config_.poll_interval = 50ms;
    FileSystemMonitor monitor(config_);
    ASSERT_TRUE(monitor.start().ok());

    dir_.mkdir("sub");
    auto listener = std::make_shared<RecordingListener>("**/*.txt", 20ms);
    auto handle = monitor.register_listener(listener);
    ASSERT_TRUE(handle.ok()) << handle.error().message;
    EXPECT_EQ(monitor.registry().backend_for(dir_.path()), "polling");

    std::string file = dir_.write("sub/a.txt", "first");
    ASSERT_TRUE(eventually([&] { return listener->count("file_created", file) == 1; }));

    std::string fresh = dir_.mkdir("fresh");
    ASSERT_TRUE(eventually([&] { return monitor.registry().is_watched(fresh); }));
    std::string inner = dir_.write("fresh/b.txt");
    ASSERT_TRUE(eventually([&] { return listener->count("file_created", inner) >= 1; }));

    fs::remove(file);
    ASSERT_TRUE(eventually([&] { return listener->count("file_deleted", file) == 1; }));
    monitor.stop();
}

TEST_F(FileSystemMonitorTest, ConcurrentRegistrationKeepsCountsConsistent) {
    constexpr int kDirectories = 5;
    constexpr int kListeners = 40;
    for (int d = 0; d < kDirectories; ++d) {
        dir_.mkdir("d" + std::to_string(d));
    }
    FileSystemMonitor& monitor = start_monitor();

    std::vector<std::shared_ptr<RecordingListener>> listeners;
    for (int i = 0; i < kListeners; ++i) {
        listeners.push_back(std::make_shared<RecordingListener>(
            "d" + std::to_string(i % kDirectories) + "/*.txt"));
    }

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kListeners; ++i) {
        threads.emplace_back([&, i] {
            if (!monitor.register_listener(listeners[i]).ok()) {
                failures++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(monitor.listener_count(), static_cast<size_t>(kListeners));
    EXPECT_EQ(monitor.watch_count(), static_cast<size_t>(kDirectories));
    EXPECT_EQ(pool_.created(), static_cast<size_t>(kDirectories));
    for (int d = 0; d < kDirectories; ++d) {
        EXPECT_EQ(monitor.registry().reference_count(dir_.sub("d" + std::to_string(d))),
                  static_cast<size_t>(kListeners / kDirectories));
    }

    threads.clear();
    for (int i = 0; i < kListeners; ++i) {
        threads.emplace_back([&, i] { monitor.unregister_listener(listeners[i]); });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(monitor.watch_count(), 0u);
    EXPECT_EQ(monitor.listener_count(), 0u);
}

TEST_F(FileSystemMonitorTest, CustomSourceInstallsSinkBeforeStart) {
    std::atomic<int> started_without_sink{0};
    FakeWatcher* last = nullptr;
    FileSystemMonitor monitor(config_, [&](const std::string& dir, const watchers::EventSink& sink)
                                  -> std::unique_ptr<watchers::IWatcher> {
        auto watcher = std::make_unique<SinkCheckingWatcher>(started_without_sink);
        watcher->on_event = sink;
        if (!watcher->start(dir)) {
            return nullptr;
        }
        last = watcher.get();
        return watcher;
    });
    ASSERT_TRUE(monitor.start().ok());

    auto listener = std::make_shared<RecordingListener>("*.txt");
    ASSERT_TRUE(monitor.register_listener(listener).ok());
    EXPECT_EQ(started_without_sink.load(), 0);

    ASSERT_NE(last, nullptr);
    last->inject(FsEvent(FsEventType::CREATED, dir_.sub("fresh.txt")));
    ASSERT_TRUE(listener->wait_for(1));
    EXPECT_EQ(listener->count("file_created", dir_.sub("fresh.txt")), 1u);
    monitor.stop();
}

TEST_F(FileSystemMonitorTest, LostRootIsRearmedOnAncestor) {
    std::string src = dir_.mkdir("src");
    FileSystemMonitor& monitor = start_monitor();
    auto listener = std::make_shared<RecordingListener>("src/*.txt");
    auto handle = register_ok(listener);
    ASSERT_NE(handle, nullptr);
    ASSERT_EQ(handle->list_watched_paths(), std::vector<std::string>{src});

    fs::remove_all(src);
    pool_.inject(src, FsEvent(FsEventType::WATCH_LOST, src, true));
    ASSERT_TRUE(eventually([&] {
        return monitor.registry().is_watched(dir_.path()) && !monitor.registry().is_watched(src);
    }));
    EXPECT_TRUE(handle->is_active());
    EXPECT_EQ(handle->list_watched_paths(), std::vector<std::string>{dir_.path()});

    dir_.mkdir("src");
    std::string file = dir_.write("src/a.txt");
    pool_.inject(dir_.path(), FsEvent(FsEventType::CREATED, src, true));
    ASSERT_TRUE(eventually([&] { return monitor.registry().is_watched(src); }));
    ASSERT_TRUE(listener->wait_for(1));
    EXPECT_EQ(listener->count("file_created", file), 1u);
}

TEST_F(FileSystemMonitorTest, RootRecreatedBeforeLossIsWatchedAfresh) {
    std::string src = dir_.mkdir("src");
    FileSystemMonitor& monitor = start_monitor();
    auto listener = std::make_shared<RecordingListener>("src/*.txt");
    auto handle = register_ok(listener);
    ASSERT_NE(handle, nullptr);
    size_t opened = pool_.created();

    fs::remove_all(src);
    dir_.mkdir("src");
    std::string file = dir_.write("src/a.txt");
    pool_.inject(src, FsEvent(FsEventType::WATCH_LOST, src, true));

    ASSERT_TRUE(eventually([&] { return pool_.created() == opened + 1; }));
    EXPECT_TRUE(monitor.registry().is_watched(src));
    EXPECT_FALSE(monitor.registry().is_watched(dir_.path()));
    ASSERT_TRUE(listener->wait_for(1));
    EXPECT_EQ(listener->count("file_created", file), 1u);
}

TEST_F(FileSystemMonitorTest, LossUnderWatchedParentWaitsForRecreation) {
    std::string src = dir_.mkdir("src");
    FileSystemMonitor& monitor = start_monitor();
    auto listener = std::make_shared<RecordingListener>("**/*.txt");
    ASSERT_NE(register_ok(listener), nullptr);
    ASSERT_TRUE(monitor.registry().is_watched(src));

    fs::remove_all(src);
    pool_.inject(src, FsEvent(FsEventType::WATCH_LOST, src, true));
    ASSERT_TRUE(eventually([&] { return !monitor.registry().is_watched(src); }));
    EXPECT_TRUE(monitor.registry().is_watched(dir_.path()));
    EXPECT_EQ(monitor.registry().reference_count(dir_.path()), 1u);
}

#if defined(__linux__)

TEST_F(FileSystemMonitorTest, InotifyListenerSurvivesRootRecreation) {
    if (!watchers::WatcherLinux::is_supported()) {
        GTEST_SKIP() << "inotify unavailable";
    }
    std::string src = dir_.mkdir("src");
    FileSystemMonitor monitor(config_);
    ASSERT_TRUE(monitor.start().ok());
    auto listener = std::make_shared<RecordingListener>("src/*.txt", 20ms);
    auto handle = monitor.register_listener(listener);
    ASSERT_TRUE(handle.ok()) << handle.error().message;
    ASSERT_EQ(monitor.registry().backend_for(src), "inotify");

    fs::remove_all(src);
    dir_.mkdir("src");
    std::string file = dir_.write("src/a.txt");

    ASSERT_TRUE(eventually([&] { return listener->count("file_created", file) >= 1; }));
    EXPECT_TRUE(handle.value()->is_active());
    EXPECT_TRUE(eventually([&] { return monitor.registry().is_watched(src); }));

    std::string second = dir_.write("src/b.txt");
    EXPECT_TRUE(eventually([&] { return listener->count("file_created", second) >= 1; }));
    monitor.stop();
}

TEST_F(FileSystemMonitorTest, InotifyWatchesManyDirectoriesNatively) {
    if (!watchers::WatcherLinux::is_supported()) {
        GTEST_SKIP() << "inotify unavailable";
    }
    constexpr int kDirectories = 200;
    for (int i = 0; i < kDirectories; ++i) {
        dir_.mkdir("d" + std::to_string(i));
    }
    FileSystemMonitor monitor(config_);
    ASSERT_TRUE(monitor.start().ok());
    auto fallbacks = core::MetricsCollector::instance().snapshot().polling_fallbacks;

    auto handle = monitor.register_listener(std::make_shared<RecordingListener>("**/*.txt"));
    ASSERT_TRUE(handle.ok()) << handle.error().message;
    EXPECT_EQ(monitor.watch_count(), static_cast<size_t>(kDirectories + 1));
    EXPECT_EQ(core::MetricsCollector::instance().snapshot().polling_fallbacks, fallbacks);
    for (const auto& dir : monitor.registry().watched_directories()) {
        EXPECT_EQ(monitor.registry().backend_for(dir), "inotify") << dir;
    }
    monitor.stop();
}

#endif
