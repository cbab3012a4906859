#include "monitor/dispatch/event_dispatcher.h"
#include "core/metrics/metrics_collector.h"
#include "MockWatchers.h"
#include <gtest/gtest.h>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace fsmon;
using namespace fsmon::test;
using watchers::FsEvent;
using watchers::FsEventType;
using namespace std::chrono_literals;

class EventDispatcherTest : public ::testing::Test {
protected:
    EventDispatcherTest()
        : registry_(100, pool_.opener())
        , resolver_(10)
        , filter_(filter_options())
        , dispatcher_(queue_, registry_, resolver_, debouncer_, listeners_, filter_, true) {}

    void SetUp() override {
        debouncer_.start([this](const PendingEvent& pending) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                delivered_.push_back(pending);
            }
            cv_.notify_all();
        });
    }

    void TearDown() override {
        dispatcher_.stop();
        debouncer_.stop();
    }

    FilterOptions filter_options() const {
        FilterOptions options;
        options.project_root = dir_.path();
        options.use_gitignore = false;
        options.ignore_patterns = {"*.tmp"};
        return options;
    }

    std::shared_ptr<ListenerEntry> add_listener(const std::string& pattern,
                                                std::shared_ptr<IFileSystemListener> listener = nullptr) {
        if (!listener) {
            listener = std::make_shared<RecordingListener>(pattern);
        }
        auto compiled = PathPattern::compile(pattern, dir_.path());
        EXPECT_TRUE(compiled.ok());
        auto entry = listeners_.add(listener, std::move(compiled).value(), 10ms);
        EXPECT_NE(entry, nullptr);
        entry->state = ListenerState::Active;
        EXPECT_TRUE(registry_.acquire(dir_.path(), entry->id).ok());
        return entry;
    }

    bool wait_for(size_t count, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return delivered_.size() >= count; });
    }

    std::vector<PendingEvent> delivered() {
        std::lock_guard<std::mutex> lock(mutex_);
        return delivered_;
    }

    TempDir dir_;
    FakeWatcherPool pool_;
    EventQueue queue_;
    WatchRegistry registry_;
    SymlinkResolver resolver_;
    Debouncer debouncer_;
    ListenerTable listeners_;
    PathFilter filter_;
    EventDispatcher dispatcher_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<PendingEvent> delivered_;
};

TEST_F(EventDispatcherTest, ClassifiesFileEvents) {
    std::string file = dir_.sub("a.txt");
    auto created = dispatcher_.classify(FsEvent(FsEventType::CREATED, file));
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created->kind, FsEventKind::FILE_CREATED);

    auto modified = dispatcher_.classify(FsEvent(FsEventType::MODIFIED, file));
    ASSERT_TRUE(modified.has_value());
    EXPECT_EQ(modified->kind, FsEventKind::FILE_MODIFIED);

    auto deleted = dispatcher_.classify(FsEvent(FsEventType::DELETED, file));
    ASSERT_TRUE(deleted.has_value());
    EXPECT_EQ(deleted->kind, FsEventKind::FILE_DELETED);
}

TEST_F(EventDispatcherTest, ClassifiesDirectoryEvents) {
    std::string sub = dir_.mkdir("sub");
    auto created = dispatcher_.classify(FsEvent(FsEventType::CREATED, sub, true));
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created->kind, FsEventKind::DIRECTORY_CREATED);

    EXPECT_FALSE(dispatcher_.classify(FsEvent(FsEventType::MODIFIED, sub, true)).has_value());

    // A deleted path that was being watched was a directory
    ASSERT_TRUE(registry_.acquire(sub, 1).ok());
    auto deleted = dispatcher_.classify(FsEvent(FsEventType::DELETED, sub));
    ASSERT_TRUE(deleted.has_value());
    EXPECT_EQ(deleted->kind, FsEventKind::DIRECTORY_DELETED);
}

TEST_F(EventDispatcherTest, ClassifiesSymlinkLifecycle) {
    dir_.write("one.txt");
    dir_.write("two.txt");
    std::string link = dir_.sub("current");
    fs::create_symlink("one.txt", link);

    auto created = dispatcher_.classify(FsEvent(FsEventType::CREATED, link, false, true));
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created->kind, FsEventKind::SYMLINK_CREATED);
    EXPECT_EQ(created->target, "one.txt");
    EXPECT_TRUE(resolver_.is_tracked(link));

    // Re-pointing the link in place
    fs::remove(link);
    fs::create_symlink("two.txt", link);
    auto changed = dispatcher_.classify(FsEvent(FsEventType::MODIFIED, link, false, true));
    ASSERT_TRUE(changed.has_value());
    EXPECT_EQ(changed->kind, FsEventKind::SYMLINK_TARGET_CHANGED);
    EXPECT_EQ(changed->old_target, "one.txt");
    EXPECT_EQ(changed->target, "two.txt");

    // Deleting: the raw event no longer knows it was a link
    fs::remove(link);
    auto deleted = dispatcher_.classify(FsEvent(FsEventType::DELETED, link));
    ASSERT_TRUE(deleted.has_value());
    EXPECT_EQ(deleted->kind, FsEventKind::SYMLINK_DELETED);

    // Re-created with another target: reported as a target change
    fs::create_symlink("one.txt", link);
    auto recreated = dispatcher_.classify(FsEvent(FsEventType::CREATED, link, false, true));
    ASSERT_TRUE(recreated.has_value());
    EXPECT_EQ(recreated->kind, FsEventKind::SYMLINK_TARGET_CHANGED);
    EXPECT_EQ(recreated->old_target, "two.txt");
    EXPECT_EQ(recreated->target, "one.txt");
}

TEST_F(EventDispatcherTest, RegularFileReplacingLinkForgetsIt) {
    dir_.write("one.txt");
    std::string link = dir_.sub("current");
    fs::create_symlink("one.txt", link);
    ASSERT_TRUE(dispatcher_.classify(FsEvent(FsEventType::CREATED, link, false, true)).has_value());

    fs::remove(link);
    dir_.write("current");
    auto created = dispatcher_.classify(FsEvent(FsEventType::CREATED, link));
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created->kind, FsEventKind::FILE_CREATED);
    EXPECT_FALSE(resolver_.is_tracked(link));
}

TEST_F(EventDispatcherTest, UnchangedLinkModificationIsDropped) {
    dir_.write("one.txt");
    std::string link = dir_.sub("current");
    fs::create_symlink("one.txt", link);
    ASSERT_TRUE(dispatcher_.classify(FsEvent(FsEventType::CREATED, link, false, true)).has_value());
    EXPECT_FALSE(dispatcher_.classify(FsEvent(FsEventType::MODIFIED, link, false, true)).has_value());
}

TEST_F(EventDispatcherTest, RoutesOnlyToMatchingActiveListeners) {
    auto txt = add_listener("*.txt");
    auto md = add_listener("*.md");

    dispatcher_.process(FsEvent(FsEventType::CREATED, dir_.sub("a.txt")));
    ASSERT_TRUE(wait_for(1));
    std::this_thread::sleep_for(50ms);

    auto events = delivered();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].listener, txt->id);
    EXPECT_NE(events[0].listener, md->id);
    EXPECT_EQ(events[0].event.path, dir_.sub("a.txt"));
}

TEST_F(EventDispatcherTest, InactiveListenersReceiveNothing) {
    auto entry = add_listener("*.txt");
    entry->state = ListenerState::Unregistering;

    dispatcher_.process(FsEvent(FsEventType::CREATED, dir_.sub("a.txt")));
    std::this_thread::sleep_for(100ms);
    EXPECT_TRUE(delivered().empty());
    EXPECT_EQ(debouncer_.pending_count(), 0u);
}

TEST_F(EventDispatcherTest, IgnoredPathsAreDropped) {
    add_listener("*");
    dispatcher_.process(FsEvent(FsEventType::CREATED, dir_.sub("scratch.tmp")));
    dispatcher_.process(FsEvent(FsEventType::CREATED, dir_.sub("server.log")));
    std::this_thread::sleep_for(100ms);
    EXPECT_TRUE(delivered().empty());
}

namespace {

class PickyListener : public RecordingListener {
public:
    PickyListener() : RecordingListener("*") {}
    bool filter(const std::string& path) const override {
        if (path.find("boom") != std::string::npos) {
            throw std::runtime_error("filter failure");
        }
        return path.find("keep") != std::string::npos;
    }
};

}

TEST_F(EventDispatcherTest, ListenerFilterIsApplied) {
    add_listener("*", std::make_shared<PickyListener>());

    dispatcher_.process(FsEvent(FsEventType::CREATED, dir_.sub("drop.txt")));
    dispatcher_.process(FsEvent(FsEventType::CREATED, dir_.sub("boom.txt")));
    dispatcher_.process(FsEvent(FsEventType::CREATED, dir_.sub("keep.txt")));
    ASSERT_TRUE(wait_for(1));
    std::this_thread::sleep_for(50ms);

    auto events = delivered();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event.path, dir_.sub("keep.txt"));
}

TEST_F(EventDispatcherTest, DirectoryHooksFire) {
    std::vector<std::string> created;
    std::vector<std::string> deleted;
    dispatcher_.set_directory_hooks(
        [&](const std::string& path) { created.push_back(path); },
        [&](const std::string& path) { deleted.push_back(path); });

    std::string sub = dir_.mkdir("sub");
    dispatcher_.process(FsEvent(FsEventType::CREATED, sub, true));
    ASSERT_TRUE(registry_.acquire(sub, 7).ok());
    dispatcher_.process(FsEvent(FsEventType::DELETED, sub));

    ASSERT_EQ(created.size(), 1u);
    EXPECT_EQ(created[0], sub);
    ASSERT_EQ(deleted.size(), 1u);
    EXPECT_EQ(deleted[0], sub);
}

TEST_F(EventDispatcherTest, LostWatchGoesToItsHookOnly) {
    add_listener("**");
    std::vector<std::string> lost;
    std::vector<std::string> deleted;
    dispatcher_.set_directory_hooks(nullptr, [&](const std::string& path) { deleted.push_back(path); });
    dispatcher_.set_watch_lost_hook([&](const std::string& path) { lost.push_back(path); });

    dispatcher_.process(FsEvent(FsEventType::WATCH_LOST, dir_.path() + "/", true));

    ASSERT_EQ(lost.size(), 1u);
    EXPECT_EQ(lost[0], dir_.path());
    EXPECT_TRUE(deleted.empty());
    EXPECT_FALSE(wait_for(1, 100ms));
}

TEST_F(EventDispatcherTest, ConsumesQueueOnItsThread) {
    add_listener("*.txt");
    dispatcher_.start();
    EXPECT_TRUE(dispatcher_.is_running());

    queue_.enqueue(FsEvent(FsEventType::CREATED, dir_.sub("queued.txt")));
    ASSERT_TRUE(wait_for(1));
    EXPECT_EQ(delivered()[0].event.kind, FsEventKind::FILE_CREATED);

    dispatcher_.stop();
    EXPECT_FALSE(dispatcher_.is_running());
}

TEST(ThreadPriorityTest, LowPriorityCanBeApplied) {
#if defined(__linux__) || defined(_WIN32)
    std::thread worker([] { EXPECT_TRUE(EventDispatcher::apply_thread_priority(ThreadPriority::Low)); });
    worker.join();
#else
    GTEST_SKIP() << "thread priorities unsupported";
#endif
}

TEST(EventQueueTest, FullQueueDropsAndCounts) {
    EventQueue queue(3);
    auto before = core::MetricsCollector::instance().snapshot().events_dropped;

    for (int i = 0; i < 5; ++i) {
        bool accepted = queue.enqueue(FsEvent(FsEventType::CREATED, "/q/" + std::to_string(i)));
        EXPECT_EQ(accepted, i < 3) << i;
    }
    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.dropped(), 2u);
    EXPECT_EQ(core::MetricsCollector::instance().snapshot().events_dropped - before, 2u);

    auto batch = queue.dequeue_batch(10ms);
    ASSERT_EQ(batch.size(), 3u);
    EXPECT_EQ(batch[0].path, "/q/0");
    EXPECT_TRUE(queue.enqueue(FsEvent(FsEventType::CREATED, "/q/again")));
}

TEST(EventQueueTest, ClosedQueueRefusesEvents) {
    EventQueue queue;
    EXPECT_EQ(queue.capacity(), EventQueue::kDefaultCapacity);
    queue.close();
    EXPECT_FALSE(queue.enqueue(FsEvent(FsEventType::CREATED, "/q/x")));
    EXPECT_EQ(queue.dropped(), 0u);
    queue.reopen();
    EXPECT_TRUE(queue.enqueue(FsEvent(FsEventType::CREATED, "/q/x")));
}
