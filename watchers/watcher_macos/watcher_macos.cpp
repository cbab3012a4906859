#include "watcher_macos.h"
#include "core/logger/logger.h"

#ifdef __APPLE__
#include <CoreServices/CoreServices.h>
#include <dispatch/dispatch.h>
#include <sys/stat.h>
#include <climits>
#include <cstdlib>
#endif

namespace fsmon {
namespace watchers {

#ifdef __APPLE__

namespace {

void fsevents_callback(ConstFSEventStreamRef /*stream*/,
                       void* info,
                       size_t num_events,
                       void* event_paths,
                       const FSEventStreamEventFlags event_flags[],
                       const FSEventStreamEventId /*event_ids*/[]) {
    auto* watcher = static_cast<WatcherMacOS*>(info);
    char** paths = static_cast<char**>(event_paths);

    for (size_t i = 0; i < num_events; ++i) {
        watcher->handle_native_event(paths[i], event_flags[i]);
    }
}

}

WatcherMacOS::WatcherMacOS()
    : running_(false)
    , stream_(nullptr)
    , queue_(nullptr) {
}

WatcherMacOS::~WatcherMacOS() {
    stop();
}

bool WatcherMacOS::is_supported() {
    return true;
}

bool WatcherMacOS::start(const std::string& path) {
    if (running_) {
        return false;
    }

    struct stat st;
    if (stat(path.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        FSMON_LOG_WARN("WatcherMacOS", "Not a directory: " + path);
        return false;
    }

    char resolved[PATH_MAX];
    real_path_ = realpath(path.c_str(), resolved) ? std::string(resolved) : path;
    watch_path_ = path;

    CFStringRef cf_path = CFStringCreateWithCString(kCFAllocatorDefault, path.c_str(),
                                                    kCFStringEncodingUTF8);
    if (!cf_path) {
        FSMON_LOG_WARN("WatcherMacOS", "Failed to create CFString for " + path);
        return false;
    }

    CFArrayRef path_array = CFArrayCreate(kCFAllocatorDefault,
                                          reinterpret_cast<const void**>(&cf_path), 1,
                                          &kCFTypeArrayCallBacks);
    CFRelease(cf_path);
    if (!path_array) {
        FSMON_LOG_WARN("WatcherMacOS", "Failed to create path array for " + path);
        return false;
    }

    FSEventStreamContext context = {0, this, nullptr, nullptr, nullptr};

    FSEventStreamRef stream = FSEventStreamCreate(
        kCFAllocatorDefault,
        &fsevents_callback,
        &context,
        path_array,
        kFSEventStreamEventIdSinceNow,
        0.1,  // Latency in seconds
        kFSEventStreamCreateFlagFileEvents | kFSEventStreamCreateFlagNoDefer |
            kFSEventStreamCreateFlagWatchRoot);
    CFRelease(path_array);

    if (!stream) {
        FSMON_LOG_WARN("WatcherMacOS", "Failed to create FSEvents stream for " + path);
        return false;
    }

    dispatch_queue_t queue = dispatch_queue_create("fsmon.watcher.fsevents", DISPATCH_QUEUE_SERIAL);
    FSEventStreamSetDispatchQueue(stream, queue);

    if (!FSEventStreamStart(stream)) {
        FSMON_LOG_WARN("WatcherMacOS", "Failed to start FSEvents stream for " + path);
        FSEventStreamInvalidate(stream);
        FSEventStreamRelease(stream);
        dispatch_release(queue);
        return false;
    }

    stream_ = stream;
    queue_ = queue;
    running_ = true;

    FSMON_LOG_DEBUG("WatcherMacOS", "Now watching directory: " + path);
    return true;
}

void WatcherMacOS::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    auto stream = static_cast<FSEventStreamRef>(stream_);
    FSEventStreamStop(stream);
    FSEventStreamInvalidate(stream);
    FSEventStreamRelease(stream);
    stream_ = nullptr;

    // Drain callbacks already queued before releasing the queue
    auto queue = static_cast<dispatch_queue_t>(queue_);
    dispatch_sync_f(queue, nullptr, [](void*) {});
    dispatch_release(queue);
    queue_ = nullptr;

    FSMON_LOG_DEBUG("WatcherMacOS", "Stopped watching directory: " + watch_path_);
}

bool WatcherMacOS::is_running() const {
    return running_;
}

std::string WatcherMacOS::get_watched_path() const {
    return watch_path_;
}

void WatcherMacOS::handle_native_event(const char* native_path, uint32_t flags) {
    if (!running_) {
        return;
    }

    if (flags & kFSEventStreamEventFlagRootChanged) {
        FSMON_LOG_DEBUG("WatcherMacOS", "Watched directory went away: " + watch_path_);
        emit(FsEvent(FsEventType::WATCH_LOST, watch_path_, true));
        return;
    }

    std::string path(native_path);
    if (path.compare(0, real_path_.size(), real_path_) == 0) {
        path = watch_path_ + path.substr(real_path_.size());
    }
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }

    // Direct children only
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return;
    }
    std::string parent = slash == 0 ? "/" : path.substr(0, slash);
    if (parent != watch_path_) {
        return;
    }

    bool is_dir = (flags & kFSEventStreamEventFlagItemIsDir) != 0;
    bool is_link = (flags & kFSEventStreamEventFlagItemIsSymlink) != 0;

    struct stat st;
    bool exists = lstat(path.c_str(), &st) == 0;

    FsEventType type;
    if (!exists && (flags & (kFSEventStreamEventFlagItemRemoved | kFSEventStreamEventFlagItemRenamed))) {
        type = FsEventType::DELETED;
    } else if (exists && (flags & (kFSEventStreamEventFlagItemCreated | kFSEventStreamEventFlagItemRenamed))) {
        type = FsEventType::CREATED;
    } else if (exists && (flags & (kFSEventStreamEventFlagItemModified |
                                   kFSEventStreamEventFlagItemInodeMetaMod))) {
        if (is_dir) {
            return;
        }
        type = FsEventType::MODIFIED;
    } else {
        return;
    }

    emit(FsEvent(type, path, is_dir, is_link));
}

#else // !__APPLE__

WatcherMacOS::WatcherMacOS()
    : running_(false)
    , stream_(nullptr)
    , queue_(nullptr) {
}

WatcherMacOS::~WatcherMacOS() = default;

bool WatcherMacOS::is_supported() {
    return false;
}

bool WatcherMacOS::start(const std::string& path) {
    FSMON_LOG_WARN("WatcherMacOS", "FSEvents is unavailable on this platform: " + path);
    return false;
}

void WatcherMacOS::stop() {
}

bool WatcherMacOS::is_running() const {
    return false;
}

std::string WatcherMacOS::get_watched_path() const {
    return watch_path_;
}

void WatcherMacOS::handle_native_event(const char*, uint32_t) {
}

#endif // __APPLE__

} // namespace watchers
} // namespace fsmon
