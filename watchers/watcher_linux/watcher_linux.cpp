#include "watcher_linux.h"
#include "core/logger/logger.h"
#include "core/metrics/metrics_collector.h"

#ifdef __linux__
#include <sys/inotify.h>
#include <sys/select.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace fsmon {
namespace watchers {

#ifdef __linux__

namespace {

constexpr size_t kEventSize = sizeof(struct inotify_event);
constexpr size_t kEventBufLen = 1024 * (kEventSize + 256);

constexpr uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_DELETE | IN_ATTRIB |
                                IN_CLOSE_WRITE | IN_MOVED_FROM | IN_MOVED_TO |
                                IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR;

std::mutex g_instance_mutex;
std::weak_ptr<InotifyInstance> g_instance;

}

/**
 * @brief One inotify file descriptor shared by every WatcherLinux
 *
 * Lives as long as at least one watcher holds it. Events are delivered
 * under mutex_, so once remove() returns the watcher is never called again.
 */
class InotifyInstance {
public:
    static std::shared_ptr<InotifyInstance> acquire();

    explicit InotifyInstance(int fd);
    ~InotifyInstance();

    InotifyInstance(const InotifyInstance&) = delete;
    InotifyInstance& operator=(const InotifyInstance&) = delete;

    /**
     * @brief Add a watch for path routed to watcher
     *
     * @return wd, or -1 with errno set
     */
    int add(const std::string& path, WatcherLinux* watcher);

    void remove(int wd, WatcherLinux* watcher);

private:
    void read_loop();
    void route(const struct inotify_event* event);

    int fd_;
    std::atomic<bool> running_;
    std::thread thread_;

    std::mutex mutex_;
    // Several watchers share a wd when their paths name the same directory
    std::map<int, std::vector<WatcherLinux*>> watchers_;
};

std::shared_ptr<InotifyInstance> InotifyInstance::acquire() {
    std::lock_guard<std::mutex> lock(g_instance_mutex);
    auto instance = g_instance.lock();
    if (instance) {
        return instance;
    }

    int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        FSMON_LOG_WARN("WatcherLinux", "Failed to initialize inotify: " + std::string(strerror(errno)));
        return nullptr;
    }

    instance = std::make_shared<InotifyInstance>(fd);
    g_instance = instance;
    FSMON_LOG_DEBUG("WatcherLinux", "Opened shared inotify instance");
    return instance;
}

InotifyInstance::InotifyInstance(int fd)
    : fd_(fd)
    , running_(true) {
    thread_ = std::thread(&InotifyInstance::read_loop, this);
}

InotifyInstance::~InotifyInstance() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    close(fd_);
    FSMON_LOG_DEBUG("WatcherLinux", "Closed shared inotify instance");
}

int InotifyInstance::add(const std::string& path, WatcherLinux* watcher) {
    std::lock_guard<std::mutex> lock(mutex_);
    int wd = inotify_add_watch(fd_, path.c_str(), kWatchMask);
    if (wd >= 0) {
        watchers_[wd].push_back(watcher);
    }
    return wd;
}

void InotifyInstance::remove(int wd, WatcherLinux* watcher) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = watchers_.find(wd);
    if (it == watchers_.end()) {
        // Already dropped by the kernel (IN_IGNORED)
        return;
    }

    auto& owners = it->second;
    auto pos = std::find(owners.begin(), owners.end(), watcher);
    if (pos == owners.end()) {
        return;
    }
    owners.erase(pos);
    if (owners.empty()) {
        inotify_rm_watch(fd_, wd);
        watchers_.erase(it);
    }
}

void InotifyInstance::read_loop() {
    alignas(struct inotify_event) char buffer[kEventBufLen];

    while (running_) {
        // Use select with timeout to allow clean shutdown
        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(fd_, &fds);

        struct timeval timeout;
        timeout.tv_sec = 0;
        timeout.tv_usec = 100000;  // 100ms

        int ret = select(fd_ + 1, &fds, nullptr, nullptr, &timeout);
        if (ret < 0) {
            if (errno == EINTR) continue;
            FSMON_LOG_ERROR("WatcherLinux", "select error on inotify: " + std::string(strerror(errno)));
            core::MetricsCollector::instance().increment_watch_errors();
            break;
        }
        if (ret == 0) {
            continue;
        }

        ssize_t length = read(fd_, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            FSMON_LOG_ERROR("WatcherLinux", "inotify read error: " + std::string(strerror(errno)));
            core::MetricsCollector::instance().increment_watch_errors();
            break;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ssize_t i = 0;
        while (i < length) {
            const auto* event = reinterpret_cast<const struct inotify_event*>(&buffer[i]);
            route(event);
            i += static_cast<ssize_t>(kEventSize + event->len);
        }
    }
}

void InotifyInstance::route(const struct inotify_event* event) {
    if (event->mask & IN_Q_OVERFLOW) {
        FSMON_LOG_WARN("WatcherLinux", "inotify event queue overflow, events were lost");
        core::MetricsCollector::instance().increment_watch_errors();
        return;
    }

    auto it = watchers_.find(event->wd);
    if (it == watchers_.end()) {
        return;
    }

    if (event->mask & IN_IGNORED) {
        // The kernel removed the watch; its wd may be reused
        watchers_.erase(it);
        return;
    }

    for (WatcherLinux* watcher : it->second) {
        watcher->process_event(event);
    }
}

WatcherLinux::WatcherLinux()
    : watch_descriptor_(-1)
    , running_(false) {
}

WatcherLinux::~WatcherLinux() {
    stop();
}

bool WatcherLinux::is_supported() {
    return InotifyInstance::acquire() != nullptr;
}

size_t WatcherLinux::instance_count() {
    std::lock_guard<std::mutex> lock(g_instance_mutex);
    return g_instance.expired() ? 0 : 1;
}

bool WatcherLinux::start(const std::string& path) {
    if (running_) {
        return false;
    }

    instance_ = InotifyInstance::acquire();
    if (!instance_) {
        return false;
    }

    watch_path_ = path;
    watch_descriptor_ = instance_->add(path, this);
    if (watch_descriptor_ < 0) {
        FSMON_LOG_WARN("WatcherLinux", "Failed to add watch for " + path + ": " +
                       std::string(strerror(errno)));
        instance_.reset();
        return false;
    }

    running_ = true;
    FSMON_LOG_DEBUG("WatcherLinux", "Now watching directory: " + path);
    return true;
}

void WatcherLinux::stop() {
    bool was_running = running_.exchange(false);

    if (instance_) {
        if (watch_descriptor_ >= 0) {
            instance_->remove(watch_descriptor_, this);
        }
        instance_.reset();
    }
    watch_descriptor_ = -1;

    if (was_running) {
        FSMON_LOG_DEBUG("WatcherLinux", "Stopped watching directory: " + watch_path_);
    }
}

bool WatcherLinux::is_running() const {
    return running_;
}

std::string WatcherLinux::get_watched_path() const {
    return watch_path_;
}

void WatcherLinux::process_event(const struct inotify_event* event) {
    if (event->mask & (IN_DELETE_SELF | IN_MOVE_SELF | IN_UNMOUNT)) {
        FSMON_LOG_DEBUG("WatcherLinux", "Watched directory went away: " + watch_path_);
        emit(FsEvent(FsEventType::WATCH_LOST, watch_path_, true));
        return;
    }

    if (event->len == 0) {
        return;
    }

    std::string full_path = watch_path_;
    if (full_path.back() != '/') {
        full_path += '/';
    }
    full_path += event->name;

    bool is_dir = (event->mask & IN_ISDIR) != 0;
    bool is_link = false;

    FsEventType type;
    if (event->mask & (IN_CREATE | IN_MOVED_TO)) {
        type = FsEventType::CREATED;
    } else if (event->mask & (IN_DELETE | IN_MOVED_FROM)) {
        type = FsEventType::DELETED;
    } else if (event->mask & (IN_MODIFY | IN_CLOSE_WRITE | IN_ATTRIB)) {
        type = FsEventType::MODIFIED;
    } else {
        return;
    }

    if (type != FsEventType::DELETED) {
        struct stat st;
        if (lstat(full_path.c_str(), &st) == 0) {
            is_link = S_ISLNK(st.st_mode);
        }
    }

    // Directory metadata churn carries no information for listeners
    if (type == FsEventType::MODIFIED && is_dir) {
        return;
    }

    emit(FsEvent(type, full_path, is_dir, is_link));
}

#else // !__linux__

WatcherLinux::WatcherLinux()
    : watch_descriptor_(-1)
    , running_(false) {
}

WatcherLinux::~WatcherLinux() = default;

bool WatcherLinux::is_supported() {
    return false;
}

size_t WatcherLinux::instance_count() {
    return 0;
}

bool WatcherLinux::start(const std::string& path) {
    FSMON_LOG_WARN("WatcherLinux", "inotify is unavailable on this platform: " + path);
    return false;
}

void WatcherLinux::stop() {
}

bool WatcherLinux::is_running() const {
    return false;
}

std::string WatcherLinux::get_watched_path() const {
    return watch_path_;
}

void WatcherLinux::process_event(const ::inotify_event*) {
}

#endif // __linux__

} // namespace watchers
} // namespace fsmon
