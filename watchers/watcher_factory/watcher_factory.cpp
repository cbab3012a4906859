#include "watcher_factory.h"
#include "watchers/watcher_linux/watcher_linux.h"
#include "watchers/watcher_macos/watcher_macos.h"
#include "watchers/watcher_windows/watcher_windows.h"
#include "watchers/watcher_polling/watcher_polling.h"
#include "core/logger/logger.h"
#include "core/metrics/metrics_collector.h"

namespace fsmon {
namespace watchers {

WatcherFactory::WatcherFactory(const WatcherOptions& options)
    : options_(options) {
}

const char* WatcherFactory::native_backend_name() {
#if defined(_WIN32)
    return "rdcw";
#elif defined(__APPLE__)
    return "fsevents";
#elif defined(__linux__)
    return "inotify";
#else
    return "polling";
#endif
}

bool WatcherFactory::native_supported() {
#if defined(_WIN32)
    return WatcherWindows::is_supported();
#elif defined(__APPLE__)
    return WatcherMacOS::is_supported();
#elif defined(__linux__)
    return WatcherLinux::is_supported();
#else
    return false;
#endif
}

std::unique_ptr<IWatcher> WatcherFactory::create_native() const {
    if (options_.native_creator) {
        return options_.native_creator();
    }
#if defined(_WIN32)
    return std::make_unique<WatcherWindows>();
#elif defined(__APPLE__)
    return std::make_unique<WatcherMacOS>();
#elif defined(__linux__)
    return std::make_unique<WatcherLinux>();
#else
    return nullptr;
#endif
}

std::unique_ptr<IWatcher> WatcherFactory::create_polling() const {
    return std::make_unique<WatcherPolling>(options_.poll_interval, options_.scan_batch_size);
}

std::unique_ptr<IWatcher> WatcherFactory::open(const std::string& dir, const EventSink& sink) const {
    if (!options_.force_polling) {
        auto native = create_native();
        if (native) {
            native->on_event = sink;
            if (native->start(dir)) {
                return native;
            }
            FSMON_LOG_WARN("WatcherFactory", std::string(native->backend_name()) +
                           " refused " + dir + ", falling back to polling");
            core::MetricsCollector::instance().increment_polling_fallbacks();
        }
    }

    auto polling = create_polling();
    polling->on_event = sink;
    if (polling->start(dir)) {
        return polling;
    }

    FSMON_LOG_ERROR("WatcherFactory", "Unable to watch directory: " + dir);
    core::MetricsCollector::instance().increment_watch_errors();
    return nullptr;
}

} // namespace watchers
} // namespace fsmon
