#ifndef FSMON_WATCHER_FACTORY_H
#define FSMON_WATCHER_FACTORY_H

#include "watchers/watcher_common/iwatcher.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace fsmon {
namespace watchers {

struct WatcherOptions {
    bool force_polling{false};
    std::chrono::milliseconds poll_interval{1000};
    size_t scan_batch_size{1000};

    // Replaces the compiled-in native backend when set
    std::function<std::unique_ptr<IWatcher>()> native_creator;
};

/**
 * @brief Creates per-directory watchers for the current platform
 *
 * The native backend is chosen at compile time (inotify, FSEvents or
 * ReadDirectoryChangesW). Directories the native backend refuses fall
 * back to polling individually.
 */
class WatcherFactory {
public:
    explicit WatcherFactory(const WatcherOptions& options = WatcherOptions());

    /**
     * @brief Name of the native backend ("polling" when none exists)
     */
    static const char* native_backend_name();

    /**
     * @brief Native backend usable on this host?
     */
    static bool native_supported();

    std::unique_ptr<IWatcher> create_native() const;
    std::unique_ptr<IWatcher> create_polling() const;

    /**
     * @brief Start a watcher on one directory
     *
     * @param dir Absolute directory path
     * @param sink Receives every event of the new watcher
     * @return Running watcher, or nullptr when neither backend could start
     */
    std::unique_ptr<IWatcher> open(const std::string& dir, const EventSink& sink) const;

    const WatcherOptions& options() const { return options_; }

private:
    WatcherOptions options_;
};

} // namespace watchers
} // namespace fsmon

#endif // FSMON_WATCHER_FACTORY_H
