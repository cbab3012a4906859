#ifndef FSMON_WATCHER_WINDOWS_H
#define FSMON_WATCHER_WINDOWS_H

#include "watchers/watcher_common/iwatcher.h"
#include <atomic>
#include <string>
#include <thread>

namespace fsmon {
namespace watchers {

/**
 * @brief Windows file system watcher using ReadDirectoryChangesW
 *
 * Overlapped I/O on a directory handle, woken by a stop event on shutdown.
 */
class WatcherWindows : public IWatcher {
public:
    WatcherWindows();
    ~WatcherWindows() override;

    WatcherWindows(const WatcherWindows&) = delete;
    WatcherWindows& operator=(const WatcherWindows&) = delete;

    bool start(const std::string& path) override;
    void stop() override;
    bool is_running() const override;
    std::string get_watched_path() const override;
    const char* backend_name() const override { return "rdcw"; }

    static bool is_supported();

private:
    void watch_loop();

    /**
     * @brief Queue the next overlapped read
     */
    bool arm();

    /**
     * @brief Translate the FILE_NOTIFY_INFORMATION records in buffer_
     */
    void process_buffer(unsigned long bytes);

    std::atomic<bool> running_;
    std::string watch_path_;
    std::thread watch_thread_;

    void* dir_handle_;          // HANDLE
    void* io_event_;            // HANDLE signalled on completion
    void* stop_event_;          // HANDLE signalled by stop()
    void* overlapped_;          // OVERLAPPED*
    alignas(8) unsigned char buffer_[64 * 1024];
};

} // namespace watchers
} // namespace fsmon

#endif // FSMON_WATCHER_WINDOWS_H
