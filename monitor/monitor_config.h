#ifndef FSMON_MONITOR_CONFIG_H
#define FSMON_MONITOR_CONFIG_H

#include "core/include/Result.h"
#include "core/logger/logger.h"
#include <chrono>
#include <string>
#include <vector>

namespace fsmon {

namespace core {
class Config;
}

enum class ThreadPriority {
    Low,
    Normal,
    High
};

const char* thread_priority_to_string(ThreadPriority priority);

/**
 * @brief Settings of one FileSystemMonitor
 *
 * Defaults match an empty configuration file. from_config() reads the
 * "fs_monitor.*", "project.*" and "core.*" keys and rejects values
 * outside their documented ranges.
 */
struct MonitorConfig {
    bool enabled{true};
    bool follow_symlinks{true};
    int max_watches{1000};
    std::chrono::milliseconds default_debounce{100};
    int symlink_max_depth{10};
    size_t directory_scan_batch_size{1000};
    ThreadPriority thread_priority{ThreadPriority::Normal};
    std::chrono::milliseconds poll_interval{1000};
    size_t max_queued_events{100000};   // Raw events buffered ahead of the dispatcher
    bool force_polling{false};
    std::vector<std::string> ignore_patterns;
    bool use_gitignore{true};
    bool ignore_log_files{true};
    std::string project_root;   // Empty: git root of the working directory

    core::LogLevel log_level{core::LogLevel::INFO};
    std::string log_file;

    /**
     * @brief Build from a loaded configuration
     *
     * @return ErrorCode::InvalidConfig naming the offending key
     */
    static Result<MonitorConfig> from_config(const core::Config& config);

    /**
     * @brief Range checks on an in-memory configuration
     */
    Result<void> validate() const;

    /**
     * @brief project_root, or the default project root when unset
     */
    std::string resolved_project_root() const;
};

} // namespace fsmon

#endif // FSMON_MONITOR_CONFIG_H
