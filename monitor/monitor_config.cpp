#include "monitor_config.h"
#include "core/config/config.h"
#include "core/utils/path_utils.h"

namespace fsmon {

namespace {

Result<void> invalid(const std::string& key, const std::string& what) {
    return Err(ErrorCode::InvalidConfig, key + ": " + what);
}

Result<void> read_bool(const core::Config& config, const std::string& key, bool& out) {
    if (!config.has_key(key)) {
        return Ok();
    }
    if (!config.holds<bool>(key)) {
        return invalid(key, "expected a boolean");
    }
    out = config.get_bool(key);
    return Ok();
}

Result<void> read_int(const core::Config& config, const std::string& key,
                      int64_t min, int64_t max, int64_t& out) {
    if (!config.has_key(key)) {
        return Ok();
    }
    if (!config.holds<int64_t>(key)) {
        return invalid(key, "expected an integer");
    }
    int64_t value = config.get_int(key);
    if (value < min || value > max) {
        return invalid(key, std::to_string(value) + " outside [" + std::to_string(min) +
                       ", " + std::to_string(max) + "]");
    }
    out = value;
    return Ok();
}

Result<void> read_string(const core::Config& config, const std::string& key, std::string& out) {
    if (!config.has_key(key)) {
        return Ok();
    }
    if (!config.holds<std::string>(key)) {
        return invalid(key, "expected a string");
    }
    out = config.get_string(key);
    return Ok();
}

Result<void> check_range(const std::string& key, int64_t value, int64_t min, int64_t max) {
    if (value < min || value > max) {
        return invalid(key, std::to_string(value) + " outside [" + std::to_string(min) +
                       ", " + std::to_string(max) + "]");
    }
    return Ok();
}

}

const char* thread_priority_to_string(ThreadPriority priority) {
    switch (priority) {
        case ThreadPriority::Low: return "low";
        case ThreadPriority::Normal: return "normal";
        case ThreadPriority::High: return "high";
        default: return "unknown";
    }
}

Result<MonitorConfig> MonitorConfig::from_config(const core::Config& config) {
    MonitorConfig mc;

#define FSMON_READ(expr)                                        \
    do {                                                        \
        auto r = (expr);                                        \
        if (!r) return Result<MonitorConfig>(r.error());        \
    } while (0)

    FSMON_READ(read_bool(config, "fs_monitor.enabled", mc.enabled));
    FSMON_READ(read_bool(config, "fs_monitor.follow_symlinks", mc.follow_symlinks));
    FSMON_READ(read_bool(config, "fs_monitor.force_polling", mc.force_polling));
    FSMON_READ(read_bool(config, "fs_monitor.use_gitignore", mc.use_gitignore));
    FSMON_READ(read_bool(config, "fs_monitor.ignore_log_files", mc.ignore_log_files));

    int64_t value = mc.max_watches;
    FSMON_READ(read_int(config, "fs_monitor.max_watches", 1, 10000, value));
    mc.max_watches = static_cast<int>(value);

    value = mc.default_debounce.count();
    FSMON_READ(read_int(config, "fs_monitor.default_debounce_ms", 0, 10000, value));
    mc.default_debounce = std::chrono::milliseconds(value);

    value = mc.symlink_max_depth;
    FSMON_READ(read_int(config, "fs_monitor.symlink_max_depth", 1, 100, value));
    mc.symlink_max_depth = static_cast<int>(value);

    value = static_cast<int64_t>(mc.directory_scan_batch_size);
    FSMON_READ(read_int(config, "fs_monitor.directory_scan_batch_size", 100, 10000, value));
    mc.directory_scan_batch_size = static_cast<size_t>(value);

    value = mc.poll_interval.count();
    FSMON_READ(read_int(config, "fs_monitor.poll_interval_ms", 50, 60000, value));
    mc.poll_interval = std::chrono::milliseconds(value);

    value = static_cast<int64_t>(mc.max_queued_events);
    FSMON_READ(read_int(config, "fs_monitor.max_queued_events", 1000, 10000000, value));
    mc.max_queued_events = static_cast<size_t>(value);

    std::string priority = thread_priority_to_string(mc.thread_priority);
    FSMON_READ(read_string(config, "fs_monitor.thread_priority", priority));
    if (priority == "low") {
        mc.thread_priority = ThreadPriority::Low;
    } else if (priority == "normal") {
        mc.thread_priority = ThreadPriority::Normal;
    } else if (priority == "high") {
        mc.thread_priority = ThreadPriority::High;
    } else {
        return Err<MonitorConfig>(ErrorCode::InvalidConfig,
                                  "fs_monitor.thread_priority: expected low, normal or high");
    }

    if (config.has_key("fs_monitor.ignore_patterns")) {
        if (!config.holds<std::vector<std::string>>("fs_monitor.ignore_patterns")) {
            return Err<MonitorConfig>(ErrorCode::InvalidConfig,
                                      "fs_monitor.ignore_patterns: expected an array of strings");
        }
        mc.ignore_patterns = config.get_string_array("fs_monitor.ignore_patterns");
    }

    FSMON_READ(read_string(config, "project.root_path", mc.project_root));
    if (!mc.project_root.empty()) {
        mc.project_root = core::PathUtils::resolve(mc.project_root, "");
    }

    std::string level;
    FSMON_READ(read_string(config, "core.log_level", level));
    if (!level.empty()) {
        auto parsed = core::parse_log_level(level);
        if (!parsed) {
            return Err<MonitorConfig>(ErrorCode::InvalidConfig,
                                      "core.log_level: unknown level " + level);
        }
        mc.log_level = *parsed;
    }
    FSMON_READ(read_string(config, "core.log_file", mc.log_file));

#undef FSMON_READ

    return mc;
}

Result<void> MonitorConfig::validate() const {
    auto r = check_range("fs_monitor.max_watches", max_watches, 1, 10000);
    if (!r) return r;
    r = check_range("fs_monitor.default_debounce_ms", default_debounce.count(), 0, 10000);
    if (!r) return r;
    r = check_range("fs_monitor.symlink_max_depth", symlink_max_depth, 1, 100);
    if (!r) return r;
    r = check_range("fs_monitor.directory_scan_batch_size",
                    static_cast<int64_t>(directory_scan_batch_size), 100, 10000);
    if (!r) return r;
    r = check_range("fs_monitor.max_queued_events", static_cast<int64_t>(max_queued_events), 1000, 10000000);
    if (!r) return r;
    return check_range("fs_monitor.poll_interval_ms", poll_interval.count(), 50, 60000);
}

std::string MonitorConfig::resolved_project_root() const {
    if (project_root.empty()) {
        return core::PathUtils::default_project_root();
    }
    return core::PathUtils::normalize(project_root);
}

} // namespace fsmon
