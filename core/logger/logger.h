#ifndef FSMON_LOGGER_H
#define FSMON_LOGGER_H

#include <atomic>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace fsmon {
namespace core {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5
};

/**
 * @brief Parse a level name ("TRACE".."FATAL", case-insensitive)
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Fixed-width level tag used in log lines ("INFO ", "ERROR", ...)
 */
const char* log_level_tag(LogLevel level);

/**
 * @brief Process-wide log sink for the monitor, the watchers and the CLI
 *
 * Lines look like "[2024-01-01 12:00:00.123] [WARN ] [WatchRegistry] text".
 * Console output sends WARN and above to stderr, the rest to stdout.
 * The level is read without locking so the FSMON_LOG_* macros can skip
 * building messages that would be filtered anyway.
 */
class Logger {
public:
    using Tap = std::function<void(LogLevel, const std::string& line)>;

    static Logger& instance();

    void set_level(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    LogLevel get_level() const { return level_.load(std::memory_order_relaxed); }
    bool enabled(LogLevel level) const { return level >= get_level(); }

    void set_console_output(bool enabled);

    /**
     * @brief Append log lines to a file as well
     *
     * An empty path closes the current file.
     * @return false if the file cannot be opened
     */
    bool set_file_output(const std::string& path);

    /**
     * @brief Receive every emitted line (nullptr to remove)
     *
     * Called with the logger's lock held; the tap must not log.
     */
    void set_tap(Tap tap);

    void log(LogLevel level, const std::string& component, const std::string& message);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();

    std::atomic<LogLevel> level_;
    bool console_enabled_;
    std::ofstream file_stream_;
    Tap tap_;
    std::mutex mutex_;
};

#define FSMON_LOG_AT(level, component, msg)                                      \
    do {                                                                        \
        auto& fsmon_logger_ = fsmon::core::Logger::instance();                  \
        if (fsmon_logger_.enabled(level)) {                                     \
            fsmon_logger_.log(level, component, msg);                           \
        }                                                                       \
    } while (0)

#define FSMON_LOG_TRACE(component, msg) FSMON_LOG_AT(fsmon::core::LogLevel::TRACE, component, msg)
#define FSMON_LOG_DEBUG(component, msg) FSMON_LOG_AT(fsmon::core::LogLevel::DEBUG, component, msg)
#define FSMON_LOG_INFO(component, msg)  FSMON_LOG_AT(fsmon::core::LogLevel::INFO, component, msg)
#define FSMON_LOG_WARN(component, msg)  FSMON_LOG_AT(fsmon::core::LogLevel::WARN, component, msg)
#define FSMON_LOG_ERROR(component, msg) FSMON_LOG_AT(fsmon::core::LogLevel::ERROR, component, msg)
#define FSMON_LOG_FATAL(component, msg) FSMON_LOG_AT(fsmon::core::LogLevel::FATAL, component, msg)

} // namespace core
} // namespace fsmon

#endif // FSMON_LOGGER_H
