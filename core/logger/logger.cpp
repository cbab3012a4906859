#include "logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace fsmon {
namespace core {

namespace {

std::string timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const long millis = static_cast<long>(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);

    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &secs);
#else
    localtime_r(&secs, &local_tm);
#endif

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local_tm);
    char stamp[40];
    std::snprintf(stamp, sizeof(stamp), "%s.%03ld", date, millis);
    return stamp;
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string upper(name.size(), '\0');
    std::transform(name.begin(), name.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    static const struct { const char* name; LogLevel level; } kNames[] = {
        {"TRACE", LogLevel::TRACE}, {"DEBUG", LogLevel::DEBUG}, {"INFO", LogLevel::INFO},
        {"WARN", LogLevel::WARN},   {"WARNING", LogLevel::WARN}, {"ERROR", LogLevel::ERROR},
        {"FATAL", LogLevel::FATAL},
    };
    for (const auto& entry : kNames) {
        if (upper == entry.name) {
            return entry.level;
        }
    }
    return std::nullopt;
}

const char* log_level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "?????";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(LogLevel::INFO)
    , console_enabled_(true) {
}

void Logger::set_console_output(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_enabled_ = enabled;
}

bool Logger::set_file_output(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_stream_.close();
    file_stream_.clear();
    if (path.empty()) {
        return true;
    }
    file_stream_.open(path, std::ios::app);
    return file_stream_.is_open();
}

void Logger::set_tap(Tap tap) {
    std::lock_guard<std::mutex> lock(mutex_);
    tap_ = std::move(tap);
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    if (!enabled(level)) {
        return;
    }

    std::string line;
    line.reserve(component.size() + message.size() + 48);
    line.append("[").append(timestamp()).append("] [")
        .append(log_level_tag(level)).append("] [")
        .append(component).append("] ")
        .append(message);

    std::lock_guard<std::mutex> lock(mutex_);
    if (console_enabled_) {
        std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
        out << line << '\n';
        out.flush();
    }
    if (file_stream_.is_open()) {
        file_stream_ << line << '\n';
        file_stream_.flush();
    }
    if (tap_) {
        tap_(level, line);
    }
}

} // namespace core
} // namespace fsmon
