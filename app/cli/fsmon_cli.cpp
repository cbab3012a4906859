#include "core/config/config.h"
#include "core/logger/logger.h"
#include "core/metrics/metrics_collector.h"
#include "monitor/file_system_monitor.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace fsmon;

static std::atomic<bool> g_running{true};

static void handleSignal(int) {
    g_running = false;
}

namespace {

/**
 * @brief Prints every event it receives, one line each
 */
class PrintingListener : public BaseFileSystemListener {
public:
    PrintingListener(std::string pattern, std::optional<std::chrono::milliseconds> debounce)
        : BaseFileSystemListener(std::move(pattern), debounce) {}

    void on_file_created(const std::string& path) override { print("CREATED", path); }
    void on_file_modified(const std::string& path) override { print("MODIFIED", path); }
    void on_file_deleted(const std::string& path) override { print("DELETED", path); }
    void on_directory_created(const std::string& path) override { print("DIR_CREATED", path); }
    void on_directory_deleted(const std::string& path) override { print("DIR_DELETED", path); }

    void on_symlink_created(const std::string& path, const std::string& target) override {
        print("LINK_CREATED", path + " -> " + target);
    }
    void on_symlink_deleted(const std::string& path) override { print("LINK_DELETED", path); }
    void on_symlink_target_changed(const std::string& path, const std::string& old_target,
                                   const std::string& new_target) override {
        print("LINK_CHANGED", path + ": " + old_target + " -> " + new_target);
    }

private:
    static void print(const char* kind, const std::string& text) {
        static std::mutex out_mutex;
        std::lock_guard<std::mutex> lock(out_mutex);
        std::cout << "[EVENT] " << kind << ": " << text << std::endl;
    }
};

void printUsage(const char* progName) {
    std::cout << "fsmon - File System Monitor\n";
    std::cout << "\nUsage: " << progName << " [options] pattern...\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>     Load settings from a JSON configuration file\n";
    std::cout << "  --root <dir>        Resolve relative patterns against <dir>\n";
    std::cout << "  --debounce <ms>     Debounce delay for every pattern\n";
    std::cout << "  --poll              Use the polling backend only\n";
    std::cout << "  --log-level <lvl>   TRACE, DEBUG, INFO, WARN, ERROR or FATAL\n";
    std::cout << "  --metrics           Print the metrics summary on exit\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << progName << " 'src/**/*.cpp'\n";
    std::cout << "  " << progName << " --poll --debounce 250 '~/notes/*.md'\n";
}

bool parseInt(const std::string& text, int64_t& out) {
    try {
        size_t consumed = 0;
        out = std::stoll(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

}

int main(int argc, char* argv[]) {
    core::Config config;
    std::vector<std::string> patterns;
    std::optional<std::chrono::milliseconds> debounce;
    bool printMetrics = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << name << " requires a value" << std::endl;
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            const char* value = needValue("--config");
            if (!value) return 1;
            if (!config.load_from_file(value)) {
                std::cerr << "Error: Cannot load " << value << ": " << config.last_error() << std::endl;
                return 1;
            }
        } else if (arg == "--root") {
            const char* value = needValue("--root");
            if (!value) return 1;
            config.set_string("project.root_path", value);
        } else if (arg == "--debounce") {
            const char* value = needValue("--debounce");
            int64_t ms = 0;
            if (!value || !parseInt(value, ms) || ms < 0) {
                std::cerr << "Error: --debounce expects a non-negative number of milliseconds" << std::endl;
                return 1;
            }
            debounce = std::chrono::milliseconds(ms);
        } else if (arg == "--poll") {
            config.set_bool("fs_monitor.force_polling", true);
        } else if (arg == "--log-level") {
            const char* value = needValue("--log-level");
            if (!value) return 1;
            config.set_string("core.log_level", value);
        } else if (arg == "--metrics") {
            printMetrics = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        } else {
            patterns.push_back(arg);
        }
    }

    if (patterns.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    auto monitorConfig = MonitorConfig::from_config(config);
    if (!monitorConfig) {
        std::cerr << "Error: " << monitorConfig.error().message << std::endl;
        return 1;
    }

    auto& logger = core::Logger::instance();
    logger.set_level(monitorConfig->log_level);
    if (!monitorConfig->log_file.empty() && !logger.set_file_output(monitorConfig->log_file)) {
        std::cerr << "Warning: Cannot open log file " << monitorConfig->log_file << std::endl;
    }

    FileSystemMonitor monitor(monitorConfig.value());
    auto started = monitor.start();
    if (!started) {
        std::cerr << "Error: " << started.error().message << std::endl;
        return 1;
    }

    std::vector<std::shared_ptr<WatchHandle>> handles;
    for (const auto& pattern : patterns) {
        auto handle = monitor.register_listener(std::make_shared<PrintingListener>(pattern, debounce));
        if (!handle) {
            std::cerr << "Error: " << pattern << ": " << handle.error().message << std::endl;
            return 1;
        }
        std::cout << "Watching " << pattern << " (" << handle.value()->list_watched_paths().size()
                  << " directories)" << std::endl;
        handles.push_back(handle.value());
    }

    // Handle Ctrl+C
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    std::cout << "Monitor running. Press Ctrl+C to exit." << std::endl;

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    monitor.stop();

    if (printMetrics) {
        std::cout << core::MetricsCollector::instance().summary();
    }
    std::cout << "Monitor stopped." << std::endl;
    return 0;
}
