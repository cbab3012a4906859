#ifndef FSMON_METRICS_COLLECTOR_H
#define FSMON_METRICS_COLLECTOR_H

#include <string>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace fsmon {
namespace core {

/**
 * @brief Snapshot of monitor counters (non-atomic copy)
 */
struct MonitorMetricsSnapshot {
    uint64_t watches_created{0};
    uint64_t watches_removed{0};
    uint64_t polling_fallbacks{0};
    uint64_t raw_events{0};
    uint64_t events_coalesced{0};
    uint64_t events_dispatched{0};
    uint64_t events_dropped{0};
    uint64_t callback_errors{0};
    uint64_t watch_errors{0};
};

/**
 * @brief MetricsCollector - process-wide monitor counters
 */
class MetricsCollector {
public:
    static MetricsCollector& instance();

    void increment_watches_created() { metrics_.watches_created++; }
    void increment_watches_removed() { metrics_.watches_removed++; }
    void increment_polling_fallbacks() { metrics_.polling_fallbacks++; }
    void increment_raw_events() { metrics_.raw_events++; }
    void increment_events_coalesced() { metrics_.events_coalesced++; }
    void increment_events_dispatched() { metrics_.events_dispatched++; }
    void increment_events_dropped() { metrics_.events_dropped++; }
    void increment_callback_errors() { metrics_.callback_errors++; }
    void increment_watch_errors() { metrics_.watch_errors++; }

    MonitorMetricsSnapshot snapshot() const;

    /**
     * @brief Human-readable multi-line summary
     */
    std::string summary() const;

    /**
     * @brief Reset all counters (tests)
     */
    void reset();

private:
    MetricsCollector();

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    struct Counters {
        std::atomic<uint64_t> watches_created{0};
        std::atomic<uint64_t> watches_removed{0};
        std::atomic<uint64_t> polling_fallbacks{0};
        std::atomic<uint64_t> raw_events{0};
        std::atomic<uint64_t> events_coalesced{0};
        std::atomic<uint64_t> events_dispatched{0};
        std::atomic<uint64_t> events_dropped{0};
        std::atomic<uint64_t> callback_errors{0};
        std::atomic<uint64_t> watch_errors{0};
    };

    Counters metrics_;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace core
} // namespace fsmon

#endif // FSMON_METRICS_COLLECTOR_H
