#include "metrics_collector.h"
#include <sstream>

namespace fsmon {
namespace core {

MetricsCollector::MetricsCollector()
    : start_time_(std::chrono::steady_clock::now()) {
}

MetricsCollector& MetricsCollector::instance() {
    static MetricsCollector instance;
    return instance;
}

MonitorMetricsSnapshot MetricsCollector::snapshot() const {
    MonitorMetricsSnapshot snap;
    snap.watches_created = metrics_.watches_created.load();
    snap.watches_removed = metrics_.watches_removed.load();
    snap.polling_fallbacks = metrics_.polling_fallbacks.load();
    snap.raw_events = metrics_.raw_events.load();
    snap.events_coalesced = metrics_.events_coalesced.load();
    snap.events_dispatched = metrics_.events_dispatched.load();
    snap.events_dropped = metrics_.events_dropped.load();
    snap.callback_errors = metrics_.callback_errors.load();
    snap.watch_errors = metrics_.watch_errors.load();
    return snap;
}

std::string MetricsCollector::summary() const {
    std::stringstream ss;

    auto uptime = std::chrono::steady_clock::now() - start_time_;
    auto hours = std::chrono::duration_cast<std::chrono::hours>(uptime).count();
    auto minutes = std::chrono::duration_cast<std::chrono::minutes>(uptime % std::chrono::hours(1)).count();

    auto snap = snapshot();

    ss << "=== fsmon Metrics Summary ===" << std::endl;
    ss << "Uptime: " << hours << "h " << minutes << "m" << std::endl << std::endl;

    ss << "--- Watches ---" << std::endl;
    ss << "  Created: " << snap.watches_created << std::endl;
    ss << "  Removed: " << snap.watches_removed << std::endl;
    ss << "  Active: " << (snap.watches_created - snap.watches_removed) << std::endl;
    ss << "  Polling Fallbacks: " << snap.polling_fallbacks << std::endl;
    ss << "  Watch Errors: " << snap.watch_errors << std::endl << std::endl;

    ss << "--- Events ---" << std::endl;
    ss << "  Raw: " << snap.raw_events << std::endl;
    ss << "  Coalesced: " << snap.events_coalesced << std::endl;
    ss << "  Dispatched: " << snap.events_dispatched << std::endl;
    ss << "  Dropped: " << snap.events_dropped << std::endl;
    ss << "  Callback Errors: " << snap.callback_errors << std::endl;

    return ss.str();
}

void MetricsCollector::reset() {
    metrics_.watches_created = 0;
    metrics_.watches_removed = 0;
    metrics_.polling_fallbacks = 0;
    metrics_.raw_events = 0;
    metrics_.events_coalesced = 0;
    metrics_.events_dispatched = 0;
    metrics_.events_dropped = 0;
    metrics_.callback_errors = 0;
    metrics_.watch_errors = 0;
}

} // namespace core
} // namespace fsmon
