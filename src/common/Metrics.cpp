#include "common/Metrics.hpp"

#include <algorithm>
#include <sstream>
#include <utility>
#include <vector>

namespace tfsync::common::metrics {

Registry::Registry()
    : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    const auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& gauge = gauges_[gaugeKey];
    gauge.value = value;
    gauge.updatedAt = now;
}

std::uint64_t Registry::counter(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = counters_.find(counterKey); it != counters_.end()) {
        return it->second;
    }
    return 0U;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.counters = counters_;
    snapshot.gauges = gauges_;
    return snapshot;
}

std::string Registry::summary() const {
    const auto snap = snapshot();

    std::vector<std::pair<std::string, std::string>> lines;
    lines.reserve(snap.counters.size() + snap.gauges.size());
    for (const auto& [key, value] : snap.counters) {
        lines.emplace_back(key, std::to_string(value));
    }
    for (const auto& [key, gauge] : snap.gauges) {
        std::ostringstream value;
        value << gauge.value;
        lines.emplace_back(key, value.str());
    }
    std::sort(lines.begin(), lines.end());

    const auto uptime =
        std::chrono::duration_cast<std::chrono::seconds>(snap.capturedAt - snap.startTime);

    std::ostringstream out;
    out << "uptime_seconds=" << uptime.count();
    for (const auto& [key, value] : lines) {
        out << '\n' << "  " << key << '=' << value;
    }
    return out.str();
}

}  // namespace tfsync::common::metrics
