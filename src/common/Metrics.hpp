#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tfsync::common::metrics {

class Registry {
public:
    struct GaugeSnapshot {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::unordered_map<std::string, std::uint64_t> counters;
        std::unordered_map<std::string, GaugeSnapshot> gauges;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    void setGauge(const std::string& gaugeKey, double value);

    std::uint64_t counter(const std::string& counterKey) const;
    Snapshot snapshot() const;

    // One line per metric, sorted by key.
    std::string summary() const;

private:
    Registry();

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::uint64_t> counters_;
    std::unordered_map<std::string, GaugeSnapshot> gauges_;
};

}  // namespace tfsync::common::metrics
