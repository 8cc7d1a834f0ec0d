#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace cds::common::metrics {

// Process-wide counters, gauges and latency timers. Keys are free-form
// dotted names such as "sync.updated" or "payload.build".
class Registry {
public:
    // Latency quantiles are computed over the most recent samples only.
    static constexpr std::size_t kTimerWindow = 1024;

    struct TimerSnapshot {
        std::uint64_t samples{0};
        std::optional<double> lastMs{};
        std::optional<double> p95Ms{};
        std::optional<double> p99Ms{};
    };

    struct GaugeSnapshot {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::map<std::string, TimerSnapshot> timers;
        std::map<std::string, std::uint64_t> counters;
        std::map<std::string, GaugeSnapshot> gauges;
    };

    // Records its own lifetime as one sample of `timerKey`.
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string timerKey);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        std::string timerKey_;
        std::chrono::steady_clock::time_point start_;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    std::uint64_t counterValue(const std::string& counterKey) const;

    void setGauge(const std::string& gaugeKey, double value);

    void recordLatency(const std::string& timerKey, double latencyMs);

    Snapshot snapshot() const;

    // Drops every sample. Used between test cases.
    void reset();

private:
    struct TimerWindow {
        std::uint64_t samples{0};
        std::deque<double> recentMs;
    };

    Registry();

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::map<std::string, TimerWindow> timers_;
    std::map<std::string, std::uint64_t> counters_;
    std::map<std::string, GaugeSnapshot> gauges_;
};

}  // namespace cds::common::metrics
