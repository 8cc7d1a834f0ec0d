#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace cds::common::metrics {
namespace {

// Linear interpolation between closest ranks.
double quantileOf(const std::vector<double>& sorted, double q) {
    if (sorted.size() == 1U) {
        return sorted.front();
    }
    const double rank = std::clamp(q, 0.0, 1.0) * static_cast<double>(sorted.size() - 1U);
    const auto below = static_cast<std::size_t>(std::floor(rank));
    const auto above = std::min(below + 1U, sorted.size() - 1U);
    const double fraction = rank - static_cast<double>(below);
    return sorted[below] + fraction * (sorted[above] - sorted[below]);
}

}  // namespace

Registry::Registry()
    : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry registry;
    return registry;
}

Registry::ScopedTimer::ScopedTimer(std::string timerKey)
    : timerKey_(std::move(timerKey)),
      start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimer::~ScopedTimer() {
    const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start_;
    Registry::instance().recordLatency(timerKey_, elapsed.count());
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

std::uint64_t Registry::counterValue(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counterKey);
    return it == counters_.end() ? 0U : it->second;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[gaugeKey] = GaugeSnapshot{value, now};
}

void Registry::recordLatency(const std::string& timerKey, double latencyMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& timer = timers_[timerKey];
    ++timer.samples;
    timer.recentMs.push_back(latencyMs);
    if (timer.recentMs.size() > kTimerWindow) {
        timer.recentMs.pop_front();
    }
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.capturedAt = std::chrono::steady_clock::now();
    snapshot.counters = counters_;
    snapshot.gauges = gauges_;

    for (const auto& [key, timer] : timers_) {
        TimerSnapshot entry;
        entry.samples = timer.samples;
        if (!timer.recentMs.empty()) {
            std::vector<double> sorted(timer.recentMs.begin(), timer.recentMs.end());
            std::sort(sorted.begin(), sorted.end());
            entry.lastMs = timer.recentMs.back();
            entry.p95Ms = quantileOf(sorted, 0.95);
            entry.p99Ms = quantileOf(sorted, 0.99);
        }
        snapshot.timers.emplace(key, std::move(entry));
    }
    return snapshot;
}

void Registry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.clear();
    counters_.clear();
    gauges_.clear();
}

}  // namespace cds::common::metrics
