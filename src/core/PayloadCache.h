#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "common/Metrics.hpp"
#include "domain/Models.hpp"

namespace core {

struct PayloadKey {
    std::string datasetId;
    domain::Interval interval{domain::Interval::OneDay};

    bool operator==(const PayloadKey& o) const {
        return datasetId == o.datasetId && interval == o.interval;
    }
};

struct PayloadKeyHash {
    std::size_t operator()(const PayloadKey& k) const {
        std::size_t seed = std::hash<std::string>{}(k.datasetId);
        seed ^= static_cast<std::size_t>(k.interval) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }
};

// Memo table keyed by (dataset, interval). Concurrent callers of the same key
// wait on one computation; a computation that throws leaves no entry behind.
template <typename Value>
class PayloadCache {
public:
    using ValuePtr = std::shared_ptr<const Value>;
    using Compute = std::function<ValuePtr()>;

    explicit PayloadCache(std::string metricsPrefix = {})
        : metricsPrefix_(std::move(metricsPrefix)) {}

    ValuePtr getOrCompute(const PayloadKey& key, const Compute& compute) {
        std::promise<ValuePtr> promise;
        std::uint64_t ticket = 0;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            auto it = entries_.find(key);
            if (it != entries_.end()) {
                auto pending = it->second.future;
                lock.unlock();
                count("cache_hit");
                return pending.get();
            }
            ticket = ++nextTicket_;
            entries_.emplace(key, Slot{promise.get_future().share(), ticket});
        }
        count("cache_miss");

        try {
            auto value = compute();
            promise.set_value(value);
            return value;
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                auto it = entries_.find(key);
                if (it != entries_.end() && it->second.ticket == ticket) {
                    entries_.erase(it);
                }
            }
            promise.set_exception(std::current_exception());
            throw;
        }
    }

    void invalidate(const std::string& datasetId) {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->first.datasetId == datasetId) {
                it = entries_.erase(it);
            }
            else {
                ++it;
            }
        }
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        entries_.clear();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return entries_.size();
    }

    bool contains(const PayloadKey& key) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return entries_.count(key) > 0;
    }

private:
    struct Slot {
        std::shared_future<ValuePtr> future;
        std::uint64_t ticket{0};
    };

    void count(const char* name) const {
        if (!metricsPrefix_.empty()) {
            cds::common::metrics::Registry::instance().incrementCounter(metricsPrefix_ + "." + name);
        }
    }

    std::string metricsPrefix_;
    mutable std::mutex mtx_;
    std::unordered_map<PayloadKey, Slot, PayloadKeyHash> entries_;
    std::uint64_t nextTicket_{0};
};

}  // namespace core
