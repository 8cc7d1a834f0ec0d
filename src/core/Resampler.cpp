#include "core/Resampler.h"

#include <algorithm>
#include <memory>
#include <string>

#include "domain/Errors.hpp"

namespace core {

namespace {

constexpr std::int32_t kThreeDayBucket = 3;
constexpr int kSunday = 6;

std::int32_t floorMod(std::int32_t value, std::int32_t divisor) {
    const auto r = value % divisor;
    return r < 0 ? r + divisor : r;
}

}  // namespace

domain::Date Resampler::bucketEnd(domain::Date date, domain::Interval interval, domain::Date anchor) {
    switch (interval) {
    case domain::Interval::OneDay:
        return date;
    case domain::Interval::ThreeDays: {
        const auto offset = domain::daysBetween(anchor, date);
        const auto position = floorMod(offset, kThreeDayBucket);
        return domain::addDays(date, kThreeDayBucket - 1 - position);
    }
    case domain::Interval::OneWeek:
        return domain::addDays(date, kSunday - domain::weekday(date));
    case domain::Interval::Unknown:
    default:
        break;
    }
    throw domain::PipelineError(domain::ErrorKind::UnsupportedInterval, domain::intervalToString(interval));
}

domain::SeriesPtr Resampler::resample(const domain::SeriesPtr& daily, domain::Interval interval) {
    if (interval == domain::Interval::Unknown) {
        throw domain::PipelineError(domain::ErrorKind::UnsupportedInterval, "unknown interval");
    }
    if (!daily || daily->empty()) {
        throw domain::PipelineError(domain::ErrorKind::InsufficientData, "no bars to resample");
    }
    if (interval == domain::Interval::OneDay) {
        return daily;
    }

    const auto anchor = daily->front().date;
    auto buckets = std::make_shared<domain::OhlcvSeries>();
    buckets->reserve(daily->size() / 3 + 1);

    for (const auto& bar : *daily) {
        const auto label = bucketEnd(bar.date, interval, anchor);
        if (buckets->empty() || buckets->back().date != label) {
            buckets->push_back(domain::Bar{label, bar.open, bar.high, bar.low, bar.close, bar.volume});
            continue;
        }
        auto& bucket = buckets->back();
        bucket.high = std::max(bucket.high, bar.high);
        bucket.low = std::min(bucket.low, bar.low);
        bucket.close = bar.close;
        bucket.volume += bar.volume;
    }

    if (buckets->empty()) {
        throw domain::PipelineError(domain::ErrorKind::InsufficientData,
                                    "resample to " + domain::intervalToString(interval) + " produced no bars");
    }
    return buckets;
}

}  // namespace core
