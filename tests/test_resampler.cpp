#include <iostream>
#include <memory>

#include "TestSupport.hpp"
#include "core/Resampler.h"
#include "domain/Errors.hpp"

using testsupport::bar;
using testsupport::ymd;

namespace {

domain::SeriesPtr share(domain::OhlcvSeries bars) {
    return std::make_shared<const domain::OhlcvSeries>(std::move(bars));
}

domain::ErrorKind kindOf(const domain::SeriesPtr& series, domain::Interval interval) {
    try {
        core::Resampler::resample(series, interval);
    } catch (const domain::PipelineError& ex) {
        return ex.kind();
    }
    return domain::ErrorKind::InvalidRow;
}

}  // namespace

int main() {
    const auto three = share({
        bar(ymd(2024, 3, 4), 10, 12, 9, 11, 100),
        bar(ymd(2024, 3, 5), 11, 13, 10, 10, 200),
        bar(ymd(2024, 3, 6), 10, 11, 8, 9, 300),
    });

    const auto threeDay = core::Resampler::resample(three, domain::Interval::ThreeDays);
    CHECK(threeDay->size() == 1, "three daily bars should make one 3-day bar");
    const auto& b = threeDay->front();
    CHECK(b.open == 10 && b.high == 13 && b.low == 8 && b.close == 9, "OHLC aggregation wrong");
    CHECK(b.volume == 600, "volume should be summed");
    CHECK(b.date == ymd(2024, 3, 6), "bucket is labelled with its last day");

    CHECK(core::Resampler::resample(three, domain::Interval::OneDay) == three, "1d must pass the series through");

    // Anchored at the first bar; empty buckets are not emitted.
    const auto gappy = share({
        bar(ymd(2024, 3, 1), 1, 2, 0.5, 1.5, 1),
        bar(ymd(2024, 3, 3), 1.5, 3, 1, 2, 1),
        bar(ymd(2024, 3, 10), 2, 4, 1.5, 3, 1),
    });
    const auto gappy3 = core::Resampler::resample(gappy, domain::Interval::ThreeDays);
    CHECK(gappy3->size() == 2, "expected two non-empty 3-day buckets, got " << gappy3->size());
    CHECK((*gappy3)[0].date == ymd(2024, 3, 3) && (*gappy3)[0].close == 2, "first bucket ends 03-03");
    CHECK((*gappy3)[1].date == ymd(2024, 3, 12), "bucket containing 03-10 ends 03-12");

    // Weekly buckets end on Sunday.
    const auto days = share(testsupport::makeDaily(ymd(2024, 1, 3), 12));  // Wed 01-03 .. Sun 01-14
    const auto weekly = core::Resampler::resample(days, domain::Interval::OneWeek);
    CHECK(weekly->size() == 2, "expected two weekly bars, got " << weekly->size());
    CHECK((*weekly)[0].date == ymd(2024, 1, 7) && (*weekly)[1].date == ymd(2024, 1, 14),
          "weekly labels should be Sundays");
    CHECK((*weekly)[0].open == (*days)[0].open && (*weekly)[0].close == (*days)[4].close,
          "first week spans Wed..Sun");

    double volume = 0;
    for (std::size_t i = 5; i < days->size(); ++i) {
        volume += (*days)[i].volume;
    }
    CHECK((*weekly)[1].volume == volume, "second week volume mismatch");

    CHECK(kindOf(share({}), domain::Interval::OneWeek) == domain::ErrorKind::InsufficientData,
          "empty input is InsufficientData");
    CHECK(kindOf(three, domain::Interval::Unknown) == domain::ErrorKind::UnsupportedInterval,
          "unknown interval is UnsupportedInterval");

    return 0;
}
