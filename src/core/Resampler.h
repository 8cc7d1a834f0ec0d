#pragma once

#include "domain/Models.hpp"

namespace core {

// Aggregates a daily series into coarser right-labelled buckets.
class Resampler {
public:
    // OneDay returns `daily` itself. Throws domain::PipelineError with
    // UnsupportedInterval or InsufficientData.
    static domain::SeriesPtr resample(const domain::SeriesPtr& daily, domain::Interval interval);

    // Label (last covered day) of the bucket containing `date`.
    static domain::Date bucketEnd(domain::Date date, domain::Interval interval, domain::Date anchor);
};

}  // namespace core
