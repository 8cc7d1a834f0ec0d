#include "app/ChartPayloadBuilder.hpp"

#include <optional>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/Resampler.h"
#include "domain/Errors.hpp"
#include "indicators/IndicatorEngine.h"

namespace app {

namespace {

// Re-indexes `series` onto the bar dates. Gaps after the first defined value
// are forward-filled; leading gaps become `leadingFill` or are dropped.
std::vector<indicators::DatedValue> alignToBars(const domain::OhlcvSeries& bars,
                                                const indicators::IndicatorSeries& series,
                                                std::optional<double> leadingFill) {
    std::vector<indicators::DatedValue> aligned;
    aligned.reserve(bars.size());

    std::optional<double> last;
    std::size_t j = 0;
    for (const auto& bar : bars) {
        while (j < series.points.size() && series.points[j].date <= bar.date) {
            last = series.points[j].value;
            ++j;
        }
        if (last.has_value()) {
            aligned.push_back(indicators::DatedValue{bar.date, *last});
        }
        else if (leadingFill.has_value()) {
            aligned.push_back(indicators::DatedValue{bar.date, *leadingFill});
        }
    }
    return aligned;
}

}  // namespace

ChartPayloadBuilder::ChartPayloadBuilder(domain::ISeriesStore& store,
                                         const domain::IDatasetCatalog& catalog,
                                         PayloadOptions options)
    : store_(store),
      catalog_(catalog),
      options_(std::move(options)),
      cache_(std::make_shared<core::PayloadCache<ChartPayload>>("payload")) {
    std::weak_ptr<core::PayloadCache<ChartPayload>> weakCache = cache_;
    store_.addChangeListener([weakCache](const std::string& datasetId, domain::Date lastDate) {
        if (auto cache = weakCache.lock()) {
            cache->invalidate(datasetId);
            LOG_DEBUG("Payload cache invalidated for " << datasetId << " (last " << domain::formatDate(lastDate)
                                                       << ")");
        }
    });
}

PayloadPtr ChartPayloadBuilder::build(const std::string& datasetId, const std::string& interval) {
    const auto parsed = domain::intervalFromString(interval);
    if (parsed == domain::Interval::Unknown) {
        throw domain::PipelineError(domain::ErrorKind::UnsupportedInterval, interval);
    }
    return build(datasetId, parsed);
}

PayloadPtr ChartPayloadBuilder::build(const std::string& datasetId, domain::Interval interval) {
    if (interval == domain::Interval::Unknown) {
        throw domain::PipelineError(domain::ErrorKind::UnsupportedInterval, "unknown interval");
    }
    return cache_->getOrCompute(core::PayloadKey{datasetId, interval},
                                [this, &datasetId, interval]() { return compose(datasetId, interval); });
}

void ChartPayloadBuilder::invalidate(const std::string& datasetId) {
    cache_->invalidate(datasetId);
}

std::size_t ChartPayloadBuilder::cachedEntries() const {
    return cache_->size();
}

PayloadPtr ChartPayloadBuilder::compose(const std::string& datasetId, domain::Interval interval) const {
    cds::common::metrics::Registry::ScopedTimer timer("payload.build");

    const auto info = catalog_.resolve(datasetId);
    const auto daily = store_.load(datasetId);
    const auto bars = core::Resampler::resample(daily, interval);

    auto payload = std::make_shared<ChartPayload>();
    payload->datasetId = datasetId;
    payload->assetClass = info ? info->assetClass : catalog_.classify(datasetId);
    payload->interval = interval;
    payload->candles = bars;

    payload->volumes.reserve(bars->size());
    for (const auto& bar : *bars) {
        payload->volumes.push_back(VolumePoint{bar.date, bar.volume, bar.close >= bar.open});
    }

    const auto rsi = indicators::IndicatorEngine::computeRSI(*bars, options_.rsi);
    const auto obv = indicators::IndicatorEngine::computeOBV(*bars);
    const auto ad = indicators::IndicatorEngine::computeAD(*bars);
    payload->rsi = alignToBars(*bars, rsi, std::nullopt);
    payload->obv = alignToBars(*bars, obv, 0.0);
    payload->ad = alignToBars(*bars, ad, 0.0);
    payload->cloud = indicators::IndicatorEngine::computeIchimokuCloud(*bars, options_.ichimoku);

    LOG_DEBUG("Built payload " << datasetId << "/" << domain::intervalToString(interval) << " candles="
                               << bars->size() << " rsi=" << payload->rsi.size()
                               << " cloud=" << payload->cloud.size());
    return payload;
}

}  // namespace app
