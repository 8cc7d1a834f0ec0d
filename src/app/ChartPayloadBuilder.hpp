#pragma once

#include <memory>
#include <string>
#include <vector>

#include "core/PayloadCache.h"
#include "domain/Ports.hpp"
#include "indicators/IndicatorTypes.h"

namespace app {

struct VolumePoint {
    domain::Date date{};
    double value = 0.0;
    bool up = true;

    const char* color() const { return up ? "rgba(8, 153, 129, 0.4)" : "rgba(242, 54, 69, 0.4)"; }
};

struct ChartPayload {
    std::string datasetId;
    domain::AssetClass assetClass{domain::AssetClass::Stock};
    domain::Interval interval{domain::Interval::OneDay};
    domain::SeriesPtr candles;
    std::vector<VolumePoint> volumes;
    std::vector<indicators::DatedValue> rsi;
    std::vector<indicators::DatedValue> obv;
    std::vector<indicators::DatedValue> ad;
    std::vector<indicators::CloudPoint> cloud;
};

using PayloadPtr = std::shared_ptr<const ChartPayload>;

struct PayloadOptions {
    indicators::RsiParams rsi{};
    indicators::IchimokuParams ichimoku{};
};

class ChartPayloadBuilder {
public:
    ChartPayloadBuilder(domain::ISeriesStore& store,
                        const domain::IDatasetCatalog& catalog,
                        PayloadOptions options = {});

    // Throws domain::PipelineError. An unsupported interval never reaches the
    // cache.
    PayloadPtr build(const std::string& datasetId, const std::string& interval);
    PayloadPtr build(const std::string& datasetId, domain::Interval interval);

    void invalidate(const std::string& datasetId);
    std::size_t cachedEntries() const;

private:
    PayloadPtr compose(const std::string& datasetId, domain::Interval interval) const;

    domain::ISeriesStore& store_;
    const domain::IDatasetCatalog& catalog_;
    PayloadOptions options_;
    std::shared_ptr<core::PayloadCache<ChartPayload>> cache_;
};

}  // namespace app
