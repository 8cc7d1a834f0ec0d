#pragma once

#include <vector>

#include "domain/Models.hpp"
#include "indicators/IndicatorTypes.h"

namespace indicators {

// Stateless transforms over a date-ordered series. Output points carry the
// date of the bar they belong to; warm-up rows are omitted.
class IndicatorEngine {
public:
    // Wilder RSI. Throws std::invalid_argument for a non-positive period.
    static IndicatorSeries computeRSI(const domain::OhlcvSeries& bars, const RsiParams& params = {});

    static IndicatorSeries computeOBV(const domain::OhlcvSeries& bars);

    // Accumulation/Distribution line.
    static IndicatorSeries computeAD(const domain::OhlcvSeries& bars);

    static std::vector<CloudPoint> computeIchimokuCloud(const domain::OhlcvSeries& bars,
                                                        const IchimokuParams& params = {});
};

}  // namespace indicators
