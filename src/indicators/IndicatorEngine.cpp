#include "indicators/IndicatorEngine.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace indicators {
namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Midpoint of the highest high and lowest low over the trailing window ending
// at each row. NaN until the window is full.
std::vector<double> rollingMidpoint(const domain::OhlcvSeries& bars, int window) {
    std::vector<double> result(bars.size(), kNaN);
    if (window <= 0) {
        return result;
    }
    const auto span = static_cast<std::size_t>(window);
    for (std::size_t i = span - 1; i < bars.size(); ++i) {
        double highest = bars[i + 1 - span].high;
        double lowest = bars[i + 1 - span].low;
        for (std::size_t j = i + 2 - span; j <= i; ++j) {
            highest = std::max(highest, bars[j].high);
            lowest = std::min(lowest, bars[j].low);
        }
        result[i] = (highest + lowest) / 2.0;
    }
    return result;
}

std::vector<double> shiftForward(const std::vector<double>& values, int displacement) {
    std::vector<double> shifted(values.size(), kNaN);
    const auto offset = static_cast<std::size_t>(std::max(displacement, 0));
    for (std::size_t i = offset; i < values.size(); ++i) {
        shifted[i] = values[i - offset];
    }
    return shifted;
}

}  // namespace

IndicatorSeries IndicatorEngine::computeRSI(const domain::OhlcvSeries& bars, const RsiParams& params) {
    if (params.period <= 0) {
        throw std::invalid_argument("RSI period must be positive, got " + std::to_string(params.period));
    }

    IndicatorSeries series;
    series.id = params.name();
    if (bars.size() < 2) {
        return series;
    }

    const double alpha = 1.0 / static_cast<double>(params.period);
    double avgGain = 0.0;
    double avgLoss = 0.0;

    for (std::size_t i = 1; i < bars.size(); ++i) {
        const double delta = bars[i].close - bars[i - 1].close;
        const double gain = std::max(delta, 0.0);
        const double loss = std::max(-delta, 0.0);

        if (i == 1) {
            avgGain = gain;
            avgLoss = loss;
        }
        else {
            avgGain = (1.0 - alpha) * avgGain + alpha * gain;
            avgLoss = (1.0 - alpha) * avgLoss + alpha * loss;
        }

        if (i < static_cast<std::size_t>(params.period)) {
            continue;
        }

        double rsi = 100.0;
        if (avgLoss > 0.0) {
            const double rs = avgGain / avgLoss;
            rsi = 100.0 - 100.0 / (1.0 + rs);
        }
        series.points.push_back(DatedValue{bars[i].date, std::clamp(rsi, 0.0, 100.0)});
    }

    return series;
}

IndicatorSeries IndicatorEngine::computeOBV(const domain::OhlcvSeries& bars) {
    IndicatorSeries series;
    series.id = "OBV";
    series.points.reserve(bars.size());

    double obv = 0.0;
    for (std::size_t i = 0; i < bars.size(); ++i) {
        if (i > 0) {
            if (bars[i].close > bars[i - 1].close) {
                obv += bars[i].volume;
            }
            else if (bars[i].close < bars[i - 1].close) {
                obv -= bars[i].volume;
            }
        }
        series.points.push_back(DatedValue{bars[i].date, obv});
    }
    return series;
}

IndicatorSeries IndicatorEngine::computeAD(const domain::OhlcvSeries& bars) {
    IndicatorSeries series;
    series.id = "AD";
    series.points.reserve(bars.size());

    double ad = 0.0;
    for (const auto& bar : bars) {
        const double range = bar.high - bar.low;
        double clv = 0.0;
        if (range != 0.0) {
            clv = ((bar.close - bar.low) - (bar.high - bar.close)) / range;
        }
        ad += clv * bar.volume;
        series.points.push_back(DatedValue{bar.date, ad});
    }
    return series;
}

std::vector<CloudPoint> IndicatorEngine::computeIchimokuCloud(const domain::OhlcvSeries& bars,
                                                              const IchimokuParams& params) {
    std::vector<CloudPoint> cloud;
    if (bars.empty()) {
        return cloud;
    }

    const auto conversion = rollingMidpoint(bars, params.conversionPeriod);
    const auto base = rollingMidpoint(bars, params.basePeriod);
    const auto spanBRaw = rollingMidpoint(bars, params.spanBPeriod);

    std::vector<double> spanARaw(bars.size(), kNaN);
    for (std::size_t i = 0; i < bars.size(); ++i) {
        if (!std::isnan(conversion[i]) && !std::isnan(base[i])) {
            spanARaw[i] = (conversion[i] + base[i]) / 2.0;
        }
    }

    const auto spanA = shiftForward(spanARaw, params.displacement);
    const auto spanB = shiftForward(spanBRaw, params.displacement);

    for (std::size_t i = 0; i < bars.size(); ++i) {
        if (std::isnan(spanA[i]) || std::isnan(spanB[i])) {
            continue;
        }
        CloudPoint point;
        point.date = bars[i].date;
        point.spanA = spanA[i];
        point.spanB = spanB[i];
        point.top = std::max(spanA[i], spanB[i]);
        point.bottom = std::min(spanA[i], spanB[i]);
        point.bullish = spanA[i] >= spanB[i];
        cloud.push_back(point);
    }
    return cloud;
}

}  // namespace indicators
