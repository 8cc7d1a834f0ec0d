#pragma once

#include <string>
#include <vector>

#include "domain/Date.hpp"

namespace indicators {

struct RsiParams {
    int period = 14;

    std::string name() const { return "RSI(" + std::to_string(period) + ")"; }
};

struct IchimokuParams {
    int conversionPeriod = 9;
    int basePeriod = 26;
    int spanBPeriod = 52;
    int displacement = 26;
};

struct DatedValue {
    domain::Date date{};
    double value = 0.0;
};

struct IndicatorSeries {
    std::string id;
    std::vector<DatedValue> points;
};

inline constexpr const char* kCloudBullishColor = "#089981";
inline constexpr const char* kCloudBearishColor = "#f23645";

struct CloudPoint {
    domain::Date date{};
    double spanA = 0.0;
    double spanB = 0.0;
    double top = 0.0;
    double bottom = 0.0;
    bool bullish = false;

    const char* color() const { return bullish ? kCloudBullishColor : kCloudBearishColor; }
};

}  // namespace indicators
