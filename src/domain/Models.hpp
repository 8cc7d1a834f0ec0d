#pragma once

#include <cctype>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "domain/Date.hpp"

namespace domain {

struct Bar {
    Date date{};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
};

// Bars of one dataset, dates strictly increasing.
using OhlcvSeries = std::vector<Bar>;
using SeriesPtr = std::shared_ptr<const OhlcvSeries>;

enum class AssetClass {
    Stock,
    Crypto,
};

inline const char* assetClassToString(AssetClass assetClass) {
    return assetClass == AssetClass::Crypto ? "crypto" : "stock";
}

enum class Interval {
    Unknown,
    OneDay,
    ThreeDays,
    OneWeek,
};

inline std::string intervalToString(Interval interval) {
    switch (interval) {
    case Interval::OneDay:
        return "1d";
    case Interval::ThreeDays:
        return "3d";
    case Interval::OneWeek:
        return "1w";
    case Interval::Unknown:
    default:
        break;
    }
    return "";
}

// Empty input selects the daily resolution.
inline Interval intervalFromString(std::string_view value) {
    std::string normalized;
    normalized.reserve(value.size());
    for (char ch : value) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }

    if (normalized.empty() || normalized == "1d" || normalized == "1-day" || normalized == "1day"
        || normalized == "d") {
        return Interval::OneDay;
    }
    if (normalized == "3d" || normalized == "3-day" || normalized == "3day") {
        return Interval::ThreeDays;
    }
    if (normalized == "1w" || normalized == "1-week" || normalized == "1week" || normalized == "w") {
        return Interval::OneWeek;
    }
    return Interval::Unknown;
}

struct DatasetInfo {
    std::string id;
    std::optional<std::string> ticker;
    AssetClass assetClass{AssetClass::Stock};
};

// Drops bars with a non-finite open/high/low/close and clamps a non-finite or
// negative volume to 0. Returns the number of dropped bars.
std::size_t sanitizeBars(std::vector<Bar>& bars);

// Stable sort by date, then collapse equal dates to the last occurrence.
void sortAndDedupKeepLast(std::vector<Bar>& bars);

}  // namespace domain
