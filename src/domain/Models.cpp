#include "domain/Models.hpp"

#include <algorithm>
#include <cmath>

namespace domain {

std::size_t sanitizeBars(std::vector<Bar>& bars) {
    const auto before = bars.size();
    bars.erase(std::remove_if(bars.begin(), bars.end(),
                              [](const Bar& bar) {
                                  return !std::isfinite(bar.open) || !std::isfinite(bar.high)
                                      || !std::isfinite(bar.low) || !std::isfinite(bar.close);
                              }),
               bars.end());
    for (auto& bar : bars) {
        if (!std::isfinite(bar.volume) || bar.volume < 0.0) {
            bar.volume = 0.0;
        }
    }
    return before - bars.size();
}

void sortAndDedupKeepLast(std::vector<Bar>& bars) {
    std::stable_sort(bars.begin(), bars.end(),
                     [](const Bar& lhs, const Bar& rhs) { return lhs.date < rhs.date; });

    std::vector<Bar> result;
    result.reserve(bars.size());
    for (const auto& bar : bars) {
        if (!result.empty() && result.back().date == bar.date) {
            result.back() = bar;
        }
        else {
            result.push_back(bar);
        }
    }
    bars.swap(result);
}

}  // namespace domain
