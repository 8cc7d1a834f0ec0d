#include "adapters/binance/BinanceDailyFetcher.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <boost/json.hpp>

#include "common/Log.hpp"

namespace adapters::binance {

namespace {

constexpr const char* kHost = "api.binance.com";
constexpr int kMaxAttempts = 3;
constexpr int kUsedWeightSoftLimit = 1000;

std::int64_t jsonToInt64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stoll(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Invalid integer in kline row: " + str + " (" + ex.what() + ")");
        }
    }
    throw std::runtime_error("Unexpected JSON type for integer field");
}

double jsonToDouble(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stod(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Invalid number in kline row: " + str + " (" + ex.what() + ")");
        }
    }
    throw std::runtime_error("Unexpected JSON type for numeric field");
}

}  // namespace

std::vector<domain::Bar> parseKlines(const std::string& body) {
    boost::json::value json;
    try {
        json = boost::json::parse(body);
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string{"Failed to parse Binance response: "} + ex.what());
    }
    if (!json.is_array()) {
        throw std::runtime_error("Unexpected Binance response type (expected array)");
    }

    std::vector<domain::Bar> bars;
    const auto& rows = json.as_array();
    bars.reserve(rows.size());
    for (const auto& rowValue : rows) {
        if (!rowValue.is_array()) {
            throw std::runtime_error("Unexpected Binance kline row type");
        }
        const auto& row = rowValue.as_array();
        if (row.size() < 6) {
            throw std::runtime_error("Incomplete Binance kline row");
        }

        domain::Bar bar{};
        bar.date = domain::fromUnixSeconds(jsonToInt64(row.at(0)) / 1000);
        bar.open = jsonToDouble(row.at(1));
        bar.high = jsonToDouble(row.at(2));
        bar.low = jsonToDouble(row.at(3));
        bar.close = jsonToDouble(row.at(4));
        bar.volume = jsonToDouble(row.at(5));
        bars.push_back(bar);
    }
    return bars;
}

BinanceDailyFetcher::BinanceDailyFetcher()
    : BinanceDailyFetcher(infra::http::TlsClientOptions{}) {}

BinanceDailyFetcher::BinanceDailyFetcher(infra::http::TlsClientOptions options)
    : client_(std::move(options)) {}

std::string BinanceDailyFetcher::requestWithRetry(const std::string& target) const {
    for (int attempt = 1; attempt <= kMaxAttempts; ++attempt) {
        auto response = client_.get(kHost, target);
        const unsigned status = response.status;
        if (status == 200U) {
            if (!response.usedWeight.empty()) {
                try {
                    if (std::stoi(response.usedWeight) > kUsedWeightSoftLimit) {
                        LOG_WARN("Binance used weight " << response.usedWeight << ", pausing");
                        std::this_thread::sleep_for(std::chrono::seconds(2));
                    }
                } catch (const std::exception&) {
                    LOG_DEBUG("Ignoring malformed used-weight header '" << response.usedWeight << "'");
                }
            }
            return std::move(response.body);
        }

        if ((status == 429U || (status >= 500U && status < 600U)) && attempt < kMaxAttempts) {
            const auto backoff = std::chrono::seconds(1LL << (attempt - 1));
            LOG_WARN("Binance HTTP " << status << " on attempt " << attempt << ", retrying in "
                                     << backoff.count() << "s");
            std::this_thread::sleep_for(backoff);
            continue;
        }

        std::ostringstream oss;
        oss << "Binance request " << target << " returned HTTP " << status;
        throw std::runtime_error(oss.str());
    }
    throw std::runtime_error("Binance request " + target + " exhausted retries");
}

std::vector<domain::Bar> BinanceDailyFetcher::fetchRange(const std::string& ticker,
                                                         domain::Date start,
                                                         domain::Date end) {
    std::vector<domain::Bar> bars;
    if (ticker.empty() || start > end) {
        return bars;
    }

    const std::int64_t endMs = (domain::toUnixSeconds(end) + domain::kSecondsPerDay) * 1000 - 1;
    std::int64_t cursorMs = domain::toUnixSeconds(start) * 1000;

    while (cursorMs <= endMs) {
        std::ostringstream target;
        target << "/api/v3/klines?symbol=" << ticker << "&interval=1d&startTime=" << cursorMs
               << "&endTime=" << endMs << "&limit=" << kPageLimit;
        LOG_DEBUG("Binance REST " << target.str());

        auto page = parseKlines(requestWithRetry(target.str()));
        if (page.empty()) {
            break;
        }

        const auto lastDate = page.back().date;
        for (auto& bar : page) {
            if (bars.empty() || bars.back().date < bar.date) {
                bars.push_back(bar);
            }
        }

        if (page.size() < kPageLimit) {
            break;
        }
        cursorMs = (domain::toUnixSeconds(lastDate) + domain::kSecondsPerDay) * 1000;
    }

    LOG_INFO("Binance " << ticker << " " << domain::formatDate(start) << ".." << domain::formatDate(end)
                        << " returned " << bars.size() << " bars");
    return bars;
}

}  // namespace adapters::binance
