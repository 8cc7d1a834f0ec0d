#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "domain/Ports.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::binance {

// Daily klines from the Binance public REST API.
class BinanceDailyFetcher : public domain::IFetcher {
public:
    BinanceDailyFetcher();
    explicit BinanceDailyFetcher(infra::http::TlsClientOptions options);
    ~BinanceDailyFetcher() override = default;

    std::vector<domain::Bar> fetchRange(const std::string& ticker,
                                        domain::Date start,
                                        domain::Date end) override;

    static constexpr std::size_t kPageLimit = 1000;

private:
    std::string requestWithRetry(const std::string& target) const;

    infra::http::TlsHttpClient client_;
};

// Converts one Binance klines response body into bars. Exposed for tests.
std::vector<domain::Bar> parseKlines(const std::string& body);

}  // namespace adapters::binance
