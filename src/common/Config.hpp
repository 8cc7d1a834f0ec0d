#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common/Log.hpp"

namespace cds::common {

enum class Action {
    List,
    Sync,
    Payload,
};

struct Config {
    std::string dataDir = "./stock_data";
    std::string tickerMapPath;  // empty until resolved against dataDir
    std::string defaultDatasetId = "ETHUSDT_2Y_OHLCV_Trans";
    std::vector<std::string> cryptoKeywords{"USDT", "USDC", "BUSD", "BTC", "ETH", "KRW-", "CRYPTO"};
    cds::log::Level logLevel = cds::log::Level::Info;

    std::size_t syncThreads = 4;
    std::int32_t fallbackDays = 730;
    std::uint32_t fetchTimeoutMs = 30000;

    Action action = Action::List;
    std::vector<std::string> datasets{};
    std::string interval = "1d";

    static Config fromArgs(int argc, char** argv);
};

const char* actionToString(Action action) noexcept;

}  // namespace cds::common
