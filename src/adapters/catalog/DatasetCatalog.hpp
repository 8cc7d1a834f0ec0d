#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/Ports.hpp"

namespace adapters::catalog {

// Immutable id -> (ticker, asset class) lookup. Built once at startup from the
// `*.csv` files of the data directory and the ticker map file. A mapped id
// with no file is still an entry so that the first sync can create it.
class DatasetCatalog : public domain::IDatasetCatalog {
public:
    struct Options {
        std::filesystem::path dataDir;
        std::filesystem::path tickerMapPath;
        std::string preferredDefault = "ETHUSDT_2Y_OHLCV_Trans";
        std::vector<std::string> cryptoKeywords{"USDT", "USDC", "BUSD", "BTC", "ETH", "KRW-", "CRYPTO"};
    };

    DatasetCatalog(std::vector<std::string> datasetIds,
                   std::map<std::string, std::string> tickers,
                   std::string preferredDefault,
                   std::vector<std::string> cryptoKeywords);

    static DatasetCatalog load(const Options& options);

    std::optional<domain::DatasetInfo> resolve(const std::string& datasetId) const override;
    std::vector<domain::DatasetInfo> list() const override;
    std::string defaultDatasetId() const override;

    domain::AssetClass classify(const std::string& datasetId) const override;

private:
    std::map<std::string, domain::DatasetInfo> entries_;
    std::string defaultId_;
    std::vector<std::string> cryptoKeywords_;
};

// Reads `{ "<datasetId>": "<ticker>" }`. A missing file yields an empty map.
std::map<std::string, std::string> readTickerMap(const std::filesystem::path& path);

std::vector<std::string> scanDatasetIds(const std::filesystem::path& dataDir);

}  // namespace adapters::catalog
