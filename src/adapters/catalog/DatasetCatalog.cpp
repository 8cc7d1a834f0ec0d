#include "adapters/catalog/DatasetCatalog.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <boost/json.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace adapters::catalog {

namespace {

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

}  // namespace

std::map<std::string, std::string> readTickerMap(const std::filesystem::path& path) {
    std::map<std::string, std::string> tickers;

    std::error_code ec;
    if (path.empty() || !std::filesystem::is_regular_file(path, ec)) {
        LOG_INFO("No ticker map at " << path.string() << "; sync disabled for all datasets");
        return tickers;
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Could not open ticker map " + path.string());
    }
    const std::string content{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};

    boost::json::value json;
    try {
        json = boost::json::parse(content);
    } catch (const std::exception& ex) {
        throw std::runtime_error("Invalid ticker map " + path.string() + ": " + ex.what());
    }
    if (!json.is_object()) {
        throw std::runtime_error("Ticker map " + path.string() + " must be a JSON object");
    }

    for (const auto& entry : json.as_object()) {
        if (!entry.value().is_string()) {
            LOG_WARN("Ticker map entry '" << std::string(entry.key()) << "' is not a string, skipped");
            continue;
        }
        std::string ticker{entry.value().as_string().c_str()};
        if (ticker.empty()) {
            continue;
        }
        tickers.emplace(std::string(entry.key()), std::move(ticker));
    }
    return tickers;
}

std::vector<std::string> scanDatasetIds(const std::filesystem::path& dataDir) {
    std::vector<std::string> ids;

    std::error_code ec;
    if (!std::filesystem::is_directory(dataDir, ec)) {
        LOG_WARN("Data directory " << dataDir.string() << " does not exist");
        return ids;
    }

    for (const auto& entry : std::filesystem::directory_iterator(dataDir, ec)) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != ".csv") {
            continue;
        }
        ids.push_back(entry.path().stem().string());
    }
    if (ec) {
        LOG_WARN("Directory iteration error in " << dataDir.string() << ": " << ec.message());
    }

    std::sort(ids.begin(), ids.end());
    return ids;
}

DatasetCatalog::DatasetCatalog(std::vector<std::string> datasetIds,
                               std::map<std::string, std::string> tickers,
                               std::string preferredDefault,
                               std::vector<std::string> cryptoKeywords)
    : cryptoKeywords_(std::move(cryptoKeywords)) {
    for (auto& keyword : cryptoKeywords_) {
        keyword = toUpper(std::move(keyword));
    }

    std::sort(datasetIds.begin(), datasetIds.end());
    for (const auto& id : datasetIds) {
        domain::DatasetInfo info;
        info.id = id;
        info.assetClass = classify(id);
        entries_.emplace(id, std::move(info));
    }

    // Mapped ids without a file yet are synced from scratch.
    for (auto& [id, ticker] : tickers) {
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            domain::DatasetInfo info;
            info.id = id;
            info.assetClass = classify(id);
            it = entries_.emplace(id, std::move(info)).first;
        }
        it->second.ticker = std::move(ticker);
    }

    // The default must be backed by a file.
    if (std::binary_search(datasetIds.begin(), datasetIds.end(), preferredDefault)) {
        defaultId_ = std::move(preferredDefault);
    }
    else if (!datasetIds.empty()) {
        defaultId_ = datasetIds.front();
    }
}

DatasetCatalog DatasetCatalog::load(const Options& options) {
    auto ids = scanDatasetIds(options.dataDir);
    auto tickers = readTickerMap(options.tickerMapPath);
    DatasetCatalog catalog(std::move(ids), std::move(tickers), options.preferredDefault, options.cryptoKeywords);
    cds::common::metrics::Registry::instance().setGauge("catalog.datasets",
                                                        static_cast<double>(catalog.entries_.size()));
    LOG_INFO("Catalog: " << catalog.entries_.size() << " datasets, default '" << catalog.defaultId_ << "'");
    return catalog;
}

std::optional<domain::DatasetInfo> DatasetCatalog::resolve(const std::string& datasetId) const {
    const auto it = entries_.find(datasetId);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<domain::DatasetInfo> DatasetCatalog::list() const {
    std::vector<domain::DatasetInfo> result;
    result.reserve(entries_.size());
    for (const auto& [id, info] : entries_) {
        result.push_back(info);
    }
    return result;
}

std::string DatasetCatalog::defaultDatasetId() const {
    return defaultId_;
}

domain::AssetClass DatasetCatalog::classify(const std::string& datasetId) const {
    const auto upper = toUpper(datasetId);
    for (const auto& keyword : cryptoKeywords_) {
        if (!keyword.empty() && upper.find(keyword) != std::string::npos) {
            return domain::AssetClass::Crypto;
        }
    }
    return domain::AssetClass::Stock;
}

}  // namespace adapters::catalog
