#pragma once

#include <map>
#include <memory>

#include "domain/Ports.hpp"

namespace app {

// Fetcher per asset class. Filled at startup, read-only afterwards.
class FetcherRegistry {
public:
    void registerFetcher(domain::AssetClass assetClass, std::shared_ptr<domain::IFetcher> fetcher) {
        fetchers_[assetClass] = std::move(fetcher);
    }

    std::shared_ptr<domain::IFetcher> find(domain::AssetClass assetClass) const {
        const auto it = fetchers_.find(assetClass);
        return it == fetchers_.end() ? nullptr : it->second;
    }

private:
    std::map<domain::AssetClass, std::shared_ptr<domain::IFetcher>> fetchers_;
};

}  // namespace app
