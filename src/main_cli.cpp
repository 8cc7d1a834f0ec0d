#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "adapters/binance/BinanceDailyFetcher.hpp"
#include "adapters/catalog/DatasetCatalog.hpp"
#include "adapters/csv/CsvSeriesStore.hpp"
#include "api/ChartService.hpp"
#include "app/ChartPayloadBuilder.hpp"
#include "app/FetcherRegistry.hpp"
#include "app/GapFillSynchronizer.hpp"
#include "app/SyncOrchestrator.h"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "http/HttpJson.hpp"

namespace {

std::string joinList(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (joined.empty()) {
            joined = value;
        } else {
            joined.append(",").append(value);
        }
    }
    return joined;
}

int emit(const cds::api::Response& response) {
    std::cout << response.body << std::endl;
    return response.statusCode < 400 ? EXIT_SUCCESS : EXIT_FAILURE;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
        }
        std::_Exit(1);
    });

    // stdout carries the JSON result.
    cds::log::setOutput(cds::log::Output::Stderr);

    try {
        auto config = cds::common::Config::fromArgs(argc, argv);
        cds::log::setLevel(config.logLevel);

        LOG_INFO("Configuration loaded");
        LOG_INFO("  Action: " << cds::common::actionToString(config.action));
        LOG_INFO("  Data dir: " << config.dataDir);
        LOG_INFO("  Ticker map: " << config.tickerMapPath);
        LOG_INFO("  Log level: " << cds::log::levelToString(config.logLevel));
        LOG_INFO("  Sync threads: " << config.syncThreads << " fallback_days=" << config.fallbackDays
                                    << " fetch_timeout=" << config.fetchTimeoutMs << " ms");
        LOG_INFO("  Crypto keywords: " << joinList(config.cryptoKeywords));

        adapters::catalog::DatasetCatalog::Options catalogOptions;
        catalogOptions.dataDir = config.dataDir;
        catalogOptions.tickerMapPath = config.tickerMapPath;
        catalogOptions.preferredDefault = config.defaultDatasetId;
        catalogOptions.cryptoKeywords = config.cryptoKeywords;
        const auto catalog = adapters::catalog::DatasetCatalog::load(catalogOptions);

        adapters::csv::CsvSeriesStore store(config.dataDir);
        app::ChartPayloadBuilder builder(store, catalog);
        cds::api::ChartService service(store, catalog, builder);

        switch (config.action) {
        case cds::common::Action::List:
            return emit(service.handleList());

        case cds::common::Action::Payload: {
            const auto datasetId = config.datasets.empty() ? std::string{} : config.datasets.front();
            return emit(service.handlePayload(datasetId, config.interval));
        }

        case cds::common::Action::Sync: {
            app::FetcherRegistry fetchers;
            fetchers.registerFetcher(domain::AssetClass::Crypto,
                                     std::make_shared<adapters::binance::BinanceDailyFetcher>());

            app::GapFillOptions syncOptions;
            syncOptions.fallbackDays = config.fallbackDays;
            syncOptions.fetchTimeout = std::chrono::milliseconds(config.fetchTimeoutMs);
            app::GapFillSynchronizer synchronizer(store, catalog, fetchers, syncOptions);
            app::SyncOrchestrator orchestrator(synchronizer, catalog, config.syncThreads);

            const auto report = config.datasets.empty() ? orchestrator.syncAll()
                                                        : orchestrator.sync(config.datasets);
            std::cout << cds::http::serialize_json(cds::api::syncReportToJson(report)) << std::endl;
            LOG_DEBUG("Stats: " << service.handleStats().body);

            for (const auto& result : report.results) {
                if (result.status == app::SyncStatus::Failed) {
                    return EXIT_FAILURE;
                }
            }
            return EXIT_SUCCESS;
        }
        }
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal error: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
