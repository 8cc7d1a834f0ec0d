#include <iostream>
#include <memory>
#include <string>

#include <boost/json.hpp>

#include "TestSupport.hpp"
#include "adapters/catalog/DatasetCatalog.hpp"
#include "adapters/csv/CsvSeriesStore.hpp"
#include "api/ChartService.hpp"
#include "app/SyncOrchestrator.h"

using testsupport::ymd;

int main() {
    testsupport::ScopedTempDir dir("cds_e2e");
    adapters::csv::CsvSeriesStore store(dir.path());

    // 100 full Monday-Friday weeks starting Monday 2022-01-03.
    const auto history = testsupport::makeDaily(ymd(2022, 1, 3), 500, true);
    store.save("BTCUSDT_DAILY", history);
    testsupport::writeFile(dir.path() / "dataset_tickers.json", R"({"BTCUSDT_DAILY": "BTCUSDT"})");

    adapters::catalog::DatasetCatalog::Options catalogOptions;
    catalogOptions.dataDir = dir.path();
    catalogOptions.tickerMapPath = dir.path() / "dataset_tickers.json";
    const auto catalog = adapters::catalog::DatasetCatalog::load(catalogOptions);

    app::ChartPayloadBuilder builder(store, catalog);
    cds::api::ChartService service(store, catalog, builder);

    const auto before = builder.build("BTCUSDT_DAILY", "1w");
    CHECK(before->candles->size() == 100, "expected 100 weekly candles, got " << before->candles->size());
    CHECK(before->candles->back().date == domain::addDays(history.back().date, 2), "last week ends on Sunday");
    CHECK(before->rsi.size() <= before->candles->size() && before->obv.size() <= before->candles->size(),
          "indicator lines never exceed the candle count");

    // Next Friday: the fetcher has the following week of business days.
    const auto today = domain::addDays(history.back().date, 7);
    auto fetcher = std::make_shared<testsupport::FakeFetcher>();
    fetcher->setRows("BTCUSDT", testsupport::makeDaily(ymd(2022, 1, 3), 505, true));
    app::FetcherRegistry registry;
    registry.registerFetcher(domain::AssetClass::Crypto, fetcher);

    app::GapFillOptions syncOptions;
    syncOptions.today = [today]() { return today; };
    app::GapFillSynchronizer synchronizer(store, catalog, registry, syncOptions);
    app::SyncOrchestrator orchestrator(synchronizer, catalog, 4);

    const auto report = orchestrator.syncAll();
    CHECK(report.results.size() == 1 && report.results[0].status == app::SyncStatus::Updated, "sync should update");
    CHECK(report.rowsAppended() == 5, "one more business week expected, got " << report.rowsAppended());
    CHECK(store.load("BTCUSDT_DAILY")->size() == 505, "store should hold 505 daily rows");

    const auto after = builder.build("BTCUSDT_DAILY", "1w");
    CHECK(after != before, "sync should invalidate the cached weekly payload");
    CHECK(after->candles->size() == 101, "expected 101 weekly candles after sync");

    const auto response = service.handlePayload("", "1w");
    CHECK(response.statusCode == 200, "default payload should succeed: " << response.body);
    const auto json = boost::json::parse(response.body).as_object();
    CHECK(json.at("dataset").as_string() == "BTCUSDT_DAILY", "only dataset is the default");
    CHECK(json.at("candles").as_array().size() == 101, "serialized candles should match");

    CHECK(orchestrator.syncAll().rowsAppended() == 0, "second sync is a no-op");

    return 0;
}
