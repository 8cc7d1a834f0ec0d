#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "TestSupport.hpp"
#include "adapters/catalog/DatasetCatalog.hpp"
#include "adapters/csv/CsvSeriesStore.hpp"
#include "api/ChartService.hpp"
#include "app/SyncOrchestrator.h"

using testsupport::ymd;

int main() {
    testsupport::ScopedTempDir dir("cds_orchestrator");
    adapters::csv::CsvSeriesStore store(dir.path());
    const adapters::catalog::DatasetCatalog catalog(
        {"AAAUSDT", "BBBUSDT", "CCCUSDT", "DDDUSDT"},
        {{"AAAUSDT", "AAAUSDT"}, {"BBBUSDT", "BBBUSDT"}, {"CCCUSDT", "CCCUSDT"}},
        "", {"USDT"});

    const auto today = ymd(2024, 3, 1);
    store.save("CCCUSDT", testsupport::makeDaily(ymd(2024, 2, 1), 30));  // through 03-01

    auto fetcher = std::make_shared<testsupport::FakeFetcher>();
    fetcher->setRows("AAAUSDT", testsupport::makeDaily(ymd(2024, 2, 1), 30));
    fetcher->failTicker("BBBUSDT");
    app::FetcherRegistry registry;
    registry.registerFetcher(domain::AssetClass::Crypto, fetcher);

    app::GapFillOptions options;
    options.fallbackDays = 5;
    options.today = [today]() { return today; };
    app::GapFillSynchronizer synchronizer(store, catalog, registry, options);
    app::SyncOrchestrator orchestrator(synchronizer, catalog, 2);

    const auto report = orchestrator.sync({"CCCUSDT", "AAAUSDT", "BBBUSDT"});
    CHECK(report.results.size() == 3, "one result per dataset");
    CHECK(report.results[0].datasetId == "CCCUSDT" && report.results[1].datasetId == "AAAUSDT"
              && report.results[2].datasetId == "BBBUSDT",
          "results must keep the input order");
    CHECK(report.results[0].status == app::SyncStatus::UpToDate, "CCCUSDT is already current");
    CHECK(report.results[1].status == app::SyncStatus::Updated && report.results[1].appended.size() == 6,
          "AAAUSDT should receive the 6-day fallback window");
    CHECK(report.results[2].status == app::SyncStatus::Failed, "BBBUSDT fetch fails");
    CHECK(report.rowsAppended() == 6 && report.anyUpdated(), "aggregate counts wrong");

    const auto json = cds::api::syncReportToJson(report);
    CHECK(json.at("status").as_string() == "updated", "report status should be updated");
    CHECK(json.at("rows_appended").as_uint64() == 6, "report rows_appended should be 6");
    const auto& details = json.at("details").as_object();
    CHECK(details.at("CCCUSDT").as_object().at("status").as_string() == "up_to_date", "CCCUSDT detail");
    CHECK(details.at("AAAUSDT").as_object().at("rows_appended").as_uint64() == 6, "AAAUSDT detail");
    const auto& failed = details.at("BBBUSDT").as_object();
    CHECK(failed.at("status").as_string() == "error", "failed dataset status should be error");
    CHECK(failed.at("error").as_string() == "FetchFailure", "failed dataset error kind");
    CHECK(failed.contains("message"), "failed dataset carries a message");

    // syncAll skips datasets without a ticker and reports no changes now.
    const auto again = orchestrator.syncAll();
    CHECK(again.results.size() == 3, "DDDUSDT has no ticker and is skipped");
    CHECK(!again.anyUpdated() && again.rowsAppended() == 0, "second pass has nothing to append");
    CHECK(cds::api::syncReportToJson(again).at("status").as_string() == "no_changes", "no_changes expected");

    CHECK(orchestrator.sync({}).results.empty(), "empty request yields an empty report");

    // A ticker map entry with no file yet is created by the first syncAll.
    {
        testsupport::ScopedTempDir freshDir("cds_bootstrap");
        adapters::csv::CsvSeriesStore freshStore(freshDir.path());
        testsupport::writeFile(freshDir.path() / "dataset_tickers.json", R"({"NEWUSDT_DAILY": "NEWUSDT"})");

        adapters::catalog::DatasetCatalog::Options catalogOptions;
        catalogOptions.dataDir = freshDir.path();
        catalogOptions.tickerMapPath = freshDir.path() / "dataset_tickers.json";
        const auto freshCatalog = adapters::catalog::DatasetCatalog::load(catalogOptions);
        CHECK(freshCatalog.defaultDatasetId().empty(), "no file means no default yet");

        auto newFetcher = std::make_shared<testsupport::FakeFetcher>();
        newFetcher->setRows("NEWUSDT", testsupport::makeDaily(ymd(2024, 2, 1), 30));
        app::FetcherRegistry freshRegistry;
        freshRegistry.registerFetcher(domain::AssetClass::Crypto, newFetcher);

        app::GapFillSynchronizer freshSync(freshStore, freshCatalog, freshRegistry, options);
        app::SyncOrchestrator freshOrchestrator(freshSync, freshCatalog, 2);
        const auto created = freshOrchestrator.syncAll();
        CHECK(created.results.size() == 1 && created.results[0].datasetId == "NEWUSDT_DAILY",
              "mapped dataset should be visited");
        CHECK(created.results[0].status == app::SyncStatus::Updated && created.rowsAppended() == 6,
              "new dataset should receive the fallback window: " << created.results[0].errorMessage);
        CHECK(freshStore.exists("NEWUSDT_DAILY") && freshStore.load("NEWUSDT_DAILY")->size() == 6,
              "sync should create the dataset file");
        CHECK(newFetcher->calls() == 1, "one fetch expected");
    }

    return 0;
}
