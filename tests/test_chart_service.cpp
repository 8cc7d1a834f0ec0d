#include <iostream>
#include <string>

#include <boost/json.hpp>

#include "TestSupport.hpp"
#include "adapters/catalog/DatasetCatalog.hpp"
#include "adapters/csv/CsvSeriesStore.hpp"
#include "api/ChartService.hpp"

using testsupport::ymd;

int main() {
    testsupport::ScopedTempDir dir("cds_service");
    adapters::csv::CsvSeriesStore store(dir.path());
    store.save("ETHUSDT_2Y_OHLCV_Trans", testsupport::makeDaily(ymd(2024, 1, 1), 90));
    store.save("SAMSUNG_1Y", testsupport::makeDaily(ymd(2023, 6, 1), 60));
    testsupport::writeFile(dir.path() / "JUNK.csv", "a,b,c\n1,2,3\n");

    adapters::catalog::DatasetCatalog::Options options;
    options.dataDir = dir.path();
    const auto catalog = adapters::catalog::DatasetCatalog::load(options);
    app::ChartPayloadBuilder builder(store, catalog);
    cds::api::ChartService service(store, catalog, builder);

    // Listing
    const auto datasets = service.listDatasets();
    CHECK(datasets.size() == 2, "unreadable JUNK should be skipped, got " << datasets.size());
    const auto& eth = datasets[0].as_object();
    CHECK(eth.at("id").as_string() == "ETHUSDT_2Y_OHLCV_Trans", "datasets sorted by id");
    CHECK(eth.at("label").as_string() == "ETHUSDT 2Y OHLCV Trans", "label replaces underscores");
    CHECK(eth.at("rows").as_uint64() == 90, "row count");
    CHECK(eth.at("range").as_string() == "2024-01-01 ~ 2024-03-30", "range " << eth.at("range"));
    CHECK(eth.at("default").as_bool(), "ETHUSDT is the default dataset");
    CHECK(!datasets[1].as_object().at("default").as_bool(), "SAMSUNG is not the default");

    const auto listed = service.handleList();
    CHECK(listed.statusCode == 200, "list should succeed");
    CHECK(boost::json::parse(listed.body).at("datasets").as_array().size() == 2, "list body shape");

    // Crypto payload times are Unix seconds.
    const auto crypto = service.handlePayload("ETHUSDT_2Y_OHLCV_Trans", "1d");
    CHECK(crypto.statusCode == 200, "crypto payload should succeed: " << crypto.body);
    CHECK(crypto.contentType.find("application/json") == 0, "JSON content type expected");
    const auto cryptoJson = boost::json::parse(crypto.body).as_object();
    CHECK(cryptoJson.at("type").as_string() == "crypto", "type should be crypto");
    CHECK(cryptoJson.at("interval").as_string() == "1d", "interval echoed");
    const auto& firstCandle = cryptoJson.at("candles").as_array().at(0).as_object();
    CHECK(firstCandle.at("time").is_int64() && firstCandle.at("time").as_int64() == 1704067200,
          "crypto time should be 1704067200");
    CHECK(cryptoJson.at("candles").as_array().size() == 90, "candle count");
    CHECK(cryptoJson.at("volumes").as_array().at(0).as_object().contains("color"), "volume colour present");
    CHECK(cryptoJson.at("rsi").as_array().size() <= 90, "RSI not longer than candles");
    CHECK(cryptoJson.at("cloud").as_array().size() == 90 - 77, "cloud rows");
    const auto& cloudRow = cryptoJson.at("cloud").as_array().at(0).as_object();
    CHECK(cloudRow.contains("spanA") && cloudRow.contains("bullish") && cloudRow.contains("color"), "cloud row shape");

    // Stock payload times are calendar objects.
    const auto stock = service.handlePayload("SAMSUNG_1Y", "3d");
    CHECK(stock.statusCode == 200, "stock payload should succeed: " << stock.body);
    const auto stockJson = boost::json::parse(stock.body).as_object();
    CHECK(stockJson.at("type").as_string() == "stock", "type should be stock");
    const auto& stockTime = stockJson.at("candles").as_array().at(0).as_object().at("time").as_object();
    CHECK(stockTime.at("year").as_int64() == 2023 && stockTime.at("month").as_int64() == 6
              && stockTime.at("day").as_int64() == 3,
          "first 3-day bucket of SAMSUNG ends 2023-06-03");
    CHECK(stockJson.at("candles").as_array().size() == 20, "60 daily bars make 20 3-day bars");

    // Errors
    const auto missing = service.handlePayload("NOPE", "1d");
    CHECK(missing.statusCode == 404, "unknown dataset should be 404");
    CHECK(boost::json::parse(missing.body).at("error").as_string() == "DatasetNotFound", missing.body);

    const auto badInterval = service.handlePayload("ETHUSDT_2Y_OHLCV_Trans", "2d");
    CHECK(badInterval.statusCode == 400, "unsupported interval should be 400");
    CHECK(boost::json::parse(badInterval.body).at("error").as_string() == "UnsupportedInterval", badInterval.body);

    const auto defaulted = service.getPayload("", "1w");
    CHECK(defaulted.at("dataset").as_string() == "ETHUSDT_2Y_OHLCV_Trans", "empty id uses the default dataset");

    CHECK(cds::api::statusForError(domain::ErrorKind::EmptySeries) == 500, "other kinds map to 500");

    // Stats
    const auto stats = service.handleStats();
    const auto statsJson = boost::json::parse(stats.body).as_object();
    CHECK(statsJson.at("cached_payloads").as_int64() == 3, "three payloads cached");
    CHECK(statsJson.at("counters").as_object().contains("payload.cache_miss"), "cache miss counter reported");
    CHECK(statsJson.at("timers").as_object().contains("payload.build"), "build timer reported");
    CHECK(statsJson.at("gauges").as_object().at("catalog.datasets").as_double() == 3.0,
          "catalog gauge counts every csv file");

    return 0;
}
