#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "adapters/csv/CsvSeriesStore.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"

using testsupport::bar;
using testsupport::ymd;

namespace {

bool throwsKind(domain::ErrorKind expected, const std::function<void()>& fn) {
    try {
        fn();
    } catch (const domain::PipelineError& ex) {
        return ex.kind() == expected;
    }
    return false;
}

}  // namespace

int main() {
    testsupport::ScopedTempDir dir("cds_store");
    adapters::csv::CsvSeriesStore store(dir.path());
    cds::common::metrics::Registry::instance().reset();

    // Localised headers, BOM, quotes, invalid and duplicate rows.
    testsupport::writeFile(dir.path() / "SAMSUNG.csv",
                           "\xEF\xBB\xBF"
                           "\xEB\x82\xA0\xEC\xA7\x9C,\xEC\x8B\x9C\xEA\xB0\x80,\xEA\xB3\xA0\xEA\xB0\x80,"
                           "\xEC\xA0\x80\xEA\xB0\x80,\xEC\xA2\x85\xEA\xB0\x80,\xEA\xB1\xB0\xEB\x9E\x98\xEB\x9F\x89\n"
                           "2024-01-03,10,12,9,11,100\n"
                           "\"2024-01-02\",\"9\",\"10\",\"8\",\"9.5\",\"\"\n"
                           "2024-01-04,abc,12,9,11,100\n"
                           "not-a-date,10,12,9,11,100\n"
                           "2024-01-03,20,22,19,21,-5\n"
                           "2024-01-05,11,13,10,12,x\n");

    CHECK(store.exists("SAMSUNG"), "expected SAMSUNG to exist");
    const auto report = store.loadReport("SAMSUNG");
    const auto& series = *report.series;
    CHECK(report.droppedRows == 2, "expected 2 dropped rows, got " << report.droppedRows);
    CHECK(series.size() == 3, "expected 3 rows after dedup, got " << series.size());
    CHECK(series[0].date == ymd(2024, 1, 2) && series[0].volume == 0.0, "missing volume should become 0");
    CHECK(series[1].date == ymd(2024, 1, 3) && series[1].close == 21.0, "duplicate date keeps the last row read");
    CHECK(series[1].volume == 0.0, "negative volume should become 0");
    CHECK(series[2].volume == 0.0, "non-numeric volume should become 0");
    CHECK(cds::common::metrics::Registry::instance().counterValue("store.invalid_rows") == 2,
          "invalid rows should be counted");

    // Save and reload with a change notification.
    std::vector<std::pair<std::string, domain::Date>> notifications;
    store.addChangeListener([&notifications](const std::string& id, domain::Date last) {
        notifications.emplace_back(id, last);
    });

    const domain::OhlcvSeries fresh{
        bar(ymd(2024, 2, 1), 1.25, 1.5, 1.0, 1.125, 10.0),
        bar(ymd(2024, 2, 2), 1.125, 2.0, 1.0, 1.75, 0.0),
    };
    store.save("BTCUSDT", fresh);
    CHECK(notifications.size() == 1 && notifications[0].first == "BTCUSDT"
              && notifications[0].second == ymd(2024, 2, 2),
          "save should notify listeners with the last date");
    CHECK(!std::filesystem::exists(dir.path() / "BTCUSDT.csv.tmp"), "temp file must not survive a save");

    std::ifstream saved(dir.path() / "BTCUSDT.csv");
    std::string header;
    std::getline(saved, header);
    CHECK(header == "date,open,high,low,close,volume", "unexpected header " << header);

    const auto reloaded = store.load("BTCUSDT");
    CHECK(reloaded->size() == 2 && (*reloaded)[0].open == 1.25 && (*reloaded)[1].close == 1.75,
          "reloaded series differs from the saved one");

    // Values that need 17 significant digits survive a save.
    const double open = 0.1 + 0.2;
    const double high = 1.0 + 1.0 / 3.0;
    const double close = 2.0 / 3.0;
    const double volume = 123456789.123456789;
    store.save("PRECISE", {bar(ymd(2024, 2, 1), open, high, 0.1, close, volume)});
    const auto precise = store.load("PRECISE");
    CHECK(precise->size() == 1 && (*precise)[0].open == open && (*precise)[0].high == high
              && (*precise)[0].close == close && (*precise)[0].volume == volume,
          "saved doubles must reload bit-exact");

    // Failure kinds.
    CHECK(throwsKind(domain::ErrorKind::DatasetNotFound, [&] { store.load("MISSING"); }),
          "missing file should be DatasetNotFound");
    CHECK(throwsKind(domain::ErrorKind::DatasetNotFound, [&] { store.load("../etc/passwd"); }),
          "path traversal should be DatasetNotFound");
    CHECK(!store.exists("../SAMSUNG"), "exists must reject traversal ids");
    CHECK(throwsKind(domain::ErrorKind::EmptySeries, [&] { store.save("EMPTY", domain::OhlcvSeries{}); }),
          "saving an empty series should be EmptySeries");
    CHECK(notifications.size() == 2, "failed save must not notify");

    testsupport::writeFile(dir.path() / "JUNK.csv", "date,open,high,low,close,volume\nx,y,z,w,v,u\n");
    CHECK(throwsKind(domain::ErrorKind::EmptySeries, [&] { store.load("JUNK"); }),
          "all-invalid file should be EmptySeries");

    testsupport::writeFile(dir.path() / "NOCLOSE.csv", "date,open,high,low\n2024-01-01,1,2,0.5\n");
    CHECK(throwsKind(domain::ErrorKind::EmptySeries, [&] { store.load("NOCLOSE"); }),
          "file without a close column should be EmptySeries");

    const auto fields = adapters::csv::splitCsvLine("\"a,b\", c ,\"say \"\"hi\"\"\"\r");
    CHECK(fields.size() == 3 && fields[0] == "a,b" && fields[1] == "c" && fields[2] == "say \"hi\"",
          "quoted CSV fields not split correctly");

    return 0;
}
