#include "api/ChartService.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "http/HttpJson.hpp"

namespace cds::api {

namespace {

boost::json::value encodeTime(domain::Date date, domain::AssetClass assetClass) {
    if (assetClass == domain::AssetClass::Crypto) {
        return boost::json::value(domain::toUnixSeconds(date));
    }
    const auto ymd = domain::toYmd(date);
    boost::json::object time;
    time["year"] = ymd.year;
    time["month"] = ymd.month;
    time["day"] = ymd.day;
    return time;
}

// JSON has no NaN or infinity.
boost::json::value sanitize_value(double value) {
    if (!std::isfinite(value)) {
        return nullptr;
    }
    return value;
}

boost::json::array lineToJson(const std::vector<indicators::DatedValue>& points, domain::AssetClass assetClass) {
    boost::json::array items;
    items.reserve(points.size());
    for (const auto& point : points) {
        boost::json::object row;
        row["time"] = encodeTime(point.date, assetClass);
        row["value"] = sanitize_value(point.value);
        items.emplace_back(std::move(row));
    }
    return items;
}

}  // namespace

int statusForError(domain::ErrorKind kind) noexcept {
    switch (kind) {
    case domain::ErrorKind::UnsupportedInterval:
        return 400;
    case domain::ErrorKind::DatasetNotFound:
        return 404;
    default:
        break;
    }
    return 500;
}

boost::json::object payloadToJson(const app::ChartPayload& payload) {
    const auto assetClass = payload.assetClass;

    boost::json::array candles;
    if (payload.candles) {
        candles.reserve(payload.candles->size());
        for (const auto& bar : *payload.candles) {
            boost::json::object row;
            row["time"] = encodeTime(bar.date, assetClass);
            row["open"] = sanitize_value(bar.open);
            row["high"] = sanitize_value(bar.high);
            row["low"] = sanitize_value(bar.low);
            row["close"] = sanitize_value(bar.close);
            candles.emplace_back(std::move(row));
        }
    }

    boost::json::array volumes;
    volumes.reserve(payload.volumes.size());
    for (const auto& volume : payload.volumes) {
        boost::json::object row;
        row["time"] = encodeTime(volume.date, assetClass);
        row["value"] = sanitize_value(volume.value);
        row["color"] = volume.color();
        volumes.emplace_back(std::move(row));
    }

    boost::json::array cloud;
    cloud.reserve(payload.cloud.size());
    for (const auto& point : payload.cloud) {
        boost::json::object row;
        row["time"] = encodeTime(point.date, assetClass);
        row["spanA"] = point.spanA;
        row["spanB"] = point.spanB;
        row["top"] = point.top;
        row["bottom"] = point.bottom;
        row["bullish"] = point.bullish;
        row["color"] = point.color();
        cloud.emplace_back(std::move(row));
    }

    boost::json::object json;
    json["type"] = domain::assetClassToString(assetClass);
    json["dataset"] = payload.datasetId;
    json["interval"] = domain::intervalToString(payload.interval);
    json["candles"] = std::move(candles);
    json["volumes"] = std::move(volumes);
    json["rsi"] = lineToJson(payload.rsi, assetClass);
    json["obv"] = lineToJson(payload.obv, assetClass);
    json["ad"] = lineToJson(payload.ad, assetClass);
    json["cloud"] = std::move(cloud);
    return json;
}

boost::json::object syncReportToJson(const app::SyncReport& report) {
    boost::json::object details;
    for (const auto& result : report.results) {
        boost::json::object entry;
        entry["status"] = app::syncStatusToString(result.status);
        entry["rows_appended"] = static_cast<std::uint64_t>(result.appended.size());
        if (result.status == app::SyncStatus::Failed) {
            entry["error"] = result.errorKind ? domain::errorKindToString(*result.errorKind) : "InternalError";
            entry["message"] = result.errorMessage;
        }
        details[result.datasetId] = std::move(entry);
    }

    boost::json::object json;
    json["status"] = report.anyUpdated() ? "updated" : "no_changes";
    json["rows_appended"] = static_cast<std::uint64_t>(report.rowsAppended());
    json["details"] = std::move(details);
    return json;
}

ChartService::ChartService(const domain::ISeriesStore& store,
                           const domain::IDatasetCatalog& catalog,
                           app::ChartPayloadBuilder& builder)
    : store_(store),
      catalog_(catalog),
      builder_(builder) {}

boost::json::array ChartService::listDatasets() const {
    const auto defaultId = catalog_.defaultDatasetId();

    boost::json::array items;
    for (const auto& info : catalog_.list()) {
        if (!store_.exists(info.id)) {
            continue;  // mapped, not synced yet
        }
        domain::SeriesPtr series;
        try {
            series = store_.load(info.id);
        } catch (const std::exception& ex) {
            LOG_WARN("Skipping dataset " << info.id << ": " << ex.what());
            continue;
        }

        std::string label = info.id;
        std::replace(label.begin(), label.end(), '_', ' ');

        boost::json::object row;
        row["id"] = info.id;
        row["label"] = label;
        row["rows"] = static_cast<std::uint64_t>(series->size());
        row["range"] = domain::formatDate(series->front().date) + " ~ " + domain::formatDate(series->back().date);
        row["default"] = info.id == defaultId;
        items.emplace_back(std::move(row));
    }
    return items;
}

boost::json::object ChartService::getPayload(const std::string& datasetId, const std::string& interval) {
    const auto resolvedId = datasetId.empty() ? catalog_.defaultDatasetId() : datasetId;
    if (resolvedId.empty()) {
        throw domain::PipelineError(domain::ErrorKind::DatasetNotFound, "no datasets available");
    }
    const auto payload = builder_.build(resolvedId, interval);
    return payloadToJson(*payload);
}

Response ChartService::handleList() const {
    Response response{};
    boost::json::object payload;
    payload["datasets"] = listDatasets();
    cds::http::write_json(response, payload);
    return response;
}

Response ChartService::handlePayload(const std::string& datasetId, const std::string& interval) {
    Response response{};
    try {
        cds::http::write_json(response, getPayload(datasetId, interval));
    } catch (const domain::PipelineError& ex) {
        LOG_WARN("Payload " << datasetId << "/" << interval << " failed: " << ex.what());
        cds::http::json_error(response, statusForError(ex.kind()), domain::errorKindToString(ex.kind()));
    } catch (const std::exception& ex) {
        LOG_ERR("Payload " << datasetId << "/" << interval << " failed: " << ex.what());
        cds::http::json_error(response, 500, "InternalError");
    }
    return response;
}

Response ChartService::handleStats() const {
    const auto snapshot = cds::common::metrics::Registry::instance().snapshot();
    const auto uptimeSeconds =
        std::chrono::duration_cast<std::chrono::duration<double>>(snapshot.capturedAt - snapshot.startTime).count();

    boost::json::object counters;
    for (const auto& [key, value] : snapshot.counters) {
        counters[key] = value;
    }

    boost::json::object timers;
    for (const auto& [key, timer] : snapshot.timers) {
        boost::json::object entry;
        entry["samples"] = timer.samples;
        entry["last_ms"] = timer.lastMs ? boost::json::value(*timer.lastMs) : boost::json::value(nullptr);
        entry["p95_ms"] = timer.p95Ms ? boost::json::value(*timer.p95Ms) : boost::json::value(nullptr);
        entry["p99_ms"] = timer.p99Ms ? boost::json::value(*timer.p99Ms) : boost::json::value(nullptr);
        timers[key] = std::move(entry);
    }

    boost::json::object gauges;
    for (const auto& [key, gauge] : snapshot.gauges) {
        gauges[key] = gauge.value;
    }

    boost::json::object payload;
    payload["uptime_seconds"] = uptimeSeconds;
    payload["cached_payloads"] = static_cast<std::uint64_t>(builder_.cachedEntries());
    payload["counters"] = std::move(counters);
    payload["timers"] = std::move(timers);
    payload["gauges"] = std::move(gauges);

    Response response{};
    cds::http::write_json(response, payload);
    return response;
}

}  // namespace cds::api
