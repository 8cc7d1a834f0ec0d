#pragma once

#include <string>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include "api/Response.hpp"
#include "app/ChartPayloadBuilder.hpp"
#include "app/SyncOrchestrator.h"
#include "domain/Errors.hpp"
#include "domain/Ports.hpp"

namespace cds::api {

// JSON contract consumed by the chart front end.
class ChartService {
public:
    ChartService(const domain::ISeriesStore& store,
                 const domain::IDatasetCatalog& catalog,
                 app::ChartPayloadBuilder& builder);

    // [{id, label, rows, range, default}] sorted by id. Unreadable datasets
    // are skipped.
    boost::json::array listDatasets() const;

    // Empty datasetId selects the default dataset. Throws domain::PipelineError.
    boost::json::object getPayload(const std::string& datasetId, const std::string& interval);

    Response handleList() const;
    Response handlePayload(const std::string& datasetId, const std::string& interval);
    Response handleStats() const;

private:
    const domain::ISeriesStore& store_;
    const domain::IDatasetCatalog& catalog_;
    app::ChartPayloadBuilder& builder_;
};

boost::json::object payloadToJson(const app::ChartPayload& payload);
boost::json::object syncReportToJson(const app::SyncReport& report);

int statusForError(domain::ErrorKind kind) noexcept;

}  // namespace cds::api
