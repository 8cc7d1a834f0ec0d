#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/Models.hpp"

namespace domain {

// Remote source of daily bars. May return rows outside [start, end]; callers
// filter. Failures are reported by throwing.
class IFetcher {
public:
    virtual ~IFetcher() = default;

    virtual std::vector<Bar> fetchRange(const std::string& ticker, Date start, Date end) = 0;
};

struct LoadReport {
    SeriesPtr series;
    std::size_t droppedRows{0};
};

class ISeriesStore {
public:
    using ChangeListener = std::function<void(const std::string& datasetId, Date lastDate)>;

    virtual ~ISeriesStore() = default;

    virtual bool exists(const std::string& datasetId) const = 0;
    virtual LoadReport loadReport(const std::string& datasetId) const = 0;
    virtual void save(const std::string& datasetId, const OhlcvSeries& series) = 0;
    virtual void addChangeListener(ChangeListener listener) = 0;

    SeriesPtr load(const std::string& datasetId) const {
        return loadReport(datasetId).series;
    }
};

class IDatasetCatalog {
public:
    virtual ~IDatasetCatalog() = default;

    virtual std::optional<DatasetInfo> resolve(const std::string& datasetId) const = 0;
    virtual std::vector<DatasetInfo> list() const = 0;
    virtual std::string defaultDatasetId() const = 0;

    // Asset class by keyword match on the id. Valid for ids not in the catalog.
    virtual AssetClass classify(const std::string& datasetId) const = 0;
};

}  // namespace domain
