#pragma once

#include "domain/Ports.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace adapters::csv {

// One `<id>.csv` file per dataset under a data directory.
class CsvSeriesStore : public domain::ISeriesStore {
public:
    explicit CsvSeriesStore(std::filesystem::path dataDir);

    bool exists(const std::string& datasetId) const override;
    domain::LoadReport loadReport(const std::string& datasetId) const override;
    void save(const std::string& datasetId, const domain::OhlcvSeries& series) override;
    void addChangeListener(ChangeListener listener) override;

    std::filesystem::path pathFor(const std::string& datasetId) const;
    const std::filesystem::path& dataDir() const noexcept { return dataDir_; }

private:
    void notifyChanged(const std::string& datasetId, domain::Date lastDate) const;

    std::filesystem::path dataDir_;
    mutable std::mutex listenersMutex_;
    std::vector<ChangeListener> listeners_;
};

// Parses one CSV record, honouring double-quoted fields.
std::vector<std::string> splitCsvLine(const std::string& line);

}  // namespace adapters::csv
