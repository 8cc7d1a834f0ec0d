#include "adapters/csv/CsvSeriesStore.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"

namespace adapters::csv {

namespace {

constexpr const char* kExtension = ".csv";
constexpr const char* kTempSuffix = ".tmp";
constexpr const char* kHeader = "date,open,high,low,close,volume";
constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

enum Field : std::size_t { kDate = 0, kOpen, kHigh, kLow, kClose, kVolume, kFieldCount };

const std::array<std::vector<std::string>, kFieldCount>& fieldAliases() {
    static const std::array<std::vector<std::string>, kFieldCount> aliases{{
        {"date", "Date", "DATE", "timestamp", "날짜", "일자"},
        {"open", "Open", "OPEN", "시가"},
        {"high", "High", "HIGH", "고가"},
        {"low", "Low", "LOW", "저가"},
        {"close", "Close", "CLOSE", "종가"},
        {"volume", "Volume", "VOLUME", "거래량"},
    }};
    return aliases;
}

const char* fieldName(std::size_t field) {
    static constexpr const char* kNames[] = {"date", "open", "high", "low", "close", "volume"};
    return kNames[field];
}

std::string trimField(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

// Column index per canonical field, resolved once from the header.
using ColumnMap = std::array<std::optional<std::size_t>, kFieldCount>;

ColumnMap resolveColumns(const std::vector<std::string>& header) {
    ColumnMap columns{};
    const auto& aliases = fieldAliases();
    for (std::size_t field = 0; field < kFieldCount; ++field) {
        for (const auto& alias : aliases[field]) {
            const auto it = std::find(header.begin(), header.end(), alias);
            if (it != header.end()) {
                columns[field] = static_cast<std::size_t>(std::distance(header.begin(), it));
                break;
            }
        }
    }
    return columns;
}

std::optional<double> parseNumber(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> fieldNumber(const std::vector<std::string>& row,
                                  const std::optional<std::size_t>& column) {
    if (!column.has_value() || *column >= row.size()) {
        return std::nullopt;
    }
    return parseNumber(row[*column]);
}

bool validDatasetId(const std::string& datasetId) {
    if (datasetId.empty()) {
        return false;
    }
    if (datasetId.find('/') != std::string::npos || datasetId.find('\\') != std::string::npos) {
        return false;
    }
    return datasetId.find("..") == std::string::npos;
}

}  // namespace

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool inQuotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (inQuotes) {
            if (ch == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                }
                else {
                    inQuotes = false;
                }
            }
            else {
                current.push_back(ch);
            }
            continue;
        }

        if (ch == '"') {
            inQuotes = true;
        }
        else if (ch == ',') {
            fields.push_back(trimField(std::move(current)));
            current.clear();
        }
        else if (ch != '\r') {
            current.push_back(ch);
        }
    }
    fields.push_back(trimField(std::move(current)));
    return fields;
}

CsvSeriesStore::CsvSeriesStore(std::filesystem::path dataDir)
    : dataDir_(std::move(dataDir)) {}

std::filesystem::path CsvSeriesStore::pathFor(const std::string& datasetId) const {
    if (!validDatasetId(datasetId)) {
        throw domain::PipelineError(domain::ErrorKind::DatasetNotFound,
                                    "invalid dataset id '" + datasetId + "'");
    }
    return dataDir_ / (datasetId + kExtension);
}

bool CsvSeriesStore::exists(const std::string& datasetId) const {
    if (!validDatasetId(datasetId)) {
        return false;
    }
    std::error_code ec;
    const auto path = pathFor(datasetId);
    return std::filesystem::is_regular_file(path, ec);
}

domain::LoadReport CsvSeriesStore::loadReport(const std::string& datasetId) const {
    const auto path = pathFor(datasetId);

    std::ifstream input(path);
    if (!input) {
        throw domain::PipelineError(domain::ErrorKind::DatasetNotFound, datasetId);
    }

    std::string line;
    if (!std::getline(input, line)) {
        throw domain::PipelineError(domain::ErrorKind::EmptySeries, datasetId + " has no header");
    }
    if (line.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
        line.erase(0, kUtf8Bom.size());
    }

    const auto columns = resolveColumns(splitCsvLine(line));
    for (std::size_t field = kDate; field <= kClose; ++field) {
        if (!columns[field].has_value()) {
            throw domain::PipelineError(domain::ErrorKind::EmptySeries,
                                        datasetId + " lacks a '" + fieldName(field) + "' column");
        }
    }

    domain::OhlcvSeries bars;
    std::size_t dropped = 0;
    while (std::getline(input, line)) {
        if (line.empty() || line == "\r") {
            continue;
        }
        const auto row = splitCsvLine(line);

        std::optional<domain::Date> date;
        if (*columns[kDate] < row.size()) {
            date = domain::parseDate(row[*columns[kDate]]);
        }
        const auto open = fieldNumber(row, columns[kOpen]);
        const auto high = fieldNumber(row, columns[kHigh]);
        const auto low = fieldNumber(row, columns[kLow]);
        const auto close = fieldNumber(row, columns[kClose]);
        if (!date || !open || !high || !low || !close) {
            ++dropped;
            continue;
        }

        const auto volume = fieldNumber(row, columns[kVolume]);
        bars.push_back(domain::Bar{*date, *open, *high, *low, *close,
                                   volume.has_value() && *volume >= 0.0 ? *volume : 0.0});
    }

    if (dropped > 0) {
        cds::common::metrics::Registry::instance().incrementCounter("store.invalid_rows", dropped);
        LOG_WARN("Dropped " << dropped << " invalid rows from " << path.string());
    }

    domain::sortAndDedupKeepLast(bars);
    if (bars.empty()) {
        throw domain::PipelineError(domain::ErrorKind::EmptySeries, datasetId);
    }

    LOG_DEBUG("Loaded " << datasetId << " rows=" << bars.size() << " last="
                        << domain::formatDate(bars.back().date));

    domain::LoadReport report;
    report.series = std::make_shared<const domain::OhlcvSeries>(std::move(bars));
    report.droppedRows = dropped;
    return report;
}

void CsvSeriesStore::save(const std::string& datasetId, const domain::OhlcvSeries& series) {
    if (series.empty()) {
        throw domain::PipelineError(domain::ErrorKind::EmptySeries, "refusing to save " + datasetId);
    }

    const auto target = pathFor(datasetId);
    auto temp = target;
    temp += kTempSuffix;

    std::error_code ec;
    std::filesystem::create_directories(dataDir_, ec);
    if (ec) {
        throw std::runtime_error("Could not create data directory " + dataDir_.string() + ": "
                                 + ec.message());
    }

    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output) {
            throw std::runtime_error("Could not open " + temp.string() + " for writing");
        }
        output << kHeader << '\n';
        output << std::setprecision(std::numeric_limits<double>::max_digits10);
        for (const auto& bar : series) {
            output << domain::formatDate(bar.date) << ',' << bar.open << ',' << bar.high << ','
                   << bar.low << ',' << bar.close << ',' << bar.volume << '\n';
        }
        output.flush();
        if (!output) {
            output.close();
            std::filesystem::remove(temp, ec);
            throw std::runtime_error("Failed writing " + temp.string());
        }
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code removeEc;
        std::filesystem::remove(temp, removeEc);
        throw std::runtime_error("Could not replace " + target.string() + ": " + ec.message());
    }

    LOG_INFO("Saved " << datasetId << " rows=" << series.size() << " last="
                      << domain::formatDate(series.back().date));

    notifyChanged(datasetId, series.back().date);
}

void CsvSeriesStore::addChangeListener(ChangeListener listener) {
    if (!listener) {
        return;
    }
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.push_back(std::move(listener));
}

void CsvSeriesStore::notifyChanged(const std::string& datasetId, domain::Date lastDate) const {
    std::vector<ChangeListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners = listeners_;
    }

    for (const auto& listener : listeners) {
        try {
            listener(datasetId, lastDate);
        } catch (const std::exception& ex) {
            LOG_WARN("Change listener for " << datasetId << " threw: " << ex.what());
        }
    }
}

}  // namespace adapters::csv
