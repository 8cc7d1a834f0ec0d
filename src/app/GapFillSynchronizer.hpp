#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "app/FetcherRegistry.hpp"
#include "domain/Errors.hpp"
#include "domain/Ports.hpp"

namespace app {

enum class SyncStatus {
    Updated,
    UpToDate,
    Failed,
};

const char* syncStatusToString(SyncStatus status) noexcept;

struct SyncResult {
    std::string datasetId;
    SyncStatus status{SyncStatus::UpToDate};
    std::vector<domain::Bar> appended;
    std::optional<domain::ErrorKind> errorKind;
    std::string errorMessage;
};

struct GapFillOptions {
    std::int32_t fallbackDays = 730;
    std::chrono::milliseconds fetchTimeout{30000};
    // How long the destructor waits for fetches that already timed out.
    std::chrono::milliseconds shutdownGrace{5000};
    std::function<domain::Date()> today;  // local calendar date when empty
};

// Fetches the trailing date window a dataset is missing and merges it into the
// persisted series. Runs for one dataset id at a time.
//
// A fetch that times out keeps running on its own thread. The destructor joins
// those threads, waiting up to shutdownGrace in total, so the synchronizer must
// be destroyed before main returns. Threads still busy after the grace period
// are detached with a warning.
class GapFillSynchronizer {
public:
    // Throws std::invalid_argument when fallbackDays is negative.
    GapFillSynchronizer(domain::ISeriesStore& store,
                        const domain::IDatasetCatalog& catalog,
                        const FetcherRegistry& fetchers,
                        GapFillOptions options = {});
    ~GapFillSynchronizer();

    GapFillSynchronizer(const GapFillSynchronizer&) = delete;
    GapFillSynchronizer& operator=(const GapFillSynchronizer&) = delete;

    // Returns the fetched rows that were written. Empty when the dataset is
    // already current. Throws domain::PipelineError.
    std::vector<domain::Bar> update(const std::string& datasetId);

    // update() with every failure folded into the result.
    SyncResult synchronize(const std::string& datasetId);

    // local + fetched, ascending by date. A fetched bar replaces a local bar
    // with the same date.
    static domain::OhlcvSeries merge(const domain::OhlcvSeries& local, const std::vector<domain::Bar>& fetched);

    // Timed-out fetches whose threads have not been joined yet.
    std::size_t abandonedFetches() const;

private:
    struct AbandonedFetch {
        std::thread worker;
        std::future<std::vector<domain::Bar>> result;
    };

    std::mutex& datasetMutex(const std::string& datasetId);
    std::vector<domain::Bar> fetchWithTimeout(std::shared_ptr<domain::IFetcher> fetcher,
                                              const std::string& ticker,
                                              domain::Date start,
                                              domain::Date end);
    void reapAbandoned(std::chrono::milliseconds budget);
    domain::Date today() const;

    domain::ISeriesStore& store_;
    const domain::IDatasetCatalog& catalog_;
    const FetcherRegistry& fetchers_;
    GapFillOptions options_;

    std::mutex locksMutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> datasetLocks_;

    mutable std::mutex abandonedMutex_;
    std::vector<AbandonedFetch> abandoned_;
};

}  // namespace app
