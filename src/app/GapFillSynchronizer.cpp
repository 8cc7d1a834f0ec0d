#include "app/GapFillSynchronizer.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace app {

const char* syncStatusToString(SyncStatus status) noexcept {
    switch (status) {
    case SyncStatus::Updated:
        return "updated";
    case SyncStatus::UpToDate:
        return "up_to_date";
    case SyncStatus::Failed:
        return "error";
    }
    return "error";
}

GapFillSynchronizer::GapFillSynchronizer(domain::ISeriesStore& store,
                                         const domain::IDatasetCatalog& catalog,
                                         const FetcherRegistry& fetchers,
                                         GapFillOptions options)
    : store_(store),
      catalog_(catalog),
      fetchers_(fetchers),
      options_(std::move(options)) {
    if (options_.fallbackDays < 0) {
        throw std::invalid_argument("fallbackDays must not be negative, got "
                                    + std::to_string(options_.fallbackDays));
    }
}

GapFillSynchronizer::~GapFillSynchronizer() {
    reapAbandoned(options_.shutdownGrace);

    std::lock_guard<std::mutex> lock(abandonedMutex_);
    if (abandoned_.empty()) {
        return;
    }
    LOG_WARN(abandoned_.size() << " timed-out fetches still running at shutdown, detaching");
    for (auto& fetch : abandoned_) {
        fetch.worker.detach();
    }
}

domain::Date GapFillSynchronizer::today() const {
    return options_.today ? options_.today() : domain::localToday();
}

std::mutex& GapFillSynchronizer::datasetMutex(const std::string& datasetId) {
    std::lock_guard<std::mutex> lock(locksMutex_);
    auto& slot = datasetLocks_[datasetId];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

void GapFillSynchronizer::reapAbandoned(std::chrono::milliseconds budget) {
    const auto deadline = std::chrono::steady_clock::now() + budget;

    std::lock_guard<std::mutex> lock(abandonedMutex_);
    auto it = abandoned_.begin();
    while (it != abandoned_.end()) {
        if (it->result.wait_until(deadline) != std::future_status::ready) {
            ++it;
            continue;
        }
        it->worker.join();
        it = abandoned_.erase(it);
    }
}

std::size_t GapFillSynchronizer::abandonedFetches() const {
    std::lock_guard<std::mutex> lock(abandonedMutex_);
    return abandoned_.size();
}

std::vector<domain::Bar> GapFillSynchronizer::fetchWithTimeout(std::shared_ptr<domain::IFetcher> fetcher,
                                                               const std::string& ticker,
                                                               domain::Date start,
                                                               domain::Date end) {
    reapAbandoned(std::chrono::milliseconds::zero());

    // The task owns the fetcher so an abandoned call can finish safely.
    std::packaged_task<std::vector<domain::Bar>()> task(
        [fetcher = std::move(fetcher), ticker, start, end]() {
            return fetcher->fetchRange(ticker, start, end);
        });
    auto result = task.get_future();
    std::thread worker(std::move(task));

    if (result.wait_for(options_.fetchTimeout) != std::future_status::ready) {
        {
            std::lock_guard<std::mutex> lock(abandonedMutex_);
            abandoned_.push_back(AbandonedFetch{std::move(worker), std::move(result)});
        }
        throw domain::PipelineError(domain::ErrorKind::FetchFailure,
                                    ticker + " timed out after " + std::to_string(options_.fetchTimeout.count())
                                        + " ms");
    }
    worker.join();

    try {
        return result.get();
    } catch (const domain::PipelineError&) {
        throw;
    } catch (const std::exception& ex) {
        throw domain::PipelineError(domain::ErrorKind::FetchFailure, ticker + ": " + ex.what());
    }
}

std::vector<domain::Bar> GapFillSynchronizer::update(const std::string& datasetId) {
    const auto info = catalog_.resolve(datasetId);
    if (!info.has_value() || !info->ticker.has_value() || info->ticker->empty()) {
        throw domain::PipelineError(domain::ErrorKind::FetchFailure, "no ticker mapped for " + datasetId);
    }
    auto fetcher = fetchers_.find(info->assetClass);
    if (!fetcher) {
        throw domain::PipelineError(domain::ErrorKind::FetchFailure,
                                    std::string{"no fetcher for "} + domain::assetClassToString(info->assetClass)
                                        + " dataset " + datasetId);
    }

    std::lock_guard<std::mutex> datasetLock(datasetMutex(datasetId));

    domain::SeriesPtr local;
    if (store_.exists(datasetId)) {
        try {
            local = store_.load(datasetId);
        } catch (const domain::PipelineError& ex) {
            if (ex.kind() != domain::ErrorKind::EmptySeries) {
                throw;
            }
            LOG_WARN(datasetId << " has no usable rows, refetching the fallback window");
        }
    }

    const auto end = today();
    const auto start = (local && !local->empty()) ? domain::addDays(local->back().date, 1)
                                                  : domain::addDays(end, -options_.fallbackDays);
    if (start > end) {
        LOG_DEBUG(datasetId << " is current through " << domain::formatDate(local->back().date));
        return {};
    }

    LOG_INFO("Gap-fill " << datasetId << " (" << *info->ticker << ") " << domain::formatDate(start) << " .. "
                         << domain::formatDate(end));

    auto fetched = fetchWithTimeout(std::move(fetcher), *info->ticker, start, end);
    fetched.erase(std::remove_if(fetched.begin(), fetched.end(),
                                 [start, end](const domain::Bar& bar) {
                                     return bar.date < start || bar.date > end;
                                 }),
                  fetched.end());
    domain::sanitizeBars(fetched);
    domain::sortAndDedupKeepLast(fetched);

    if (fetched.empty()) {
        LOG_INFO(datasetId << ": no new rows");
        return {};
    }

    const auto merged = merge(local ? *local : domain::OhlcvSeries{}, fetched);
    store_.save(datasetId, merged);
    return fetched;
}

domain::OhlcvSeries GapFillSynchronizer::merge(const domain::OhlcvSeries& local,
                                               const std::vector<domain::Bar>& fetched) {
    domain::OhlcvSeries merged;
    merged.reserve(local.size() + fetched.size());
    merged.insert(merged.end(), local.begin(), local.end());
    merged.insert(merged.end(), fetched.begin(), fetched.end());
    domain::sortAndDedupKeepLast(merged);
    return merged;
}

SyncResult GapFillSynchronizer::synchronize(const std::string& datasetId) {
    auto& metrics = cds::common::metrics::Registry::instance();

    SyncResult result;
    result.datasetId = datasetId;
    try {
        result.appended = update(datasetId);
        result.status = result.appended.empty() ? SyncStatus::UpToDate : SyncStatus::Updated;
    } catch (const domain::PipelineError& ex) {
        result.status = SyncStatus::Failed;
        result.errorKind = ex.kind();
        result.errorMessage = ex.what();
    } catch (const std::exception& ex) {
        result.status = SyncStatus::Failed;
        result.errorMessage = ex.what();
    }

    switch (result.status) {
    case SyncStatus::Updated:
        metrics.incrementCounter("sync.updated");
        metrics.incrementCounter("sync.rows_appended", result.appended.size());
        LOG_INFO(datasetId << ": " << result.appended.size() << " rows written");
        break;
    case SyncStatus::UpToDate:
        metrics.incrementCounter("sync.up_to_date");
        break;
    case SyncStatus::Failed:
        metrics.incrementCounter("sync.failed");
        LOG_ERR(datasetId << " sync failed: " << result.errorMessage);
        break;
    }
    return result;
}

}  // namespace app
