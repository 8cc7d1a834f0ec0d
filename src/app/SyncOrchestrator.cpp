#include "app/SyncOrchestrator.h"

#include <algorithm>
#include <chrono>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "common/Log.hpp"

namespace app {

std::size_t SyncReport::rowsAppended() const noexcept {
    std::size_t total = 0;
    for (const auto& result : results) {
        total += result.appended.size();
    }
    return total;
}

bool SyncReport::anyUpdated() const noexcept {
    return std::any_of(results.begin(), results.end(),
                       [](const SyncResult& r) { return r.status == SyncStatus::Updated; });
}

SyncOrchestrator::SyncOrchestrator(GapFillSynchronizer& synchronizer,
                                   const domain::IDatasetCatalog& catalog,
                                   std::size_t threads)
    : synchronizer_(synchronizer),
      catalog_(catalog),
      threads_(std::max<std::size_t>(threads, 1)) {}

SyncReport SyncOrchestrator::syncAll() {
    std::vector<std::string> ids;
    for (const auto& info : catalog_.list()) {
        if (info.ticker.has_value()) {
            ids.push_back(info.id);
        }
        else {
            LOG_DEBUG("Skipping " << info.id << ": no ticker mapped");
        }
    }
    return sync(ids);
}

SyncReport SyncOrchestrator::sync(const std::vector<std::string>& datasetIds) {
    SyncReport report;
    report.results.resize(datasetIds.size());
    if (datasetIds.empty()) {
        LOG_INFO("Nothing to sync");
        return report;
    }

    const auto started = std::chrono::steady_clock::now();
    const auto workers = std::min(threads_, datasetIds.size());
    LOG_INFO("Syncing " << datasetIds.size() << " datasets on " << workers << " workers");

    boost::asio::thread_pool pool(workers);
    for (std::size_t i = 0; i < datasetIds.size(); ++i) {
        boost::asio::post(pool, [this, &report, &datasetIds, i]() {
            const auto& id = datasetIds[i];
            try {
                report.results[i] = synchronizer_.synchronize(id);
            } catch (const std::exception& ex) {
                SyncResult failed;
                failed.datasetId = id;
                failed.status = SyncStatus::Failed;
                failed.errorMessage = ex.what();
                report.results[i] = std::move(failed);
                LOG_ERR("Unexpected failure syncing " << id << ": " << ex.what());
            }
        });
    }
    pool.join();

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    LOG_INFO("Sync finished: rows_appended=" << report.rowsAppended() << " in " << elapsed.count() << " ms");
    return report;
}

}  // namespace app
