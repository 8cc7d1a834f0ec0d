#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "app/GapFillSynchronizer.hpp"
#include "domain/Ports.hpp"

namespace app {

struct SyncReport {
    std::vector<SyncResult> results;

    std::size_t rowsAppended() const noexcept;
    bool anyUpdated() const noexcept;
};

// Runs gap-fill for many datasets on a bounded worker pool. One dataset
// failing never affects the others.
class SyncOrchestrator {
public:
    SyncOrchestrator(GapFillSynchronizer& synchronizer,
                     const domain::IDatasetCatalog& catalog,
                     std::size_t threads);

    // Every catalogued dataset that has a ticker.
    SyncReport syncAll();

    // Results come back in the order of `datasetIds`.
    SyncReport sync(const std::vector<std::string>& datasetIds);

private:
    GapFillSynchronizer& synchronizer_;
    const domain::IDatasetCatalog& catalog_;
    std::size_t threads_;
};

}  // namespace app
