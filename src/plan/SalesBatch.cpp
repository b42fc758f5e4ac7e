#include "farmstock/plan/SalesOptimizer.h"

#include "farmstock/core/JobSystem.h"
#include "farmstock/core/Log.h"

namespace farmstock::plan {

std::vector<SellingPlan> optimizeSalesBatch(const std::vector<StockEntry>& entries,
                                            const std::vector<econ::Money>& targets,
                                            const SalesOptimizerParams& params,
                                            core::JobSystem& jobs) {
  std::vector<SellingPlan> out(targets.size());
  if (targets.empty()) return out;

  // Each job writes only its own slot; `entries` is shared read-only.
  jobs.parallelFor(targets.size(), [&](std::size_t i) {
    out[i] = optimizeSales(entries, targets[i], params);
  });

  FARMSTOCK_LOG_DEBUG("optimizeSalesBatch: " + std::to_string(targets.size()) + " targets on " +
                      std::to_string(jobs.threadCount()) + " threads");
  return out;
}

} // namespace farmstock::plan
