#pragma once

#include "farmstock/core/Types.h"
#include "farmstock/econ/Money.h"
#include "farmstock/plan/StockEntry.h"

#include <string>
#include <vector>

namespace farmstock::core {
class JobSystem;
}

namespace farmstock::plan {

// Volume of one product to sell, and the trips it takes.
struct TripAllocation {
  std::string productId{};
  double volumeSoldL{0.0};  // 0 < volumeSoldL <= sellable volume
  int tripsUsed{0};         // ceil(volumeSoldL / capacityPerTripL)
  int fullTrips{0};         // trips loaded to capacity
  bool partialTrip{false};  // last trip carries less than capacity
  econ::Money revenue{};
};

enum class PlanStatus : core::u8 {
  Ok = 0,            // target reached
  ZeroTarget,        // nothing to sell for a zero target
  NoEligibleStock,   // no enabled entry has sellable stock
  TargetNotReached,  // everything eligible is sold and it is not enough
  InvalidTarget,     // negative target; nothing computed
};

// Short code for reports/UI ("ok", "no_products", "not_reached_quota", ...).
const char* planStatusReason(PlanStatus status);

struct SellingPlan {
  // Selling priority order: highest revenue per trip first.
  std::vector<TripAllocation> allocations{};

  int totalTrips{0};
  econ::Money totalRevenue{};
  double totalVolumeSoldL{0.0};

  bool targetMet{false};
  econ::Money targetAmount{};

  // Sum of revenueCap over eligible entries.
  econ::Money maxAchievableRevenue{};

  PlanStatus status{PlanStatus::Ok};
};

struct SalesOptimizerParams {
  // When false, the entry that completes the target sells whole trip loads
  // instead of only the liters still needed.
  bool trimFinalEntry{true};
};

// Trip-minimal selling plan for `target`.
//
// Among plans with the fewest trips, returns the one that sells the least
// volume (leaves the most stock). The search for it is bounded; on very large
// farms the least volume found within the bound is used. When the target is
// out of reach the plan sells every eligible entry down to its minimum stock
// and targetMet=false.
//
// Disabled or malformed entries are skipped. Pure: no shared state, safe to
// call from several threads at once.
SellingPlan optimizeSales(const std::vector<StockEntry>& entries,
                          econ::Money target,
                          const SalesOptimizerParams& params = {});

// One plan per target, computed in parallel on `jobs`. Results are in
// target order and equal to calling optimizeSales() serially.
std::vector<SellingPlan> optimizeSalesBatch(const std::vector<StockEntry>& entries,
                                            const std::vector<econ::Money>& targets,
                                            const SalesOptimizerParams& params,
                                            core::JobSystem& jobs);

// ceil(volume / capacity), tolerant of float noise at exact multiples.
int tripsForVolume(double volumeL, double capacityL);

// Lowest total trip count any plan needs to reach `target`, or -1 if the
// eligible stock cannot reach it.
int minimumTripsForTarget(const std::vector<StockEntry>& entries, econ::Money target);

} // namespace farmstock::plan
