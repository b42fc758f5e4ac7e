#include "farmstock/plan/SalesOptimizer.h"

#include "farmstock/core/Assert.h"
#include "farmstock/core/Log.h"

#include <algorithm>
#include <climits>
#include <cmath>
#include <queue>
#include <sstream>
#include <unordered_set>

namespace farmstock::plan {

namespace {

constexpr double kTripSlack = 1e-9;
constexpr double kVolumeEps = 1e-9;

// The stock-guided construction re-evaluates every remaining trip at every
// step; beyond this many trips only the best-value selection is tried.
constexpr int kMaxGuidedTrips = 256;

// Node limit of the least-volume search. Past it the best plan found so far
// is kept.
constexpr long kMaxSearchNodes = 200000;

// Volumes closer than this count as equal when comparing plans.
constexpr double kVolumeTieL = 1e-6;

// An eligible entry with its trip structure precomputed.
//
// A lot offers `fullTrips` trips of capL liters and then, once those are
// used up, one last trip with the remaining remL liters.
struct Lot {
  const StockEntry* entry{nullptr};
  double sellableL{0.0};
  double capL{0.0};
  double price{0.0};
  econ::Money perTrip{};
  int fullTrips{0};
  double remL{0.0};
};

struct Take {
  int full{0};
  bool last{false};
};

using TakeState = std::vector<Take>;

struct Pick {
  std::size_t lot{0};
  double volumeL{0.0};
};

struct HeapItem {
  double value{0.0};
  std::size_t lot{0};
};

// Max-heap on trip value; equal values go to the higher-ranked lot.
struct HeapLess {
  bool operator()(const HeapItem& a, const HeapItem& b) const {
    if (a.value != b.value) return a.value < b.value;
    return a.lot > b.lot;
  }
};

bool rankBefore(const Lot& a, const Lot& b) {
  if (a.perTrip != b.perTrip) return a.perTrip > b.perTrip;
  if (a.price != b.price) return a.price > b.price;
  return a.entry->productId < b.entry->productId;
}

Lot makeLot(const StockEntry& e) {
  Lot lot;
  lot.entry = &e;
  lot.sellableL = sellableVolumeL(e);
  lot.capL = e.capacityPerTripL;
  lot.price = e.pricePerThousand;
  lot.perTrip = perTripRevenue(e);

  const double ratio = std::min(lot.sellableL / lot.capL, (double)(INT_MAX / 4));
  lot.fullTrips = (int)std::floor(ratio + kTripSlack);
  lot.remL = std::max(0.0, lot.sellableL - (double)lot.fullTrips * lot.capL);
  if (lot.remL <= kVolumeEps * std::max(1.0, lot.capL)) lot.remL = 0.0;
  return lot;
}

std::vector<Lot> collectLots(const std::vector<StockEntry>& entries) {
  std::vector<Lot> lots;
  lots.reserve(entries.size());
  std::unordered_set<std::string> seen;

  for (const StockEntry& e : entries) {
    const StockEntryIssue issue = validateStockEntry(e);
    if (issue != StockEntryIssue::None) {
      FARMSTOCK_LOG_WARN("optimizeSales: skipping malformed stock entry '" + e.productId + "' (" +
                         stockEntryIssueName(issue) + ")");
      continue;
    }
    if (!isEligible(e)) continue;
    if (!seen.insert(e.productId).second) {
      FARMSTOCK_LOG_WARN("optimizeSales: duplicate stock entry '" + e.productId + "' ignored");
      continue;
    }
    lots.push_back(makeLot(e));
  }

  std::sort(lots.begin(), lots.end(), rankBefore);
  return lots;
}

int maxTrips(const Lot& lot) {
  return lot.fullTrips + (lot.remL > 0.0 ? 1 : 0);
}

// Liters `trips` trips of this lot carry.
double capVolume(const Lot& lot, int trips) {
  if (trips <= 0) return 0.0;
  if (trips <= lot.fullTrips) return std::min((double)trips * lot.capL, lot.sellableL);
  return lot.sellableL;
}

double takenVolume(const Lot& lot, const Take& t) {
  const double v = (double)t.full * lot.capL + (t.last ? lot.remL : 0.0);
  return std::min(v, lot.sellableL);
}

// Liters carried by the next trip this lot offers; 0 when exhausted.
double nextTripVolume(const Lot& lot, const Take& t) {
  if (t.full < lot.fullTrips) return lot.capL;
  if (!t.last && lot.remL > 0.0) return lot.remL;
  return 0.0;
}

void applyNextTrip(const Lot& lot, Take& t) {
  if (t.full < lot.fullTrips) {
    ++t.full;
  } else {
    t.last = true;
  }
}

econ::Money stateRevenue(const std::vector<Lot>& lots, const TakeState& st) {
  econ::Money sum{};
  for (std::size_t i = 0; i < lots.size(); ++i) {
    sum += econ::revenueFor(takenVolume(lots[i], st[i]), lots[i].price);
  }
  return sum;
}

// Adds up to maxTrips of the most valuable remaining trips to `st`, stopping
// early once the state earns `stopAt`. Because every lot's trips are ordered
// by non-increasing value, the result is the best revenue reachable with
// that many extra trips. Returns the number of trips added.
int addBestTrips(const std::vector<Lot>& lots, TakeState& st, int maxTrips, econ::Money stopAt) {
  std::priority_queue<HeapItem, std::vector<HeapItem>, HeapLess> heap;
  for (std::size_t i = 0; i < lots.size(); ++i) {
    const double v = nextTripVolume(lots[i], st[i]);
    if (v > 0.0) heap.push(HeapItem{v * lots[i].price, i});
  }

  econ::Money total = stateRevenue(lots, st);
  int added = 0;
  while (!heap.empty() && added < maxTrips && total < stopAt) {
    const HeapItem top = heap.top();
    heap.pop();

    const Lot& lot = lots[top.lot];
    Take& t = st[top.lot];
    const econ::Money before = econ::revenueFor(takenVolume(lot, t), lot.price);
    applyNextTrip(lot, t);
    total += econ::revenueFor(takenVolume(lot, t), lot.price) - before;
    ++added;

    const double v = nextTripVolume(lot, t);
    if (v > 0.0) heap.push(HeapItem{v * lot.price, top.lot});
  }
  return added;
}

int minimumTrips(const std::vector<Lot>& lots, econ::Money target) {
  if (target.minor() <= 0) return 0;
  TakeState st(lots.size());
  const int k = addBestTrips(lots, st, INT_MAX, target);
  return (stateRevenue(lots, st) >= target) ? k : -1;
}

// Builds exactly k trips one at a time. Each step takes the trip that leaves
// the most stock on the farm, among the trips after which the best k - step
// remaining trips still reach the target.
bool buildStockGuidedTrips(const std::vector<Lot>& lots, int k, econ::Money target, TakeState& out) {
  TakeState st(lots.size());

  for (int step = 0; step < k; ++step) {
    const int tripsLeftAfter = k - step - 1;

    std::size_t bestIdx = lots.size();
    double bestRemaining = 0.0;
    double bestValue = 0.0;

    for (std::size_t i = 0; i < lots.size(); ++i) {
      const double v = nextTripVolume(lots[i], st[i]);
      if (v <= 0.0) continue;

      TakeState trial = st;
      applyNextTrip(lots[i], trial[i]);
      const double remaining = lots[i].entry->quantityL - takenVolume(lots[i], trial[i]);

      addBestTrips(lots, trial, tripsLeftAfter, target);
      if (stateRevenue(lots, trial) < target) continue;

      const double value = v * lots[i].price;
      const bool better = (bestIdx == lots.size()) ||
                          (remaining > bestRemaining + kVolumeEps) ||
                          (std::abs(remaining - bestRemaining) <= kVolumeEps && value > bestValue);
      if (better) {
        bestIdx = i;
        bestRemaining = remaining;
        bestValue = value;
      }
    }

    if (bestIdx == lots.size()) return false;
    applyNextTrip(lots[bestIdx], st[bestIdx]);
  }

  out = std::move(st);
  return true;
}

// Liters a lot with availL on hand sells when it completes a remaining
// `need`: only what is still needed, or whole loads when trimming is off.
double completingVolume(const Lot& lot, double availL, econ::Money need, const SalesOptimizerParams& params) {
  if (econ::revenueFor(availL, lot.price) <= need) return availL;

  double vol = std::min(availL, econ::volumeForRevenue(need, lot.price));
  // Half a minor unit of extra volume absorbs float error in the inverse.
  if (econ::revenueFor(vol, lot.price) < need) {
    vol = std::min(availL, vol + 500.0 / ((double)econ::Money::kMinorPerUnit * lot.price));
  }
  if (!params.trimFinalEntry) {
    vol = std::min(availL, (double)tripsForVolume(vol, lot.capL) * lot.capL);
  }
  return vol;
}

// Fewest trips of this lot alone that earn `need`; maxTrips + 1 if it cannot.
int tripsToCover(const Lot& lot, econ::Money need) {
  const int most = maxTrips(lot);
  if (most == 0 || econ::revenueFor(lot.sellableL, lot.price) < need) return most + 1;

  int t = std::clamp(tripsForVolume(econ::volumeForRevenue(need, lot.price), lot.capL), 1, most);
  while (t < most && econ::revenueFor(capVolume(lot, t), lot.price) < need) ++t;
  while (t > 1 && econ::revenueFor(capVolume(lot, t - 1), lot.price) >= need) --t;
  return t;
}

// Sells from `order` until the target is covered, each lot limited to
// capsL[lot]. The lot that completes the target sells completingVolume().
std::vector<Pick> fillToTarget(const std::vector<Lot>& lots,
                               const std::vector<std::size_t>& order,
                               const std::vector<double>& capsL,
                               econ::Money target,
                               const SalesOptimizerParams& params) {
  std::vector<Pick> picks;
  econ::Money acc{};

  for (const std::size_t idx : order) {
    if (acc >= target) break;
    const Lot& lot = lots[idx];
    const double cap = capsL[idx];
    if (cap <= kVolumeEps) continue;

    const double vol = completingVolume(lot, cap, target - acc, params);
    if (vol <= kVolumeEps) continue;

    picks.push_back(Pick{idx, vol});
    acc += econ::revenueFor(vol, lot.price);
  }
  return picks;
}

SellingPlan assemblePlan(const std::vector<Lot>& lots, std::vector<Pick> picks, econ::Money target) {
  std::sort(picks.begin(), picks.end(), [](const Pick& a, const Pick& b) { return a.lot < b.lot; });

  SellingPlan plan;
  plan.targetAmount = target;
  plan.allocations.reserve(picks.size());

  for (const Pick& p : picks) {
    const Lot& lot = lots[p.lot];

    TripAllocation a;
    a.productId = lot.entry->productId;
    a.volumeSoldL = std::min(p.volumeL, lot.sellableL);
    a.tripsUsed = tripsForVolume(a.volumeSoldL, lot.capL);
    a.fullTrips = std::min(a.tripsUsed, (int)std::floor(a.volumeSoldL / lot.capL + kTripSlack));
    a.partialTrip = a.tripsUsed > a.fullTrips;
    a.revenue = econ::revenueFor(a.volumeSoldL, lot.price);

    plan.totalTrips += a.tripsUsed;
    plan.totalRevenue += a.revenue;
    plan.totalVolumeSoldL += a.volumeSoldL;
    plan.allocations.push_back(std::move(a));
  }

  plan.targetMet = plan.totalRevenue >= target;
  plan.status = plan.targetMet ? PlanStatus::Ok : PlanStatus::TargetNotReached;
  return plan;
}

std::vector<double> capsFromState(const std::vector<Lot>& lots, const TakeState& st) {
  std::vector<double> caps(lots.size(), 0.0);
  for (std::size_t i = 0; i < lots.size(); ++i) caps[i] = takenVolume(lots[i], st[i]);
  return caps;
}

// Highest price first: the same revenue then costs the least volume.
std::vector<std::size_t> priceOrder(const std::vector<Lot>& lots) {
  std::vector<std::size_t> order(lots.size());
  for (std::size_t i = 0; i < order.size(); ++i) order[i] = i;
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return lots[a].price > lots[b].price;
  });
  return order;
}

bool fewerTripsOrLessVolume(const SellingPlan& a, const SellingPlan& b) {
  if (a.totalTrips != b.totalTrips) return a.totalTrips < b.totalTrips;
  return a.totalVolumeSoldL < b.totalVolumeSoldL - kVolumeTieL;
}

// Depth-first search over per-lot trip counts for the plan that reaches the
// target within a trip budget selling the least volume.
//
// For fixed trip counts the least volume comes from filling lots in price
// order, so lots are visited by descending price: every lot before the one
// that completes the target sells all its chosen trips, every lot after it
// sells nothing. Branches are cut when even the best price left cannot beat
// the current best volume, or when the budget cannot earn what is missing.
class LeastVolumeSearch {
public:
  LeastVolumeSearch(const std::vector<Lot>& lots,
                    const std::vector<std::size_t>& byPrice,
                    econ::Money target,
                    const SalesOptimizerParams& params,
                    double boundL)
    : lots_(lots), order_(byPrice), target_(target), params_(params), bestL_(boundL),
      trips_(lots.size(), 0), suffixCapMinor_(byPrice.size() + 1, 0.0), suffixTripMinor_(byPrice.size() + 1, 0.0) {
    for (std::size_t pos = order_.size(); pos-- > 0;) {
      const Lot& lot = lots_[order_[pos]];
      suffixCapMinor_[pos] = suffixCapMinor_[pos + 1] + (double)econ::revenueFor(lot.sellableL, lot.price).minor();
      // Unrounded, so that budget * best trip never undercounts t rounded trips.
      const double tripMinor =
        std::min(lot.capL, lot.sellableL) * lot.price * (double)econ::Money::kMinorPerUnit / 1000.0;
      suffixTripMinor_[pos] = std::max(suffixTripMinor_[pos + 1], tripMinor);
    }
  }

  // Caps (liters per lot) of a plan strictly better than the bound, if any.
  bool run(int budget, std::vector<double>& outCapsL) {
    visit(0, budget, econ::Money{}, 0.0);
    if (!found_) return false;
    outCapsL.assign(lots_.size(), 0.0);
    for (std::size_t i = 0; i < lots_.size(); ++i) outCapsL[i] = capVolume(lots_[i], best_[i]);
    return true;
  }

  bool truncated() const { return truncated_; }

private:
  void visit(std::size_t pos, int budget, econ::Money acc, double volumeL) {
    if (pos == order_.size() || budget <= 0) return;
    if (++nodes_ > kMaxSearchNodes) {
      truncated_ = true;
      return;
    }

    const econ::Money need = target_ - acc;
    // Each lot may round its revenue up by at most one minor unit.
    const double roundingMinor = (double)(order_.size() - pos);
    const double reachMinor =
      std::min(suffixCapMinor_[pos], (double)budget * suffixTripMinor_[pos]) + roundingMinor;
    if (reachMinor < (double)need.minor()) return;

    const std::size_t idx = order_[pos];
    const Lot& lot = lots_[idx];
    const econ::Money relaxedNeed = need - econ::Money::fromMinor((core::i64)roundingMinor);
    if (volumeL + econ::volumeForRevenue(relaxedNeed, lot.price) >= bestL_ - kVolumeTieL) return;

    const int most = std::min(budget, maxTrips(lot));
    const int covering = tripsToCover(lot, need);
    if (covering <= most) {
      const double totalL = volumeL + completingVolume(lot, capVolume(lot, covering), need, params_);
      if (totalL < bestL_ - kVolumeTieL) {
        bestL_ = totalL;
        best_ = trips_;
        best_[idx] = covering;
        found_ = true;
      }
    }

    for (int t = std::min(covering - 1, most); t >= 1; --t) {
      const double capL = capVolume(lot, t);
      trips_[idx] = t;
      visit(pos + 1, budget - t, acc + econ::revenueFor(capL, lot.price), volumeL + capL);
    }
    trips_[idx] = 0;
    visit(pos + 1, budget, acc, volumeL);
  }

  const std::vector<Lot>& lots_;
  const std::vector<std::size_t>& order_;
  econ::Money target_;
  const SalesOptimizerParams& params_;

  double bestL_{0.0};
  std::vector<int> trips_;
  std::vector<int> best_;
  std::vector<double> suffixCapMinor_;
  std::vector<double> suffixTripMinor_;
  long nodes_{0};
  bool found_{false};
  bool truncated_{false};
};

} // namespace

const char* planStatusReason(PlanStatus status) {
  switch (status) {
    case PlanStatus::Ok: return "ok";
    case PlanStatus::ZeroTarget: return "no_plan";
    case PlanStatus::NoEligibleStock: return "no_products";
    case PlanStatus::TargetNotReached: return "not_reached_quota";
    case PlanStatus::InvalidTarget: return "invalid_target";
  }
  return "unknown";
}

int tripsForVolume(double volumeL, double capacityL) {
  if (!(volumeL > 0.0) || !(capacityL > 0.0)) return 0;
  const double ratio = volumeL / capacityL;
  if (ratio >= (double)INT_MAX) return INT_MAX;
  return std::max(1, (int)std::ceil(ratio - kTripSlack));
}

int minimumTripsForTarget(const std::vector<StockEntry>& entries, econ::Money target) {
  if (target.minor() <= 0) return 0;
  return minimumTrips(collectLots(entries), target);
}

SellingPlan optimizeSales(const std::vector<StockEntry>& entries,
                          econ::Money target,
                          const SalesOptimizerParams& params) {
  SellingPlan plan;
  plan.targetAmount = target;

  if (target.isNegative()) {
    FARMSTOCK_LOG_WARN("optimizeSales: negative target " + target.format() + " rejected");
    plan.status = PlanStatus::InvalidTarget;
    plan.targetMet = false;
    return plan;
  }

  const std::vector<Lot> lots = collectLots(entries);
  econ::Money maxRevenue{};
  for (const Lot& lot : lots) maxRevenue += econ::revenueFor(lot.sellableL, lot.price);
  plan.maxAchievableRevenue = maxRevenue;

  if (target.isZero()) {
    plan.status = PlanStatus::ZeroTarget;
    plan.targetMet = true;
    return plan;
  }
  if (lots.empty()) {
    plan.status = PlanStatus::NoEligibleStock;
    plan.targetMet = false;
    return plan;
  }

  std::vector<std::size_t> rankOrder(lots.size());
  std::vector<double> sellable(lots.size());
  for (std::size_t i = 0; i < lots.size(); ++i) {
    rankOrder[i] = i;
    sellable[i] = lots[i].sellableL;
  }

  const int k = minimumTrips(lots, target);
  if (k < 0) {
    std::vector<Pick> all;
    all.reserve(lots.size());
    for (std::size_t i = 0; i < lots.size(); ++i) all.push_back(Pick{i, lots[i].sellableL});
    SellingPlan out = assemblePlan(lots, std::move(all), target);
    out.maxAchievableRevenue = maxRevenue;
    FARMSTOCK_LOG_DEBUG("optimizeSales: target " + target.format() + " out of reach (max " +
                        maxRevenue.format() + "), selling all eligible stock");
    return out;
  }

  // Ranked walk: best revenue per trip first.
  SellingPlan best = assemblePlan(lots, fillToTarget(lots, rankOrder, sellable, target, params), target);
  const char* chosen = "ranked";

  const std::vector<std::size_t> byPrice = priceOrder(lots);

  // The k most valuable trips always reach the target in k trips.
  {
    TakeState st(lots.size());
    addBestTrips(lots, st, k, target);
    SellingPlan cand = assemblePlan(lots, fillToTarget(lots, byPrice, capsFromState(lots, st), target, params), target);
    FARMSTOCK_ASSERT_MSG(cand.totalTrips <= k, "optimizeSales: best-trips plan exceeds the minimum trip count");
    if (fewerTripsOrLessVolume(cand, best)) {
      best = std::move(cand);
      chosen = "best-trips";
    }
  }

  if (k <= kMaxGuidedTrips) {
    TakeState st;
    if (buildStockGuidedTrips(lots, k, target, st)) {
      SellingPlan cand = assemblePlan(lots, fillToTarget(lots, byPrice, capsFromState(lots, st), target, params), target);
      if (fewerTripsOrLessVolume(cand, best)) {
        best = std::move(cand);
        chosen = "stock-guided";
      }
    }
  }

  {
    LeastVolumeSearch search(lots, byPrice, target, params, best.totalVolumeSoldL);
    std::vector<double> caps;
    if (search.run(k, caps)) {
      SellingPlan cand = assemblePlan(lots, fillToTarget(lots, byPrice, caps, target, params), target);
      if (fewerTripsOrLessVolume(cand, best)) {
        best = std::move(cand);
        chosen = "least-volume";
      }
    }
    if (search.truncated()) {
      FARMSTOCK_LOG_DEBUG("optimizeSales: least-volume search stopped at its node limit");
    }
  }

  best.maxAchievableRevenue = maxRevenue;

  if (core::getLogLevel() <= core::LogLevel::Debug) {
    std::ostringstream oss;
    oss << "optimizeSales: target " << target.format() << " -> " << best.totalTrips << " trips (min " << k
        << "), " << best.totalVolumeSoldL << " L, revenue " << best.totalRevenue.format() << " [" << chosen << "]";
    FARMSTOCK_LOG_DEBUG(oss.str());
  }
  return best;
}

} // namespace farmstock::plan
