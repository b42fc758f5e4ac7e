#include "farmstock/plan/SalesOptimizer.h"

#include "test_harness.h"

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace farmstock;

namespace {

plan::StockEntry entry(const char* id, double qty, double price, double cap, double minKeep, bool enabled = true) {
  plan::StockEntry e;
  e.productId = id;
  e.quantityL = qty;
  e.pricePerThousand = price;
  e.capacityPerTripL = cap;
  e.minStockToKeepL = minKeep;
  e.enabled = enabled;
  return e;
}

const plan::TripAllocation* findAlloc(const plan::SellingPlan& p, const std::string& id) {
  for (const auto& a : p.allocations) {
    if (a.productId == id) return &a;
  }
  return nullptr;
}

bool near(double a, double b, double eps = 1e-6) { return std::abs(a - b) <= eps; }

// Fewest trips any combination of per-entry trip counts needs to reach the
// target, by exhaustive search. -1 if unreachable.
int bruteForceMinTrips(const std::vector<plan::StockEntry>& entries, econ::Money target) {
  std::vector<const plan::StockEntry*> eligible;
  std::vector<int> maxTrips;
  for (const auto& e : entries) {
    if (!plan::isEligible(e)) continue;
    eligible.push_back(&e);
    maxTrips.push_back(plan::tripsForVolume(plan::sellableVolumeL(e), e.capacityPerTripL));
  }

  int best = INT_MAX;
  std::vector<int> trips(eligible.size(), 0);
  for (;;) {
    econ::Money revenue{};
    int total = 0;
    for (std::size_t i = 0; i < eligible.size(); ++i) {
      const double vol = std::min(plan::sellableVolumeL(*eligible[i]), trips[i] * eligible[i]->capacityPerTripL);
      revenue += econ::revenueFor(vol, eligible[i]->pricePerThousand);
      total += trips[i];
    }
    if (revenue >= target) best = std::min(best, total);

    std::size_t d = 0;
    while (d < trips.size() && trips[d] == maxTrips[d]) {
      trips[d] = 0;
      ++d;
    }
    if (d == trips.size()) break;
    ++trips[d];
  }
  return best == INT_MAX ? -1 : best;
}

// Least volume any plan of at most maxTotalTrips trips sells to reach the
// target, by exhaustive search over per-entry trip counts. For fixed trip
// counts the least volume comes from filling entries by descending price,
// the last one selling only what is still needed. -1 if unreachable.
double bruteForceLeastVolume(const std::vector<plan::StockEntry>& entries, econ::Money target, int maxTotalTrips) {
  std::vector<const plan::StockEntry*> eligible;
  for (const auto& e : entries) {
    if (plan::isEligible(e)) eligible.push_back(&e);
  }
  std::sort(eligible.begin(), eligible.end(), [](const plan::StockEntry* a, const plan::StockEntry* b) {
    if (a->pricePerThousand != b->pricePerThousand) return a->pricePerThousand > b->pricePerThousand;
    const econ::Money ta = plan::perTripRevenue(*a);
    const econ::Money tb = plan::perTripRevenue(*b);
    if (ta != tb) return ta > tb;
    return a->productId < b->productId;
  });

  std::vector<int> maxTrips;
  for (const auto* e : eligible) maxTrips.push_back(plan::tripsForVolume(plan::sellableVolumeL(*e), e->capacityPerTripL));

  double best = -1.0;
  std::vector<int> trips(eligible.size(), 0);
  for (;;) {
    int total = 0;
    for (const int t : trips) total += t;

    if (total <= maxTotalTrips) {
      econ::Money acc{};
      double volume = 0.0;
      for (std::size_t i = 0; i < eligible.size() && acc < target; ++i) {
        const plan::StockEntry& e = *eligible[i];
        const double avail = std::min(plan::sellableVolumeL(e), trips[i] * e.capacityPerTripL);
        if (avail <= 0.0) continue;

        const econ::Money need = target - acc;
        double take = avail;
        if (econ::revenueFor(avail, e.pricePerThousand) > need) {
          take = std::min(avail, econ::volumeForRevenue(need, e.pricePerThousand));
          if (econ::revenueFor(take, e.pricePerThousand) < need) {
            take = std::min(avail, take + 500.0 / (100.0 * e.pricePerThousand));
          }
        }
        acc += econ::revenueFor(take, e.pricePerThousand);
        volume += take;
      }
      if (acc >= target && (best < 0.0 || volume < best)) best = volume;
    }

    std::size_t d = 0;
    while (d < trips.size() && trips[d] == maxTrips[d]) {
      trips[d] = 0;
      ++d;
    }
    if (d == trips.size()) break;
    ++trips[d];
  }
  return best;
}

// Deterministic LCG so the synthetic sets are identical on every run.
struct Lcg {
  std::uint64_t s;
  std::uint32_t next() {
    s = s * 6364136223846793005ull + 1442695040888963407ull;
    return (std::uint32_t)(s >> 33);
  }
  int range(int lo, int hi) { return lo + (int)(next() % (std::uint32_t)(hi - lo + 1)); }
};

// Properties every plan must satisfy regardless of the target.
int checkPlanShape(const std::vector<plan::StockEntry>& entries, const plan::SellingPlan& p) {
  int failures = 0;

  econ::Money revenue{};
  int trips = 0;
  double volume = 0.0;
  for (const auto& a : p.allocations) {
    const plan::StockEntry* src = nullptr;
    for (const auto& e : entries) {
      if (e.productId == a.productId) { src = &e; break; }
    }
    CHECK(src != nullptr);
    if (!src) continue;

    CHECK(plan::isEligible(*src));
    CHECK(a.volumeSoldL > 0.0);
    CHECK(a.volumeSoldL <= plan::sellableVolumeL(*src) + 1e-9);
    CHECK(a.tripsUsed == plan::tripsForVolume(a.volumeSoldL, src->capacityPerTripL));
    CHECK(a.fullTrips + (a.partialTrip ? 1 : 0) == a.tripsUsed);
    CHECK(a.revenue == econ::revenueFor(a.volumeSoldL, src->pricePerThousand));

    revenue += a.revenue;
    trips += a.tripsUsed;
    volume += a.volumeSoldL;
  }

  CHECK(p.totalRevenue == revenue);
  CHECK(p.totalTrips == trips);
  CHECK(near(p.totalVolumeSoldL, volume));
  CHECK(p.totalRevenue <= p.maxAchievableRevenue);
  return failures;
}

} // namespace

int test_sales_optimizer() {
  int failures = 0;

  // ---- single product covers the target with a partial second trip ----
  {
    const std::vector<plan::StockEntry> stock = {
      entry("WHEAT", 5000, 200, 3000, 0),
      entry("BARLEY", 10000, 100, 5000, 1000),
    };
    const plan::SellingPlan p = plan::optimizeSales(stock, econ::Money::fromUnits(900));

    CHECK(p.status == plan::PlanStatus::Ok);
    CHECK(p.targetMet);
    CHECK(p.allocations.size() == 1);
    if (p.allocations.size() == 1) {
      const auto& a = p.allocations[0];
      CHECK(a.productId == "WHEAT");
      CHECK(near(a.volumeSoldL, 4500.0));
      CHECK(a.tripsUsed == 2);
      CHECK(a.fullTrips == 1);
      CHECK(a.partialTrip);
      CHECK(a.revenue == econ::Money::fromUnits(900));
    }
    CHECK(p.totalTrips == 2);
    CHECK(p.totalRevenue == econ::Money::fromUnits(900));
    CHECK(p.maxAchievableRevenue == econ::Money::fromUnits(1900));
    failures += checkPlanShape(stock, p);
  }

  // ---- unreachable target sells everything eligible down to min stock ----
  {
    const std::vector<plan::StockEntry> stock = {
      entry("BARLEY", 10000, 100, 5000, 1000),
      entry("WHEAT", 5000, 200, 3000, 0),
    };
    const plan::SellingPlan p = plan::optimizeSales(stock, econ::Money::fromUnits(5000));

    CHECK(p.status == plan::PlanStatus::TargetNotReached);
    CHECK(!p.targetMet);
    CHECK(p.allocations.size() == 2);
    if (p.allocations.size() == 2) {
      // Ranked by revenue per trip: WHEAT 600, BARLEY 500.
      CHECK(p.allocations[0].productId == "WHEAT");
      CHECK(near(p.allocations[0].volumeSoldL, 5000.0));
      CHECK(p.allocations[0].tripsUsed == 2);
      CHECK(p.allocations[1].productId == "BARLEY");
      CHECK(near(p.allocations[1].volumeSoldL, 9000.0));
      CHECK(p.allocations[1].tripsUsed == 2);
    }
    CHECK(p.totalTrips == 4);
    CHECK(p.totalRevenue == econ::Money::fromUnits(1900));
    CHECK(p.totalRevenue == p.maxAchievableRevenue);
    failures += checkPlanShape(stock, p);
  }

  // ---- taking the best single trip first is not always trip-minimal ----
  {
    const std::vector<plan::StockEntry> stock = {
      entry("OLIVE", 1500, 1000, 1000, 0),
      entry("SILAGE", 20000, 90, 10000, 0),
    };
    const econ::Money target = econ::Money::fromUnits(1800);
    const plan::SellingPlan p = plan::optimizeSales(stock, target);

    CHECK(p.targetMet);
    CHECK(p.totalTrips == 2);
    CHECK(p.totalRevenue >= target);
    CHECK(plan::minimumTripsForTarget(stock, target) == 2);
    failures += checkPlanShape(stock, p);
  }

  // ---- among plans with the fewest trips, sell the least volume ----
  {
    // One trip of either product reaches 500; MILK does it with less volume.
    const std::vector<plan::StockEntry> stock = {
      entry("STRAW", 20000, 100, 8000, 0),
      entry("MILK", 2000, 1000, 2000, 0),
    };
    const plan::SellingPlan p = plan::optimizeSales(stock, econ::Money::fromUnits(500));
    CHECK(p.totalTrips == 1);
    CHECK(p.allocations.size() == 1);
    if (p.allocations.size() == 1) {
      CHECK(p.allocations[0].productId == "MILK");
      CHECK(near(p.allocations[0].volumeSoldL, 500.0));
    }
  }

  // ---- the least-volume plan may come from an entry that is not ranked first ----
  {
    // MAIZE earns more per trip, but one trip of SOY reaches the target with less volume.
    const std::vector<plan::StockEntry> stock = {
      entry("SOY", 3000, 180, 5000, 0),
      entry("MAIZE", 7000, 140, 6000, 0),
    };
    const econ::Money target = econ::Money::fromMinor(25841);
    const plan::SellingPlan p = plan::optimizeSales(stock, target);
    CHECK(p.targetMet);
    CHECK(p.totalTrips == 1);
    CHECK(p.allocations.size() == 1);
    if (p.allocations.size() == 1) {
      CHECK(p.allocations[0].productId == "SOY");
      CHECK(near(p.allocations[0].volumeSoldL, 258.41 * 1000.0 / 180.0, 1e-3));
    }
    failures += checkPlanShape(stock, p);
  }

  // ---- huge targets saturate and are reported unreachable, not rejected ----
  {
    const std::vector<plan::StockEntry> stock = {entry("WHEAT", 5000, 200, 3000, 0)};
    const plan::SellingPlan p = plan::optimizeSales(stock, econ::Money::fromUnits(1e20));
    CHECK(p.status == plan::PlanStatus::TargetNotReached);
    CHECK(!p.targetAmount.isNegative());
    CHECK(p.totalRevenue == econ::Money::fromUnits(1000));
  }

  // ---- zero target ----
  {
    const std::vector<plan::StockEntry> stock = {entry("WHEAT", 5000, 200, 3000, 0)};
    const plan::SellingPlan p = plan::optimizeSales(stock, econ::Money{});
    CHECK(p.status == plan::PlanStatus::ZeroTarget);
    CHECK(p.targetMet);
    CHECK(p.allocations.empty());
    CHECK(p.totalTrips == 0);
    CHECK(p.totalRevenue.isZero());
    CHECK(p.maxAchievableRevenue == econ::Money::fromUnits(1000));
    CHECK(std::string(plan::planStatusReason(p.status)) == "no_plan");
  }

  // ---- negative target is rejected ----
  {
    const std::vector<plan::StockEntry> stock = {entry("WHEAT", 5000, 200, 3000, 0)};
    const plan::SellingPlan p = plan::optimizeSales(stock, econ::Money::fromUnits(-10));
    CHECK(p.status == plan::PlanStatus::InvalidTarget);
    CHECK(!p.targetMet);
    CHECK(p.allocations.empty());
    CHECK(p.totalTrips == 0);
  }

  // ---- nothing eligible ----
  {
    const std::vector<plan::StockEntry> stock = {
      entry("WHEAT", 5000, 200, 3000, 0, /*enabled=*/false),
      entry("BARLEY", 1000, 100, 3000, 2000),  // min stock above quantity
      entry("STRAW", 1000, 0, 3000, 0),        // unpriced
    };
    const plan::SellingPlan p = plan::optimizeSales(stock, econ::Money::fromUnits(100));
    CHECK(p.status == plan::PlanStatus::NoEligibleStock);
    CHECK(!p.targetMet);
    CHECK(p.allocations.empty());
    CHECK(p.maxAchievableRevenue.isZero());
    CHECK(std::string(plan::planStatusReason(p.status)) == "no_products");

    const plan::SellingPlan none = plan::optimizeSales({}, econ::Money::fromUnits(100));
    CHECK(none.status == plan::PlanStatus::NoEligibleStock);
  }

  // ---- disabled entries are never sold, even when valuable ----
  {
    const std::vector<plan::StockEntry> stock = {
      entry("WOOL", 50000, 2400, 5000, 0, /*enabled=*/false),
      entry("WHEAT", 5000, 200, 3000, 0),
    };
    const plan::SellingPlan p = plan::optimizeSales(stock, econ::Money::fromUnits(5000));
    CHECK(findAlloc(p, "WOOL") == nullptr);
    CHECK(!p.targetMet);
    CHECK(p.maxAchievableRevenue == econ::Money::fromUnits(1000));
  }

  // ---- malformed entries are skipped, the rest is planned ----
  {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const std::vector<plan::StockEntry> stock = {
      entry("GRAPE", 5000, 1950, 0, 0),       // zero capacity
      entry("EGG", nan, 2300, 1000, 0),       // not finite
      entry("COTTON", -5, 2200, 1000, 0),     // negative quantity
      entry("", 5000, 1000, 1000, 0),         // empty id
      entry("WHEAT", 5000, 200, 3000, 0),
    };
    const plan::SellingPlan p = plan::optimizeSales(stock, econ::Money::fromUnits(600));
    CHECK(p.targetMet);
    CHECK(p.allocations.size() == 1);
    CHECK(findAlloc(p, "WHEAT") != nullptr);
    CHECK(p.maxAchievableRevenue == econ::Money::fromUnits(1000));
  }

  // ---- duplicate product ids: the first entry wins ----
  {
    const std::vector<plan::StockEntry> stock = {
      entry("WHEAT", 5000, 200, 3000, 0),
      entry("WHEAT", 90000, 900, 3000, 0),
    };
    const plan::SellingPlan p = plan::optimizeSales(stock, econ::Money::fromUnits(100000));
    CHECK(p.maxAchievableRevenue == econ::Money::fromUnits(1000));
    CHECK(p.allocations.size() == 1);
  }

  // ---- whole loads for the entry that completes the target ----
  {
    const std::vector<plan::StockEntry> stock = {entry("WHEAT", 5000, 200, 3000, 0)};

    const plan::SellingPlan trimmed = plan::optimizeSales(stock, econ::Money::fromUnits(700));
    CHECK(trimmed.allocations.size() == 1);
    if (trimmed.allocations.size() == 1) CHECK(near(trimmed.allocations[0].volumeSoldL, 3500.0));

    plan::SalesOptimizerParams params;
    params.trimFinalEntry = false;
    const plan::SellingPlan whole = plan::optimizeSales(stock, econ::Money::fromUnits(700), params);
    CHECK(whole.allocations.size() == 1);
    if (whole.allocations.size() == 1) {
      // Two loads would be 6000 L; only 5000 L are sellable.
      CHECK(near(whole.allocations[0].volumeSoldL, 5000.0));
      CHECK(whole.allocations[0].tripsUsed == 2);
    }
    CHECK(whole.totalTrips == trimmed.totalTrips);
    CHECK(whole.totalRevenue == econ::Money::fromUnits(1000));

    const std::vector<plan::StockEntry> big = {entry("MILK", 30000, 1000, 4000, 0)};
    const plan::SellingPlan loads = plan::optimizeSales(big, econ::Money::fromUnits(5000), params);
    CHECK(loads.allocations.size() == 1);
    if (loads.allocations.size() == 1) {
      CHECK(near(loads.allocations[0].volumeSoldL, 8000.0));
      CHECK(!loads.allocations[0].partialTrip);
    }
  }

  // ---- trip counting helpers ----
  {
    CHECK(plan::tripsForVolume(3000.0, 3000.0) == 1);
    CHECK(plan::tripsForVolume(3000.0 * (1.0 + 1e-15), 3000.0) == 1);
    CHECK(plan::tripsForVolume(3001.0, 3000.0) == 2);
    CHECK(plan::tripsForVolume(0.5, 3000.0) == 1);
    CHECK(plan::tripsForVolume(0.0, 3000.0) == 0);
    CHECK(plan::tripsForVolume(100.0, 0.0) == 0);

    const std::vector<plan::StockEntry> stock = {entry("WHEAT", 5000, 200, 3000, 0)};
    CHECK(plan::minimumTripsForTarget(stock, econ::Money{}) == 0);
    CHECK(plan::minimumTripsForTarget(stock, econ::Money::fromUnits(600)) == 1);
    CHECK(plan::minimumTripsForTarget(stock, econ::Money::fromUnits(601)) == 2);
    CHECK(plan::minimumTripsForTarget(stock, econ::Money::fromUnits(1000.01)) == -1);
  }

  // ---- input order does not change the plan ----
  {
    std::vector<plan::StockEntry> stock = {
      entry("WHEAT", 5000, 200, 3000, 0),
      entry("CANOLA", 8000, 1480, 2000, 500),
      entry("MILK", 12000, 1400, 8000, 2000),
    };
    const econ::Money target = econ::Money::fromUnits(9000);
    const plan::SellingPlan a = plan::optimizeSales(stock, target);
    std::reverse(stock.begin(), stock.end());
    const plan::SellingPlan b = plan::optimizeSales(stock, target);

    CHECK(a.totalTrips == b.totalTrips);
    CHECK(a.totalRevenue == b.totalRevenue);
    CHECK(a.allocations.size() == b.allocations.size());
    for (std::size_t i = 0; i < std::min(a.allocations.size(), b.allocations.size()); ++i) {
      CHECK(a.allocations[i].productId == b.allocations[i].productId);
      CHECK(near(a.allocations[i].volumeSoldL, b.allocations[i].volumeSoldL));
    }
  }

  // ---- trip minimality against exhaustive search on small synthetic farms ----
  {
    static const char* kIds[] = {"P0", "P1", "P2", "P3"};
    Lcg rng{20240917ull};
    int mismatches = 0;
    int volumeMismatches = 0;
    int shapeFailures = 0;

    for (int round = 0; round < 400; ++round) {
      std::vector<plan::StockEntry> stock;
      const int n = rng.range(1, 4);
      for (int i = 0; i < n; ++i) {
        stock.push_back(entry(kIds[i],
                              500.0 * rng.range(0, 20),
                              10.0 * rng.range(0, 30),
                              1000.0 * rng.range(1, 6),
                              500.0 * rng.range(0, 4),
                              rng.range(0, 9) != 0));
      }

      econ::Money maxRevenue{};
      for (const auto& e : stock) {
        if (plan::isEligible(e)) maxRevenue += plan::revenueCap(e);
      }
      // Mostly reachable targets, some slightly above the maximum.
      const econ::Money target = econ::Money::fromMinor(maxRevenue.minor() * rng.range(1, 110) / 100 + 1);

      const plan::SellingPlan p = plan::optimizeSales(stock, target);
      const int expected = bruteForceMinTrips(stock, target);

      if (expected < 0) {
        if (p.targetMet || p.totalRevenue != p.maxAchievableRevenue) ++mismatches;
      } else {
        if (!p.targetMet || p.totalTrips != expected || p.totalRevenue < target) ++mismatches;
        if (plan::minimumTripsForTarget(stock, target) != expected) ++mismatches;
        if (p.totalVolumeSoldL > bruteForceLeastVolume(stock, target, expected) + 1e-6) ++volumeMismatches;
      }
      shapeFailures += checkPlanShape(stock, p);
    }

    CHECK(mismatches == 0);
    CHECK(volumeMismatches == 0);
    CHECK(shapeFailures == 0);
  }

  // ---- a smaller target never needs more trips ----
  {
    static const char* kIds[] = {"P0", "P1", "P2", "P3", "P4"};
    Lcg rng{77ull};
    int violations = 0;

    for (int round = 0; round < 60; ++round) {
      std::vector<plan::StockEntry> stock;
      const int n = rng.range(1, 5);
      for (int i = 0; i < n; ++i) {
        stock.push_back(entry(kIds[i],
                              250.0 * rng.range(1, 60),
                              5.0 * rng.range(1, 300),
                              500.0 * rng.range(1, 12),
                              250.0 * rng.range(0, 8)));
      }

      econ::Money maxRevenue{};
      for (const auto& e : stock) {
        if (plan::isEligible(e)) maxRevenue += plan::revenueCap(e);
      }

      // Ascending targets from zero to a little above the maximum.
      plan::SellingPlan prev = plan::optimizeSales(stock, econ::Money{});
      for (int step = 1; step <= 24; ++step) {
        const econ::Money t = econ::Money::fromMinor(maxRevenue.minor() * step / 20);
        const plan::SellingPlan cur = plan::optimizeSales(stock, t);
        if (cur.targetMet && !prev.targetMet) ++violations;
        if (cur.targetMet && prev.totalTrips > cur.totalTrips) ++violations;
        prev = cur;
      }
    }
    CHECK(violations == 0);
  }

  return failures;
}
