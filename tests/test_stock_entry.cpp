#include "farmstock/plan/StockEntry.h"

#include "test_harness.h"

#include <cmath>
#include <limits>
#include <string>

int test_stock_entry() {
  int failures = 0;

  using namespace farmstock;
  using plan::StockEntry;
  using plan::StockEntryIssue;

  StockEntry wheat;
  wheat.productId = "WHEAT";
  wheat.quantityL = 5000.0;
  wheat.pricePerThousand = 200.0;
  wheat.capacityPerTripL = 3000.0;
  wheat.minStockToKeepL = 1000.0;

  // ---- derived values ----
  {
    CHECK(plan::validateStockEntry(wheat) == StockEntryIssue::None);
    CHECK(plan::sellableVolumeL(wheat) == 4000.0);
    CHECK(plan::revenueCap(wheat) == econ::Money::fromUnits(800));
    CHECK(plan::perTripRevenue(wheat) == econ::Money::fromUnits(600));
    CHECK(plan::isEligible(wheat));

    // A trip never carries more than what is sellable.
    StockEntry small = wheat;
    small.quantityL = 1500.0;
    CHECK(plan::perTripRevenue(small) == econ::Money::fromUnits(100));
  }

  // ---- validation issues ----
  {
    StockEntry e = wheat;
    e.productId.clear();
    CHECK(plan::validateStockEntry(e) == StockEntryIssue::EmptyId);

    e = wheat;
    e.pricePerThousand = std::numeric_limits<double>::infinity();
    CHECK(plan::validateStockEntry(e) == StockEntryIssue::NotFinite);

    e = wheat;
    e.quantityL = -1.0;
    CHECK(plan::validateStockEntry(e) == StockEntryIssue::NegativeQuantity);

    e = wheat;
    e.pricePerThousand = -1.0;
    CHECK(plan::validateStockEntry(e) == StockEntryIssue::NegativePrice);

    e = wheat;
    e.capacityPerTripL = 0.0;
    CHECK(plan::validateStockEntry(e) == StockEntryIssue::NonPositiveCapacity);
    CHECK(plan::sellableVolumeL(e) == 0.0);
    CHECK(!plan::isEligible(e));

    e = wheat;
    e.minStockToKeepL = -5.0;
    CHECK(plan::validateStockEntry(e) == StockEntryIssue::NegativeMinStock);

    CHECK(std::string(plan::stockEntryIssueName(StockEntryIssue::NonPositiveCapacity)) == "non_positive_capacity");
    CHECK(std::string(plan::stockEntryIssueName(StockEntryIssue::None)) == "none");
  }

  // ---- eligibility ----
  {
    StockEntry e = wheat;
    e.enabled = false;
    CHECK(!plan::isEligible(e));

    e = wheat;
    e.pricePerThousand = 0.0;
    CHECK(plan::validateStockEntry(e) == StockEntryIssue::None);
    CHECK(!plan::isEligible(e));

    // Keeping more than is held is allowed; nothing is sellable.
    e = wheat;
    e.minStockToKeepL = 9000.0;
    CHECK(plan::validateStockEntry(e) == StockEntryIssue::None);
    CHECK(plan::sellableVolumeL(e) == 0.0);
    CHECK(plan::revenueCap(e).isZero());
    CHECK(!plan::isEligible(e));
  }

  return failures;
}
