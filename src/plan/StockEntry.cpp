#include "farmstock/plan/StockEntry.h"

#include <algorithm>
#include <cmath>

namespace farmstock::plan {

StockEntryIssue validateStockEntry(const StockEntry& e) {
  if (e.productId.empty()) return StockEntryIssue::EmptyId;
  if (!std::isfinite(e.quantityL) || !std::isfinite(e.pricePerThousand) ||
      !std::isfinite(e.capacityPerTripL) || !std::isfinite(e.minStockToKeepL)) {
    return StockEntryIssue::NotFinite;
  }
  if (e.quantityL < 0.0) return StockEntryIssue::NegativeQuantity;
  if (e.pricePerThousand < 0.0) return StockEntryIssue::NegativePrice;
  if (e.capacityPerTripL <= 0.0) return StockEntryIssue::NonPositiveCapacity;
  if (e.minStockToKeepL < 0.0) return StockEntryIssue::NegativeMinStock;
  return StockEntryIssue::None;
}

const char* stockEntryIssueName(StockEntryIssue issue) {
  switch (issue) {
    case StockEntryIssue::None: return "none";
    case StockEntryIssue::EmptyId: return "empty_id";
    case StockEntryIssue::NotFinite: return "not_finite";
    case StockEntryIssue::NegativeQuantity: return "negative_quantity";
    case StockEntryIssue::NegativePrice: return "negative_price";
    case StockEntryIssue::NonPositiveCapacity: return "non_positive_capacity";
    case StockEntryIssue::NegativeMinStock: return "negative_min_stock";
  }
  return "unknown";
}

double sellableVolumeL(const StockEntry& e) {
  if (validateStockEntry(e) != StockEntryIssue::None) return 0.0;
  return std::max(0.0, e.quantityL - e.minStockToKeepL);
}

econ::Money revenueCap(const StockEntry& e) {
  return econ::revenueFor(sellableVolumeL(e), e.pricePerThousand);
}

econ::Money perTripRevenue(const StockEntry& e) {
  return econ::revenueFor(std::min(e.capacityPerTripL, sellableVolumeL(e)), e.pricePerThousand);
}

bool isEligible(const StockEntry& e) {
  return e.enabled &&
         validateStockEntry(e) == StockEntryIssue::None &&
         e.pricePerThousand > 0.0 &&
         sellableVolumeL(e) > 0.0;
}

} // namespace farmstock::plan
