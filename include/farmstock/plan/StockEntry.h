#pragma once

#include "farmstock/core/Types.h"
#include "farmstock/econ/Money.h"

#include <string>

namespace farmstock::plan {

// One sellable product held by a farm. Volumes are liters.
struct StockEntry {
  std::string productId{};
  double quantityL{0.0};
  double pricePerThousand{0.0}; // currency units per 1000 L
  double capacityPerTripL{0.0}; // volume one delivery trip can carry
  double minStockToKeepL{0.0};  // never sold
  bool enabled{true};           // disabled entries are never sold
};

enum class StockEntryIssue : core::u8 {
  None = 0,
  EmptyId,
  NotFinite,
  NegativeQuantity,
  NegativePrice,
  NonPositiveCapacity,
  NegativeMinStock,
};

// Checks the invariants a repository must enforce before storing an entry.
// minStockToKeep > quantity is allowed (the entry simply has nothing to sell).
StockEntryIssue validateStockEntry(const StockEntry& e);

// Short machine-friendly name ("none", "non_positive_capacity", ...).
const char* stockEntryIssueName(StockEntryIssue issue);

// max(0, quantity - minStockToKeep); 0 for malformed entries.
double sellableVolumeL(const StockEntry& e);

// Revenue from selling the whole sellable volume.
econ::Money revenueCap(const StockEntry& e);

// Revenue of one loaded trip: min(capacity, sellable) liters.
econ::Money perTripRevenue(const StockEntry& e);

// Enabled, well formed, priced and with something left to sell.
bool isEligible(const StockEntry& e);

} // namespace farmstock::plan
