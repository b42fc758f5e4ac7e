#pragma once

#include "farmstock/plan/SalesOptimizer.h"
#include "farmstock/plan/StockEntry.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace farmstock::farm {

// Line-based stock file used by the command line tool:
//
//   FarmStock 1
//   name North field farm
//   entry WHEAT 5000 200 3000 0 1
//   entry MILK 12000 1400 8000 2000 0
//   plan 90000 90000 190000 1 0 1
//   alloc WHEAT 4500 2 1 1 90000
//
// entry: id quantityL pricePer1000 capacityPerTripL minStockToKeepL enabled(0|1)
// plan:  targetMinor revenueMinor maxRevenueMinor targetMet status allocationCount
// alloc: id volumeL trips fullTrips partialTrip(0|1) revenueMinor
//
// Product ids must not contain whitespace. Unknown keys are skipped.
struct StockFileData {
  std::string name{};
  std::vector<plan::StockEntry> entries{};
  std::optional<plan::SellingPlan> lastPlan{};
};

constexpr int kStockFileVersion = 1;

bool saveStockFile(const StockFileData& data, const std::string& path, std::string* outError = nullptr);
bool loadStockFile(const std::string& path, StockFileData& out, std::string* outError = nullptr);

// Parses "ID:qty:price:capacity:minKeep[:on|off]" (the CLI --entry form).
bool parseStockEntryArg(std::string_view text, plan::StockEntry& out, std::string* outError = nullptr);

} // namespace farmstock::farm
