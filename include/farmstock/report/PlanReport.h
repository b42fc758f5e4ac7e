#pragma once

#include "farmstock/econ/Product.h"
#include "farmstock/plan/SalesOptimizer.h"
#include "farmstock/plan/StockEntry.h"

#include <string>
#include <vector>

namespace farmstock::core {
class JsonWriter;
}

namespace farmstock::report {

struct ReportOptions {
  econ::Language language{econ::Language::English};
  std::string currencySymbol{"EUR"};
};

// "12 500" (whole liters, space-grouped).
std::string formatLiters(double volumeL);

// Human-readable plan table with totals and a status line.
std::string formatPlanText(const plan::SellingPlan& plan, const ReportOptions& opts = {});

// Stock table: per-entry value of the full quantity, sellable liters, and
// the value of everything sellable across eligible entries.
std::string formatStockText(const std::vector<plan::StockEntry>& stock, const ReportOptions& opts = {});

// One JSON object describing the plan. Amounts are in currency units with
// two decimals; volumes in liters.
void writePlanJson(core::JsonWriter& j, const plan::SellingPlan& plan, const ReportOptions& opts = {});

} // namespace farmstock::report
