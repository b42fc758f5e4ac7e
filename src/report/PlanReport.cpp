#include "farmstock/report/PlanReport.h"

#include "farmstock/core/JsonWriter.h"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace farmstock::report {

namespace {

struct Labels {
  const char* planTitle;
  const char* stockTitle;
  const char* target;
  const char* product;
  const char* liters;
  const char* trips;
  const char* tripsLower;
  const char* revenue;
  const char* total;
  const char* status;
  const char* quantity;
  const char* sellable;
  const char* price;
  const char* value;
  const char* state;
  const char* on;
  const char* off;
  const char* stockValue;
  const char* sellableValue;
  const char* maxAchievable;
  const char* nothingToSell;
};

constexpr Labels kEnglish{
  "Selling plan", "Stock", "target", "Product", "Liters", "Trips", "trips", "Revenue", "Total", "Status",
  "Quantity", "Sellable", "Price/1000L", "Value", "State", "on", "off",
  "Total stock value", "Sellable value", "max achievable", "(nothing to sell)",
};

constexpr Labels kSpanish{
  "Plan de venta", "Existencias", "objetivo", "Producto", "Litros", "Viajes", "viajes", "Ingresos", "Total", "Estado",
  "Cantidad", "Vendible", "Precio/1000L", "Valor", "Estado", "si", "no",
  "Valor total de existencias", "Valor vendible", "maximo alcanzable", "(nada que vender)",
};

const Labels& labelsFor(econ::Language lang) {
  return (lang == econ::Language::Spanish) ? kSpanish : kEnglish;
}

std::string money(econ::Money m, const ReportOptions& opts) {
  std::string s = m.format(2);
  if (!opts.currencySymbol.empty()) {
    s += ' ';
    s += opts.currencySymbol;
  }
  return s;
}

std::string tripsCell(const plan::TripAllocation& a) {
  std::string s = std::to_string(a.tripsUsed);
  if (a.partialTrip) s += " (" + std::to_string(a.fullTrips) + " + 1)";
  return s;
}

std::string statusLine(const plan::SellingPlan& plan, const ReportOptions& opts, const Labels& L) {
  std::string s = std::string(L.status) + ": " + plan::planStatusReason(plan.status);
  if (plan.status == plan::PlanStatus::TargetNotReached) {
    s += " (" + std::string(L.maxAchievable) + " " + money(plan.maxAchievableRevenue, opts) + ")";
  }
  return s;
}

} // namespace

std::string formatLiters(double volumeL) {
  if (!std::isfinite(volumeL)) return "?";
  const long long whole = std::llround(volumeL);
  const bool neg = whole < 0;
  const std::string digits = std::to_string(neg ? -whole : whole);

  std::string out;
  if (neg) out.push_back('-');
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i > 0 && (digits.size() - i) % 3 == 0) out.push_back(' ');
    out.push_back(digits[i]);
  }
  return out;
}

std::string formatPlanText(const plan::SellingPlan& plan, const ReportOptions& opts) {
  const Labels& L = labelsFor(opts.language);
  std::ostringstream os;

  os << L.planTitle << " (" << L.target << " " << money(plan.targetAmount, opts) << ")\n";

  if (plan.allocations.empty()) {
    os << "  " << L.nothingToSell << "\n";
  } else {
    os << "  " << std::left << std::setw(22) << L.product
       << std::right << std::setw(12) << L.liters
       << std::setw(14) << L.trips
       << std::setw(18) << L.revenue << "\n";
    for (const plan::TripAllocation& a : plan.allocations) {
      os << "  " << std::left << std::setw(22) << std::string(econ::productDisplayName(a.productId, opts.language))
         << std::right << std::setw(12) << formatLiters(a.volumeSoldL)
         << std::setw(14) << tripsCell(a)
         << std::setw(18) << money(a.revenue, opts) << "\n";
    }
  }

  os << L.total << ": " << plan.totalTrips << " " << L.tripsLower << ", "
     << formatLiters(plan.totalVolumeSoldL) << " L, "
     << money(plan.totalRevenue, opts) << "\n";
  os << statusLine(plan, opts, L) << "\n";
  return os.str();
}

std::string formatStockText(const std::vector<plan::StockEntry>& stock, const ReportOptions& opts) {
  const Labels& L = labelsFor(opts.language);
  std::ostringstream os;

  econ::Money totalValue{};
  econ::Money sellableValue{};

  os << L.stockTitle << "\n";
  os << "  " << std::left << std::setw(22) << L.product
     << std::right << std::setw(12) << L.quantity
     << std::setw(12) << L.sellable
     << std::setw(14) << L.price
     << std::setw(18) << L.value
     << std::setw(8) << L.state << "\n";

  for (const plan::StockEntry& e : stock) {
    const econ::Money value = econ::revenueFor(e.quantityL, e.pricePerThousand);
    totalValue += value;
    if (plan::isEligible(e)) sellableValue += plan::revenueCap(e);

    std::ostringstream price;
    price << std::fixed << std::setprecision(0) << e.pricePerThousand;

    os << "  " << std::left << std::setw(22) << std::string(econ::productDisplayName(e.productId, opts.language))
       << std::right << std::setw(12) << formatLiters(e.quantityL)
       << std::setw(12) << formatLiters(plan::sellableVolumeL(e))
       << std::setw(14) << price.str()
       << std::setw(18) << money(value, opts)
       << std::setw(8) << (e.enabled ? L.on : L.off) << "\n";
  }

  os << L.stockValue << ": " << money(totalValue, opts) << "\n";
  os << L.sellableValue << ": " << money(sellableValue, opts) << "\n";
  return os.str();
}

void writePlanJson(core::JsonWriter& j, const plan::SellingPlan& plan, const ReportOptions& opts) {
  j.beginObject();
  j.key("status"); j.value(plan::planStatusReason(plan.status));
  j.key("targetMet"); j.value(plan.targetMet);
  j.key("target"); j.valueFixed(plan.targetAmount.toUnits(), 2);
  j.key("totalRevenue"); j.valueFixed(plan.totalRevenue.toUnits(), 2);
  j.key("maxAchievableRevenue"); j.valueFixed(plan.maxAchievableRevenue.toUnits(), 2);
  j.key("totalTrips"); j.value(plan.totalTrips);
  j.key("totalVolumeL"); j.valueFixed(plan.totalVolumeSoldL, 3);
  j.key("currency"); j.value(opts.currencySymbol);

  j.key("allocations");
  j.beginArray();
  for (const plan::TripAllocation& a : plan.allocations) {
    j.beginObject();
    j.key("productId"); j.value(a.productId);
    j.key("name"); j.value(econ::productDisplayName(a.productId, opts.language));
    j.key("volumeL"); j.valueFixed(a.volumeSoldL, 3);
    j.key("trips"); j.value(a.tripsUsed);
    j.key("fullTrips"); j.value(a.fullTrips);
    j.key("partialTrip"); j.value(a.partialTrip);
    j.key("revenue"); j.valueFixed(a.revenue.toUnits(), 2);
    j.endObject();
  }
  j.endArray();

  j.endObject();
}

} // namespace farmstock::report
