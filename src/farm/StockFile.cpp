#include "farmstock/farm/StockFile.h"

#include "farmstock/core/Log.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace farmstock::farm {

static bool hasWhitespace(std::string_view s) {
  return std::any_of(s.begin(), s.end(), [](char c) { return std::isspace((unsigned char)c) != 0; });
}

static void setError(std::string* outError, const std::string& msg) {
  if (outError) *outError = msg;
}

bool saveStockFile(const StockFileData& data, const std::string& path, std::string* outError) {
  for (const plan::StockEntry& e : data.entries) {
    if (e.productId.empty() || hasWhitespace(e.productId)) {
      setError(outError, "StockFile: product id '" + e.productId + "' cannot be stored");
      return false;
    }
  }

  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f) {
    setError(outError, "StockFile: failed to open file for writing: " + path);
    core::log(core::LogLevel::Error, "StockFile: failed to open file for writing: " + path);
    return false;
  }

  f.setf(std::ios::fixed);
  f.precision(6);

  f << "FarmStock " << kStockFileVersion << "\n";
  if (!data.name.empty()) f << "name " << data.name << "\n";

  for (const plan::StockEntry& e : data.entries) {
    f << "entry " << e.productId << " "
      << e.quantityL << " "
      << e.pricePerThousand << " "
      << e.capacityPerTripL << " "
      << e.minStockToKeepL << " "
      << (e.enabled ? 1 : 0) << "\n";
  }

  if (data.lastPlan) {
    const plan::SellingPlan& p = *data.lastPlan;
    f << "plan "
      << p.targetAmount.minor() << " "
      << p.totalRevenue.minor() << " "
      << p.maxAchievableRevenue.minor() << " "
      << (p.targetMet ? 1 : 0) << " "
      << static_cast<int>(p.status) << " "
      << p.allocations.size() << "\n";
    for (const plan::TripAllocation& a : p.allocations) {
      f << "alloc " << a.productId << " "
        << a.volumeSoldL << " "
        << a.tripsUsed << " "
        << a.fullTrips << " "
        << (a.partialTrip ? 1 : 0) << " "
        << a.revenue.minor() << "\n";
    }
  }

  f.flush();
  if (!f) {
    setError(outError, "StockFile: write failed: " + path);
    return false;
  }
  return true;
}

bool loadStockFile(const std::string& path, StockFileData& out, std::string* outError) {
  std::ifstream f(path);
  if (!f) {
    setError(outError, "StockFile: failed to open file: " + path);
    return false;
  }

  std::string line;
  int lineNo = 0;

  auto fail = [&](const std::string& what) {
    setError(outError, path + ":" + std::to_string(lineNo) + ": " + what);
    core::log(core::LogLevel::Error, "StockFile: " + path + ":" + std::to_string(lineNo) + ": " + what);
    return false;
  };

  if (!std::getline(f, line)) return fail("empty file");
  ++lineNo;
  {
    std::istringstream hs(line);
    std::string header;
    int version = 0;
    if (!(hs >> header >> version) || header != "FarmStock") return fail("bad header");
    if (version < 1 || version > kStockFileVersion) return fail("unsupported version " + std::to_string(version));
  }

  StockFileData data;
  std::size_t pendingAllocs = 0;

  while (std::getline(f, line)) {
    ++lineNo;
    std::istringstream ls(line);
    std::string key;
    if (!(ls >> key) || key[0] == '#') continue;

    if (key == "name") {
      std::string rest;
      std::getline(ls, rest);
      const auto b = rest.find_first_not_of(" \t");
      data.name = (b == std::string::npos) ? std::string() : rest.substr(b);
    } else if (key == "entry") {
      plan::StockEntry e;
      int enabled = 1;
      if (!(ls >> e.productId >> e.quantityL >> e.pricePerThousand >> e.capacityPerTripL >> e.minStockToKeepL)) {
        return fail("malformed entry line");
      }
      if (ls >> enabled) e.enabled = (enabled != 0);
      data.entries.push_back(std::move(e));
    } else if (key == "plan") {
      long long target = 0;
      long long revenue = 0;
      long long maxRevenue = 0;
      int met = 0;
      int status = 0;
      std::size_t count = 0;
      if (!(ls >> target >> revenue >> maxRevenue >> met >> status >> count)) return fail("malformed plan line");
      if (status < 0 || status > static_cast<int>(plan::PlanStatus::InvalidTarget)) return fail("bad plan status");

      plan::SellingPlan p;
      p.targetAmount = econ::Money::fromMinor(target);
      p.totalRevenue = econ::Money::fromMinor(revenue);
      p.maxAchievableRevenue = econ::Money::fromMinor(maxRevenue);
      p.targetMet = (met != 0);
      p.status = static_cast<plan::PlanStatus>(status);
      p.allocations.reserve(count);
      data.lastPlan = std::move(p);
      pendingAllocs = count;
    } else if (key == "alloc") {
      if (!data.lastPlan || pendingAllocs == 0) return fail("alloc outside of a plan block");
      plan::TripAllocation a;
      int partial = 0;
      long long revenue = 0;
      if (!(ls >> a.productId >> a.volumeSoldL >> a.tripsUsed >> a.fullTrips >> partial >> revenue)) {
        return fail("malformed alloc line");
      }
      a.partialTrip = (partial != 0);
      a.revenue = econ::Money::fromMinor(revenue);

      plan::SellingPlan& p = *data.lastPlan;
      p.totalTrips += a.tripsUsed;
      p.totalVolumeSoldL += a.volumeSoldL;
      p.allocations.push_back(std::move(a));
      --pendingAllocs;
    } else {
      core::log(core::LogLevel::Debug, "StockFile: skipping unknown key '" + key + "'");
    }
  }

  if (pendingAllocs != 0) return fail("plan block is missing allocations");

  out = std::move(data);
  return true;
}

static bool parseNumber(const std::string& text, double& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  const double v = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0') return false;
  out = v;
  return true;
}

bool parseStockEntryArg(std::string_view text, plan::StockEntry& out, std::string* outError) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  for (;;) {
    const std::size_t colon = text.find(':', start);
    parts.emplace_back(text.substr(start, colon == std::string_view::npos ? std::string_view::npos : colon - start));
    if (colon == std::string_view::npos) break;
    start = colon + 1;
  }

  if (parts.size() != 5 && parts.size() != 6) {
    setError(outError, "expected ID:qty:price:capacity:minKeep[:on|off], got '" + std::string(text) + "'");
    return false;
  }

  plan::StockEntry e;
  e.productId = parts[0];
  if (e.productId.empty()) {
    setError(outError, "empty product id in '" + std::string(text) + "'");
    return false;
  }

  double* fields[] = {&e.quantityL, &e.pricePerThousand, &e.capacityPerTripL, &e.minStockToKeepL};
  for (std::size_t i = 0; i < 4; ++i) {
    if (!parseNumber(parts[i + 1], *fields[i])) {
      setError(outError, "bad number '" + parts[i + 1] + "' in '" + std::string(text) + "'");
      return false;
    }
  }

  if (parts.size() == 6) {
    std::string s = parts[5];
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    if (s == "on" || s == "1" || s == "true" || s == "enabled") {
      e.enabled = true;
    } else if (s == "off" || s == "0" || s == "false" || s == "disabled") {
      e.enabled = false;
    } else {
      setError(outError, "bad enabled state '" + parts[5] + "' in '" + std::string(text) + "'");
      return false;
    }
  }

  out = std::move(e);
  return true;
}

} // namespace farmstock::farm
