#include "farmstock/farm/StockRepository.h"

#include "farmstock/core/Hash.h"
#include "farmstock/core/Log.h"

#include <algorithm>
#include <cstdio>

namespace farmstock::farm {

StockRepository::StockRepository(core::u64 idSeed) : idSeed_(idSeed) {}

std::string StockRepository::nextFarmId() {
  for (;;) {
    const core::u64 h = core::hashCombine(idSeed_, ++idCounter_);
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)h);
    std::string id(buf, 10);
    if (!findFarm(id)) return id;
  }
}

std::string StockRepository::createFarm(std::string_view name) {
  Farm f;
  f.id = nextFarmId();
  f.name = name.empty() ? std::string("My farm") : std::string(name);
  farms_.push_back(std::move(f));

  const std::string& id = farms_.back().id;
  if (activeId_.empty()) activeId_ = id;
  FARMSTOCK_LOG_DEBUG("StockRepository: created farm " + id + " '" + farms_.back().name + "'");
  return id;
}

bool StockRepository::removeFarm(std::string_view farmId) {
  const auto it = std::find_if(farms_.begin(), farms_.end(), [&](const Farm& f) { return f.id == farmId; });
  if (it == farms_.end()) return false;
  const bool wasActive = (it->id == activeId_);
  farms_.erase(it);
  if (wasActive) activeId_ = farms_.empty() ? std::string() : farms_.front().id;
  return true;
}

Farm* StockRepository::findFarm(std::string_view farmId) {
  for (Farm& f : farms_) {
    if (f.id == farmId) return &f;
  }
  return nullptr;
}

const Farm* StockRepository::findFarm(std::string_view farmId) const {
  for (const Farm& f : farms_) {
    if (f.id == farmId) return &f;
  }
  return nullptr;
}

bool StockRepository::setActiveFarm(std::string_view farmId) {
  if (!findFarm(farmId)) return false;
  activeId_ = std::string(farmId);
  return true;
}

RepoResult StockRepository::upsertStock(std::string_view farmId, const plan::StockEntry& entry) {
  RepoResult r{};
  Farm* farm = findFarm(farmId);
  if (!farm) {
    r.reason = "unknown_farm";
    return r;
  }

  r.issue = plan::validateStockEntry(entry);
  if (r.issue != plan::StockEntryIssue::None) {
    FARMSTOCK_LOG_WARN("StockRepository: rejected entry '" + entry.productId + "' (" +
                       plan::stockEntryIssueName(r.issue) + ")");
    r.reason = "invalid_entry";
    return r;
  }

  auto it = std::find_if(farm->stock.begin(), farm->stock.end(), [&](const plan::StockEntry& e) {
    return e.productId == entry.productId;
  });
  if (it != farm->stock.end()) {
    *it = entry;
  } else {
    farm->stock.push_back(entry);
  }

  farm->lastPlan.reset();
  r.ok = true;
  return r;
}

RepoResult StockRepository::removeStock(std::string_view farmId, std::string_view productId) {
  RepoResult r{};
  Farm* farm = findFarm(farmId);
  if (!farm) {
    r.reason = "unknown_farm";
    return r;
  }

  const auto it = std::find_if(farm->stock.begin(), farm->stock.end(), [&](const plan::StockEntry& e) {
    return e.productId == productId;
  });
  if (it == farm->stock.end()) {
    r.reason = "unknown_product";
    return r;
  }

  farm->stock.erase(it);
  farm->lastPlan.reset();
  r.ok = true;
  return r;
}

RepoResult StockRepository::setEnabled(std::string_view farmId, std::string_view productId, bool enabled) {
  RepoResult r{};
  Farm* farm = findFarm(farmId);
  if (!farm) {
    r.reason = "unknown_farm";
    return r;
  }

  for (plan::StockEntry& e : farm->stock) {
    if (e.productId != productId) continue;
    if (e.enabled != enabled) {
      e.enabled = enabled;
      farm->lastPlan.reset();
    }
    r.ok = true;
    return r;
  }

  r.reason = "unknown_product";
  return r;
}

const plan::StockEntry* StockRepository::findStock(std::string_view farmId, std::string_view productId) const {
  const Farm* farm = findFarm(farmId);
  if (!farm) return nullptr;
  for (const plan::StockEntry& e : farm->stock) {
    if (e.productId == productId) return &e;
  }
  return nullptr;
}

std::vector<plan::StockEntry> StockRepository::snapshot(std::string_view farmId, bool enabledOnly) const {
  std::vector<plan::StockEntry> out;
  const Farm* farm = findFarm(farmId);
  if (!farm) return out;

  out.reserve(farm->stock.size());
  for (const plan::StockEntry& e : farm->stock) {
    if (enabledOnly && !e.enabled) continue;
    out.push_back(e);
  }
  return out;
}

RepoResult StockRepository::recordPlan(std::string_view farmId, plan::SellingPlan plan) {
  RepoResult r{};
  Farm* farm = findFarm(farmId);
  if (!farm) {
    r.reason = "unknown_farm";
    return r;
  }
  farm->lastPlan = std::move(plan);
  r.ok = true;
  return r;
}

const plan::SellingPlan* StockRepository::lastPlan(std::string_view farmId) const {
  const Farm* farm = findFarm(farmId);
  if (!farm || !farm->lastPlan) return nullptr;
  return &*farm->lastPlan;
}

std::optional<plan::SellingPlan> optimizeFarm(StockRepository& repo,
                                              std::string_view farmId,
                                              econ::Money target,
                                              const plan::SalesOptimizerParams& params) {
  if (!repo.findFarm(farmId)) {
    FARMSTOCK_LOG_ERROR("optimizeFarm: unknown farm " + std::string(farmId));
    return std::nullopt;
  }

  plan::SellingPlan result = plan::optimizeSales(repo.snapshot(farmId), target, params);
  const RepoResult rec = repo.recordPlan(farmId, result);
  if (!rec.ok) {
    FARMSTOCK_LOG_WARN(std::string("optimizeFarm: plan not recorded (") + rec.reason + ")");
  }
  return result;
}

} // namespace farmstock::farm
