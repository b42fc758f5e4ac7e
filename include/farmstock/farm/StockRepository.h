#pragma once

#include "farmstock/core/Types.h"
#include "farmstock/econ/Money.h"
#include "farmstock/plan/SalesOptimizer.h"
#include "farmstock/plan/StockEntry.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace farmstock::farm {

struct Farm {
  std::string id{};   // 10 lowercase hex characters
  std::string name{};
  std::vector<plan::StockEntry> stock{};

  // Last plan computed for this stock; cleared by any stock change.
  std::optional<plan::SellingPlan> lastPlan{};
};

struct RepoResult {
  bool ok{false};
  // Short machine-friendly reason on failure:
  //  - "unknown_farm"
  //  - "unknown_product"
  //  - "invalid_entry"
  const char* reason{nullptr};
  plan::StockEntryIssue issue{plan::StockEntryIssue::None};
};

// In-memory store of farms and their stock.
//
// Entries are validated here, once, so the optimizer only ever sees
// well-formed stock. Farm pointers returned by findFarm()/activeFarm() stay
// valid until the next createFarm() or removeFarm().
class StockRepository {
public:
  explicit StockRepository(core::u64 idSeed = 0x46534d53544f434bull);

  // Creates a farm and makes it active if no farm was active. Returns its id.
  std::string createFarm(std::string_view name);
  bool removeFarm(std::string_view farmId);

  Farm* findFarm(std::string_view farmId);
  const Farm* findFarm(std::string_view farmId) const;
  const std::vector<Farm>& farms() const { return farms_; }

  bool setActiveFarm(std::string_view farmId);
  const std::string& activeFarmId() const { return activeId_; }
  Farm* activeFarm() { return findFarm(activeId_); }

  // Adds the entry, or replaces the entry with the same product id.
  RepoResult upsertStock(std::string_view farmId, const plan::StockEntry& entry);
  RepoResult removeStock(std::string_view farmId, std::string_view productId);
  RepoResult setEnabled(std::string_view farmId, std::string_view productId, bool enabled);

  const plan::StockEntry* findStock(std::string_view farmId, std::string_view productId) const;

  // Copy of the farm's stock for the optimizer (empty for unknown farms).
  std::vector<plan::StockEntry> snapshot(std::string_view farmId, bool enabledOnly = true) const;

  RepoResult recordPlan(std::string_view farmId, plan::SellingPlan plan);
  const plan::SellingPlan* lastPlan(std::string_view farmId) const;

private:
  std::string nextFarmId();

  std::vector<Farm> farms_{};
  std::string activeId_{};
  core::u64 idSeed_{0};
  core::u64 idCounter_{0};
};

// Optimizes the farm's current stock and records the plan as its last plan.
// Returns std::nullopt for an unknown farm.
std::optional<plan::SellingPlan> optimizeFarm(StockRepository& repo,
                                              std::string_view farmId,
                                              econ::Money target,
                                              const plan::SalesOptimizerParams& params = {});

} // namespace farmstock::farm
