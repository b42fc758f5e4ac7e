#include "farmstock/core/Args.h"
#include "farmstock/core/CVar.h"
#include "farmstock/core/JobSystem.h"
#include "farmstock/core/JsonWriter.h"
#include "farmstock/core/Log.h"
#include "farmstock/econ/Money.h"
#include "farmstock/econ/Product.h"
#include "farmstock/farm/StockFile.h"
#include "farmstock/farm/StockRepository.h"
#include "farmstock/plan/SalesOptimizer.h"
#include "farmstock/report/PlanReport.h"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace farmstock;

static constexpr int kExitUsage = 2;

static void printHelp() {
  std::cout << "farmstock_cli\n"
            << "  --stock <file>         Load stock from a stock file\n"
            << "  --entry <desc>         Add a stock entry: ID:qty:price:capacity:minKeep[:on|off]\n"
            << "                         (repeatable; price is per 1000 L)\n"
            << "  --target <amount>      Amount of money to raise (default: cvar plan.default_target)\n"
            << "  --sweep <a b c ...>    Plan several targets at once (parallel)\n"
            << "  --wholeLoads           The entry that completes the target sells whole trip loads\n"
            << "                         (default: cvar plan.whole_loads)\n"
            << "  --showStock            Print the stock table before the plan\n"
            << "  --listProducts         Print the built-in product catalog and exit\n"
            << "  --save <file>          Write stock and the computed plan to a stock file\n"
            << "  --json                 Emit machine-readable JSON to stdout (also works with --out)\n"
            << "  --out <path>           Write JSON output to a file instead of stdout ('-' means stdout)\n"
            << "\n"
            << "Configuration:\n"
            << "  --config <file>        Load cvars (name = value) from a config file\n"
            << "  --set <name=value>     Set one cvar, after --config (repeatable)\n"
            << "  --listConfig           Print every cvar with its value and exit\n"
            << "  --log <level>          trace|debug|info|warn|error|off (overrides log.level)\n"
            << "  --lang <en|es>         Product names and report labels (overrides plan.language)\n"
            << "  -h, --help             Show this help\n";
}

static void printConfig() {
  for (const core::CVar* v : core::cvars().list()) {
    std::cout << "  " << std::left << std::setw(24) << v->name
              << std::setw(12) << core::CVarRegistry::formatValue(*v) << v->help << "\n";
  }
}

static void printProducts(econ::Language lang) {
  for (const econ::ProductDef& p : econ::productTable()) {
    std::cout << "  " << std::left << std::setw(14) << p.id
              << std::setw(22) << std::string(econ::productDisplayName(p.id, lang))
              << std::right << std::fixed << std::setprecision(0) << std::setw(8)
              << p.defaultPricePerThousand << "\n";
  }
}

int main(int argc, char** argv) {
  core::Args args;
  args.setArity("sweep", -1);
  args.parse(argc, argv);

  if (args.hasFlag("help") || args.hasFlag("h")) {
    printHelp();
    return 0;
  }

  core::installDefaultCVars();

  std::string configPath;
  if (args.getString("config", configPath)) {
    std::string err;
    if (!core::cvars().loadFile(configPath, &err)) {
      std::cerr << "Failed to load --config: " << err << "\n";
      return kExitUsage;
    }
  }

  for (const std::string& assignment : args.values("set")) {
    const std::size_t eq = assignment.find('=');
    std::string err;
    if (eq == std::string::npos) {
      std::cerr << "Invalid --set '" << assignment << "': expected name=value\n";
      return kExitUsage;
    }
    if (!core::cvars().setFromText(assignment.substr(0, eq), assignment.substr(eq + 1), &err)) {
      std::cerr << "Invalid --set: " << err << "\n";
      return kExitUsage;
    }
  }

  if (args.hasFlag("listConfig")) {
    printConfig();
    return 0;
  }

  std::string logLevel;
  if (args.getString("log", logLevel)) {
    core::LogLevel lvl{};
    if (!core::parseLogLevel(logLevel, lvl)) {
      std::cerr << "Invalid --log: '" << logLevel << "'\n";
      return kExitUsage;
    }
    std::string err;
    if (!core::cvars().setString("log.level", logLevel, &err)) {
      std::cerr << "Failed to set log.level: " << err << "\n";
      return kExitUsage;
    }
  }

  report::ReportOptions reportOpts;
  reportOpts.currencySymbol = core::cvars().getString("plan.currency_symbol", "EUR");
  {
    std::string lang = core::cvars().getString("plan.language", "en");
    (void)args.getString("lang", lang);
    if (!econ::tryParseLanguage(lang, reportOpts.language)) {
      std::cerr << "Invalid language: '" << lang << "' (expected en or es)\n";
      return kExitUsage;
    }
  }

  if (args.hasFlag("listProducts")) {
    printProducts(reportOpts.language);
    return 0;
  }

  // Stock.
  farm::StockRepository repo;
  std::string farmId;

  std::string stockPath;
  if (args.getString("stock", stockPath)) {
    farm::StockFileData data;
    std::string err;
    if (!farm::loadStockFile(stockPath, data, &err)) {
      std::cerr << "Failed to load --stock: " << err << "\n";
      return kExitUsage;
    }
    farmId = repo.createFarm(data.name);
    for (const plan::StockEntry& e : data.entries) {
      const farm::RepoResult r = repo.upsertStock(farmId, e);
      if (!r.ok) {
        std::cerr << "Skipping stock entry '" << e.productId << "': "
                  << plan::stockEntryIssueName(r.issue) << "\n";
      }
    }
  }

  const std::vector<std::string> entryArgs = args.values("entry");
  if (!entryArgs.empty()) {
    if (farmId.empty()) farmId = repo.createFarm({});
    for (const std::string& arg : entryArgs) {
      plan::StockEntry e;
      std::string err;
      if (!farm::parseStockEntryArg(arg, e, &err)) {
        std::cerr << "Invalid --entry: " << err << "\n";
        return kExitUsage;
      }
      const farm::RepoResult r = repo.upsertStock(farmId, e);
      if (!r.ok) {
        std::cerr << "Invalid --entry '" << arg << "': " << plan::stockEntryIssueName(r.issue) << "\n";
        return kExitUsage;
      }
    }
  }

  if (farmId.empty()) {
    std::cerr << "No stock given (use --stock or --entry). See --help.\n";
    return kExitUsage;
  }

  // Targets.
  double target = core::cvars().getFloat("plan.default_target", 0.0);
  if (args.has("target") && !args.getDouble("target", target)) {
    std::cerr << "Invalid --target: '" << args.last("target").value_or("") << "'\n";
    return kExitUsage;
  }

  std::vector<econ::Money> sweep;
  for (const std::string& s : args.values("sweep")) {
    double v = 0.0;
    if (!core::Args::parseDouble(s, v) || !econ::Money::fitsUnits(v) || v < 0.0) {
      std::cerr << "Invalid --sweep value: '" << s << "'\n";
      return kExitUsage;
    }
    sweep.push_back(econ::Money::fromUnits(v));
  }

  if (sweep.empty() && (!econ::Money::fitsUnits(target) || target < 0.0)) {
    std::cerr << "Invalid target: must be a non-negative amount up to "
              << econ::Money::fromUnits(econ::Money::kMaxUnits).format(0) << "\n";
    return kExitUsage;
  }

  plan::SalesOptimizerParams params;
  params.trimFinalEntry = !(args.hasFlag("wholeLoads") || core::cvars().getBool("plan.whole_loads", false));

  std::vector<plan::SellingPlan> plans;
  if (!sweep.empty()) {
    core::JobSystem jobs(core::JobSystem::clampThreadCount(core::cvars().getInt("jobs.threads", 0)));
    plans = plan::optimizeSalesBatch(repo.snapshot(farmId), sweep, params, jobs);
  } else {
    std::optional<plan::SellingPlan> p = farm::optimizeFarm(repo, farmId, econ::Money::fromUnits(target), params);
    if (!p) {
      std::cerr << "Optimization failed\n";
      return kExitUsage;
    }
    plans.push_back(std::move(*p));
  }

  // Output.
  const bool json = args.hasFlag("json");
  std::string outPath;
  (void)args.getString("out", outPath);

  if (json) {
    std::unique_ptr<std::ofstream> jsonFile;
    std::ostream* jsonStream = &std::cout;
    if (!outPath.empty() && outPath != "-") {
      jsonFile = std::make_unique<std::ofstream>(outPath, std::ios::out | std::ios::trunc);
      if (!*jsonFile) {
        std::cerr << "Failed to open --out file: " << outPath << "\n";
        return kExitUsage;
      }
      jsonStream = jsonFile.get();
    }

    core::JsonWriter j(*jsonStream, /*pretty=*/true);
    j.beginObject();
    j.key("farm"); j.value(repo.findFarm(farmId)->name);
    j.key("trimFinalEntry"); j.value(params.trimFinalEntry);
    if (sweep.empty()) {
      j.key("plan");
      report::writePlanJson(j, plans.front(), reportOpts);
    } else {
      j.key("sweep");
      j.beginArray();
      for (const plan::SellingPlan& p : plans) report::writePlanJson(j, p, reportOpts);
      j.endArray();
    }
    j.endObject();
  } else {
    if (args.hasFlag("showStock")) {
      std::cout << report::formatStockText(repo.snapshot(farmId, /*enabledOnly=*/false), reportOpts) << "\n";
    }
    for (std::size_t i = 0; i < plans.size(); ++i) {
      if (i > 0) std::cout << "\n";
      std::cout << report::formatPlanText(plans[i], reportOpts);
    }
  }

  std::string savePath;
  if (args.getString("save", savePath)) {
    const farm::Farm* f = repo.findFarm(farmId);
    farm::StockFileData data;
    data.name = f->name;
    data.entries = f->stock;
    data.lastPlan = f->lastPlan;
    std::string err;
    if (!farm::saveStockFile(data, savePath, &err)) {
      std::cerr << "Failed to write --save: " << err << "\n";
      return kExitUsage;
    }
    FARMSTOCK_LOG_INFO("Saved stock to " + savePath);
  }

  return 0;
}
