#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace farmstock::core {

// Configuration variables ("cvars").
//
// Typed settings with a default, overridden from a config file or from
// `--set name=value` on the command line:
//
//   # comment
//   log.level = debug
//   plan.default_target = 25000
//   plan.currency_symbol = "EUR"

enum class CVarType : std::uint8_t {
  Bool   = 0,
  Int    = 1,
  Float  = 2,
  String = 3
};

using CVarValue = std::variant<bool, std::int64_t, double, std::string>;
using CVarListener = std::function<void(const struct CVar&)>;

struct CVar {
  std::string name;
  std::string help;
  CVarType type{CVarType::String};
  CVarValue value{};

  // Called after every successful assignment.
  std::vector<CVarListener> listeners;
};

class CVarRegistry {
public:
  CVarRegistry() = default;

  const CVar* find(std::string_view name) const;
  bool exists(std::string_view name) const { return find(name) != nullptr; }

  // Defining an existing name with the same type returns it unchanged.
  // Defining it with a different type returns nullptr.
  CVar* defineBool(std::string_view name, bool defaultValue, std::string_view help = {});
  CVar* defineInt(std::string_view name, std::int64_t defaultValue, std::string_view help = {});
  CVar* defineFloat(std::string_view name, double defaultValue, std::string_view help = {});
  CVar* defineString(std::string_view name, std::string defaultValue, std::string_view help = {});

  bool        getBool(std::string_view name, bool fallback = false) const;
  std::int64_t getInt(std::string_view name, std::int64_t fallback = 0) const;
  double      getFloat(std::string_view name, double fallback = 0.0) const;
  std::string getString(std::string_view name, std::string_view fallback = {}) const;

  bool setString(std::string_view name, std::string v, std::string* outError = nullptr);

  // Parses `text` as the variable's type ("on"/"off" for bools, quotes
  // stripped from strings). The old value is kept when parsing fails.
  bool setFromText(std::string_view name, std::string_view text, std::string* outError = nullptr);

  bool addListener(std::string_view name, CVarListener cb, std::string* outError = nullptr);

  // Every variable, sorted by name.
  std::vector<const CVar*> list() const;

  static std::string formatValue(const CVar& v);

  // Applies every `name = value` line. Unknown names are logged and skipped;
  // bad values are collected as "path:line: message" and make the call fail.
  bool loadFile(const std::string& path, std::string* outError = nullptr);

private:
  CVar* define(std::string_view name, CVarType type, CVarValue def, std::string_view help);
  bool assign(std::string_view name, CVarValue v, std::string* outError);

  mutable std::mutex mutex_;
  std::map<std::string, CVar, std::less<>> vars_;
};

// Process-wide registry used by the tools.
CVarRegistry& cvars();

// Defines log.level, plan.* and jobs.* (idempotent).
void installDefaultCVars();

} // namespace farmstock::core
