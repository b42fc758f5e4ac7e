#include "farmstock/core/CVar.h"

#include "farmstock/core/Log.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace farmstock::core {

namespace {

std::string_view trimmed(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
  return s;
}

const char* typeLabel(CVarType t) {
  switch (t) {
    case CVarType::Bool: return "bool";
    case CVarType::Int: return "int";
    case CVarType::Float: return "float";
    case CVarType::String: return "string";
  }
  return "?";
}

// Drops a '#' comment that starts the line or follows whitespace. A '#'
// inside double quotes is text.
std::string_view withoutComment(std::string_view line) {
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '"') quoted = !quoted;
    if (quoted || line[i] != '#') continue;
    if (i == 0 || std::isspace((unsigned char)line[i - 1])) return line.substr(0, i);
  }
  return line;
}

bool parseValue(CVarType type, std::string_view text, CVarValue& out) {
  text = trimmed(text);

  if (type == CVarType::String) {
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') text = text.substr(1, text.size() - 2);
    out = std::string(text);
    return true;
  }
  if (text.empty()) return false;

  if (type == CVarType::Bool) {
    std::string k(text);
    for (char& c : k) c = (char)std::tolower((unsigned char)c);
    if (k == "on" || k == "true" || k == "yes" || k == "1") {
      out = true;
    } else if (k == "off" || k == "false" || k == "no" || k == "0") {
      out = false;
    } else {
      return false;
    }
    return true;
  }

  if (type == CVarType::Int) {
    std::int64_t v = 0;
    const auto res = std::from_chars(text.data(), text.data() + text.size(), v);
    if (res.ec != std::errc{} || res.ptr != text.data() + text.size()) return false;
    out = v;
    return true;
  }

  const std::string buf(text);
  char* end = nullptr;
  const double v = std::strtod(buf.c_str(), &end);
  if (end != buf.c_str() + buf.size() || !std::isfinite(v)) return false;
  out = v;
  return true;
}

} // namespace

const CVar* CVarRegistry::find(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  return (it != vars_.end()) ? &it->second : nullptr;
}

CVar* CVarRegistry::define(std::string_view name, CVarType type, CVarValue def, std::string_view help) {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto it = vars_.find(name);
  if (it != vars_.end()) return (it->second.type == type) ? &it->second : nullptr;

  CVar v;
  v.name = std::string(name);
  v.help = std::string(help);
  v.type = type;
  v.value = std::move(def);
  return &vars_.emplace(v.name, std::move(v)).first->second;
}

CVar* CVarRegistry::defineBool(std::string_view name, bool defaultValue, std::string_view help) {
  return define(name, CVarType::Bool, CVarValue{defaultValue}, help);
}

CVar* CVarRegistry::defineInt(std::string_view name, std::int64_t defaultValue, std::string_view help) {
  return define(name, CVarType::Int, CVarValue{defaultValue}, help);
}

CVar* CVarRegistry::defineFloat(std::string_view name, double defaultValue, std::string_view help) {
  return define(name, CVarType::Float, CVarValue{defaultValue}, help);
}

CVar* CVarRegistry::defineString(std::string_view name, std::string defaultValue, std::string_view help) {
  return define(name, CVarType::String, CVarValue{std::move(defaultValue)}, help);
}

bool CVarRegistry::getBool(std::string_view name, bool fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end()) return fallback;
  const bool* v = std::get_if<bool>(&it->second.value);
  return v ? *v : fallback;
}

std::int64_t CVarRegistry::getInt(std::string_view name, std::int64_t fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end()) return fallback;
  const std::int64_t* v = std::get_if<std::int64_t>(&it->second.value);
  return v ? *v : fallback;
}

double CVarRegistry::getFloat(std::string_view name, double fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end()) return fallback;
  const double* v = std::get_if<double>(&it->second.value);
  return v ? *v : fallback;
}

std::string CVarRegistry::getString(std::string_view name, std::string_view fallback) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end()) return std::string(fallback);
  const std::string* v = std::get_if<std::string>(&it->second.value);
  return v ? *v : std::string(fallback);
}

bool CVarRegistry::assign(std::string_view name, CVarValue v, std::string* outError) {
  CVar* var = nullptr;
  std::vector<CVarListener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vars_.find(name);
    if (it == vars_.end()) {
      if (outError) *outError = "unknown cvar '" + std::string(name) + "'";
      return false;
    }
    if (it->second.value.index() != v.index()) {
      if (outError) *outError = "cvar '" + it->second.name + "' expects a " + typeLabel(it->second.type);
      return false;
    }
    it->second.value = std::move(v);
    var = &it->second;
    listeners = var->listeners;
  }

  // Unlocked: a listener may read other cvars.
  for (const CVarListener& cb : listeners) {
    if (cb) cb(*var);
  }
  return true;
}

bool CVarRegistry::setString(std::string_view name, std::string v, std::string* outError) {
  return assign(name, CVarValue{std::move(v)}, outError);
}

bool CVarRegistry::setFromText(std::string_view name, std::string_view text, std::string* outError) {
  const CVar* var = find(name);
  if (!var) {
    if (outError) *outError = "unknown cvar '" + std::string(name) + "'";
    return false;
  }

  CVarValue parsed;
  if (!parseValue(var->type, text, parsed)) {
    if (outError) {
      *outError = "bad " + std::string(typeLabel(var->type)) + " value '" + std::string(trimmed(text)) +
                  "' for " + var->name;
    }
    return false;
  }
  return assign(name, std::move(parsed), outError);
}

bool CVarRegistry::addListener(std::string_view name, CVarListener cb, std::string* outError) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = vars_.find(name);
  if (it == vars_.end()) {
    if (outError) *outError = "unknown cvar '" + std::string(name) + "'";
    return false;
  }
  it->second.listeners.push_back(std::move(cb));
  return true;
}

std::vector<const CVar*> CVarRegistry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<const CVar*> out;
  out.reserve(vars_.size());
  for (const auto& kv : vars_) out.push_back(&kv.second);
  return out;
}

std::string CVarRegistry::formatValue(const CVar& v) {
  if (const bool* b = std::get_if<bool>(&v.value)) return *b ? "on" : "off";
  if (const std::int64_t* i = std::get_if<std::int64_t>(&v.value)) return std::to_string(*i);
  if (const double* d = std::get_if<double>(&v.value)) {
    std::ostringstream oss;
    oss << *d;
    return oss.str();
  }
  return "\"" + std::get<std::string>(v.value) + "\"";
}

bool CVarRegistry::loadFile(const std::string& path, std::string* outError) {
  std::ifstream in(path);
  if (!in) {
    if (outError) *outError = "cannot open '" + path + "'";
    return false;
  }

  std::ostringstream errors;
  bool ok = true;
  std::string line;
  for (int lineNo = 1; std::getline(in, line); ++lineNo) {
    const std::string_view body = trimmed(withoutComment(line));
    if (body.empty()) continue;

    std::size_t split = body.find('=');
    if (split == std::string_view::npos) {
      split = 0;
      while (split < body.size() && !std::isspace((unsigned char)body[split])) ++split;
    }
    const std::string_view name = trimmed(body.substr(0, split));
    const std::string_view text = (split < body.size()) ? body.substr(split + 1) : std::string_view{};

    if (!exists(name)) {
      FARMSTOCK_LOG_WARN(path + ":" + std::to_string(lineNo) + ": unknown cvar '" + std::string(name) + "' ignored");
      continue;
    }

    std::string err;
    if (!setFromText(name, text, &err)) {
      ok = false;
      errors << path << ":" << lineNo << ": " << err << "\n";
    }
  }

  if (!ok && outError) *outError = errors.str();
  return ok;
}

CVarRegistry& cvars() {
  static CVarRegistry g;
  return g;
}

void installDefaultCVars() {
  static std::once_flag once;
  std::call_once(once, []() {
    CVarRegistry& r = cvars();

    if (r.defineString("log.level", "info", "Global log level: trace|debug|info|warn|error|off")) {
      r.addListener("log.level", [](const CVar& cv) {
        LogLevel lvl = LogLevel::Info;
        if (!parseLogLevel(std::get<std::string>(cv.value), lvl)) {
          FARMSTOCK_LOG_WARN("cvar log.level: expected trace|debug|info|warn|error|off");
          return;
        }
        setLogLevel(lvl);
      });
    }

    r.defineFloat("plan.default_target", 0.0, "Revenue target when --target is not given (currency units)");
    r.defineBool("plan.whole_loads", false, "Sell whole trip loads for the entry that completes the target");
    r.defineString("plan.currency_symbol", "EUR", "Currency symbol printed by reports");
    r.defineString("plan.language", "en", "Product names and report labels: en|es");
    r.defineInt("jobs.threads", 0, "Worker threads for --sweep (0 = hardware concurrency)");
  });
}

} // namespace farmstock::core
