#pragma once

#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace farmstock::core {

// Small argument parser for the command line tools.
//
// Accepted forms:
//  - flags:       --json   -h   -hv
//  - key/value:   --target 900   --target=900   -o=path
//  - multi-value: --sweep 500 900 1200   (see setArity)
//  - positional:  everything else, and everything after "--"
//
// Repeated keys keep every value in order; last() returns the final one.
class Args {
public:
  Args() = default;
  Args(int argc, char** argv) { parse(argc, argv); }

  // Let --key consume up to `valueCount` following values.
  // A negative count means "until the next switch".
  void setArity(std::string_view key, int valueCount) {
    if (valueCount == 0) return;
    arity_[std::string(key)] = valueCount;
  }

  void parse(int argc, char** argv) {
    program_.clear();
    kv_.clear();
    flags_.clear();
    positional_.clear();

    if (argc > 0 && argv && argv[0]) program_ = argv[0];

    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i] ? std::string(argv[i]) : std::string();
      if (a.empty()) continue;

      if (a == "--") {
        for (int j = i + 1; j < argc; ++j) {
          if (argv[j]) positional_.push_back(std::string(argv[j]));
        }
        break;
      }

      if (a.size() > 2 && a[0] == '-' && a[1] == '-') {
        const auto eq = a.find('=');
        if (eq != std::string::npos) {
          kv_[a.substr(2, eq - 2)].push_back(a.substr(eq + 1));
          continue;
        }

        const std::string key = a.substr(2);
        const auto ar = arity_.find(key);
        const int need = (ar != arity_.end()) ? ar->second : 1;

        int took = 0;
        while ((need < 0 || took < need) && i + 1 < argc && argv[i + 1] && !isSwitch(argv[i + 1])) {
          kv_[key].push_back(std::string(argv[++i]));
          ++took;
        }

        if (took == 0) flags_.push_back(key);
        continue;
      }

      if (a.size() >= 2 && a[0] == '-' && a[1] != '-' && !looksLikeNumber(a.c_str())) {
        if (a.size() > 3 && a[2] == '=') {
          kv_[a.substr(1, 1)].push_back(a.substr(3));
          continue;
        }
        for (std::size_t j = 1; j < a.size(); ++j) {
          const char c = a[j];
          if (std::isalnum((unsigned char)c) || c == '_') flags_.push_back(std::string(1, c));
        }
        continue;
      }

      positional_.push_back(a);
    }
  }

  const std::string& program() const { return program_; }

  bool hasFlag(std::string_view key) const {
    for (const auto& f : flags_) {
      if (f == key) return true;
    }
    return false;
  }

  bool has(std::string_view key) const {
    return hasFlag(key) || kv_.find(std::string(key)) != kv_.end();
  }

  std::optional<std::string> last(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
  }

  std::vector<std::string> values(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end()) return {};
    return it->second;
  }

  const std::vector<std::string>& flags() const { return flags_; }
  const std::vector<std::string>& positional() const { return positional_; }

  // Typed getters return true only if the key was given and fully parsed.
  bool getInt(std::string_view key, int& out) const {
    const auto v = last(key);
    if (!v) return false;
    char* end = nullptr;
    const long long val = std::strtoll(v->c_str(), &end, 10);
    if (end == v->c_str() || *end != '\0') return false;
    out = static_cast<int>(val);
    return true;
  }

  bool getDouble(std::string_view key, double& out) const {
    const auto v = last(key);
    if (!v) return false;
    return parseDouble(*v, out);
  }

  bool getString(std::string_view key, std::string& out) const {
    const auto v = last(key);
    if (!v) return false;
    out = *v;
    return true;
  }

  static bool parseDouble(const std::string& text, double& out) {
    char* end = nullptr;
    const double val = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') return false;
    out = val;
    return true;
  }

private:
  // -1, -0.5, -.25, 1e-3 are values, not switches.
  static bool looksLikeNumber(const char* s) {
    if (!s || !*s) return false;

    int i = 0;
    if (s[i] == '+' || s[i] == '-') ++i;
    if (!s[i]) return false;

    bool anyDigit = false;
    bool anyDot = false;
    for (; s[i]; ++i) {
      const unsigned char c = (unsigned char)s[i];
      if (std::isdigit(c)) { anyDigit = true; continue; }
      if (c == '.' && !anyDot) { anyDot = true; continue; }

      if ((c == 'e' || c == 'E') && anyDigit) {
        ++i;
        if (s[i] == '+' || s[i] == '-') ++i;
        bool expDigit = false;
        for (; s[i]; ++i) {
          if (!std::isdigit((unsigned char)s[i])) return false;
          expDigit = true;
        }
        return expDigit;
      }
      return false;
    }
    return anyDigit;
  }

  static bool isSwitch(const char* s) {
    if (!s || s[0] != '-') return false;
    // A lone "-" means stdin/stdout.
    if (s[1] == '\0') return false;
    return !looksLikeNumber(s);
  }

  std::string program_;
  std::unordered_map<std::string, int> arity_;
  std::unordered_map<std::string, std::vector<std::string>> kv_;
  std::vector<std::string> flags_;
  std::vector<std::string> positional_;
};

} // namespace farmstock::core
