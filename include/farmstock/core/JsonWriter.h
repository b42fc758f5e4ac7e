#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace farmstock::core {

// Minimal streaming JSON writer for tool output.
//
//   JsonWriter j(std::cout, /*pretty=*/true);
//   j.beginObject();
//   j.key("trips"); j.value(2);
//   j.endObject();
//
// The writer inserts commas and indentation; it does not validate that keys
// and values alternate correctly.
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& out, bool pretty = true) : out_(out), pretty_(pretty) {}

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  void key(std::string_view k);

  void value(std::string_view v);
  void value(const char* v) { value(std::string_view(v ? v : "")); }
  void value(const std::string& v) { value(std::string_view(v)); }
  void value(bool v);
  void value(int v) { value((long long)v); }
  void value(long long v);
  void value(unsigned long long v);
  void value(double v);
  void nullValue();

  // Number with a fixed number of decimals (money, liters).
  void valueFixed(double v, int decimals);

private:
  struct Frame {
    bool array{false};
    bool empty{true};
  };

  void beforeValue();
  void newline();
  void writeEscaped(std::string_view s);

  std::ostream& out_;
  bool pretty_{true};
  bool afterKey_{false};
  std::vector<Frame> stack_{};
};

} // namespace farmstock::core
