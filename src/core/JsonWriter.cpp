#include "farmstock/core/JsonWriter.h"

#include <cmath>
#include <cstdio>

namespace farmstock::core {

void JsonWriter::newline() {
  if (!pretty_) return;
  out_ << '\n';
  for (std::size_t i = 0; i < stack_.size(); ++i) out_ << "  ";
}

void JsonWriter::beforeValue() {
  if (afterKey_) {
    afterKey_ = false;
    return;
  }
  if (stack_.empty()) return;

  Frame& f = stack_.back();
  if (!f.empty) out_ << ',';
  f.empty = false;
  newline();
}

void JsonWriter::beginObject() {
  beforeValue();
  out_ << '{';
  stack_.push_back(Frame{false, true});
}

void JsonWriter::endObject() {
  if (stack_.empty()) return;
  const bool wasEmpty = stack_.back().empty;
  stack_.pop_back();
  if (!wasEmpty) newline();
  out_ << '}';
  if (stack_.empty() && pretty_) out_ << '\n';
}

void JsonWriter::beginArray() {
  beforeValue();
  out_ << '[';
  stack_.push_back(Frame{true, true});
}

void JsonWriter::endArray() {
  if (stack_.empty()) return;
  const bool wasEmpty = stack_.back().empty;
  stack_.pop_back();
  if (!wasEmpty) newline();
  out_ << ']';
  if (stack_.empty() && pretty_) out_ << '\n';
}

void JsonWriter::key(std::string_view k) {
  beforeValue();
  writeEscaped(k);
  out_ << (pretty_ ? ": " : ":");
  afterKey_ = true;
}

void JsonWriter::value(std::string_view v) {
  beforeValue();
  writeEscaped(v);
}

void JsonWriter::value(bool v) {
  beforeValue();
  out_ << (v ? "true" : "false");
}

void JsonWriter::value(long long v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(unsigned long long v) {
  beforeValue();
  out_ << v;
}

void JsonWriter::value(double v) {
  if (!std::isfinite(v)) {
    nullValue();
    return;
  }
  beforeValue();
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.17g", v);
  out_ << buf;
}

void JsonWriter::valueFixed(double v, int decimals) {
  if (!std::isfinite(v)) {
    nullValue();
    return;
  }
  beforeValue();
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
  out_ << buf;
}

void JsonWriter::nullValue() {
  beforeValue();
  out_ << "null";
}

void JsonWriter::writeEscaped(std::string_view s) {
  out_ << '"';
  for (const char c : s) {
    switch (c) {
      case '"': out_ << "\\\""; break;
      case '\\': out_ << "\\\\"; break;
      case '\n': out_ << "\\n"; break;
      case '\r': out_ << "\\r"; break;
      case '\t': out_ << "\\t"; break;
      default:
        if ((unsigned char)c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
          out_ << buf;
        } else {
          out_ << c;
        }
        break;
    }
  }
  out_ << '"';
}

} // namespace farmstock::core
