#pragma once

#include <string_view>

namespace farmstock::core {

// Logs the message and aborts. Reserved for broken internal invariants;
// user input is validated and reported, never asserted.
[[noreturn]] void panic(std::string_view message, const char* file, int line);

} // namespace farmstock::core

#define FARMSTOCK_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      ::farmstock::core::panic("Assertion failed: " #expr, __FILE__, __LINE__); \
    } \
  } while (0)

#define FARMSTOCK_ASSERT_MSG(expr, msg) \
  do { \
    if (!(expr)) { \
      ::farmstock::core::panic((msg), __FILE__, __LINE__); \
    } \
  } while (0)
