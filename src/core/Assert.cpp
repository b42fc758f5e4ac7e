#include "farmstock/core/Assert.h"
#include "farmstock/core/Log.h"

#include <cstdlib>
#include <sstream>

namespace farmstock::core {

[[noreturn]] void panic(std::string_view message, const char* file, int line) {
  std::ostringstream oss;
  oss << "PANIC: " << message << " (" << file << ":" << line << ")";
  log(LogLevel::Error, oss.str());
  std::abort();
}

} // namespace farmstock::core
