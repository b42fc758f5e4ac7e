#pragma once

#include "farmstock/core/Types.h"

namespace farmstock::core {

// Order-sensitive mix of two hashes, with a final avalanche step.
u64 hashCombine(u64 a, u64 b);

} // namespace farmstock::core
