#pragma once
#include <cstdint>

#include "dg/core/variable.hpp"

namespace dg {

// Inverted dropout: zeroes each element with probability `ratio` and scales
// the survivors by 1/(1-ratio). Identity when training mode is off.
// The mask is a deterministic function of (seed, element index).
Variable dropout(const Variable& x, double ratio = 0.5, std::uint64_t seed = 0);

} // namespace dg
