#pragma once

#include <cstdint>

#include "core/Config.hpp"

// Validity test and fix-up for "stream" (gamma) state words.
namespace core {

// 0 is best; even values always rate 64. An odd gamma is penalized for an
// unbalanced upper half and for too few or too many bit transitions.
int RateGamma(uint64_t gamma);

// Returns an odd value rating at most `threshold`. Values that already pass
// are returned unchanged. Others keep their low kStreamLowBits bits while the
// high field walks a fixed Weyl sequence until the first passing value, so
// distinct odd inputs below 2^29 always give distinct results.
uint64_t FixGamma(uint64_t gamma, int threshold = cfg::kStreamThreshold);

} // namespace core
