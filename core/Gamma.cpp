#include "core/Gamma.hpp"

#include <cstdlib>

#include "core/Bits.hpp"

namespace core {

int RateGamma(const uint64_t gamma) {
  if ((gamma & 1ull) == 0ull) {
    return 64;
  }
  const int upper = PopCount64(gamma >> 32);
  const int transitions = PopCount64(gamma ^ (gamma >> 1));
  return (std::abs(upper - 16) >> 2) + (std::abs(transitions - 32) >> 3);
}

uint64_t FixGamma(uint64_t gamma, int threshold) {
  if (threshold < 0) {
    threshold = 0;
  }
  gamma |= 1ull;
  const uint64_t low = gamma & cfg::kStreamLowMask;
  uint64_t high = gamma >> cfg::kStreamLowBits;
  // The walk has full period over the high field, and every low field has a
  // passing completion, so this terminates (in practice within a few steps).
  while (RateGamma(gamma) > threshold) {
    high = (high + cfg::kStreamWalk) & cfg::kStreamHighMask;
    gamma = low | (high << cfg::kStreamLowBits);
  }
  return gamma;
}

} // namespace core
