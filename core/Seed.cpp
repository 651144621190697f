#include "core/Seed.hpp"

#include <atomic>
#include <chrono>
#include <random>

#include "core/Config.hpp"

namespace core {

uint64_t Mix64(uint64_t x) {
  x ^= x >> 32;
  x *= cfg::kMx3Mul;
  x ^= x >> 29;
  x *= cfg::kMx3Mul;
  x ^= x >> 32;
  x *= cfg::kMx3Mul;
  x ^= x >> 29;
  return x;
}

uint64_t MakeSeed() {
  static std::atomic<uint64_t> s_Counter{0u};

  thread_local std::random_device device;
  const uint64_t fromDevice =
      (static_cast<uint64_t>(device()) << 32) ^ static_cast<uint64_t>(device());
  const uint64_t fromClock = static_cast<uint64_t>(
      std::chrono::steady_clock::now().time_since_epoch().count());
  const uint64_t count =
      s_Counter.fetch_add(cfg::kGoldenGamma, std::memory_order_relaxed);

  return Mix64(fromDevice ^ Mix64(fromClock + count));
}

} // namespace core
