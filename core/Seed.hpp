#pragma once

#include <cstdint>

namespace core {

// Non-deterministic "don't care" seed for default-constructed generators.
// Draws from std::random_device, the steady clock and a process-wide counter,
// so back-to-back calls differ even when random_device is deterministic.
uint64_t MakeSeed();

// MX3 unary hash; bijective on uint64_t.
uint64_t Mix64(uint64_t x);

} // namespace core
