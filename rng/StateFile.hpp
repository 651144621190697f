#pragma once

#include <string>

namespace rng {

class EnhancedRandom;

// JSON snapshot of a generator:
//   { "tag": "TrcR", "states": ["0x...", ...] }
// Words are written as 0x-prefixed uppercase hex strings so they survive
// readers that parse numbers as doubles.
std::string StateToJson(const EnhancedRandom &rng);

// Both return false and log the cause on failure. A failed load leaves the
// generator untouched.
bool StateFromJson(EnhancedRandom &rng, const std::string &text);
bool SaveStateToFile(const EnhancedRandom &rng, const char *path);
bool LoadStateFromFile(EnhancedRandom &rng, const char *path);

} // namespace rng
