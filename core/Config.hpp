#pragma once

#include <cstdint>

namespace cfg {
// --- Generator ---
constexpr int kTraceStateCount = 6;
constexpr const char *kTraceTag = "TrcR";

// Weyl increment for state A (2^64 / golden ratio).
constexpr uint64_t kGoldenGamma = 0x9E3779B97F4A7C15ull;
constexpr int kTraceRotation = 52;

// --- Seeder (XLCG followed by an MX3 unary hash) ---
constexpr uint64_t kSeedXor = 0x1C69B3F74AC4AE35ull;
constexpr uint64_t kSeedMul = 0x3C79AC492BA7B653ull;
constexpr uint64_t kMx3Mul = 0xBEA225F9EB34556Dull;
constexpr uint64_t kSeedMaskA = 0xC6BC279692B5C323ull;
constexpr uint64_t kSeedMaskB = 0xD3833E804F4C574Bull;

// --- Stream constraint ---
constexpr int kStreamThreshold = 1;
constexpr int kStreamLowBits = 29; // preserved by FixGamma
constexpr uint64_t kStreamLowMask = (1ull << kStreamLowBits) - 1ull;
constexpr uint64_t kStreamHighMask = (1ull << (64 - kStreamLowBits)) - 1ull;
constexpr uint64_t kStreamWalk =
    ((kGoldenGamma >> kStreamLowBits) | 1ull) & kStreamHighMask;
// FixGamma(1); the stream of a default-constructed state.
constexpr uint64_t kDefaultStream = 0x3C6EF372C0000001ull;

// --- Float extraction ---
constexpr uint32_t kFloatOneBits = 0x3F800000u;
constexpr uint64_t kDoubleOneBits = 0x3FF0000000000000ull;
constexpr float kFloatAdjust = 1.0f / 16777216.0f;      // 2^-24
constexpr double kDoubleAdjust = 1.0 / 9007199254740992.0; // 2^-53

// --- Serialization ---
constexpr char kTagDelimiter = '`';
constexpr char kWordDelimiter = '~';

// --- Runner defaults ---
constexpr uint64_t kDefaultRunnerSeed = 0xC0FFEEull;
constexpr int kDefaultRunnerCount = 16;
constexpr const char *kLogFile = "tracerng.log";

} // namespace cfg
