#pragma once

#include <cstdint>
#include <cstring>

// Bit helpers shared by the generators and the stream constraint.
namespace core {

// Amounts are taken mod 64; a zero amount returns x unchanged.
inline uint64_t RotateLeft64(const uint64_t x, const int amt) {
  const unsigned r = static_cast<unsigned>(amt) & 63u;
  return (x << r) | (x >> ((64u - r) & 63u));
}

inline uint64_t RotateRight64(const uint64_t x, const int amt) {
  const unsigned r = static_cast<unsigned>(amt) & 63u;
  return (x >> r) | (x << ((64u - r) & 63u));
}

inline int PopCount64(uint64_t x) {
#if defined(__GNUC__) || defined(__clang__)
  return __builtin_popcountll(x);
#else
  x = x - ((x >> 1) & 0x5555555555555555ull);
  x = (x & 0x3333333333333333ull) + ((x >> 2) & 0x3333333333333333ull);
  x = (x + (x >> 4)) & 0x0F0F0F0F0F0F0F0Full;
  return static_cast<int>((x * 0x0101010101010101ull) >> 56);
#endif
}

inline float FloatFromBits(const uint32_t bits) {
  float f;
  std::memcpy(&f, &bits, sizeof(f));
  return f;
}

inline double DoubleFromBits(const uint64_t bits) {
  double d;
  std::memcpy(&d, &bits, sizeof(d));
  return d;
}

} // namespace core
