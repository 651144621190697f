#include "rng/EnhancedRandom.hpp"

#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <stdexcept>

#include "core/Bits.hpp"
#include "core/Config.hpp"
#include "core/Log.hpp"

namespace rng {

namespace {

// Upper 64 bits of rand * bound, computed from 32-bit halves; slightly
// truncated, but always below bound.
uint64_t MultiplyHigh(const uint64_t rand, const uint64_t bound) {
  const uint64_t randLow = rand & 0xFFFFFFFFull;
  const uint64_t boundLow = bound & 0xFFFFFFFFull;
  const uint64_t randHigh = rand >> 32;
  const uint64_t boundHigh = bound >> 32;
  return (randHigh * boundLow >> 32) + (randLow * boundHigh >> 32) +
         randHigh * boundHigh;
}

int HexDigit(const char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  return -1;
}

} // namespace

bool ParseStateWord(const std::string &text, uint64_t &out) {
  std::size_t pos = 0;
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    pos = 2;
  }
  const std::size_t digits = text.size() - pos;
  if (digits == 0 || digits > 16) {
    return false;
  }
  uint64_t value = 0;
  for (; pos < text.size(); ++pos) {
    const int d = HexDigit(text[pos]);
    if (d < 0) {
      return false;
    }
    value = (value << 4) | static_cast<uint64_t>(d);
  }
  out = value;
  return true;
}

uint64_t EnhancedRandom::PreviousULong() {
  throw std::logic_error(DefaultTag() + ": PreviousULong() not supported");
}

uint64_t EnhancedRandom::SelectState(int /*selection*/) const {
  throw std::logic_error(DefaultTag() + ": SelectState() not supported");
}

void EnhancedRandom::SetSelectedState(int /*selection*/, const uint64_t value) {
  Seed(value);
}

std::vector<uint64_t> EnhancedRandom::GetState() const {
  const int count = StateCount();
  std::vector<uint64_t> states;
  states.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; ++i) {
    states.push_back(SelectState(i));
  }
  return states;
}

void EnhancedRandom::SetState(const std::vector<uint64_t> &states) {
  if (states.empty()) {
    return;
  }
  const int count = StateCount();
  for (int i = 0; i < count; ++i) {
    SetSelectedState(i, states[static_cast<std::size_t>(i) % states.size()]);
  }
}

float EnhancedRandom::NextSparseFloat() {
  const uint32_t bits = static_cast<uint32_t>(NextULong() >> 41);
  return core::FloatFromBits(bits | cfg::kFloatOneBits) - 1.0f;
}

double EnhancedRandom::NextSparseDouble() {
  const uint64_t bits = NextULong() >> 12;
  return core::DoubleFromBits(bits | cfg::kDoubleOneBits) - 1.0;
}

uint64_t EnhancedRandom::NextULong(const uint64_t bound) {
  return NextULong(0u, bound);
}

uint64_t EnhancedRandom::NextULong(uint64_t inner, uint64_t outer) {
  const uint64_t rand = NextULong();
  if (outer < inner) {
    const uint64_t t = outer;
    outer = inner + 1u;
    inner = t + 1u;
  }
  return inner + MultiplyHigh(rand, outer - inner);
}

int64_t EnhancedRandom::NextLong(const int64_t inner, const int64_t outer) {
  const uint64_t rand = NextULong();
  uint64_t i2 = static_cast<uint64_t>(inner);
  uint64_t o2 = static_cast<uint64_t>(outer);
  if (outer < inner) {
    i2 = static_cast<uint64_t>(outer) + 1u;
    o2 = static_cast<uint64_t>(inner) + 1u;
  }
  return static_cast<int64_t>(i2 + MultiplyHigh(rand, o2 - i2));
}

uint32_t EnhancedRandom::NextUInt(const uint32_t bound) {
  return static_cast<uint32_t>(static_cast<uint64_t>(bound) *
                                   (NextULong() & 0xFFFFFFFFull) >>
                               32);
}

int32_t EnhancedRandom::NextInt(const int32_t inner, const int32_t outer) {
  return static_cast<int32_t>(NextLong(inner, outer));
}

uint32_t EnhancedRandom::NextBits(const int bits) {
  const int count = ((bits - 1) & 31) + 1;
  return static_cast<uint32_t>(NextULong() >> (64 - count));
}

bool EnhancedRandom::NextBool() {
  return (NextULong() & 0x8000000000000000ull) != 0u;
}

float EnhancedRandom::NextFloat() {
  return static_cast<float>(NextULong() >> 40) * cfg::kFloatAdjust;
}

double EnhancedRandom::NextDouble() {
  return static_cast<double>(NextULong() >> 11) * cfg::kDoubleAdjust;
}

double EnhancedRandom::NextDouble(const double inner, const double outer) {
  const double d = inner + NextDouble() * (outer - inner);
  // Rounding can land exactly on the exclusive bound; step back inside.
  if (d >= outer && outer > inner)
    return std::nextafter(outer, inner);
  if (d <= outer && outer < inner)
    return std::nextafter(outer, inner);
  return d;
}

void EnhancedRandom::NextBytes(uint8_t *bytes, const std::size_t size) {
  std::size_t i = 0;
  while (i < size) {
    uint64_t r = NextULong();
    for (int n = 0; n < 8 && i < size; ++n, r >>= 8) {
      bytes[i++] = static_cast<uint8_t>(r);
    }
  }
}

std::string EnhancedRandom::StringSerialize() const {
  std::string ser = DefaultTag();
  ser += cfg::kTagDelimiter;
  const int count = StateCount();
  char word[17];
  for (int i = 0; i < count; ++i) {
    if (i > 0) {
      ser += cfg::kWordDelimiter;
    }
    std::snprintf(word, sizeof(word), "%" PRIX64, SelectState(i));
    ser += word;
  }
  ser += cfg::kTagDelimiter;
  return ser;
}

bool EnhancedRandom::StringDeserialize(const std::string &data) {
  const std::string tag = DefaultTag();
  const std::size_t open = data.find(cfg::kTagDelimiter);
  if (open == std::string::npos) {
    LOG_ERROR("Serialized state has no opening delimiter: '{}'", data);
    return false;
  }
  if (data.compare(0, open, tag) != 0) {
    LOG_ERROR("Serialized tag '{}' does not match '{}'", data.substr(0, open),
              tag);
    return false;
  }
  const std::size_t close = data.find(cfg::kTagDelimiter, open + 1);
  if (close == std::string::npos) {
    LOG_ERROR("Serialized state for {} has no closing delimiter", tag);
    return false;
  }

  const int count = StateCount();
  std::vector<uint64_t> states;
  states.reserve(static_cast<std::size_t>(count));
  std::size_t start = open + 1;
  while (start <= close) {
    std::size_t end = data.find(cfg::kWordDelimiter, start);
    if (end == std::string::npos || end > close) {
      end = close;
    }
    uint64_t value = 0;
    if (!ParseStateWord(data.substr(start, end - start), value)) {
      LOG_ERROR("Bad state word #{} in serialized {}", states.size(), tag);
      return false;
    }
    states.push_back(value);
    start = end + 1;
  }
  if (static_cast<int>(states.size()) != count) {
    LOG_ERROR("Serialized {} has {} words, expected {}", tag, states.size(),
              count);
    return false;
  }

  for (int i = 0; i < count; ++i) {
    SetSelectedState(i, states[static_cast<std::size_t>(i)]);
  }
  return true;
}

} // namespace rng
