#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace rng {

// Common contract for 64-bit generators. A generator describes what it can do
// through the Supports*() flags; optional operations that are not supported
// throw std::logic_error.
//
// Helpers here only ever consume whole NextULong() results, so any generator
// that implements the pure virtuals gets bounded sampling, floats, shuffling
// and string serialization for free.
class EnhancedRandom {
public:
  virtual ~EnhancedRandom() = default;

  // --- Generator description ---
  virtual void Seed(uint64_t seed) = 0;
  virtual int StateCount() const = 0;
  virtual bool SupportsReadAccess() const = 0;
  virtual bool SupportsWriteAccess() const = 0;
  virtual bool SupportsSkip() const = 0;
  virtual bool SupportsLeap() const = 0;
  virtual bool SupportsPrevious() const = 0;
  // Short identifier used by StringSerialize(); never contains '`' or '~'.
  virtual std::string DefaultTag() const = 0;

  // --- Core stepping ---
  virtual uint64_t NextULong() = 0;
  // Undoes one NextULong() and returns the value it produced.
  virtual uint64_t PreviousULong();
  // Full independent duplicate; no state is shared with this generator.
  virtual std::unique_ptr<EnhancedRandom> Copy() const = 0;

  // --- Indexed state access ---
  virtual uint64_t SelectState(int selection) const;
  // Defaults to Seed(value) for generators without write access.
  virtual void SetSelectedState(int selection, uint64_t value);
  std::vector<uint64_t> GetState() const;
  // Fills every state from `states`, cycling through it when it is shorter
  // than StateCount(). Does nothing for an empty vector.
  void SetState(const std::vector<uint64_t> &states);

  // --- Restricted-precision floats in [0, 1) ---
  virtual float NextSparseFloat();
  virtual double NextSparseDouble();

  // --- Derived outputs ---
  // [0, bound); returns 0 when bound is 0.
  uint64_t NextULong(uint64_t bound);
  // Between inner (inclusive) and outer (exclusive), in either order.
  uint64_t NextULong(uint64_t inner, uint64_t outer);
  int64_t NextLong(int64_t inner, int64_t outer);
  uint32_t NextUInt(uint32_t bound);
  int32_t NextInt(int32_t inner, int32_t outer);
  // 1 to 32 bits; other counts are taken mod 32, with 0 meaning 32.
  uint32_t NextBits(int bits);
  bool NextBool();
  float NextFloat();
  double NextDouble();
  double NextDouble(double inner, double outer);
  void NextBytes(uint8_t *bytes, std::size_t size);

  // Fisher-Yates, consuming one bounded draw per element after the first.
  template <typename T> void Shuffle(std::vector<T> &items) {
    for (std::size_t i = items.size(); i > 1; --i) {
      const std::size_t j = static_cast<std::size_t>(NextULong(i));
      std::swap(items[i - 1], items[j]);
    }
  }

  // --- Serialization ---
  // "TAG`HEX~HEX~...~HEX`" with uppercase hex words in index order.
  std::string StringSerialize() const;
  // Accepts the StringSerialize() form for this generator's tag. On malformed
  // input logs the reason, leaves the generator untouched and returns false.
  bool StringDeserialize(const std::string &data);

protected:
  EnhancedRandom() = default;
  EnhancedRandom(const EnhancedRandom &) = default;
  EnhancedRandom &operator=(const EnhancedRandom &) = default;
};

// Parses one state word as written by StringSerialize() or a state file:
// hex digits with an optional 0x prefix, no sign, at most 16 digits.
bool ParseStateWord(const std::string &text, uint64_t &out);

} // namespace rng
