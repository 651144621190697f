#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "core/Config.hpp"
#include "rng/EnhancedRandom.hpp"

namespace rng {

// Six-word state of the Trace generator. A through E can hold any value and
// are all advanced by every step. F is the "stream": always odd and passing
// core::RateGamma() at cfg::kStreamThreshold. The step function never reads F;
// it only travels with the state so that serialized generators keep it.
struct TraceState {
  uint64_t a = 0u;
  uint64_t b = 0u;
  uint64_t c = 0u;
  uint64_t d = 0u;
  uint64_t e = 0u;
  uint64_t f = cfg::kDefaultStream;
};

bool operator==(const TraceState &lhs, const TraceState &rhs);
bool operator!=(const TraceState &lhs, const TraceState &rhs);

// Expands one seed into all six words. Same seed, same state, on every
// platform.
void Seed(TraceState &state, uint64_t seed);

// Advances A..E and returns the new E.
uint64_t NextULong(TraceState &state);

// Exact inverse of NextULong(): rewinds A..E by one step and returns the
// value that step produced.
uint64_t PreviousULong(TraceState &state);

// One step each; the top 23 (float) or 52 (double) bits of the output become
// the mantissa of a value in [1, 2), then 1 is subtracted.
float NextSparseFloat(TraceState &state);
double NextSparseDouble(TraceState &state);

// 0..4 select A..E; 5 and anything else select F. Writes to F are constrained.
uint64_t GetWord(const TraceState &state, int index);
void SetWord(TraceState &state, int index, uint64_t value);

// Five states plus a stream, with a guaranteed minimum period of 2^64.
// Supports PreviousULong(); does not support skip or leap.
class TraceRandom final : public EnhancedRandom {
public:
  // Every word, stream included, comes from core::MakeSeed().
  TraceRandom();
  explicit TraceRandom(uint64_t seed);
  // Words are used verbatim except stateF, which is constrained.
  TraceRandom(uint64_t stateA, uint64_t stateB, uint64_t stateC,
              uint64_t stateD, uint64_t stateE, uint64_t stateF);

  TraceRandom(const TraceRandom &) = default;
  TraceRandom &operator=(const TraceRandom &) = default;

  using EnhancedRandom::NextULong;
  using EnhancedRandom::SetState;

  void Seed(uint64_t seed) override;
  int StateCount() const override;
  bool SupportsReadAccess() const override { return true; }
  bool SupportsWriteAccess() const override { return true; }
  bool SupportsSkip() const override { return false; }
  bool SupportsLeap() const override { return false; }
  bool SupportsPrevious() const override { return true; }
  std::string DefaultTag() const override;

  uint64_t NextULong() override;
  uint64_t PreviousULong() override;
  float NextSparseFloat() override;
  double NextSparseDouble() override;
  std::unique_ptr<EnhancedRandom> Copy() const override;

  uint64_t SelectState(int selection) const override;
  void SetSelectedState(int selection, uint64_t value) override;
  void SetState(uint64_t stateA, uint64_t stateB, uint64_t stateC,
                uint64_t stateD, uint64_t stateE, uint64_t stateF);

  uint64_t StateA() const { return m_State.a; }
  uint64_t StateB() const { return m_State.b; }
  uint64_t StateC() const { return m_State.c; }
  uint64_t StateD() const { return m_State.d; }
  uint64_t StateE() const { return m_State.e; }
  uint64_t StateF() const { return m_State.f; }
  void SetStateA(uint64_t value) { m_State.a = value; }
  void SetStateB(uint64_t value) { m_State.b = value; }
  void SetStateC(uint64_t value) { m_State.c = value; }
  void SetStateD(uint64_t value) { m_State.d = value; }
  void SetStateE(uint64_t value) { m_State.e = value; }
  // May change `value` to satisfy the stream constraint.
  void SetStateF(uint64_t value);

  const TraceState &State() const { return m_State; }

  bool operator==(const TraceRandom &other) const {
    return m_State == other.m_State;
  }
  bool operator!=(const TraceRandom &other) const { return !(*this == other); }

private:
  TraceState m_State{};
};

} // namespace rng
