#include "rng/TraceRandom.hpp"

#include "core/Bits.hpp"
#include "core/Config.hpp"
#include "core/Gamma.hpp"
#include "core/Seed.hpp"

namespace rng {

bool operator==(const TraceState &lhs, const TraceState &rhs) {
  return lhs.a == rhs.a && lhs.b == rhs.b && lhs.c == rhs.c &&
         lhs.d == rhs.d && lhs.e == rhs.e && lhs.f == rhs.f;
}

bool operator!=(const TraceState &lhs, const TraceState &rhs) {
  return !(lhs == rhs);
}

void Seed(TraceState &state, uint64_t seed) {
  seed = (seed ^ cfg::kSeedXor) * cfg::kSeedMul; // XLCG
  state.a = seed ^ ~cfg::kSeedMaskA;
  seed ^= seed >> 32;
  state.b = seed ^ cfg::kSeedMaskB;
  // MX3 rounds, with the outputs spread across the hash.
  seed *= cfg::kMx3Mul;
  seed ^= seed >> 29;
  state.c = seed ^ ~cfg::kSeedMaskB;
  seed *= cfg::kMx3Mul;
  seed ^= seed >> 32;
  state.d = seed ^ cfg::kSeedMaskA;
  seed *= cfg::kMx3Mul;
  seed ^= seed >> 29;
  state.e = seed;
  seed ^= (seed * seed) | 7u;
  seed ^= seed >> 27;
  state.f = core::FixGamma(seed ^ cfg::kMx3Mul);
}

uint64_t NextULong(TraceState &state) {
  const uint64_t fa = state.a;
  const uint64_t fb = state.b;
  const uint64_t fc = state.c;
  const uint64_t fd = state.d;
  const uint64_t fe = state.e;
  state.a = fa + cfg::kGoldenGamma;
  state.b = fa ^ fe;
  state.c = fb + fd;
  state.d = core::RotateLeft64(fc, cfg::kTraceRotation);
  return state.e = fb - fc;
}

uint64_t PreviousULong(TraceState &state) {
  const uint64_t fb = state.b;
  const uint64_t fc = state.c;
  const uint64_t fd = state.d;
  const uint64_t fe = state.e;
  state.a -= cfg::kGoldenGamma;
  state.c = core::RotateRight64(fd, cfg::kTraceRotation);
  state.b = state.c + fe;
  state.d = fc - state.b;
  state.e = fb ^ state.a;
  return fe;
}

float NextSparseFloat(TraceState &state) {
  const uint32_t bits = static_cast<uint32_t>(NextULong(state) >> 41);
  return core::FloatFromBits(bits | cfg::kFloatOneBits) - 1.0f;
}

double NextSparseDouble(TraceState &state) {
  const uint64_t bits = NextULong(state) >> 12;
  return core::DoubleFromBits(bits | cfg::kDoubleOneBits) - 1.0;
}

uint64_t GetWord(const TraceState &state, const int index) {
  switch (index) {
  case 0:
    return state.a;
  case 1:
    return state.b;
  case 2:
    return state.c;
  case 3:
    return state.d;
  case 4:
    return state.e;
  default:
    return state.f;
  }
}

void SetWord(TraceState &state, const int index, const uint64_t value) {
  switch (index) {
  case 0:
    state.a = value;
    break;
  case 1:
    state.b = value;
    break;
  case 2:
    state.c = value;
    break;
  case 3:
    state.d = value;
    break;
  case 4:
    state.e = value;
    break;
  default:
    state.f = core::FixGamma(value);
    break;
  }
}

// --- TraceRandom ---

TraceRandom::TraceRandom() {
  m_State.a = core::MakeSeed();
  m_State.b = core::MakeSeed();
  m_State.c = core::MakeSeed();
  m_State.d = core::MakeSeed();
  m_State.e = core::MakeSeed();
  SetStateF(core::MakeSeed());
}

TraceRandom::TraceRandom(const uint64_t seed) { rng::Seed(m_State, seed); }

TraceRandom::TraceRandom(const uint64_t stateA, const uint64_t stateB,
                         const uint64_t stateC, const uint64_t stateD,
                         const uint64_t stateE, const uint64_t stateF) {
  SetState(stateA, stateB, stateC, stateD, stateE, stateF);
}

void TraceRandom::Seed(const uint64_t seed) { rng::Seed(m_State, seed); }

int TraceRandom::StateCount() const { return cfg::kTraceStateCount; }

std::string TraceRandom::DefaultTag() const { return cfg::kTraceTag; }

uint64_t TraceRandom::NextULong() { return rng::NextULong(m_State); }

uint64_t TraceRandom::PreviousULong() { return rng::PreviousULong(m_State); }

float TraceRandom::NextSparseFloat() { return rng::NextSparseFloat(m_State); }

double TraceRandom::NextSparseDouble() {
  return rng::NextSparseDouble(m_State);
}

std::unique_ptr<EnhancedRandom> TraceRandom::Copy() const {
  return std::make_unique<TraceRandom>(*this);
}

uint64_t TraceRandom::SelectState(const int selection) const {
  return GetWord(m_State, selection);
}

void TraceRandom::SetSelectedState(const int selection, const uint64_t value) {
  SetWord(m_State, selection, value);
}

void TraceRandom::SetState(const uint64_t stateA, const uint64_t stateB,
                           const uint64_t stateC, const uint64_t stateD,
                           const uint64_t stateE, const uint64_t stateF) {
  m_State.a = stateA;
  m_State.b = stateB;
  m_State.c = stateC;
  m_State.d = stateD;
  m_State.e = stateE;
  SetStateF(stateF);
}

void TraceRandom::SetStateF(const uint64_t value) {
  m_State.f = core::FixGamma(value);
}

} // namespace rng
