#pragma once

#include <atomic>

// Global heap allocation counter, used to check that generator stepping
// never touches the heap. Counting is active only in debug builds (NDEBUG
// not defined) and only in executables that link core/PerfTracker.cpp.

namespace perf {

#ifndef NDEBUG

inline std::atomic<int> g_allocCounter{0};

inline void ResetAllocCounter() { g_allocCounter.store(0, std::memory_order_relaxed); }
inline int  ReadAllocCounter()  { return g_allocCounter.load(std::memory_order_relaxed); }
constexpr bool kAllocCountingEnabled = true;

#else

inline void ResetAllocCounter() {}
inline int  ReadAllocCounter()  { return 0; }
constexpr bool kAllocCountingEnabled = false;

#endif

// Counts allocations made between construction and Count().
class AllocScope {
public:
    AllocScope() : m_Start(ReadAllocCounter()) {}
    int Count() const { return ReadAllocCounter() - m_Start; }

private:
    int m_Start;
};

}  // namespace perf
