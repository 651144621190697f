#include "core/PerfTracker.hpp"

#include <cstdlib>
#include <new>

// Override global new/delete in debug builds to count heap allocations.
#ifndef NDEBUG

namespace {

void* CountedAlloc(std::size_t size) {
    perf::g_allocCounter.fetch_add(1, std::memory_order_relaxed);
    // malloc(0) may return null; operator new must not.
    void* ptr = std::malloc(size != 0 ? size : 1);
    if (!ptr) {
        throw std::bad_alloc();
    }
    return ptr;
}

}  // namespace

void* operator new(std::size_t size) {
    return CountedAlloc(size);
}

void* operator new[](std::size_t size) {
    return CountedAlloc(size);
}

void operator delete(void* ptr) noexcept {
    std::free(ptr);
}

void operator delete[](void* ptr) noexcept {
    std::free(ptr);
}

void operator delete(void* ptr, std::size_t) noexcept {
    std::free(ptr);
}

void operator delete[](void* ptr, std::size_t) noexcept {
    std::free(ptr);
}

#endif
