// Replacement global allocation functions feeding the heap probe.
//
// Sizes come from malloc_usable_size so that unsized deletes can be accounted
// for; live/peak therefore reflect what the allocator actually reserved.

#include "memory_probe.hpp"
#include <atomic>
#include <cstdlib>
#include <new>

#if defined(__GLIBC__) || defined(__linux__)
#include <malloc.h>
#define TICKSCALE_HAS_USABLE_SIZE 1
#else
#define TICKSCALE_HAS_USABLE_SIZE 0
#endif

namespace {

std::atomic<uint64_t> g_live_bytes{0};
std::atomic<uint64_t> g_peak_bytes{0};

inline std::size_t block_size(void* ptr) noexcept {
#if TICKSCALE_HAS_USABLE_SIZE
    return malloc_usable_size(ptr);
#else
    (void)ptr;
    return 0;
#endif
}

inline void on_alloc(void* ptr) noexcept {
    const uint64_t size = block_size(ptr);
    const uint64_t live = g_live_bytes.fetch_add(size, std::memory_order_relaxed) + size;

    uint64_t peak = g_peak_bytes.load(std::memory_order_relaxed);
    while (live > peak &&
           !g_peak_bytes.compare_exchange_weak(peak, live, std::memory_order_relaxed)) {
    }
}

inline void on_free(void* ptr) noexcept {
    g_live_bytes.fetch_sub(block_size(ptr), std::memory_order_relaxed);
}

void* tracked_alloc(std::size_t size) noexcept {
    if (size == 0) size = 1;
    void* ptr = std::malloc(size);
    if (ptr) on_alloc(ptr);
    return ptr;
}

void* tracked_aligned_alloc(std::size_t size, std::align_val_t align) noexcept {
    auto alignment = static_cast<std::size_t>(align);
    if (alignment < sizeof(void*)) alignment = sizeof(void*);
    // aligned_alloc wants a size that is a multiple of the alignment
    const std::size_t rounded = ((size == 0 ? 1 : size) + alignment - 1) / alignment * alignment;
    void* ptr = std::aligned_alloc(alignment, rounded);
    if (ptr) on_alloc(ptr);
    return ptr;
}

void tracked_free(void* ptr) noexcept {
    if (!ptr) return;
    on_free(ptr);
    std::free(ptr);
}

void* alloc_or_throw(std::size_t size) {
    for (;;) {
        if (void* ptr = tracked_alloc(size)) return ptr;
        std::new_handler handler = std::get_new_handler();
        if (!handler) throw std::bad_alloc();
        handler();
    }
}

void* aligned_alloc_or_throw(std::size_t size, std::align_val_t align) {
    for (;;) {
        if (void* ptr = tracked_aligned_alloc(size, align)) return ptr;
        std::new_handler handler = std::get_new_handler();
        if (!handler) throw std::bad_alloc();
        handler();
    }
}

} // namespace

namespace tickscale::memory::heap_tracker {

bool installed() noexcept {
    return TICKSCALE_HAS_USABLE_SIZE != 0;
}

uint64_t live_bytes() noexcept {
    return g_live_bytes.load(std::memory_order_relaxed);
}

uint64_t peak_bytes() noexcept {
    return g_peak_bytes.load(std::memory_order_relaxed);
}

void reset_peak() noexcept {
    g_peak_bytes.store(g_live_bytes.load(std::memory_order_relaxed), std::memory_order_relaxed);
}

} // namespace tickscale::memory::heap_tracker

// =============================================================================
// GLOBAL ALLOCATION FUNCTIONS
// =============================================================================

void* operator new(std::size_t size) { return alloc_or_throw(size); }
void* operator new[](std::size_t size) { return alloc_or_throw(size); }

void* operator new(std::size_t size, const std::nothrow_t&) noexcept { return tracked_alloc(size); }
void* operator new[](std::size_t size, const std::nothrow_t&) noexcept { return tracked_alloc(size); }

void* operator new(std::size_t size, std::align_val_t align) {
    return aligned_alloc_or_throw(size, align);
}
void* operator new[](std::size_t size, std::align_val_t align) {
    return aligned_alloc_or_throw(size, align);
}
void* operator new(std::size_t size, std::align_val_t align, const std::nothrow_t&) noexcept {
    return tracked_aligned_alloc(size, align);
}
void* operator new[](std::size_t size, std::align_val_t align, const std::nothrow_t&) noexcept {
    return tracked_aligned_alloc(size, align);
}

void operator delete(void* ptr) noexcept { tracked_free(ptr); }
void operator delete[](void* ptr) noexcept { tracked_free(ptr); }
void operator delete(void* ptr, std::size_t) noexcept { tracked_free(ptr); }
void operator delete[](void* ptr, std::size_t) noexcept { tracked_free(ptr); }
void operator delete(void* ptr, const std::nothrow_t&) noexcept { tracked_free(ptr); }
void operator delete[](void* ptr, const std::nothrow_t&) noexcept { tracked_free(ptr); }

void operator delete(void* ptr, std::align_val_t) noexcept { tracked_free(ptr); }
void operator delete[](void* ptr, std::align_val_t) noexcept { tracked_free(ptr); }
void operator delete(void* ptr, std::size_t, std::align_val_t) noexcept { tracked_free(ptr); }
void operator delete[](void* ptr, std::size_t, std::align_val_t) noexcept { tracked_free(ptr); }
void operator delete(void* ptr, std::align_val_t, const std::nothrow_t&) noexcept { tracked_free(ptr); }
void operator delete[](void* ptr, std::align_val_t, const std::nothrow_t&) noexcept { tracked_free(ptr); }
