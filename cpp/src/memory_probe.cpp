#include "memory_probe.hpp"
#include "errors.hpp"
#include <fstream>
#include <sstream>
#include <string>

#if defined(__linux__)
#include <malloc.h>
#define TICKSCALE_HAS_PROC_FS 1
#else
#define TICKSCALE_HAS_PROC_FS 0
#endif

namespace tickscale::memory {

bool read_proc_status_kb(const std::string& key, uint64_t& bytes) {
#if TICKSCALE_HAS_PROC_FS
    std::ifstream status("/proc/self/status");
    if (!status) return false;

    const std::string prefix = key + ":";
    std::string line;
    while (std::getline(status, line)) {
        if (line.compare(0, prefix.size(), prefix) != 0) continue;

        std::istringstream fields(line.substr(prefix.size()));
        uint64_t kb = 0;
        std::string unit;
        if (!(fields >> kb >> unit) || unit != "kB") return false;

        bytes = kb * 1024;
        return true;
    }
#else
    (void)key;
    (void)bytes;
#endif
    return false;
}

// =============================================================================
// RSS PROBE
// =============================================================================

RssProbe::RssProbe() {
    uint64_t rss = 0;
    uint64_t hwm = 0;
    available_ = read_proc_status_kb("VmRSS", rss) &&
                 read_proc_status_kb("VmHWM", hwm) &&
                 reset_high_water_mark();
}

bool RssProbe::reset_high_water_mark() {
#if TICKSCALE_HAS_PROC_FS
    // "5" resets the peak RSS counter (Linux >= 4.0)
    std::ofstream clear_refs("/proc/self/clear_refs");
    if (!clear_refs) return false;
    clear_refs << "5";
    clear_refs.flush();
    return static_cast<bool>(clear_refs);
#else
    return false;
#endif
}

uint64_t RssProbe::measure_peak(const std::function<void()>& work) {
    if (!available_) {
        throw MeasurementUnavailable("rss probe: /proc/self/status or clear_refs not usable");
    }

#if TICKSCALE_HAS_PROC_FS
    // Hand freed pages from earlier trials back to the kernel before the baseline
    malloc_trim(0);
#endif

    if (!reset_high_water_mark()) {
        throw MeasurementUnavailable("rss probe: failed to reset VmHWM");
    }

    uint64_t baseline = 0;
    if (!read_proc_status_kb("VmRSS", baseline)) {
        throw MeasurementUnavailable("rss probe: VmRSS not readable");
    }

    work();

    uint64_t peak = 0;
    if (!read_proc_status_kb("VmHWM", peak)) {
        throw MeasurementUnavailable("rss probe: VmHWM not readable");
    }

    return peak > baseline ? peak - baseline : 0;
}

// =============================================================================
// HEAP PROBE
// =============================================================================

bool HeapProbe::available() const {
    return heap_tracker::installed();
}

uint64_t HeapProbe::measure_peak(const std::function<void()>& work) {
    if (!available()) {
        throw MeasurementUnavailable("heap probe: allocation sizes not observable on this platform");
    }

    heap_tracker::reset_peak();
    const uint64_t baseline = heap_tracker::live_bytes();

    work();

    const uint64_t peak = heap_tracker::peak_bytes();
    return peak > baseline ? peak - baseline : 0;
}

// =============================================================================
// SELECTION
// =============================================================================

std::unique_ptr<MemoryProbe> make_memory_probe(const std::string& preference) {
    if (preference == "rss") {
        auto probe = std::make_unique<RssProbe>();
        if (!probe->available()) {
            throw MeasurementUnavailable("rss probe requested but /proc peak RSS is not usable");
        }
        return probe;
    }

    if (preference == "heap") {
        auto probe = std::make_unique<HeapProbe>();
        if (!probe->available()) {
            throw MeasurementUnavailable("heap probe requested but allocation tracking is unavailable");
        }
        return probe;
    }

    if (preference == "auto") {
        if (auto rss = std::make_unique<RssProbe>(); rss->available()) {
            return rss;
        }
        if (auto heap = std::make_unique<HeapProbe>(); heap->available()) {
            return heap;
        }
        throw MeasurementUnavailable("no peak-memory probe available (tried rss, heap)");
    }

    throw InvalidConfiguration("unknown memory probe '" + preference + "' (expected rss, heap or auto)");
}

} // namespace tickscale::memory
