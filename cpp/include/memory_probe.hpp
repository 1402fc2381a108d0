#pragma once

/**
 * Peak Memory Probes
 *
 * A probe runs a closure and reports the peak memory the closure added on top
 * of what was live when it started. Two facilities:
 *
 * - rss:  Linux resident set. Resets the kernel high-water mark through
 *         /proc/self/clear_refs, then reads VmRSS (baseline) and VmHWM (peak)
 *         from /proc/self/status. Page granular, includes everything the
 *         process touches.
 * - heap: bytes handed out by the global operator new, tracked by the
 *         replacement allocator in heap_tracker.cpp. Byte granular, only
 *         counts C++ heap allocations.
 *
 * The two report different absolute numbers for the same workload; samples
 * carry the probe name so they are only compared against the same probe.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace tickscale::memory {

class MemoryProbe {
public:
    virtual ~MemoryProbe() = default;

    /**
     * Run `work` and return the peak bytes above the pre-run baseline.
     * Throws MeasurementUnavailable if the probe cannot be used on this host.
     * Exceptions thrown by `work` propagate unchanged.
     */
    virtual uint64_t measure_peak(const std::function<void()>& work) = 0;

    [[nodiscard]] virtual bool available() const = 0;
    [[nodiscard]] virtual std::string name() const = 0;
};

// =============================================================================
// RESIDENT SET PROBE (Linux /proc)
// =============================================================================

class RssProbe final : public MemoryProbe {
public:
    RssProbe();

    uint64_t measure_peak(const std::function<void()>& work) override;

    [[nodiscard]] bool available() const override { return available_; }
    [[nodiscard]] std::string name() const override { return "rss"; }

private:
    bool available_ = false;

    static bool reset_high_water_mark();
};

// =============================================================================
// HEAP ALLOCATION PROBE
// =============================================================================

class HeapProbe final : public MemoryProbe {
public:
    HeapProbe() = default;

    uint64_t measure_peak(const std::function<void()>& work) override;

    [[nodiscard]] bool available() const override;
    [[nodiscard]] std::string name() const override { return "heap"; }
};

/**
 * Build a probe by name: "rss", "heap" or "auto".
 * "auto" prefers rss and falls back to heap.
 *
 * Throws InvalidConfiguration for an unknown name and MeasurementUnavailable
 * when the selected probe (or, for "auto", every probe) is unusable.
 */
std::unique_ptr<MemoryProbe> make_memory_probe(const std::string& preference = "auto");

// Process-wide counters maintained by the replacement operator new/delete
namespace heap_tracker {

[[nodiscard]] bool installed() noexcept;
[[nodiscard]] uint64_t live_bytes() noexcept;
[[nodiscard]] uint64_t peak_bytes() noexcept;

// Lower the peak mark to the current live byte count
void reset_peak() noexcept;

} // namespace heap_tracker

// Reads a "<Key>:   <value> kB" line from /proc/self/status, in bytes
[[nodiscard]] bool read_proc_status_kb(const std::string& key, uint64_t& bytes);

} // namespace tickscale::memory
