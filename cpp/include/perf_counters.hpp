#pragma once

/**
 * Linux Performance Counters Interface
 *
 * perf_event_open() counters for a single profiling pass over a strategy:
 * cycles, instructions, cache references/misses, branches/mispredictions.
 * Wall time comes from steady_clock so it is comparable with the timed trials.
 *
 * Counters need kernel.perf_event_paranoid <= 2 (or CAP_PERFMON). When the
 * cycle counter (group leader) cannot be opened the group reports itself
 * unavailable and the profiler records no counters for the trial. A follower
 * the kernel refuses (cache events under many hypervisors) is left empty.
 */

#include <array>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <ostream>
#include <string>

#if defined(__linux__)
#include <linux/perf_event.h>
#include <sys/ioctl.h>
#include <sys/syscall.h>
#include <unistd.h>
#define TICKSCALE_HAS_PERF_COUNTERS 1
#else
#define TICKSCALE_HAS_PERF_COUNTERS 0
#endif

namespace tickscale::perf {

// =============================================================================
// COUNTER RESULTS
// =============================================================================

// Any counter the kernel refused to open stays empty and prints as "n/a".
struct CounterResult {
    std::optional<uint64_t> cycles;
    std::optional<uint64_t> instructions;
    std::optional<uint64_t> cache_references;
    std::optional<uint64_t> cache_misses;
    std::optional<uint64_t> branch_instructions;
    std::optional<uint64_t> branch_misses;
    int64_t time_ns = 0;

    // Empty when either operand is missing or the denominator is zero
    [[nodiscard]] static std::optional<double> ratio(const std::optional<uint64_t>& num,
                                                     const std::optional<uint64_t>& den,
                                                     double scale = 1.0) {
        if (!num || !den || *den == 0) return std::nullopt;
        return static_cast<double>(*num) / static_cast<double>(*den) * scale;
    }

    [[nodiscard]] std::optional<double> ipc() const {
        return ratio(instructions, cycles);
    }

    [[nodiscard]] std::optional<double> cache_miss_rate() const {
        return ratio(cache_misses, cache_references, 100.0);
    }

    [[nodiscard]] std::optional<double> branch_miss_rate() const {
        return ratio(branch_misses, branch_instructions, 100.0);
    }

    [[nodiscard]] std::optional<double> cycles_per_tick(uint64_t ticks) const {
        if (!cycles || ticks == 0) return std::nullopt;
        return static_cast<double>(*cycles) / static_cast<double>(ticks);
    }

    void print(std::ostream& out, const std::string& label, uint64_t ticks = 0) const {
        const auto saved_flags = out.flags();
        const auto saved_precision = out.precision();

        out << "\n" << label << " - hardware counters:\n";
        out << "-------------------------------------------\n";
        out << std::fixed << std::setprecision(2);

        out << "  Wall time:         " << (static_cast<double>(time_ns) / 1e6) << " ms\n";
        print_row(out, "Cycles:", cycles, "");
        print_row(out, "Instructions:", instructions, "");
        print_row(out, "IPC:", ipc(), "");
        print_row(out, "Cache refs:", cache_references, "");
        print_row(out, "Cache misses:", cache_misses, "");
        print_row(out, "Cache miss rate:", cache_miss_rate(), "%");
        print_row(out, "Branches:", branch_instructions, "");
        print_row(out, "Branch misses:", branch_misses, "");
        print_row(out, "Branch miss rate:", branch_miss_rate(), "%");

        if (ticks > 0) {
            print_row(out, "Cycles/tick:", cycles_per_tick(ticks), "");
            out << "  ns/tick:           "
                << static_cast<double>(time_ns) / static_cast<double>(ticks) << "\n";
        }

        out.flags(saved_flags);
        out.precision(saved_precision);
    }

private:
    template <typename T>
    static void print_row(std::ostream& out, const char* name,
                          const std::optional<T>& value, const char* unit) {
        out << "  " << std::left << std::setw(19) << name << std::right;
        if (value) {
            out << *value << unit << "\n";
        } else {
            out << "n/a\n";
        }
    }
};

// =============================================================================
// PERF COUNTER GROUP (Linux perf_event interface)
// =============================================================================

#if TICKSCALE_HAS_PERF_COUNTERS

class PerfCounterGroup {
public:
    PerfCounterGroup() {
        // Leader first, the rest are scheduled together with it
        leader_fd_ = open_counter(PERF_COUNT_HW_CPU_CYCLES, -1);

        if (leader_fd_ < 0) {
            available_ = false;
            return;
        }

        fds_[0] = leader_fd_;
        fds_[1] = open_counter(PERF_COUNT_HW_INSTRUCTIONS, leader_fd_);
        fds_[2] = open_counter(PERF_COUNT_HW_CACHE_REFERENCES, leader_fd_);
        fds_[3] = open_counter(PERF_COUNT_HW_CACHE_MISSES, leader_fd_);
        fds_[4] = open_counter(PERF_COUNT_HW_BRANCH_INSTRUCTIONS, leader_fd_);
        fds_[5] = open_counter(PERF_COUNT_HW_BRANCH_MISSES, leader_fd_);

        available_ = true;
    }

    ~PerfCounterGroup() {
        for (int fd : fds_) {
            if (fd >= 0) close(fd);
        }
    }

    // Non-copyable
    PerfCounterGroup(const PerfCounterGroup&) = delete;
    PerfCounterGroup& operator=(const PerfCounterGroup&) = delete;

    [[nodiscard]] bool available() const { return available_; }

    void start() {
        if (available_) {
            ioctl(leader_fd_, PERF_EVENT_IOC_RESET, PERF_IOC_FLAG_GROUP);
            ioctl(leader_fd_, PERF_EVENT_IOC_ENABLE, PERF_IOC_FLAG_GROUP);
        }
        start_time_ = std::chrono::steady_clock::now();
    }

    [[nodiscard]] CounterResult stop() {
        const auto end_time = std::chrono::steady_clock::now();

        CounterResult result;
        result.time_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
            end_time - start_time_).count();

        if (!available_) return result;

        ioctl(leader_fd_, PERF_EVENT_IOC_DISABLE, PERF_IOC_FLAG_GROUP);

        result.cycles = read_counter(fds_[0]);
        result.instructions = read_counter(fds_[1]);
        result.cache_references = read_counter(fds_[2]);
        result.cache_misses = read_counter(fds_[3]);
        result.branch_instructions = read_counter(fds_[4]);
        result.branch_misses = read_counter(fds_[5]);

        return result;
    }

private:
    static constexpr int NUM_COUNTERS = 6;
    std::array<int, NUM_COUNTERS> fds_{-1, -1, -1, -1, -1, -1};
    int leader_fd_ = -1;
    bool available_ = false;
    std::chrono::steady_clock::time_point start_time_;

    static int open_counter(uint64_t config, int group_fd) {
        struct perf_event_attr pe{};
        pe.type = PERF_TYPE_HARDWARE;
        pe.size = sizeof(pe);
        pe.config = config;
        pe.disabled = group_fd < 0 ? 1 : 0;
        pe.exclude_kernel = 1;
        pe.exclude_hv = 1;

        return static_cast<int>(syscall(__NR_perf_event_open, &pe, 0, -1, group_fd, 0));
    }

    // Empty for a counter that failed to open or read
    static std::optional<uint64_t> read_counter(int fd) {
        if (fd < 0) return std::nullopt;
        uint64_t value = 0;
        if (read(fd, &value, sizeof(value)) != static_cast<ssize_t>(sizeof(value))) {
            return std::nullopt;
        }
        return value;
    }
};

#else  // Non-Linux fallback

class PerfCounterGroup {
public:
    PerfCounterGroup() = default;
    [[nodiscard]] bool available() const { return false; }

    void start() {
        start_time_ = std::chrono::steady_clock::now();
    }

    [[nodiscard]] CounterResult stop() {
        auto end_time = std::chrono::steady_clock::now();
        CounterResult result;
        result.time_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
            end_time - start_time_).count();
        return result;
    }

private:
    std::chrono::steady_clock::time_point start_time_;
};

#endif

} // namespace tickscale::perf
