#pragma once

#include "memory_probe.hpp"
#include "profiler.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace tickscale::bench {

enum class StrategyKind : uint8_t { NAIVE = 0, CUMULATIVE = 1, WINDOWED = 2 };

const char* to_string(StrategyKind kind);

// Throws InvalidConfiguration for an unknown name
StrategyKind parse_strategy_kind(const std::string& name);

/**
 * Factory producing a fresh strategy of the given kind.
 * window_size is only read for WINDOWED, and only when the factory runs.
 */
profiler::StrategyFactory make_strategy_factory(StrategyKind kind, int64_t window_size);

struct BenchmarkConfig {
    std::vector<std::size_t> sizes{1000, 10000, 100000};
    int64_t window_size = 50;
    std::size_t repeats = 3;
    std::vector<StrategyKind> strategies{
        StrategyKind::NAIVE, StrategyKind::CUMULATIVE, StrategyKind::WINDOWED};

    // Collect hardware counters for trials of exactly this size (0 = never)
    std::size_t counters_on_size = 0;
};

struct TrialFailure {
    std::string strategy;
    std::size_t ticks = 0;
    std::string error;    // TickscaleError::kind()
    std::string message;
};

struct BenchmarkReport {
    std::vector<profiler::BenchmarkSample> samples;
    std::vector<TrialFailure> failures;
    std::string probe;
};

/**
 * Runs every (strategy, size) combination through the profiler.
 *
 * Order is strategy-major in config order, then size ascending. A trial that
 * throws a TickscaleError is recorded in BenchmarkReport::failures and the run
 * moves on to the next trial.
 */
class BenchmarkRunner {
public:
    using SampleCallback = std::function<void(const profiler::BenchmarkSample&)>;
    using FailureCallback = std::function<void(const TrialFailure&)>;

    // Throws InvalidConfiguration for an empty/zero size list or zero repeats
    BenchmarkRunner(BenchmarkConfig config, memory::MemoryProbe& probe);

    // Throws InvalidConfiguration when prices is shorter than the largest size
    [[nodiscard]] BenchmarkReport run(const std::vector<double>& prices) const;

    // Same cross-product with caller-supplied factories; the name labels samples and failures
    [[nodiscard]] BenchmarkReport run(
        const std::vector<std::pair<std::string, profiler::StrategyFactory>>& factories,
        const std::vector<double>& prices) const;

    void on_sample(SampleCallback callback) { on_sample_ = std::move(callback); }
    void on_failure(FailureCallback callback) { on_failure_ = std::move(callback); }

    [[nodiscard]] const BenchmarkConfig& config() const { return config_; }

private:
    BenchmarkConfig config_;
    memory::MemoryProbe& probe_;
    SampleCallback on_sample_;
    FailureCallback on_failure_;
};

} // namespace tickscale::bench
