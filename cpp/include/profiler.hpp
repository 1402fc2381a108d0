#pragma once

#include "memory_probe.hpp"
#include "moving_average.hpp"
#include "perf_counters.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tickscale::profiler {

using StrategyFactory = std::function<std::unique_ptr<strategy::MovingAverageStrategy>()>;

/**
 * One measured (strategy, input size) trial.
 */
struct BenchmarkSample {
    std::string strategy;
    std::size_t ticks = 0;
    double seconds = 0.0;          // minimum over the timed repeats
    uint64_t peak_memory_bytes = 0;
    std::string probe;             // probe that produced peak_memory_bytes
    std::optional<perf::CounterResult> counters;
};

/**
 * Measures one strategy over one price slice.
 *
 * Every timed repeat and the memory pass get their own strategy instance from
 * the factory; the instance is built before the clock starts and destroyed
 * after it stops. A throwing factory or ingest() aborts the measurement and
 * no sample is returned.
 */
class Profiler {
public:
    // Throws InvalidConfiguration if repeats == 0
    explicit Profiler(memory::MemoryProbe& probe, std::size_t repeats = 3);

    // The sample is labelled with strategy_name, not the instance's name()
    [[nodiscard]] BenchmarkSample measure(const std::string& strategy_name,
                                          const StrategyFactory& factory,
                                          const std::vector<double>& prices,
                                          bool collect_counters = false) const;

    // Best-of-repeats wall time in seconds
    [[nodiscard]] double time_trial(const StrategyFactory& factory,
                                    const std::vector<double>& prices) const;

    [[nodiscard]] uint64_t peak_memory_trial(const StrategyFactory& factory,
                                             const std::vector<double>& prices) const;

    // Empty when perf_event_open is not permitted on this host
    [[nodiscard]] std::optional<perf::CounterResult> counter_trial(
        const StrategyFactory& factory,
        const std::vector<double>& prices) const;

private:
    memory::MemoryProbe& probe_;
    std::size_t repeats_;
};

// Feed every price through the strategy, discarding the averages
void drive(strategy::MovingAverageStrategy& strategy, const std::vector<double>& prices);

} // namespace tickscale::profiler
