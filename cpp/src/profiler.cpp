#include "profiler.hpp"
#include "errors.hpp"
#include <algorithm>
#include <chrono>
#include <limits>

namespace tickscale::profiler {

namespace {

std::unique_ptr<strategy::MovingAverageStrategy> build(const StrategyFactory& factory) {
    auto instance = factory();
    if (!instance) {
        throw InvalidConfiguration("strategy factory returned no instance");
    }
    return instance;
}

} // namespace

void drive(strategy::MovingAverageStrategy& strategy, const std::vector<double>& prices) {
    // volatile sink keeps the loop from being optimized away
    volatile double sink = 0.0;
    for (double price : prices) {
        sink = strategy.ingest(price);
    }
    (void)sink;
}

Profiler::Profiler(memory::MemoryProbe& probe, std::size_t repeats)
    : probe_(probe), repeats_(repeats) {
    if (repeats_ == 0) {
        throw InvalidConfiguration("profiler needs at least one timing repeat");
    }
}

double Profiler::time_trial(const StrategyFactory& factory,
                            const std::vector<double>& prices) const {
    double best = std::numeric_limits<double>::infinity();

    for (std::size_t r = 0; r < repeats_; ++r) {
        auto instance = build(factory);

        const auto start = std::chrono::steady_clock::now();
        drive(*instance, prices);
        const auto end = std::chrono::steady_clock::now();

        best = std::min(best, std::chrono::duration<double>(end - start).count());
    }

    return best;
}

uint64_t Profiler::peak_memory_trial(const StrategyFactory& factory,
                                     const std::vector<double>& prices) const {
    return probe_.measure_peak([&] {
        auto instance = build(factory);
        drive(*instance, prices);
    });
}

std::optional<perf::CounterResult> Profiler::counter_trial(
    const StrategyFactory& factory,
    const std::vector<double>& prices) const {
    perf::PerfCounterGroup counters;
    if (!counters.available()) {
        return std::nullopt;
    }

    auto instance = build(factory);

    counters.start();
    drive(*instance, prices);
    return counters.stop();
}

BenchmarkSample Profiler::measure(const std::string& strategy_name,
                                  const StrategyFactory& factory,
                                  const std::vector<double>& prices,
                                  bool collect_counters) const {
    BenchmarkSample sample;
    sample.strategy = strategy_name;
    sample.ticks = prices.size();
    sample.seconds = time_trial(factory, prices);
    sample.peak_memory_bytes = peak_memory_trial(factory, prices);
    sample.probe = probe_.name();

    if (collect_counters) {
        sample.counters = counter_trial(factory, prices);
    }

    return sample;
}

} // namespace tickscale::profiler
