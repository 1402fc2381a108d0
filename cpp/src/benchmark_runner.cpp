#include "benchmark_runner.hpp"
#include "errors.hpp"
#include <algorithm>
#include <sstream>

namespace tickscale::bench {

const char* to_string(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::NAIVE: return "naive";
        case StrategyKind::CUMULATIVE: return "cumulative";
        case StrategyKind::WINDOWED: return "windowed";
        default: return "unknown";
    }
}

StrategyKind parse_strategy_kind(const std::string& name) {
    if (name == "naive") return StrategyKind::NAIVE;
    if (name == "cumulative") return StrategyKind::CUMULATIVE;
    if (name == "windowed") return StrategyKind::WINDOWED;
    throw InvalidConfiguration("unknown strategy '" + name + "' (expected naive, cumulative or windowed)");
}

profiler::StrategyFactory make_strategy_factory(StrategyKind kind, int64_t window_size) {
    switch (kind) {
        case StrategyKind::NAIVE:
            return [] { return std::make_unique<strategy::NaiveStrategy>(); };
        case StrategyKind::CUMULATIVE:
            return [] { return std::make_unique<strategy::CumulativeStrategy>(); };
        case StrategyKind::WINDOWED:
            return [window_size] { return std::make_unique<strategy::WindowedStrategy>(window_size); };
    }
    throw InvalidConfiguration("unknown strategy kind");
}

BenchmarkRunner::BenchmarkRunner(BenchmarkConfig config, memory::MemoryProbe& probe)
    : config_(std::move(config)), probe_(probe) {
    if (config_.sizes.empty()) {
        throw InvalidConfiguration("benchmark needs at least one input size");
    }
    if (std::find(config_.sizes.begin(), config_.sizes.end(), 0u) != config_.sizes.end()) {
        throw InvalidConfiguration("benchmark input sizes must be positive");
    }
    if (config_.repeats == 0) {
        throw InvalidConfiguration("benchmark needs at least one timing repeat");
    }

    // Sizes run ascending, each once
    std::sort(config_.sizes.begin(), config_.sizes.end());
    config_.sizes.erase(std::unique(config_.sizes.begin(), config_.sizes.end()), config_.sizes.end());
}

BenchmarkReport BenchmarkRunner::run(const std::vector<double>& prices) const {
    std::vector<std::pair<std::string, profiler::StrategyFactory>> factories;
    factories.reserve(config_.strategies.size());

    for (StrategyKind kind : config_.strategies) {
        factories.emplace_back(to_string(kind), make_strategy_factory(kind, config_.window_size));
    }

    return run(factories, prices);
}

BenchmarkReport BenchmarkRunner::run(
    const std::vector<std::pair<std::string, profiler::StrategyFactory>>& factories,
    const std::vector<double>& prices) const {
    const std::size_t largest = config_.sizes.back();
    if (prices.size() < largest) {
        std::ostringstream msg;
        msg << "not enough ticks: requested " << largest << ", have " << prices.size();
        throw InvalidConfiguration(msg.str());
    }

    const profiler::Profiler profiler(probe_, config_.repeats);

    BenchmarkReport report;
    report.probe = probe_.name();
    report.samples.reserve(factories.size() * config_.sizes.size());

    for (const auto& [name, factory] : factories) {
        for (std::size_t n : config_.sizes) {
            const std::vector<double> slice(prices.begin(), prices.begin() + n);
            const bool counters = config_.counters_on_size != 0 && n == config_.counters_on_size;

            try {
                report.samples.push_back(profiler.measure(name, factory, slice, counters));
            } catch (const TickscaleError& e) {
                report.failures.push_back(TrialFailure{name, n, e.kind(), e.what()});
                if (on_failure_) on_failure_(report.failures.back());
                continue;
            }

            if (on_sample_) on_sample_(report.samples.back());
        }
    }

    return report;
}

} // namespace tickscale::bench
