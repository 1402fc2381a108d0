/**
 * Moving-Average Complexity Benchmark
 *
 * Subcommands:
 *   tickscale generate --out market_data.csv --ticks 100000
 *   tickscale bench --csv market_data.csv --window 50 --repeats 3
 *
 * `bench` runs every strategy at every size, prints the results table and
 * writes a markdown report plus a CSV of samples for plotting. Without --csv
 * it benchmarks a synthetic random walk generated in memory.
 *
 * Hardware counters need perf_event_paranoid <= 2; the RSS probe needs a
 * writable /proc/self/clear_refs (Linux >= 4.0). Use --probe heap otherwise.
 */

#include "../include/benchmark_runner.hpp"
#include "../include/errors.hpp"
#include "../include/market_data.hpp"
#include "../include/memory_probe.hpp"
#include "../include/report.hpp"

#include <CLI/CLI.hpp>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace tickscale;

namespace {

struct GenerateArgs {
    std::string out = "market_data.csv";
    market::WalkParams walk;

    void add_options(CLI::App& app) {
        app.add_option("--out", out, "output CSV path")->capture_default_str();
        app.add_option("--ticks", walk.num_ticks, "number of ticks")->capture_default_str();
        app.add_option("--symbol", walk.symbol, "symbol column value")->capture_default_str();
        app.add_option("--start-price", walk.start_price, "first price")->capture_default_str();
        app.add_option("--drift", walk.drift, "per-tick drift")->capture_default_str();
        app.add_option("--volatility", walk.volatility, "std-dev of per-tick noise")->capture_default_str();
        app.add_option("--seed", walk.seed, "random seed")->capture_default_str();
    }
};

struct BenchArgs {
    std::string csv;
    std::string probe = "auto";
    std::string report = "complexity_report.md";
    std::string samples = "benchmark_samples.csv";
    std::vector<std::string> strategies{"naive", "cumulative", "windowed"};
    uint64_t seed = 42;
    bench::BenchmarkConfig config;

    void add_options(CLI::App& app) {
        app.add_option("--csv", csv, "tick CSV (timestamp,symbol,price); synthetic walk if omitted");
        app.add_option("--window", config.window_size, "window size k for the windowed strategy")
            ->capture_default_str();
        app.add_option("--repeats", config.repeats, "timed repeats per trial (minimum is kept)")
            ->capture_default_str();
        app.add_option("--sizes", config.sizes, "input sizes to benchmark")->capture_default_str();
        app.add_option("--strategies", strategies, "strategies to run")
            ->check(CLI::IsMember({"naive", "cumulative", "windowed"}))
            ->capture_default_str();
        app.add_option("--probe", probe, "peak-memory probe")
            ->check(CLI::IsMember({"auto", "rss", "heap"}))
            ->capture_default_str();
        app.add_option("--counters-on", config.counters_on_size,
                       "collect hardware counters at this size (0 = off)")
            ->capture_default_str();
        app.add_option("--report", report, "markdown report path")->capture_default_str();
        app.add_option("--samples", samples, "samples CSV path")->capture_default_str();
        app.add_option("--seed", seed, "seed for the synthetic walk")->capture_default_str();
    }
};

void print_banner() {
    std::cout << "============================================================\n";
    std::cout << "      TICKSCALE - MOVING AVERAGE COMPLEXITY BENCHMARK       \n";
    std::cout << "============================================================\n";
}

int run_generate(const GenerateArgs& args) {
    const auto ticks = market::generate_random_walk(args.walk);
    market::write_market_data_csv(args.out, ticks);

    std::cout << "Wrote " << ticks.size() << " ticks to " << args.out << "\n";
    return 0;
}

int run_bench(BenchArgs& args) {
    print_banner();

    args.config.strategies.clear();
    for (const auto& name : args.strategies) {
        args.config.strategies.push_back(bench::parse_strategy_kind(name));
    }

    std::vector<market::MarketTick> ticks;
    if (args.csv.empty()) {
        market::WalkParams walk;
        walk.seed = args.seed;
        walk.num_ticks = args.config.sizes.empty()
            ? 0 : *std::max_element(args.config.sizes.begin(), args.config.sizes.end());
        ticks = market::generate_random_walk(walk);
        std::cout << "\nGenerated " << ticks.size() << " synthetic ticks (seed " << args.seed << ")\n";
    } else {
        ticks = market::load_market_data(args.csv);
        std::cout << "\nLoaded " << ticks.size() << " ticks from " << args.csv << "\n";
    }

    std::cout << "\nSPACE COMPLEXITY OF THE DATASET:\n";
    std::cout << "-------------------------------------------\n";
    std::cout << report::dataset_space_note(ticks.size()) << "\n";

    const auto prices = market::extract_prices(ticks);
    ticks.clear();
    ticks.shrink_to_fit();

    auto probe = memory::make_memory_probe(args.probe);

    bench::BenchmarkRunner runner(args.config, *probe);
    runner.on_sample([](const profiler::BenchmarkSample& s) {
        std::cout << "  " << std::left << std::setw(12) << s.strategy
                  << std::right << std::setw(8) << s.ticks << " ticks  "
                  << std::fixed << std::setprecision(6) << s.seconds << " s\n";
        if (s.counters) {
            s.counters->print(std::cout, s.strategy + " @ " + std::to_string(s.ticks), s.ticks);
        }
    });
    runner.on_failure([](const bench::TrialFailure& f) {
        std::cerr << "  [FAILED] " << f.strategy << " @ " << f.ticks << " ticks: "
                  << f.error << ": " << f.message << "\n";
    });

    std::cout << "\nRUNNING TRIALS (window=" << args.config.window_size
              << ", repeats=" << args.config.repeats
              << ", probe=" << probe->name() << "):\n";
    std::cout << "-------------------------------------------\n";

    const auto results = runner.run(prices);

    std::cout << "\nRESULTS:\n";
    std::cout << "-------------------------------------------\n";
    report::print_results_table(std::cout, results);

    report::write_samples_csv(args.samples, results);
    report::write_markdown_report(args.report, results, args.samples);

    std::cout << "\nGenerated artifacts:\n";
    std::cout << "  - " << args.report << "\n";
    std::cout << "  - " << args.samples << "\n";

    return results.failures.empty() ? 0 : 2;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app("Moving-average runtime and memory complexity benchmark");
    app.require_subcommand(1);

    GenerateArgs generate_args;
    auto* generate_cmd = app.add_subcommand("generate", "write a synthetic random-walk tick CSV");
    generate_args.add_options(*generate_cmd);

    BenchArgs bench_args;
    auto* bench_cmd = app.add_subcommand("bench", "benchmark the strategies");
    bench_args.add_options(*bench_cmd);

    CLI11_PARSE(app, argc, argv);

    try {
        if (generate_cmd->parsed()) return run_generate(generate_args);
        if (bench_cmd->parsed()) return run_bench(bench_args);
    } catch (const TickscaleError& e) {
        std::cerr << "error: " << e.kind() << ": " << e.what() << "\n";
        return 1;
    }

    return 0;
}
