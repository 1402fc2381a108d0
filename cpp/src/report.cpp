#include "report.hpp"
#include "errors.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>
#include <vector>

namespace tickscale::report {

namespace {

std::string with_commas(std::size_t value) {
    std::string digits = std::to_string(value);
    for (int i = static_cast<int>(digits.size()) - 3; i > 0; i -= 3) {
        digits.insert(static_cast<std::size_t>(i), ",");
    }
    return digits;
}

// Restores formatting flags and precision on scope exit
class StreamStateGuard {
public:
    explicit StreamStateGuard(std::ostream& out)
        : out_(out), flags_(out.flags()), precision_(out.precision()) {}
    ~StreamStateGuard() {
        out_.flags(flags_);
        out_.precision(precision_);
    }

    StreamStateGuard(const StreamStateGuard&) = delete;
    StreamStateGuard& operator=(const StreamStateGuard&) = delete;

private:
    std::ostream& out_;
    std::ios_base::fmtflags flags_;
    std::streamsize precision_;
};

double to_mib(uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

} // namespace

std::string complexity_note(const std::string& strategy) {
    if (strategy == "naive") {
        return "Per-tick time O(n), total O(N^2); space O(N) (stores full history).";
    }
    if (strategy == "cumulative") {
        return "Per-tick time O(1), total O(N); space O(1) (running sum + count).";
    }
    if (strategy == "windowed") {
        return "Per-tick time O(1) amortized, total O(N); space O(k) (deque window + running sum).";
    }
    return "No complexity annotation.";
}

std::string dataset_space_note(std::size_t num_ticks) {
    std::ostringstream out;
    out << "Holding " << with_commas(num_ticks) << " ticks in memory is O(N) space:\n"
        << "  - the tick vector stores N records (O(N))\n"
        << "  - each record is a fixed set of fields (O(1) per tick),\n"
        << "    plus timestamp/symbol text bounded by their length\n"
        << "  - the price column handed to the benchmark is N doubles ("
        << with_commas(num_ticks * sizeof(double)) << " bytes)";
    return out.str();
}

void print_results_table(std::ostream& out, const bench::BenchmarkReport& report) {
    const StreamStateGuard guard(out);

    out << std::left << std::setw(12) << "Strategy"
        << std::right << std::setw(10) << "Ticks"
        << std::setw(14) << "Runtime (s)"
        << std::setw(14) << "Peak (MiB)"
        << std::setw(14) << "Peak (B)"
        << "  Probe\n";
    out << std::string(72, '-') << "\n";

    for (const auto& s : report.samples) {
        out << std::left << std::setw(12) << s.strategy
            << std::right << std::setw(10) << s.ticks
            << std::fixed << std::setprecision(6) << std::setw(14) << s.seconds
            << std::setprecision(3) << std::setw(14) << to_mib(s.peak_memory_bytes)
            << std::setw(14) << s.peak_memory_bytes
            << "  " << s.probe << "\n";
    }

    if (!report.failures.empty()) {
        out << "\nFailed trials:\n";
        for (const auto& f : report.failures) {
            out << "  " << f.strategy << " @ " << f.ticks << " ticks: "
                << f.error << ": " << f.message << "\n";
        }
    }
}

void write_markdown_report(std::ostream& out,
                           const bench::BenchmarkReport& report,
                           const std::string& samples_csv_path) {
    const StreamStateGuard guard(out);

    std::set<std::string> strategies;
    for (const auto& s : report.samples) strategies.insert(s.strategy);

    out << "# Runtime & Space Complexity of Moving-Average Strategies\n\n";

    out << "## Overview\n";
    out << "Three moving-average strategies ingest the same tick stream; each trial measures\n";
    out << "best-of-repeats wall time and peak memory for one (strategy, input size) pair.\n\n";

    out << "## Complexity Annotations (Big-O)\n";
    for (const auto& name : strategies) {
        out << "- **" << name << "**: " << complexity_note(name) << "\n";
    }
    out << "\n";

    out << "## Benchmark Results\n";
    out << "| Strategy | Ticks | Runtime (s) | Peak Memory (MiB) | Peak Memory (bytes) |\n";
    out << "|---|---:|---:|---:|---:|\n";
    for (const auto& s : report.samples) {
        out << "| " << s.strategy << " | " << with_commas(s.ticks) << " | "
            << std::fixed << std::setprecision(6) << s.seconds << " | "
            << std::setprecision(3) << to_mib(s.peak_memory_bytes) << " | "
            << s.peak_memory_bytes << " |\n";
    }
    out << "\n";

    if (!report.failures.empty()) {
        out << "## Failed Trials\n";
        for (const auto& f : report.failures) {
            out << "- " << f.strategy << " @ " << with_commas(f.ticks) << " ticks: `"
                << f.error << "` " << f.message << "\n";
        }
        out << "\n";
    }

    out << "## Narrative Comparison\n";
    if (report.samples.empty()) {
        out << "No trial completed.\n\n";
    } else {
        std::size_t largest = 0;
        for (const auto& s : report.samples) largest = std::max(largest, s.ticks);

        std::vector<profiler::BenchmarkSample> at_largest;
        for (const auto& s : report.samples) {
            if (s.ticks == largest) at_largest.push_back(s);
        }
        std::stable_sort(at_largest.begin(), at_largest.end(),
                         [](const auto& a, const auto& b) { return a.seconds < b.seconds; });

        out << "For **" << with_commas(largest) << " ticks**, fastest to slowest (by runtime):\n";
        for (const auto& s : at_largest) {
            out << "- " << s.strategy << ": " << std::fixed << std::setprecision(6) << s.seconds
                << "s, peak " << std::setprecision(3) << to_mib(s.peak_memory_bytes) << " MiB\n";
        }

        const auto& fastest = at_largest.front();
        const auto& slowest = at_largest.back();
        if (at_largest.size() > 1 && fastest.seconds > 0.0) {
            out << "\n" << slowest.strategy << " is " << std::setprecision(1)
                << (slowest.seconds / fastest.seconds) << "x slower than "
                << fastest.strategy << " at this size.\n";
        }

        out << "\nThe naive strategy re-sums the whole history on every tick (quadratic total work),\n"
            << "so it scales far worse than the O(N) strategies as N grows. The cumulative strategy\n"
            << "keeps only a running sum and count, and the windowed strategy bounds memory to the\n"
            << "last k prices.\n\n";
    }

    out << "## Notes on Measurement\n";
    out << "- **Runtime**: `std::chrono::steady_clock`, minimum over the timed repeats; a fresh\n"
        << "  strategy instance is built before the clock starts for every repeat.\n";
    out << "- **Peak memory**: `" << report.probe << "` probe. ";
    if (report.probe == "rss") {
        out << "Kernel peak RSS (VmHWM) above the VmRSS baseline, reset per trial.\n";
    } else if (report.probe == "heap") {
        out << "Peak live bytes from the replaced global operator new above the pre-trial baseline.\n";
    } else {
        out << "\n";
    }
    out << "- Absolute memory figures are only comparable between runs that used the same probe.\n";
    if (!samples_csv_path.empty()) {
        out << "- Raw samples for plotting: `" << samples_csv_path << "`.\n";
    }
}

void write_markdown_report(const std::string& path,
                           const bench::BenchmarkReport& report,
                           const std::string& samples_csv_path) {
    std::ofstream out(path);
    if (!out) {
        throw IoError("cannot write report: " + path);
    }
    write_markdown_report(out, report, samples_csv_path);
    if (!out.flush()) {
        throw IoError("failed writing report: " + path);
    }
}

void write_samples_csv(std::ostream& out, const bench::BenchmarkReport& report) {
    const StreamStateGuard guard(out);

    out << "strategy,ticks,seconds,peak_bytes,probe\n";
    for (const auto& s : report.samples) {
        out << s.strategy << ',' << s.ticks << ','
            << std::setprecision(9) << std::defaultfloat << s.seconds << ','
            << s.peak_memory_bytes << ',' << s.probe << '\n';
    }
}

void write_samples_csv(const std::string& path, const bench::BenchmarkReport& report) {
    std::ofstream out(path);
    if (!out) {
        throw IoError("cannot write samples: " + path);
    }
    write_samples_csv(out, report);
    if (!out.flush()) {
        throw IoError("failed writing samples: " + path);
    }
}

} // namespace tickscale::report
