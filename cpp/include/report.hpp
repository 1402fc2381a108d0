#pragma once

#include "benchmark_runner.hpp"

#include <cstddef>
#include <ostream>
#include <string>

namespace tickscale::report {

// Big-O annotation for a strategy name ("naive", "cumulative", "windowed")
std::string complexity_note(const std::string& strategy);

// Space taken by holding the whole tick stream in memory
std::string dataset_space_note(std::size_t num_ticks);

// Fixed-width table, one row per sample, then any recorded failures
void print_results_table(std::ostream& out, const bench::BenchmarkReport& report);

void write_markdown_report(std::ostream& out,
                           const bench::BenchmarkReport& report,
                           const std::string& samples_csv_path = "");

// Throws IoError
void write_markdown_report(const std::string& path,
                           const bench::BenchmarkReport& report,
                           const std::string& samples_csv_path = "");

// strategy,ticks,seconds,peak_bytes,probe
void write_samples_csv(std::ostream& out, const bench::BenchmarkReport& report);

// Throws IoError
void write_samples_csv(const std::string& path, const bench::BenchmarkReport& report);

} // namespace tickscale::report
