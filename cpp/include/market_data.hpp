#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace tickscale::market {

// Tick record as stored in the CSV; the benchmark only consumes `price`
struct MarketTick {
    std::string timestamp;  // ISO-8601 (validated on load), kept as text
    std::string symbol;
    double price;
};

/**
 * Read ticks from a CSV with a header naming at least `timestamp`, `symbol`
 * and `price` (any column order, extra columns ignored).
 *
 * Throws IoError if the file cannot be opened and MalformedInput for a
 * missing column, a short row, or a price that is not a finite number.
 */
std::vector<MarketTick> load_market_data(const std::string& path);

// Same as load_market_data; `source` only labels error messages
std::vector<MarketTick> parse_market_data(std::istream& in, const std::string& source);

// Parse one data row against the column positions found in the header.
// Throws MalformedInput for a short row, a non-ISO-8601 timestamp or a bad price.
MarketTick parse_tick_row(const std::string& line,
                          std::size_t timestamp_col,
                          std::size_t symbol_col,
                          std::size_t price_col);

// Price column in stream order
std::vector<double> extract_prices(const std::vector<MarketTick>& ticks);

// =============================================================================
// SYNTHETIC DATA
// =============================================================================

/**
 * Random walk: p[t+1] = max(0.01, p[t] + drift + N(0, volatility)),
 * one tick per second from 2026-01-01T00:00:00+00:00.
 */
struct WalkParams {
    std::string symbol = "SIM";
    std::size_t num_ticks = 100000;
    double start_price = 100.0;
    double drift = 0.0005;
    double volatility = 0.2;
    uint64_t seed = 42;
};

std::vector<MarketTick> generate_random_walk(const WalkParams& params);

// Writes "timestamp,symbol,price" with six-decimal prices. Throws IoError.
void write_market_data_csv(const std::string& path, const std::vector<MarketTick>& ticks);

} // namespace tickscale::market
