#include "market_data.hpp"
#include "errors.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace tickscale::market {

namespace {

constexpr std::size_t NO_COLUMN = static_cast<std::size_t>(-1);

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream ss(line);
    std::string field;

    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

double parse_price(const std::string& text) {
    if (text.empty()) {
        throw MalformedInput("empty price field");
    }

    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        throw MalformedInput("price is not numeric: '" + text + "'");
    }
    if (!std::isfinite(value)) {
        throw MalformedInput("price is not a finite number: '" + text + "'");
    }
    return value;
}

// Reads `count` digits at `pos`, advancing it; false on a non-digit
bool read_digits(const std::string& text, std::size_t& pos, std::size_t count, int& value) {
    if (pos + count > text.size()) return false;
    value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const char c = text[pos + i];
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    return true;
}

bool read_hh_mm(const std::string& text, std::size_t& pos, int& hours, int& minutes) {
    return read_digits(text, pos, 2, hours) && pos < text.size() && text[pos++] == ':' &&
           read_digits(text, pos, 2, minutes) && hours < 24 && minutes < 60;
}

// YYYY-MM-DD[(T| )HH:MM[:SS[.fff...]]][Z|(+|-)HH:MM]
bool is_iso8601(const std::string& text) {
    using namespace std::chrono;

    std::size_t pos = 0;
    int y = 0, m = 0, d = 0;
    if (!read_digits(text, pos, 4, y) || pos >= text.size() || text[pos++] != '-' ||
        !read_digits(text, pos, 2, m) || pos >= text.size() || text[pos++] != '-' ||
        !read_digits(text, pos, 2, d)) {
        return false;
    }
    const year_month_day date{year{y}, month{static_cast<unsigned>(m)}, day{static_cast<unsigned>(d)}};
    if (!date.ok()) return false;
    if (pos == text.size()) return true;

    if (text[pos] != 'T' && text[pos] != ' ') return false;
    ++pos;

    int hh = 0, mm = 0, ss = 0;
    if (!read_hh_mm(text, pos, hh, mm)) return false;
    if (pos < text.size() && text[pos] == ':') {
        ++pos;
        if (!read_digits(text, pos, 2, ss) || ss > 59) return false;
        if (pos < text.size() && text[pos] == '.') {
            const std::size_t first = ++pos;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') ++pos;
            if (pos == first) return false;
        }
    }
    if (pos == text.size()) return true;

    if (text[pos] == 'Z') return pos + 1 == text.size();
    if (text[pos] != '+' && text[pos] != '-') return false;
    ++pos;
    int off_h = 0, off_m = 0;
    return read_hh_mm(text, pos, off_h, off_m) && pos == text.size();
}

// 2026-01-01T00:00:00+00:00 plus `offset` seconds
std::string iso_timestamp(int64_t offset) {
    using namespace std::chrono;

    const sys_days base = year{2026} / January / 1;
    const sys_seconds at = base + seconds{offset};
    const sys_days day = floor<days>(at);
    const year_month_day ymd{day};
    const hh_mm_ss<seconds> tod{at - day};

    std::ostringstream out;
    out << std::setfill('0')
        << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.day()) << 'T'
        << std::setw(2) << tod.hours().count() << ':'
        << std::setw(2) << tod.minutes().count() << ':'
        << std::setw(2) << tod.seconds().count() << "+00:00";
    return out.str();
}

} // namespace

MarketTick parse_tick_row(const std::string& line,
                          std::size_t timestamp_col,
                          std::size_t symbol_col,
                          std::size_t price_col) {
    const auto fields = split_fields(line);
    const std::size_t needed = std::max({timestamp_col, symbol_col, price_col}) + 1;

    if (fields.size() < needed) {
        std::ostringstream msg;
        msg << "expected at least " << needed << " fields, got " << fields.size();
        throw MalformedInput(msg.str());
    }

    MarketTick tick{};
    if (!is_iso8601(fields[timestamp_col])) {
        throw MalformedInput("timestamp is not ISO-8601: '" + fields[timestamp_col] + "'");
    }
    tick.timestamp = fields[timestamp_col];
    tick.symbol = fields[symbol_col];
    tick.price = parse_price(fields[price_col]);
    return tick;
}

std::vector<MarketTick> parse_market_data(std::istream& in, const std::string& source) {
    std::string line;
    if (!std::getline(in, line)) {
        throw MalformedInput(source + ": missing header row");
    }

    const auto header = split_fields(line);
    auto column = [&](const std::string& name) {
        const auto it = std::find(header.begin(), header.end(), name);
        return it == header.end() ? NO_COLUMN : static_cast<std::size_t>(it - header.begin());
    };

    const std::size_t timestamp_col = column("timestamp");
    const std::size_t symbol_col = column("symbol");
    const std::size_t price_col = column("price");

    if (timestamp_col == NO_COLUMN || symbol_col == NO_COLUMN || price_col == NO_COLUMN) {
        throw MalformedInput(source + ": header must contain timestamp, symbol and price; got '" +
                             trim(line) + "'");
    }

    std::vector<MarketTick> ticks;
    std::size_t line_no = 1;

    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;

        try {
            ticks.push_back(parse_tick_row(line, timestamp_col, symbol_col, price_col));
        } catch (const MalformedInput& e) {
            std::ostringstream msg;
            msg << source << ":" << line_no << ": " << e.what();
            throw MalformedInput(msg.str());
        }
    }

    return ticks;
}

std::vector<MarketTick> load_market_data(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw IoError("cannot open tick file: " + path);
    }
    return parse_market_data(file, path);
}

std::vector<double> extract_prices(const std::vector<MarketTick>& ticks) {
    std::vector<double> prices;
    prices.reserve(ticks.size());

    for (const auto& tick : ticks) {
        prices.push_back(tick.price);
    }
    return prices;
}

std::vector<MarketTick> generate_random_walk(const WalkParams& params) {
    std::mt19937_64 rng(params.seed);
    std::normal_distribution<double> noise(0.0, params.volatility);

    std::vector<MarketTick> ticks;
    ticks.reserve(params.num_ticks);

    double price = params.start_price;
    for (std::size_t i = 0; i < params.num_ticks; ++i) {
        ticks.push_back(MarketTick{iso_timestamp(static_cast<int64_t>(i)), params.symbol, price});
        price = std::max(0.01, price + params.drift + noise(rng));
    }

    return ticks;
}

void write_market_data_csv(const std::string& path, const std::vector<MarketTick>& ticks) {
    std::ofstream out(path);
    if (!out) {
        throw IoError("cannot write tick file: " + path);
    }

    out << "timestamp,symbol,price\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& tick : ticks) {
        out << tick.timestamp << ',' << tick.symbol << ',' << tick.price << '\n';
    }

    if (!out.flush()) {
        throw IoError("failed writing tick file: " + path);
    }
}

} // namespace tickscale::market
