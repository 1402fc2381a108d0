#include "moving_average.hpp"
#include "errors.hpp"
#include <cmath>
#include <numeric>
#include <sstream>

namespace tickscale::strategy {

void validate_price(double price) {
    if (!std::isfinite(price)) {
        std::ostringstream msg;
        msg << "price is not a finite number: " << price;
        throw MalformedInput(msg.str());
    }
}

double NaiveStrategy::ingest(double price) {
    validate_price(price);
    history_.push_back(price);

    // O(n): sum over the whole history on every tick
    const double sum = std::accumulate(history_.begin(), history_.end(), 0.0);
    return sum / static_cast<double>(history_.size());
}

void NaiveStrategy::reset() {
    history_.clear();
    history_.shrink_to_fit();
}

double CumulativeStrategy::ingest(double price) {
    validate_price(price);
    sum_ += price;
    ++count_;
    return sum_ / static_cast<double>(count_);
}

void CumulativeStrategy::reset() {
    sum_ = 0.0;
    count_ = 0;
}

WindowedStrategy::WindowedStrategy(int64_t window_size)
    : window_size_(0) {
    if (window_size <= 0) {
        std::ostringstream msg;
        msg << "window size must be positive, got " << window_size;
        throw InvalidConfiguration(msg.str());
    }
    window_size_ = static_cast<std::size_t>(window_size);
}

double WindowedStrategy::ingest(double price) {
    validate_price(price);

    window_.push_back(price);
    sum_ += price;

    if (window_.size() > window_size_) {
        sum_ -= window_.front();
        window_.pop_front();
    }

    return sum_ / static_cast<double>(window_.size());
}

void WindowedStrategy::reset() {
    window_.clear();
    sum_ = 0.0;
}

} // namespace tickscale::strategy
