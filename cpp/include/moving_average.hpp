#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace tickscale::strategy {

// =============================================================================
// STRATEGY INTERFACE
// =============================================================================

/**
 * Streaming moving-average strategy.
 *
 * ingest() folds one price into the internal state and returns the average
 * after that price. Every implementation returns the same kind of value, they
 * only differ in what they keep and what each call costs.
 *
 * A price that is not finite throws MalformedInput and leaves the state as it
 * was before the call.
 */
class MovingAverageStrategy {
public:
    virtual ~MovingAverageStrategy() = default;

    virtual double ingest(double price) = 0;

    // Forget all ingested prices
    virtual void reset() = 0;

    // Number of prices currently held in memory
    [[nodiscard]] virtual std::size_t retained() const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

// =============================================================================
// NAIVE: FULL HISTORY, RE-SUMMED EVERY TICK
// =============================================================================

/**
 * Keeps every price and recomputes the mean from scratch.
 *
 * Time per tick: O(n), total O(N^2)
 * Space: O(N)
 */
class NaiveStrategy final : public MovingAverageStrategy {
public:
    NaiveStrategy() = default;

    double ingest(double price) override;
    void reset() override;

    [[nodiscard]] std::size_t retained() const override { return history_.size(); }
    [[nodiscard]] std::string name() const override { return "naive"; }

private:
    std::vector<double> history_;
};

// =============================================================================
// CUMULATIVE: RUNNING SUM + COUNT
// =============================================================================

/**
 * Full-history mean from a running sum and count.
 *
 * Time per tick: O(1), total O(N)
 * Space: O(1)
 */
class CumulativeStrategy final : public MovingAverageStrategy {
public:
    CumulativeStrategy() = default;

    double ingest(double price) override;
    void reset() override;

    [[nodiscard]] std::size_t retained() const override { return 0; }
    [[nodiscard]] std::string name() const override { return "cumulative"; }

    [[nodiscard]] uint64_t count() const { return count_; }

private:
    double sum_ = 0.0;
    uint64_t count_ = 0;
};

// =============================================================================
// WINDOWED: LAST K PRICES
// =============================================================================

/**
 * Mean of the k most recent prices.
 *
 * window_.size() <= k and sum_ == sum(window_) after every call. Until k
 * prices have arrived the mean is taken over the partial window.
 *
 * Time per tick: O(1) amortized (deque push_back / pop_front)
 * Space: O(k)
 */
class WindowedStrategy final : public MovingAverageStrategy {
public:
    // Throws InvalidConfiguration if window_size <= 0
    explicit WindowedStrategy(int64_t window_size);

    double ingest(double price) override;
    void reset() override;

    [[nodiscard]] std::size_t retained() const override { return window_.size(); }
    [[nodiscard]] std::string name() const override { return "windowed"; }

    [[nodiscard]] std::size_t window_size() const { return window_size_; }
    [[nodiscard]] double window_sum() const { return sum_; }

private:
    std::size_t window_size_;
    std::deque<double> window_;
    double sum_ = 0.0;
};

// Throws MalformedInput for NaN or infinite prices
void validate_price(double price);

} // namespace tickscale::strategy
