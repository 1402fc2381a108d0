#include <gtest/gtest.h>
#include "../include/profiler.hpp"
#include "../include/errors.hpp"
#include <cmath>
#include <limits>
#include <memory>
#include <vector>

using namespace tickscale;
using namespace tickscale::profiler;

namespace {

// Probe that runs the closure and reports a fixed value, or refuses to run
class StubProbe final : public memory::MemoryProbe {
public:
    explicit StubProbe(bool usable, uint64_t bytes = 4096) : usable_(usable), bytes_(bytes) {}

    uint64_t measure_peak(const std::function<void()>& work) override {
        if (!usable_) throw MeasurementUnavailable("stub probe disabled");
        ++calls;
        work();
        return bytes_;
    }

    [[nodiscard]] bool available() const override { return usable_; }
    [[nodiscard]] std::string name() const override { return "stub"; }

    int calls = 0;

private:
    bool usable_;
    uint64_t bytes_;
};

std::vector<double> ramp(std::size_t n) {
    std::vector<double> prices(n);
    for (std::size_t i = 0; i < n; ++i) prices[i] = static_cast<double>(i % 100 + 1);
    return prices;
}

StrategyFactory naive_factory() {
    return [] { return std::make_unique<strategy::NaiveStrategy>(); };
}

StrategyFactory cumulative_factory() {
    return [] { return std::make_unique<strategy::CumulativeStrategy>(); };
}

StrategyFactory windowed_factory(int64_t k) {
    return [k] { return std::make_unique<strategy::WindowedStrategy>(k); };
}

} // namespace

// =============================================================================
// SAMPLE CONTENTS AND LIFECYCLE
// =============================================================================

TEST(ProfilerTest, SampleCarriesTrialIdentity) {
    StubProbe probe(true, 12345);
    Profiler profiler(probe, 2);

    auto sample = profiler.measure("windowed", windowed_factory(10), ramp(1000));

    EXPECT_EQ(sample.strategy, "windowed");
    EXPECT_EQ(sample.ticks, 1000u);
    EXPECT_GT(sample.seconds, 0.0);
    EXPECT_EQ(sample.peak_memory_bytes, 12345u);
    EXPECT_EQ(sample.probe, "stub");
    EXPECT_FALSE(sample.counters.has_value());
    EXPECT_EQ(probe.calls, 1);
}

TEST(ProfilerTest, FreshInstancePerPass) {
    StubProbe probe(true);
    Profiler profiler(probe, 4);

    int built = 0;
    StrategyFactory counting = [&] {
        ++built;
        return std::make_unique<strategy::CumulativeStrategy>();
    };

    auto sample = profiler.measure("counting", counting, ramp(100));

    // 4 timed repeats + 1 memory pass
    EXPECT_EQ(built, 5);
    EXPECT_EQ(sample.strategy, "counting");
}

TEST(ProfilerTest, CallerNameLabelsSample) {
    StubProbe probe(true);
    Profiler profiler(probe, 1);

    auto short_window = profiler.measure("window-5", windowed_factory(5), ramp(200));
    auto long_window = profiler.measure("window-50", windowed_factory(50), ramp(200));

    EXPECT_EQ(short_window.strategy, "window-5");
    EXPECT_EQ(long_window.strategy, "window-50");
}

TEST(ProfilerTest, ZeroRepeatsRejected) {
    StubProbe probe(true);
    EXPECT_THROW((void)Profiler(probe, 0), InvalidConfiguration);
}

TEST(ProfilerTest, MalformedPriceAbortsTrial) {
    StubProbe probe(true);
    Profiler profiler(probe, 3);

    auto prices = ramp(50);
    prices[25] = std::numeric_limits<double>::quiet_NaN();

    EXPECT_THROW((void)profiler.measure("cumulative", cumulative_factory(), prices), MalformedInput);
    // Failure happens in the timed passes, before the memory pass
    EXPECT_EQ(probe.calls, 0);
}

TEST(ProfilerTest, FactoryFailurePropagates) {
    StubProbe probe(true);
    Profiler profiler(probe, 1);

    EXPECT_THROW((void)profiler.measure("windowed", windowed_factory(0), ramp(10)), InvalidConfiguration);
}

TEST(ProfilerTest, UnavailableProbeIsAnError) {
    StubProbe probe(false);
    Profiler profiler(probe, 1);

    EXPECT_THROW((void)profiler.measure("naive", naive_factory(), ramp(10)), MeasurementUnavailable);
}

TEST(ProfilerTest, CountersOnlyWhenPermitted) {
    StubProbe probe(true);
    Profiler profiler(probe, 1);

    auto sample = profiler.measure("cumulative", cumulative_factory(), ramp(1000), true);

    perf::PerfCounterGroup group;
    if (group.available()) {
        ASSERT_TRUE(sample.counters.has_value());
        ASSERT_TRUE(sample.counters->cycles.has_value());
        EXPECT_GT(*sample.counters->cycles, 0u);
    } else {
        EXPECT_FALSE(sample.counters.has_value());
    }
}

// =============================================================================
// COMPLEXITY PROPERTIES (heap probe)
// =============================================================================

class ProfilerComplexityTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!heap.available()) {
            GTEST_SKIP() << "heap probe unavailable";
        }
    }

    memory::HeapProbe heap;
};

TEST_F(ProfilerComplexityTest, WindowedMemoryFlatOnceFull) {
    Profiler profiler(heap, 1);
    const int64_t k = 100;

    const uint64_t at_k = profiler.peak_memory_trial(windowed_factory(k), ramp(100));
    const uint64_t at_10k = profiler.peak_memory_trial(windowed_factory(k), ramp(10000));

    EXPECT_GT(at_k, 0u);
    EXPECT_LE(at_10k, at_k + 4096) << "window memory grew with N";
}

TEST_F(ProfilerComplexityTest, NaiveMemoryGrowsWithN) {
    Profiler profiler(heap, 1);

    const uint64_t at_1k = profiler.peak_memory_trial(naive_factory(), ramp(1000));
    const uint64_t at_10k = profiler.peak_memory_trial(naive_factory(), ramp(10000));

    EXPECT_GE(at_1k, 1000 * sizeof(double));
    EXPECT_GE(at_10k, 10000 * sizeof(double));
    EXPECT_GT(at_10k, 5 * at_1k);
}

TEST_F(ProfilerComplexityTest, CumulativeMemoryIndependentOfN) {
    Profiler profiler(heap, 1);

    const uint64_t small = profiler.peak_memory_trial(cumulative_factory(), ramp(1000));
    const uint64_t large = profiler.peak_memory_trial(cumulative_factory(), ramp(50000));

    EXPECT_EQ(small, large);
    EXPECT_LT(large, 1024u);
}

TEST_F(ProfilerComplexityTest, NaiveOrderOfMagnitudeSlower) {
    Profiler profiler(heap, 3);
    const auto prices = ramp(20000);

    const double naive = profiler.time_trial(naive_factory(), prices);
    const double cumulative = profiler.time_trial(cumulative_factory(), prices);
    const double windowed = profiler.time_trial(windowed_factory(50), prices);

    EXPECT_GT(naive, 10.0 * cumulative);
    EXPECT_GT(naive, 10.0 * windowed);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
