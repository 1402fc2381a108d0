#include <gtest/gtest.h>
#include "../include/report.hpp"
#include "../include/errors.hpp"
#include <sstream>
#include <string>

using namespace tickscale;
using namespace tickscale::report;

namespace {

profiler::BenchmarkSample sample(const std::string& name, std::size_t ticks,
                                 double seconds, uint64_t bytes) {
    profiler::BenchmarkSample s;
    s.strategy = name;
    s.ticks = ticks;
    s.seconds = seconds;
    s.peak_memory_bytes = bytes;
    s.probe = "heap";
    return s;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

class ReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        results.probe = "heap";
        results.samples = {
            sample("naive", 1000, 0.002, 16384),
            sample("naive", 100000, 4.0, 2097152),
            sample("cumulative", 1000, 0.00001, 32),
            sample("cumulative", 100000, 0.0008, 32),
            sample("windowed", 1000, 0.00002, 1600),
            sample("windowed", 100000, 0.001, 1600),
        };
    }

    bench::BenchmarkReport results;
};

TEST_F(ReportTest, MarkdownHasNotesTableAndProbe) {
    std::ostringstream out;
    write_markdown_report(out, results, "benchmark_samples.csv");
    const std::string md = out.str();

    EXPECT_TRUE(contains(md, "# Runtime & Space Complexity"));
    EXPECT_TRUE(contains(md, complexity_note("naive")));
    EXPECT_TRUE(contains(md, complexity_note("cumulative")));
    EXPECT_TRUE(contains(md, complexity_note("windowed")));
    EXPECT_TRUE(contains(md, "| naive | 100,000 | 4.000000 |"));
    EXPECT_TRUE(contains(md, "`heap` probe"));
    EXPECT_TRUE(contains(md, "benchmark_samples.csv"));
    EXPECT_FALSE(contains(md, "## Failed Trials"));
}

TEST_F(ReportTest, NarrativeRanksLargestSize) {
    std::ostringstream out;
    write_markdown_report(out, results);
    const std::string md = out.str();

    const auto header = md.find("For **100,000 ticks**");
    ASSERT_NE(header, std::string::npos);

    const auto cumulative = md.find("- cumulative:", header);
    const auto windowed = md.find("- windowed:", header);
    const auto naive = md.find("- naive:", header);
    EXPECT_LT(cumulative, windowed);
    EXPECT_LT(windowed, naive);
    EXPECT_TRUE(contains(md, "naive is 5000.0x slower than cumulative"));
}

TEST_F(ReportTest, FailuresListed) {
    results.failures.push_back({"windowed", 1000, "InvalidConfiguration", "window size must be positive, got 0"});

    std::ostringstream md;
    write_markdown_report(md, results);
    EXPECT_TRUE(contains(md.str(), "## Failed Trials"));
    EXPECT_TRUE(contains(md.str(), "`InvalidConfiguration`"));

    std::ostringstream table;
    print_results_table(table, results);
    EXPECT_TRUE(contains(table.str(), "Failed trials:"));
    EXPECT_TRUE(contains(table.str(), "windowed @ 1000 ticks"));
}

TEST_F(ReportTest, EmptyReportStillRenders) {
    bench::BenchmarkReport empty;
    empty.probe = "rss";

    std::ostringstream out;
    write_markdown_report(out, empty);
    EXPECT_TRUE(contains(out.str(), "No trial completed."));
    EXPECT_TRUE(contains(out.str(), "VmHWM"));
}

TEST_F(ReportTest, SamplesCsv) {
    std::ostringstream out;
    write_samples_csv(out, results);

    std::istringstream lines(out.str());
    std::string line;
    ASSERT_TRUE(std::getline(lines, line));
    EXPECT_EQ(line, "strategy,ticks,seconds,peak_bytes,probe");
    ASSERT_TRUE(std::getline(lines, line));
    EXPECT_EQ(line, "naive,1000,0.002,16384,heap");

    int rows = 1;
    while (std::getline(lines, line)) ++rows;
    EXPECT_EQ(rows, 6);
}

TEST_F(ReportTest, TableRowPerSample) {
    std::ostringstream out;
    print_results_table(out, results);

    std::istringstream lines(out.str());
    std::string line;
    int rows = 0;
    while (std::getline(lines, line)) {
        if (line.rfind("naive", 0) == 0 || line.rfind("cumulative", 0) == 0 ||
            line.rfind("windowed", 0) == 0) {
            ++rows;
        }
    }
    EXPECT_EQ(rows, 6);
}

TEST_F(ReportTest, CallerStreamFormattingRestored) {
    std::ostringstream out;
    const auto flags = out.flags();
    const auto precision = out.precision();

    print_results_table(out, results);
    write_markdown_report(out, results);
    write_samples_csv(out, results);

    EXPECT_EQ(out.flags(), flags);
    EXPECT_EQ(out.precision(), precision);

    out.str("");
    out << 0.5 << '|' << 7;
    EXPECT_EQ(out.str(), "0.5|7");
}

TEST(ReportNotesTest, DatasetSpaceNote) {
    const auto note = dataset_space_note(100000);
    EXPECT_TRUE(contains(note, "100,000 ticks"));
    EXPECT_TRUE(contains(note, "O(N)"));
    EXPECT_TRUE(contains(note, "800,000 bytes"));
}

TEST(ReportNotesTest, UnwritablePathsAreIoErrors) {
    bench::BenchmarkReport empty;
    EXPECT_THROW(write_markdown_report(std::string("/nonexistent/dir/report.md"), empty), IoError);
    EXPECT_THROW(write_samples_csv(std::string("/nonexistent/dir/samples.csv"), empty), IoError);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
