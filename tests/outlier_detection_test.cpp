#include "benchmark/outlier_detection.hpp"
#include "benchmark/warnings.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

using namespace cmdbench;

TEST(OutlierDetectionTest, SlowFirstRun)
{
    const std::vector<double> xs{5.0, 1.0, 1.05, 0.98, 1.02};
    const auto scores = outlier::modifiedZScores(xs);
    ASSERT_EQ(scores.size(), xs.size());
    EXPECT_GT(scores.front(), outlier::kOutlierThreshold);
    EXPECT_EQ(outlier::classify(scores), outlier::OutlierClass::SlowInitialRun);
}

TEST(OutlierDetectionTest, LaterOutlier)
{
    const std::vector<double> xs{1.0, 1.02, 0.98, 1.01, 5.0};
    EXPECT_EQ(outlier::classify(outlier::modifiedZScores(xs)),
              outlier::OutlierClass::OutliersDetected);
}

// Only a first run that is slower counts as a slow initial run; a fast one
// is an ordinary outlier.
TEST(OutlierDetectionTest, FastFirstRunIsGenericOutlier)
{
    const std::vector<double> xs{0.1, 1.0, 1.01, 0.99, 1.0};
    EXPECT_EQ(outlier::classify(outlier::modifiedZScores(xs)),
              outlier::OutlierClass::OutliersDetected);
}

TEST(OutlierDetectionTest, ZeroMadGivesZeroScores)
{
    const std::vector<double> xs{2.0, 2.0, 2.0, 7.0};
    const auto scores = outlier::modifiedZScores(xs);
    EXPECT_TRUE(std::all_of(scores.begin(), scores.end(),
                            [](double s) { return s == 0.0; }));
    EXPECT_EQ(outlier::classify(scores), outlier::OutlierClass::None);
}

TEST(OutlierDetectionTest, MedianAbsoluteDeviation)
{
    const std::vector<double> xs{1.0, 2.0, 3.0, 4.0, 100.0};
    EXPECT_DOUBLE_EQ(outlier::medianAbsoluteDeviation(xs, 3.0), 1.0);
}

TEST(WarningsTest, FastAndFailingRuns)
{
    const std::vector<Second> times{0.001, 0.001, 0.001};
    const std::vector<std::optional<int>> codes{0, 1, 0};
    const auto w = bench::collectWarnings(times, codes);
    ASSERT_EQ(w.size(), 2u);
    EXPECT_EQ(w[0].kind, bench::WarningKind::FastExecutionTime);
    EXPECT_EQ(w[1].kind, bench::WarningKind::NonZeroExitCode);
    EXPECT_EQ(bench::describe(w[1], std::nullopt),
              "Ignoring non-zero exit code.");
}

TEST(WarningsTest, MissingExitCodeCountsAsFailure)
{
    const std::vector<Second> times{0.5, 0.5};
    const std::vector<std::optional<int>> codes{0, std::nullopt};
    const auto w = bench::collectWarnings(times, codes);
    ASSERT_EQ(w.size(), 1u);
    EXPECT_EQ(w[0].kind, bench::WarningKind::NonZeroExitCode);
}

TEST(WarningsTest, SlowInitialRunMentionsFirstTime)
{
    const std::vector<Second> times{5.0, 1.0, 1.05, 0.98, 1.02};
    const std::vector<std::optional<int>> codes(times.size(), 0);
    const auto w = bench::collectWarnings(times, codes);
    ASSERT_EQ(w.size(), 1u);
    EXPECT_EQ(w[0].kind, bench::WarningKind::SlowInitialRun);
    EXPECT_NE(bench::describe(w[0], std::nullopt).find("(5.000 s)"),
              std::string::npos);
}
