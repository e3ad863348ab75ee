#include "benchmark/relative_speed.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <string>
#include <vector>

using namespace cmdbench;

namespace
{

bench::BenchmarkResult result(const std::string& name, double mean,
                              std::optional<double> stddev = 0.1)
{
    bench::BenchmarkResult r;
    r.command = name;
    r.mean = mean;
    r.stddev = stddev;
    r.min = mean;
    r.max = mean;
    return r;
}

} // namespace

TEST(RelativeSpeedTest, RatiosAgainstFastest)
{
    const std::vector<bench::BenchmarkResult> rs{
        result("a", 3.0), result("b", 2.0), result("c", 5.0)};
    const auto out = relspeed::computeWithCheck(rs, SortOrder::Command);
    ASSERT_TRUE(out.has_value());
    ASSERT_EQ(out->size(), 3u);
    EXPECT_DOUBLE_EQ((*out)[0].relativeSpeed, 1.5);
    EXPECT_DOUBLE_EQ((*out)[1].relativeSpeed, 1.0);
    EXPECT_DOUBLE_EQ((*out)[2].relativeSpeed, 2.5);
    EXPECT_FALSE((*out)[0].isFastest);
    EXPECT_TRUE((*out)[1].isFastest);
    EXPECT_FALSE((*out)[2].isFastest);

    const double expected =
        1.5 * std::sqrt(std::pow(0.1 / 3.0, 2) + std::pow(0.1 / 2.0, 2));
    ASSERT_TRUE((*out)[0].relativeSpeedStddev.has_value());
    EXPECT_NEAR(*(*out)[0].relativeSpeedStddev, expected, 1e-12);
}

TEST(RelativeSpeedTest, UnknownStddevIsNotPropagated)
{
    const std::vector<bench::BenchmarkResult> rs{
        result("a", 1.0), result("b", 2.0, std::nullopt)};
    const auto out = relspeed::compute(rs, SortOrder::Command);
    EXPECT_FALSE(out[1].relativeSpeedStddev.has_value());
}

TEST(RelativeSpeedTest, SortByMeanTime)
{
    const std::vector<bench::BenchmarkResult> rs{
        result("a", 3.0), result("b", 2.0), result("c", 5.0)};
    const auto out = relspeed::compute(rs, SortOrder::MeanTime);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].result->command, "b");
    EXPECT_EQ(out[1].result->command, "a");
    EXPECT_EQ(out[2].result->command, "c");
}

TEST(RelativeSpeedTest, OnlyFirstOfEqualMeansIsFastest)
{
    const std::vector<bench::BenchmarkResult> rs{result("a", 2.0),
                                                 result("b", 2.0)};
    const auto out = relspeed::compute(rs, SortOrder::Command);
    EXPECT_TRUE(out[0].isFastest);
    EXPECT_FALSE(out[1].isFastest);
    EXPECT_DOUBLE_EQ(out[1].relativeSpeed, 1.0);
}

TEST(RelativeSpeedTest, ZeroFastestMean)
{
    const std::vector<bench::BenchmarkResult> rs{result("a", 1.0),
                                                 result("b", 0.0)};
    EXPECT_FALSE(relspeed::computeWithCheck(rs, SortOrder::Command));

    const auto out = relspeed::compute(rs, SortOrder::Command);
    EXPECT_TRUE(std::isinf(out[0].relativeSpeed));
    EXPECT_DOUBLE_EQ(out[1].relativeSpeed, 1.0);
}

TEST(RelativeSpeedTest, EmptyInput)
{
    const std::vector<bench::BenchmarkResult> none;
    const auto out = relspeed::computeWithCheck(none, SortOrder::Command);
    ASSERT_TRUE(out.has_value());
    EXPECT_TRUE(out->empty());
}
