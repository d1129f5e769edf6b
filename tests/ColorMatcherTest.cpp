#include <gtest/gtest.h>
#include <region_composite/internal/correction/ColorMatcher.hpp>

#include <cmath>
#include <limits>

using namespace RegionComposite;
using Internal::Correction::ColorMatcher;

namespace {

Types::Image solidRgb(double r, double g, double b, int width = 10, int height = 10) {
    return Types::Image(height, width, CV_8UC3, cv::Scalar(b, g, r));
}

Types::Image randomImage(int width, int height) {
    Types::Image image(height, width, CV_8UC3);
    cv::RNG rng(42);
    rng.fill(image, cv::RNG::UNIFORM, cv::Scalar::all(0), cv::Scalar::all(256));
    return image;
}

}  // namespace

TEST(ColorMatcherTest, DefaultStrengthRange) {
    ColorMatcher matcher;
    auto settings = matcher.getSettings();

    EXPECT_DOUBLE_EQ(settings.minStrength, 0.3);
    EXPECT_DOUBLE_EQ(settings.maxStrength, 0.6);
    EXPECT_DOUBLE_EQ(settings.magnitudeScale, 100.0);
}

TEST(ColorMatcherTest, ShiftPointsFromGeneratedTowardOriginal) {
    ColorMatcher matcher;
    auto correction = matcher.match(Domain::ColorStats(185, 172, 143), Domain::ColorStats(140, 140, 115));

    EXPECT_DOUBLE_EQ(correction.shiftR, 45.0);
    EXPECT_DOUBLE_EQ(correction.shiftG, 32.0);
    EXPECT_DOUBLE_EQ(correction.shiftB, 28.0);
    EXPECT_NEAR(correction.magnitude, std::sqrt(3833.0), 1e-9);
    EXPECT_NEAR(correction.strength, 0.49, 0.01);
    EXPECT_NEAR(correction.offsetR(), 45.0 * correction.strength, 1e-12);
}

TEST(ColorMatcherTest, MatchingStatsUseMinimumStrength) {
    ColorMatcher matcher;
    auto correction = matcher.match(Domain::ColorStats(120, 80, 60), Domain::ColorStats(120, 80, 60));

    EXPECT_TRUE(correction.isIdentity());
    EXPECT_DOUBLE_EQ(correction.magnitude, 0.0);
    EXPECT_DOUBLE_EQ(correction.strength, 0.3);
}

TEST(ColorMatcherTest, StrengthGrowsWithMagnitudeUntilCap) {
    ColorMatcher matcher;

    EXPECT_DOUBLE_EQ(matcher.computeStrength(0.0), 0.3);
    EXPECT_DOUBLE_EQ(matcher.computeStrength(50.0), 0.45);
    EXPECT_DOUBLE_EQ(matcher.computeStrength(100.0), 0.6);
    EXPECT_DOUBLE_EQ(matcher.computeStrength(1000.0), 0.6);

    double previous = matcher.computeStrength(0.0);
    for (int magnitude = 1; magnitude < 100; ++magnitude) {
        double strength = matcher.computeStrength(magnitude);
        EXPECT_GT(strength, previous) << "magnitude " << magnitude;
        previous = strength;
    }
}

TEST(ColorMatcherTest, StrengthAlwaysWithinBounds) {
    ColorMatcher matcher;
    const double magnitudes[] = {0.0, 1e-6, 63.2, 230.0, 441.7, 1e9,
                                 std::numeric_limits<double>::infinity(),
                                 std::numeric_limits<double>::quiet_NaN()};

    for (double magnitude : magnitudes) {
        double strength = matcher.computeStrength(magnitude);
        EXPECT_GE(strength, 0.3) << magnitude;
        EXPECT_LE(strength, 0.6) << magnitude;
    }
}

TEST(ColorMatcherTest, ZeroShiftLeavesImageUnchanged) {
    ColorMatcher matcher;
    Types::Image generated = randomImage(32, 24);

    auto result = matcher.apply(generated, Domain::ColorCorrection());

    ASSERT_TRUE(result.success);
    EXPECT_EQ(cv::norm(result.correctedImage, generated, cv::NORM_INF), 0.0);
    EXPECT_EQ(result.clampedChannels, 0);
}

TEST(ColorMatcherTest, MatchingRegionsWithSameStatsIsIdentity) {
    ColorMatcher matcher;
    Types::Image region = randomImage(20, 20);

    auto result = matcher.matchRegions(region, region.clone());

    ASSERT_TRUE(result.success);
    EXPECT_DOUBLE_EQ(result.correction.strength, 0.3);
    EXPECT_EQ(cv::norm(result.correctedImage, region, cv::NORM_INF), 0.0);
}

TEST(ColorMatcherTest, AppliesScaledOffsetPerChannel) {
    ColorMatcher matcher;
    Domain::ColorCorrection correction;
    correction.shiftR = 10.0;
    correction.shiftG = -10.0;
    correction.shiftB = 4.0;
    correction.strength = 0.5;

    auto result = matcher.apply(solidRgb(100, 100, 100), correction);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.correctedImage.at<cv::Vec3b>(3, 3), cv::Vec3b(102, 95, 105));
}

TEST(ColorMatcherTest, SaturatesInsteadOfWrapping) {
    ColorMatcher matcher;
    Domain::ColorCorrection correction;
    correction.shiftR = 100.0;
    correction.shiftG = -100.0;
    correction.shiftB = -100.0;
    correction.strength = 0.5;

    auto result = matcher.apply(solidRgb(250, 10, 128, 4, 4), correction);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.correctedImage.at<cv::Vec3b>(0, 0), cv::Vec3b(78, 0, 255));
    EXPECT_EQ(result.clampedChannels, 2 * 16);
}

TEST(ColorMatcherTest, KeepsAlphaChannel) {
    ColorMatcher matcher;
    Domain::ColorCorrection correction;
    correction.shiftR = 40.0;
    correction.strength = 0.5;

    Types::Image generated(5, 5, CV_8UC4, cv::Scalar(10, 20, 30, 77));
    auto result = matcher.apply(generated, correction);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.correctedImage.at<cv::Vec4b>(2, 2), cv::Vec4b(10, 20, 50, 77));
}

TEST(ColorMatcherTest, PullsGeneratedRegionTowardScene) {
    ColorMatcher matcher;
    auto result = matcher.matchRegions(solidRgb(185, 172, 143), solidRgb(140, 140, 115));

    ASSERT_TRUE(result.success);
    EXPECT_NEAR(result.correction.strength, 0.4857, 1e-3);
    // 140 + 45s, 140 + 32s, 115 + 28s rounded
    EXPECT_EQ(result.correctedImage.at<cv::Vec3b>(5, 5), cv::Vec3b(129, 156, 162));
}

TEST(ColorMatcherTest, RejectsEmptyAndUnsupportedRegions) {
    ColorMatcher matcher;

    auto empty = matcher.matchRegions(Types::Image(), solidRgb(1, 2, 3));
    EXPECT_FALSE(empty.success);
    EXPECT_EQ(empty.error, Types::ErrorCode::EMPTY_REGION);

    auto gray = matcher.apply(Types::Image(4, 4, CV_8UC1, cv::Scalar(9)), Domain::ColorCorrection());
    EXPECT_FALSE(gray.success);
    EXPECT_EQ(gray.error, Types::ErrorCode::UNSUPPORTED_FORMAT);
}
