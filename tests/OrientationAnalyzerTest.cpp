#include <gtest/gtest.h>
#include <region_composite/internal/geometry/OrientationAnalyzer.hpp>

using namespace RegionComposite;
using Internal::Geometry::OrientationAnalyzer;

TEST(OrientationAnalyzerTest, ReferenceAspectIsUpright) {
    OrientationAnalyzer analyzer;
    auto result = analyzer.analyze(Domain::BoundingBox(0.3, 0.1, 0.4, 0.8));

    ASSERT_TRUE(result.success);
    EXPECT_DOUBLE_EQ(result.descriptor.getAspectRatio(), 0.5);
    EXPECT_DOUBLE_EQ(result.descriptor.getAspectDeviation(), 0.0);
    EXPECT_FALSE(result.descriptor.isTiltDetected());
    EXPECT_EQ(result.descriptor.getVerticalZone(), Types::VerticalZone::MIDDLE);
}

TEST(OrientationAnalyzerTest, SmallDeviationStaysWithinTolerance) {
    OrientationAnalyzer analyzer;
    auto result = analyzer.analyze(Domain::BoundingBox(0.1, 0.1, 0.28, 0.5));

    ASSERT_TRUE(result.success);
    EXPECT_NEAR(result.descriptor.getAspectRatio(), 0.56, 1e-12);
    EXPECT_NEAR(result.descriptor.getAspectDeviation(), 0.12, 1e-12);
    EXPECT_FALSE(result.descriptor.isTiltDetected());
}

TEST(OrientationAnalyzerTest, WideBoxIsReportedAsTilted) {
    OrientationAnalyzer analyzer;
    auto result = analyzer.analyze(Domain::BoundingBox(0.0, 0.0, 0.623, 1.0));

    ASSERT_TRUE(result.success);
    EXPECT_NEAR(result.descriptor.getAspectDeviation(), 0.246, 1e-9);
    EXPECT_TRUE(result.descriptor.isTiltDetected());

    auto narrow = analyzer.analyze(Domain::BoundingBox(0.45, 0.0, 0.1, 1.0));
    ASSERT_TRUE(narrow.success);
    EXPECT_TRUE(narrow.descriptor.isTiltDetected());
}

TEST(OrientationAnalyzerTest, ClassifiesVerticalZones) {
    OrientationAnalyzer analyzer;

    EXPECT_EQ(analyzer.analyze(Domain::BoundingBox(0.4, 0.0, 0.1, 0.2)).descriptor.getVerticalZone(),
              Types::VerticalZone::UPPER);
    EXPECT_EQ(analyzer.analyze(Domain::BoundingBox(0.4, 0.7, 0.1, 0.2)).descriptor.getVerticalZone(),
              Types::VerticalZone::LOWER);

    EXPECT_EQ(analyzer.classifyVerticalZone(0.0), Types::VerticalZone::UPPER);
    EXPECT_EQ(analyzer.classifyVerticalZone(1.0 / 3.0), Types::VerticalZone::MIDDLE);
    EXPECT_EQ(analyzer.classifyVerticalZone(0.5), Types::VerticalZone::MIDDLE);
    EXPECT_EQ(analyzer.classifyVerticalZone(2.0 / 3.0), Types::VerticalZone::LOWER);
    EXPECT_EQ(analyzer.classifyVerticalZone(1.0), Types::VerticalZone::LOWER);
}

TEST(OrientationAnalyzerTest, DescribesPostureAndPlacement) {
    OrientationAnalyzer analyzer;

    auto upright = analyzer.analyze(Domain::BoundingBox(0.3, 0.1, 0.4, 0.8));
    EXPECT_EQ(upright.descriptor.describe(),
              "The bottle is upright (aspect 0.50) in the middle part of the frame.");

    auto tilted = analyzer.analyze(Domain::BoundingBox(0.2, 0.7, 0.3, 0.3));
    EXPECT_EQ(tilted.descriptor.describe(),
              "The bottle is tilted (aspect 1.00) in the lower part of the frame.");
}

TEST(OrientationAnalyzerTest, RejectsInvalidBox) {
    OrientationAnalyzer analyzer;
    auto result = analyzer.analyze(Domain::BoundingBox(0.5, 0.5, 0.0, 0.1));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, Types::ErrorCode::INVALID_GEOMETRY);
}

TEST(OrientationAnalyzerTest, CustomReferenceAspect) {
    OrientationAnalyzer::Settings settings;
    settings.referenceAspectRatio = 1.0;
    OrientationAnalyzer analyzer(settings);

    auto square = analyzer.analyze(Domain::BoundingBox(0.2, 0.2, 0.3, 0.3));
    ASSERT_TRUE(square.success);
    EXPECT_FALSE(square.descriptor.isTiltDetected());
}
