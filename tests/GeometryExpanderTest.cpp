#include <gtest/gtest.h>
#include <region_composite/internal/geometry/GeometryExpander.hpp>

#include <limits>
#include <vector>

using namespace RegionComposite;
using Internal::Geometry::GeometryExpander;

namespace {

const Types::Size2D kImageSize(1000, 500);

}  // namespace

TEST(GeometryExpanderTest, ExpandsEachSideByPaddingOfBoxExtent) {
    GeometryExpander expander;
    auto result = expander.expand(Domain::BoundingBox(0.4, 0.3, 0.2, 0.4), 0.3, kImageSize);

    ASSERT_TRUE(result.success);
    EXPECT_NEAR(result.box.x, 0.34, 1e-12);
    EXPECT_NEAR(result.box.y, 0.18, 1e-12);
    EXPECT_NEAR(result.box.width, 0.32, 1e-12);
    EXPECT_NEAR(result.box.height, 0.64, 1e-12);
}

TEST(GeometryExpanderTest, DefaultPaddingIsThirtyPercent) {
    GeometryExpander expander;
    EXPECT_DOUBLE_EQ(expander.getSettings().paddingFraction, 0.30);

    auto withDefault = expander.expand(Domain::BoundingBox(0.4, 0.3, 0.2, 0.4), kImageSize);
    auto explicitPadding = expander.expand(Domain::BoundingBox(0.4, 0.3, 0.2, 0.4), 0.30, kImageSize);
    EXPECT_EQ(withDefault.box, explicitPadding.box);
}

TEST(GeometryExpanderTest, ClampsOverflowOnTheOverflowingSideOnly) {
    GeometryExpander expander;

    auto left = expander.expand(Domain::BoundingBox(0.0, 0.1, 0.2, 0.2), 0.3, kImageSize);
    ASSERT_TRUE(left.success);
    EXPECT_DOUBLE_EQ(left.box.x, 0.0);
    EXPECT_NEAR(left.box.right(), 0.26, 1e-12);   // right side keeps its full padding
    EXPECT_NEAR(left.box.y, 0.04, 1e-12);

    auto corner = expander.expand(Domain::BoundingBox(0.8, 0.8, 0.2, 0.2), 0.3, kImageSize);
    ASSERT_TRUE(corner.success);
    EXPECT_NEAR(corner.box.x, 0.74, 1e-12);
    EXPECT_NEAR(corner.box.y, 0.74, 1e-12);
    EXPECT_NEAR(corner.box.right(), 1.0, 1e-12);
    EXPECT_NEAR(corner.box.bottom(), 1.0, 1e-12);
}

TEST(GeometryExpanderTest, ResultContainsOriginalAndStaysInUnitSquare) {
    GeometryExpander expander;
    const std::vector<Domain::BoundingBox> boxes = {
        {0.0, 0.0, 1.0, 1.0}, {0.0, 0.0, 0.1, 0.1}, {0.9, 0.9, 0.1, 0.1},
        {0.45, 0.05, 0.1, 0.9}, {0.2, 0.6, 0.7, 0.4}, {0.333, 0.111, 0.5, 0.25}};
    const std::vector<double> paddings = {0.0, 0.15, 0.3, 1.0, 5.0};

    for (const auto& box : boxes) {
        for (double padding : paddings) {
            auto result = expander.expand(box, padding, kImageSize);
            ASSERT_TRUE(result.success) << box.toString() << " padding " << padding;
            EXPECT_TRUE(result.box.contains(box)) << box.toString() << " padding " << padding;
            EXPECT_GE(result.box.x, 0.0);
            EXPECT_GE(result.box.y, 0.0);
            EXPECT_LE(result.box.right(), 1.0 + Domain::BoundingBox::EPSILON);
            EXPECT_LE(result.box.bottom(), 1.0 + Domain::BoundingBox::EPSILON);
            EXPECT_TRUE(result.box.isValid());
        }
    }
}

TEST(GeometryExpanderTest, ZeroPaddingKeepsTheBox) {
    GeometryExpander expander;
    Domain::BoundingBox box(0.25, 0.5, 0.5, 0.25);

    auto result = expander.expand(box, 0.0, kImageSize);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.box, box);
}

TEST(GeometryExpanderTest, MapsExpandedBoxToPixelRectangle) {
    GeometryExpander expander;
    auto result = expander.expand(Domain::BoundingBox(0.4, 0.3, 0.2, 0.4), 0.0, kImageSize);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.pixelRect, Types::PixelRect(400, 150, 200, 200));
}

TEST(GeometryExpanderTest, RejectsInvalidBoxes) {
    GeometryExpander expander;

    const std::vector<Domain::BoundingBox> invalid = {
        {0.5, 0.5, 0.0, 0.2},  {0.5, 0.5, 0.2, -0.1}, {-0.1, 0.2, 0.2, 0.2},
        {0.9, 0.2, 0.2, 0.2},  {0.2, 0.9, 0.2, 0.3},
        {std::numeric_limits<double>::quiet_NaN(), 0.1, 0.1, 0.1}};

    for (const auto& box : invalid) {
        auto result = expander.expand(box, 0.3, kImageSize);
        EXPECT_FALSE(result.success) << box.toString();
        EXPECT_EQ(result.error, Types::ErrorCode::INVALID_GEOMETRY) << box.toString();
    }
}

TEST(GeometryExpanderTest, RejectsNegativePaddingAndEmptyImage) {
    GeometryExpander expander;
    Domain::BoundingBox box(0.4, 0.3, 0.2, 0.4);

    auto negative = expander.expand(box, -0.1, kImageSize);
    EXPECT_FALSE(negative.success);
    EXPECT_EQ(negative.error, Types::ErrorCode::INVALID_CONFIGURATION);

    auto noImage = expander.expand(box, 0.3, Types::Size2D(0, 100));
    EXPECT_FALSE(noImage.success);
    EXPECT_EQ(noImage.error, Types::ErrorCode::INVALID_GEOMETRY);
}

TEST(BoundingBoxTest, PixelRectCoversTinyBoxes) {
    Domain::BoundingBox box(0.999, 0.999, 0.001, 0.001);
    Types::PixelRect rect = box.toPixelRect(Types::Size2D(100, 100));

    EXPECT_EQ(rect.width, 1);
    EXPECT_EQ(rect.height, 1);
    EXPECT_EQ(rect.x, 99);
    EXPECT_EQ(rect.y, 99);
}
