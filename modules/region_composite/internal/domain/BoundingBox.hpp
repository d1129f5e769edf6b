#pragma once

#include <shared/types/Common.hpp>
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

namespace RegionComposite::Domain {

// Normalized rectangle relative to an image's dimensions
struct BoundingBox {
    static constexpr double EPSILON = 1e-9;

    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    BoundingBox() = default;
    BoundingBox(double xValue, double yValue, double widthValue, double heightValue)
        : x(xValue), y(yValue), width(widthValue), height(heightValue) {}

    double right() const { return x + width; }
    double bottom() const { return y + height; }
    double centerX() const { return x + width / 2.0; }
    double centerY() const { return y + height / 2.0; }

    bool isValid() const {
        if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(width) ||
            !std::isfinite(height)) {
            return false;
        }
        return x >= 0.0 && y >= 0.0 && width > 0.0 && height > 0.0 &&
               right() <= 1.0 + EPSILON && bottom() <= 1.0 + EPSILON;
    }

    bool contains(const BoundingBox& other) const {
        return other.x >= x - EPSILON && other.y >= y - EPSILON &&
               other.right() <= right() + EPSILON && other.bottom() <= bottom() + EPSILON;
    }

    // Leading edges round down and trailing edges round up so the pixel
    // rectangle always covers the normalized area.
    Types::PixelRect toPixelRect(const Types::Size2D& imageSize) const {
        if (imageSize.width <= 0 || imageSize.height <= 0) return Types::PixelRect();

        int left = static_cast<int>(std::floor(x * imageSize.width + EPSILON));
        int top = static_cast<int>(std::floor(y * imageSize.height + EPSILON));
        int rightEdge = static_cast<int>(std::ceil(right() * imageSize.width - EPSILON));
        int bottomEdge = static_cast<int>(std::ceil(bottom() * imageSize.height - EPSILON));

        left = std::clamp(left, 0, imageSize.width - 1);
        top = std::clamp(top, 0, imageSize.height - 1);
        rightEdge = std::clamp(rightEdge, left + 1, imageSize.width);
        bottomEdge = std::clamp(bottomEdge, top + 1, imageSize.height);

        return Types::PixelRect(left, top, rightEdge - left, bottomEdge - top);
    }

    std::string toString() const {
        std::ostringstream oss;
        oss << "{x=" << x << ", y=" << y << ", w=" << width << ", h=" << height << "}";
        return oss.str();
    }

    bool operator==(const BoundingBox& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const BoundingBox& other) const { return !(*this == other); }
};

}  // namespace RegionComposite::Domain
