#include "GeometryExpander.hpp"
#include <algorithm>
#include <cmath>

namespace RegionComposite::Internal::Geometry {

GeometryExpander::Settings::Settings() : paddingFraction(0.30) {}

bool GeometryExpander::ExpansionResult::isValid() const {
    return success && box.isValid() && !pixelRect.empty();
}

GeometryExpander::GeometryExpander(const Settings& settings) : settings_(settings) {}

GeometryExpander::ExpansionResult GeometryExpander::expand(const Domain::BoundingBox& box,
                                                           const Types::Size2D& imageSize) const {
    return expand(box, settings_.paddingFraction, imageSize);
}

GeometryExpander::ExpansionResult GeometryExpander::expand(const Domain::BoundingBox& box,
                                                           double paddingFraction,
                                                           const Types::Size2D& imageSize) const {
    if (!box.isValid()) {
        return fail(Types::ErrorCode::INVALID_GEOMETRY, "Bounding box is invalid: " + box.toString());
    }

    if (imageSize.width <= 0 || imageSize.height <= 0) {
        return fail(Types::ErrorCode::INVALID_GEOMETRY, "Image size must be positive");
    }

    if (!std::isfinite(paddingFraction) || paddingFraction < 0.0) {
        return fail(Types::ErrorCode::INVALID_CONFIGURATION,
                    "Padding fraction must be a non-negative number");
    }

    const double padX = paddingFraction * box.width;
    const double padY = paddingFraction * box.height;

    // Each edge is clamped on its own; overflow on one side never moves the other
    const double left = std::max(0.0, box.x - padX);
    const double top = std::max(0.0, box.y - padY);
    const double right = std::min(1.0, box.right() + padX);
    const double bottom = std::min(1.0, box.bottom() + padY);

    ExpansionResult result;
    result.box = Domain::BoundingBox(left, top, right - left, bottom - top);
    result.pixelRect = result.box.toPixelRect(imageSize);
    result.success = true;

    LOG_DEBUG("Expanded ", box.toString(), " by ", paddingFraction, " to ", result.box.toString(),
              " (", result.pixelRect.width, "x", result.pixelRect.height, " px at ",
              result.pixelRect.x, ",", result.pixelRect.y, ")");

    return result;
}

void GeometryExpander::setSettings(const Settings& settings) {
    settings_ = settings;
}

GeometryExpander::Settings GeometryExpander::getSettings() const {
    return settings_;
}

GeometryExpander::ExpansionResult GeometryExpander::fail(Types::ErrorCode code,
                                                         const std::string& message) const {
    ExpansionResult result;
    result.error = code;
    result.errorMessage = message;
    LOG_ERROR(message);
    return result;
}

}  // namespace RegionComposite::Internal::Geometry
