#include "OrientationAnalyzer.hpp"
#include <cmath>

namespace RegionComposite::Internal::Geometry {

OrientationAnalyzer::Settings::Settings()
    : referenceAspectRatio(0.5),
      tiltTolerance(0.15),
      upperZoneLimit(1.0 / 3.0),
      lowerZoneLimit(2.0 / 3.0) {}

OrientationAnalyzer::OrientationAnalyzer(const Settings& settings) : settings_(settings) {}

OrientationAnalyzer::OrientationResult OrientationAnalyzer::analyze(
    const Domain::BoundingBox& box) const {
    OrientationResult result;

    if (!box.isValid()) {
        result.error = Types::ErrorCode::INVALID_GEOMETRY;
        result.errorMessage = "Cannot analyze orientation of invalid box " + box.toString();
        LOG_ERROR(result.errorMessage);
        return result;
    }

    if (settings_.referenceAspectRatio <= 0.0) {
        result.error = Types::ErrorCode::INVALID_CONFIGURATION;
        result.errorMessage = "Reference aspect ratio must be positive";
        LOG_ERROR(result.errorMessage);
        return result;
    }

    const double aspectRatio = box.width / box.height;
    const double deviation =
        std::abs(aspectRatio - settings_.referenceAspectRatio) / settings_.referenceAspectRatio;
    const bool tilted = deviation > settings_.tiltTolerance;
    const double verticalCenter = box.centerY();

    result.descriptor = Domain::OrientationDescriptor(aspectRatio, deviation, tilted,
                                                      verticalCenter,
                                                      classifyVerticalZone(verticalCenter));
    result.success = true;

    LOG_DEBUG("Orientation: aspect ", aspectRatio, ", deviation ", deviation * 100.0, "%, ",
              tilted ? "tilted" : "upright", ", zone ",
              Types::toString(result.descriptor.getVerticalZone()));

    return result;
}

Types::VerticalZone OrientationAnalyzer::classifyVerticalZone(double verticalCenter) const {
    if (verticalCenter < settings_.upperZoneLimit) return Types::VerticalZone::UPPER;
    if (verticalCenter < settings_.lowerZoneLimit) return Types::VerticalZone::MIDDLE;
    return Types::VerticalZone::LOWER;
}

void OrientationAnalyzer::setSettings(const Settings& settings) {
    settings_ = settings;
}

OrientationAnalyzer::Settings OrientationAnalyzer::getSettings() const {
    return settings_;
}

}  // namespace RegionComposite::Internal::Geometry
