#pragma once

#include "../domain/BoundingBox.hpp"
#include "../domain/OrientationDescriptor.hpp"
#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <string>

namespace RegionComposite::Internal::Geometry {

class OrientationAnalyzer {
  public:
    struct Settings {
        double referenceAspectRatio;   // Expected width:height of an upright bottle
        double tiltTolerance;          // Relative deviation above which tilt is reported
        double upperZoneLimit;         // Vertical centers below this are "upper"
        double lowerZoneLimit;         // Vertical centers at or above this are "lower"

        Settings();
    };

    struct OrientationResult {
        Domain::OrientationDescriptor descriptor;

        bool success = false;
        Types::ErrorCode error = Types::ErrorCode::NONE;
        std::string errorMessage;
    };

    explicit OrientationAnalyzer(const Settings& settings = Settings{});

    OrientationResult analyze(const Domain::BoundingBox& box) const;

    Types::VerticalZone classifyVerticalZone(double verticalCenter) const;

    void setSettings(const Settings& settings);
    Settings getSettings() const;

  private:
    Settings settings_;
};

}  // namespace RegionComposite::Internal::Geometry
