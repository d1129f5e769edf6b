#pragma once

#include <shared/types/Common.hpp>
#include <iomanip>
#include <sstream>
#include <string>

namespace RegionComposite::Domain {

class OrientationDescriptor {
  public:
    OrientationDescriptor() = default;

    OrientationDescriptor(double aspectRatio, double aspectDeviation, bool tiltDetected,
                          double verticalCenter, Types::VerticalZone verticalZone)
        : aspectRatio_(aspectRatio), aspectDeviation_(aspectDeviation),
          tiltDetected_(tiltDetected), verticalCenter_(verticalCenter),
          verticalZone_(verticalZone) {}

    double getAspectRatio() const { return aspectRatio_; }

    // Relative deviation from the reference aspect ratio
    double getAspectDeviation() const { return aspectDeviation_; }

    bool isTiltDetected() const { return tiltDetected_; }
    double getVerticalCenter() const { return verticalCenter_; }
    Types::VerticalZone getVerticalZone() const { return verticalZone_; }

    std::string describe() const {
        std::ostringstream oss;
        oss << "The bottle is " << (tiltDetected_ ? "tilted" : "upright") << " (aspect "
            << std::fixed << std::setprecision(2) << aspectRatio_ << ") in the "
            << Types::toString(verticalZone_) << " part of the frame.";
        return oss.str();
    }

  private:
    double aspectRatio_ = 0.0;
    double aspectDeviation_ = 0.0;
    bool tiltDetected_ = false;
    double verticalCenter_ = 0.5;
    Types::VerticalZone verticalZone_ = Types::VerticalZone::MIDDLE;
};

}  // namespace RegionComposite::Domain
