#pragma once

#include <shared/types/Common.hpp>
#include <iomanip>
#include <sstream>
#include <string>

namespace RegionComposite::Domain {

// Global color-cast correction: one scaled shift applied to every pixel
struct ColorCorrection {
    double shiftR = 0.0;
    double shiftG = 0.0;
    double shiftB = 0.0;
    double magnitude = 0.0;
    double strength = 0.0;

    double offsetR() const { return shiftR * strength; }
    double offsetG() const { return shiftG * strength; }
    double offsetB() const { return shiftB * strength; }

    bool isIdentity() const { return shiftR == 0.0 && shiftG == 0.0 && shiftB == 0.0; }

    std::string toString() const {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << "shift=(" << shiftR << ", " << shiftG
            << ", " << shiftB << ") magnitude=" << magnitude << " strength=" << strength;
        return oss.str();
    }
};

}  // namespace RegionComposite::Domain
