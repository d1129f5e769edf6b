#pragma once

#include <shared/types/Common.hpp>
#include <cstddef>

namespace RegionComposite::Domain {

struct ColorStats {
    double meanR = 0.0;
    double meanG = 0.0;
    double meanB = 0.0;
    std::size_t pixelCount = 0;

    ColorStats() = default;
    ColorStats(double r, double g, double b, std::size_t pixels = 0)
        : meanR(r), meanG(g), meanB(b), pixelCount(pixels) {}

    double brightness() const { return (meanR + meanG + meanB) / 3.0; }

    // Positive is warm (red-heavy), negative is cool (blue-heavy)
    double colorTemperatureDelta() const { return meanR - meanB; }

    Types::ColorValue asColorValue() const { return Types::ColorValue(meanR, meanG, meanB); }

    bool operator==(const ColorStats& other) const {
        return meanR == other.meanR && meanG == other.meanG && meanB == other.meanB;
    }
    bool operator!=(const ColorStats& other) const { return !(*this == other); }
};

}  // namespace RegionComposite::Domain
