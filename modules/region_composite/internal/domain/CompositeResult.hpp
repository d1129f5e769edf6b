#pragma once

#include "BoundingBox.hpp"
#include "ColorCorrection.hpp"
#include "LightingDescriptor.hpp"
#include "OrientationDescriptor.hpp"
#include <shared/types/Common.hpp>
#include <sstream>
#include <string>

namespace RegionComposite::Domain {

struct CompositeResult {
    bool success = false;
    Types::ErrorCode error = Types::ErrorCode::NONE;
    std::string errorMessage;

    Types::Image compositedImage;

    ColorCorrection correction;
    LightingDescriptor lighting;
    OrientationDescriptor orientation;
    std::string generationContext;

    BoundingBox expandedBox;
    Types::PixelRect compositedRect;

    int clampedChannels = 0;
    float processingTimeMs = 0.0f;

    double appliedStrength() const { return correction.strength; }

    bool isValid() const { return success && !compositedImage.empty(); }

    std::string getSummary() const {
        std::ostringstream oss;
        if (!success) {
            oss << "Composite failed (" << Types::toString(error) << "): " << errorMessage;
            return oss.str();
        }
        oss << "Composite " << compositedImage.cols << "x" << compositedImage.rows
            << " region " << compositedRect.width << "x" << compositedRect.height << "@"
            << compositedRect.x << "," << compositedRect.y << "\n";
        oss << "  Lighting: " << lighting.describe() << " [" << lighting.diagnostics() << "]\n";
        oss << "  Orientation: " << orientation.describe() << "\n";
        oss << "  Correction: " << correction.toString() << "\n";
        oss << "  Clamped channels: " << clampedChannels << "\n";
        oss << "  Processing time: " << processingTimeMs << "ms";
        return oss.str();
    }
};

}  // namespace RegionComposite::Domain
