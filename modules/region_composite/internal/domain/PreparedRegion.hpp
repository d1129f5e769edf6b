#pragma once

#include "BoundingBox.hpp"
#include "ColorStats.hpp"
#include "LightingDescriptor.hpp"
#include "OrientationDescriptor.hpp"
#include <shared/types/Common.hpp>
#include <string>

namespace RegionComposite::Domain {

// Everything the pipeline derives before the external generation call
struct PreparedRegion {
    bool success = false;
    Types::ErrorCode error = Types::ErrorCode::NONE;
    std::string errorMessage;

    Types::Size2D sourceSize;   // Size of the image prepare() ran on
    BoundingBox detectionBox;
    BoundingBox expandedBox;
    Types::PixelRect cropRect;

    Types::Image originalCrop;
    Types::Image generatorInput;   // originalCrop scaled to the generation limit

    ColorStats originalStats;
    LightingDescriptor lighting;
    OrientationDescriptor orientation;
    std::string generationContext;

    bool isValid() const { return success && !originalCrop.empty() && !generatorInput.empty(); }

    // Lighting sentence followed by the orientation sentence
    static std::string composeContext(const LightingDescriptor& lighting,
                                      const OrientationDescriptor& orientation) {
        return "The scene has " + lighting.describe() + ". " + orientation.describe();
    }
};

}  // namespace RegionComposite::Domain
