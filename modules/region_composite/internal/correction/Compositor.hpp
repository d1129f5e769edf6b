#pragma once

#include "../domain/BoundingBox.hpp"
#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <shared/utils/Saturate.hpp>
#include <opencv2/opencv.hpp>
#include <string>

namespace RegionComposite::Internal::Correction {

class Compositor {
  public:
    struct Settings {
        // Width of the transition band as a fraction of the half-extent
        double featherFraction;
        Types::FalloffCurve falloff;

        Settings();
    };

    struct BlendResult {
        Types::Image compositedImage;
        Types::PixelRect region;

        bool success = false;
        Types::ErrorCode error = Types::ErrorCode::NONE;
        std::string errorMessage;

        bool isValid() const;
    };

    explicit Compositor(const Settings& settings = Settings{});

    BlendResult composite(const Types::Image& base, const Types::Image& correctedRegion,
                          const Domain::BoundingBox& box) const;

    BlendResult composite(const Types::Image& base, const Types::Image& correctedRegion,
                          const Types::PixelRect& rect) const;

    // CV_32FC1 weights for the generated content: 1 in the interior,
    // falling to 0 at the rectangle edge across the feather band.
    cv::Mat createFeatherMask(const Types::Size2D& size) const;

    // Weight for a normalized Chebyshev distance from the center (0 center, 1 edge)
    double featherWeight(double normalizedDistance) const;

    void setSettings(const Settings& settings);
    Settings getSettings() const;

  private:
    Settings settings_;

    BlendResult fail(Types::ErrorCode code, const std::string& message) const;
    double applyFalloff(double t) const;
};

}  // namespace RegionComposite::Internal::Correction
