#pragma once

#include "../domain/ColorStats.hpp"
#include "../domain/LightingDescriptor.hpp"
#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <opencv2/opencv.hpp>
#include <string>

namespace RegionComposite::Internal::Processing {

class PhotometricAnalyzer {
  public:
    struct Settings {
        // Brightness thresholds on the 0-255 mean
        double brightThreshold;     // >= bright
        double moderateThreshold;   // >= moderate
        double dimThreshold;        // >= dim, below is dark

        // Thresholds on meanR - meanB
        double warmThreshold;       // > warm
        double coolThreshold;       // < cool

        Settings();
    };

    struct PhotometricResult {
        Domain::ColorStats stats;
        Domain::LightingDescriptor lighting;

        bool success = false;
        Types::ErrorCode error = Types::ErrorCode::NONE;
        std::string errorMessage;
    };

    explicit PhotometricAnalyzer(const Settings& settings = Settings{});

    PhotometricResult analyze(const Types::Image& region) const;

    // Channel means over every pixel of the region. Check the returned
    // pixelCount: zero means the region was empty or unsupported.
    Domain::ColorStats computeStats(const Types::Image& region) const;

    Domain::LightingDescriptor describe(const Domain::ColorStats& stats) const;

    Types::BrightnessLevel classifyBrightness(double brightness) const;
    Types::ColorTemperature classifyTemperature(double temperatureDelta) const;

    void setSettings(const Settings& settings);
    Settings getSettings() const;

  private:
    Settings settings_;
};

}  // namespace RegionComposite::Internal::Processing
