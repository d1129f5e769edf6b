#pragma once

#include "../domain/ColorCorrection.hpp"
#include "../domain/ColorStats.hpp"
#include "../processing/PhotometricAnalyzer.hpp"
#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <shared/utils/Saturate.hpp>
#include <opencv2/opencv.hpp>
#include <string>

namespace RegionComposite::Internal::Correction {

class ColorMatcher {
  public:
    struct Settings {
        double minStrength;      // Applied when the generator already matches the scene
        double maxStrength;      // Never replaces the generated shading entirely
        double magnitudeScale;   // Shift magnitude at which maxStrength is reached

        Settings();
    };

    struct MatchResult {
        Types::Image correctedImage;
        Domain::ColorCorrection correction;

        // Channel values that had to be saturated to [0, 255]
        int clampedChannels = 0;

        bool success = false;
        Types::ErrorCode error = Types::ErrorCode::NONE;
        std::string errorMessage;

        bool isValid() const;
    };

    explicit ColorMatcher(const Settings& settings = Settings{});

    Domain::ColorCorrection match(const Domain::ColorStats& originalStats,
                                  const Domain::ColorStats& generatedStats) const;

    double computeStrength(double magnitude) const;

    MatchResult apply(const Types::Image& generated,
                      const Domain::ColorCorrection& correction) const;

    // Measures both regions, then matches and applies in one step
    MatchResult matchRegions(const Types::Image& originalRegion,
                             const Types::Image& generatedRegion) const;

    void setSettings(const Settings& settings);
    Settings getSettings() const;

  private:
    Settings settings_;
    Processing::PhotometricAnalyzer analyzer_;

    bool validateRegion(const Types::Image& region, MatchResult& result) const;
};

}  // namespace RegionComposite::Internal::Correction
