#pragma once

#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <opencv2/opencv.hpp>
#include <opencv2/imgproc.hpp>

namespace RegionComposite::Internal::Processing {

class ResizePlanner {
  public:
    struct Settings {
        int maxDimension;             // Longest side sent to the generator
        int downscaleInterpolation;   // Used when shrinking the crop
        int restoreInterpolation;     // Used when scaling generator output back

        Settings();
    };

    explicit ResizePlanner(const Settings& settings = Settings{});

    Types::Size2D plan(const Types::Size2D& size) const;

    // Identity when the longest side fits, otherwise a uniform downscale
    // rounded to nearest. Never yields a side below 1.
    static Types::Size2D plan(const Types::Size2D& size, int maxDimension);

    double scaleFactor(const Types::Size2D& size) const;

    Types::Image resizeForGeneration(const Types::Image& crop) const;

    Types::Image restoreToCrop(const Types::Image& generated, const Types::Size2D& cropSize) const;

    void setSettings(const Settings& settings);
    Settings getSettings() const;

  private:
    Settings settings_;
};

}  // namespace RegionComposite::Internal::Processing
