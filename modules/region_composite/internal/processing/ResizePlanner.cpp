#include "ResizePlanner.hpp"
#include <algorithm>
#include <cmath>

namespace RegionComposite::Internal::Processing {

ResizePlanner::Settings::Settings()
    : maxDimension(1536),
      downscaleInterpolation(cv::INTER_AREA),
      restoreInterpolation(cv::INTER_LANCZOS4) {}

ResizePlanner::ResizePlanner(const Settings& settings) : settings_(settings) {}

Types::Size2D ResizePlanner::plan(const Types::Size2D& size) const {
    return plan(size, settings_.maxDimension);
}

Types::Size2D ResizePlanner::plan(const Types::Size2D& size, int maxDimension) {
    const int width = std::max(1, size.width);
    const int height = std::max(1, size.height);
    const int longest = std::max(width, height);

    if (maxDimension <= 0 || longest <= maxDimension) {
        return Types::Size2D(width, height);
    }

    // Multiply before dividing so exact ratios such as 1500 * 1536 / 2000 stay exact
    const double scaledWidth = static_cast<double>(width) * maxDimension / longest;
    const double scaledHeight = static_cast<double>(height) * maxDimension / longest;

    return Types::Size2D(std::max(1, static_cast<int>(std::lround(scaledWidth))),
                         std::max(1, static_cast<int>(std::lround(scaledHeight))));
}

double ResizePlanner::scaleFactor(const Types::Size2D& size) const {
    const int longest = std::max(size.width, size.height);
    if (longest <= 0 || settings_.maxDimension <= 0 || longest <= settings_.maxDimension) {
        return 1.0;
    }
    return static_cast<double>(settings_.maxDimension) / longest;
}

Types::Image ResizePlanner::resizeForGeneration(const Types::Image& crop) const {
    if (crop.empty()) {
        LOG_ERROR("Cannot plan resize of an empty crop");
        return Types::Image();
    }

    const Types::Size2D target = plan(crop.size());
    if (target == crop.size()) {
        return crop;
    }

    Types::Image resized;
    cv::resize(crop, resized, target, 0, 0, settings_.downscaleInterpolation);

    LOG_DEBUG("Generator input resized from ", crop.cols, "x", crop.rows, " to ", target.width,
              "x", target.height, " (scale ", scaleFactor(crop.size()), ")");

    return resized;
}

Types::Image ResizePlanner::restoreToCrop(const Types::Image& generated,
                                          const Types::Size2D& cropSize) const {
    if (generated.empty() || cropSize.width <= 0 || cropSize.height <= 0) {
        LOG_ERROR("Cannot restore generator output to crop size");
        return Types::Image();
    }

    if (generated.size() == cropSize) {
        return generated;
    }

    Types::Image restored;
    cv::resize(generated, restored, cropSize, 0, 0, settings_.restoreInterpolation);

    LOG_DEBUG("Generator output restored from ", generated.cols, "x", generated.rows, " to ",
              cropSize.width, "x", cropSize.height);

    return restored;
}

void ResizePlanner::setSettings(const Settings& settings) {
    settings_ = settings;
}

ResizePlanner::Settings ResizePlanner::getSettings() const {
    return settings_;
}

}  // namespace RegionComposite::Internal::Processing
