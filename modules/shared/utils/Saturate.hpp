#pragma once

#include <shared/types/Common.hpp>
#include <opencv2/core.hpp>

namespace RegionComposite::Shared {

// All per-pixel color arithmetic funnels through these helpers so that every
// output channel value is rounded to nearest and saturated to [0, 255].

inline uchar saturateChannel(double value) {
    return cv::saturate_cast<uchar>(value);
}

inline bool exceedsChannelRange(double value) {
    return value < Types::CHANNEL_MIN - 0.5 || value >= Types::CHANNEL_MAX + 0.5;
}

inline uchar saturatingAdd(uchar channel, double offset) {
    return saturateChannel(static_cast<double>(channel) + offset);
}

// weight 0 keeps base, weight 1 yields overlay exactly
inline uchar saturatingBlend(uchar base, uchar overlay, double weight) {
    double b = static_cast<double>(base);
    return saturateChannel(b + (static_cast<double>(overlay) - b) * weight);
}

}  // namespace RegionComposite::Shared
