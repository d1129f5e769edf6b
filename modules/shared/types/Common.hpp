#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <algorithm>

namespace RegionComposite::Types {

using Image = cv::Mat;           // 8-bit BGR or BGRA
using ColorValue = cv::Vec3d;    // R, G, B in the 0-255 domain
using PixelRect = cv::Rect;
using Size2D = cv::Size;

constexpr double CHANNEL_MIN = 0.0;
constexpr double CHANNEL_MAX = 255.0;

enum class BrightnessLevel { BRIGHT, MODERATE, DIM, DARK };

enum class ColorTemperature { WARM, COOL, NEUTRAL };

enum class VerticalZone { UPPER, MIDDLE, LOWER };

enum class FalloffCurve { LINEAR, QUADRATIC, COSINE };

enum class ErrorCode {
    NONE,
    INVALID_GEOMETRY,       // Bounding box or rectangle violates its invariants
    EMPTY_REGION,           // Zero-pixel region
    DIMENSION_MISMATCH,     // Region does not fit the box it should fill
    UNSUPPORTED_FORMAT,     // Not an 8-bit 3 or 4 channel image
    INVALID_CONFIGURATION,
    GENERATOR_FAILURE       // External generator returned nothing usable
};

inline const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "none";
        case ErrorCode::INVALID_GEOMETRY: return "invalid geometry";
        case ErrorCode::EMPTY_REGION: return "empty region";
        case ErrorCode::DIMENSION_MISMATCH: return "dimension mismatch";
        case ErrorCode::UNSUPPORTED_FORMAT: return "unsupported format";
        case ErrorCode::INVALID_CONFIGURATION: return "invalid configuration";
        case ErrorCode::GENERATOR_FAILURE: return "generator failure";
    }
    return "unknown";
}

inline const char* toString(BrightnessLevel level) {
    switch (level) {
        case BrightnessLevel::BRIGHT: return "bright";
        case BrightnessLevel::MODERATE: return "moderate";
        case BrightnessLevel::DIM: return "dim";
        case BrightnessLevel::DARK: return "dark";
    }
    return "unknown";
}

inline const char* toString(ColorTemperature temperature) {
    switch (temperature) {
        case ColorTemperature::WARM: return "warm";
        case ColorTemperature::COOL: return "cool";
        case ColorTemperature::NEUTRAL: return "neutral";
    }
    return "unknown";
}

inline const char* toString(VerticalZone zone) {
    switch (zone) {
        case VerticalZone::UPPER: return "upper";
        case VerticalZone::MIDDLE: return "middle";
        case VerticalZone::LOWER: return "lower";
    }
    return "unknown";
}

inline const char* toString(FalloffCurve curve) {
    switch (curve) {
        case FalloffCurve::LINEAR: return "linear";
        case FalloffCurve::QUADRATIC: return "quadratic";
        case FalloffCurve::COSINE: return "cosine";
    }
    return "unknown";
}

inline FalloffCurve falloffCurveFromString(const std::string& name,
                                           FalloffCurve fallback = FalloffCurve::COSINE) {
    if (name == "linear") return FalloffCurve::LINEAR;
    if (name == "quadratic") return FalloffCurve::QUADRATIC;
    if (name == "cosine") return FalloffCurve::COSINE;
    return fallback;
}

inline bool isSupportedImage(const Image& image) {
    return !image.empty() && image.depth() == CV_8U &&
           (image.channels() == 3 || image.channels() == 4);
}

}  // namespace RegionComposite::Types
