#include "ColorMatcher.hpp"
#include <algorithm>
#include <cmath>

namespace RegionComposite::Internal::Correction {

ColorMatcher::Settings::Settings()
    : minStrength(0.3),
      maxStrength(0.6),
      magnitudeScale(100.0) {}

bool ColorMatcher::MatchResult::isValid() const {
    return success && !correctedImage.empty();
}

ColorMatcher::ColorMatcher(const Settings& settings) : settings_(settings), analyzer_() {}

Domain::ColorCorrection ColorMatcher::match(const Domain::ColorStats& originalStats,
                                            const Domain::ColorStats& generatedStats) const {
    Domain::ColorCorrection correction;

    // Direction that pulls the generated region toward the scene
    correction.shiftR = originalStats.meanR - generatedStats.meanR;
    correction.shiftG = originalStats.meanG - generatedStats.meanG;
    correction.shiftB = originalStats.meanB - generatedStats.meanB;

    correction.magnitude = std::sqrt(correction.shiftR * correction.shiftR +
                                     correction.shiftG * correction.shiftG +
                                     correction.shiftB * correction.shiftB);
    correction.strength = computeStrength(correction.magnitude);

    LOG_DEBUG("Color match: ", correction.toString());

    return correction;
}

double ColorMatcher::computeStrength(double magnitude) const {
    if (!std::isfinite(magnitude)) {
        return settings_.maxStrength;
    }

    const double scale = settings_.magnitudeScale > 0.0 ? settings_.magnitudeScale : 1.0;
    const double ramp = settings_.minStrength +
                        (magnitude / scale) * (settings_.maxStrength - settings_.minStrength);

    return std::clamp(ramp, settings_.minStrength, settings_.maxStrength);
}

ColorMatcher::MatchResult ColorMatcher::apply(const Types::Image& generated,
                                              const Domain::ColorCorrection& correction) const {
    MatchResult result;
    result.correction = correction;

    if (!validateRegion(generated, result)) {
        return result;
    }

    // BGR(A) channel order
    const double offsets[3] = {correction.offsetB(), correction.offsetG(), correction.offsetR()};
    const int channels = generated.channels();

    Types::Image corrected = generated.clone();

    if (correction.isIdentity()) {
        result.correctedImage = corrected;
        result.success = true;
        return result;
    }

    int clamped = 0;
    for (int y = 0; y < corrected.rows; ++y) {
        uchar* row = corrected.ptr<uchar>(y);
        for (int x = 0; x < corrected.cols; ++x) {
            uchar* pixel = row + x * channels;
            for (int c = 0; c < 3; ++c) {
                const double value = static_cast<double>(pixel[c]) + offsets[c];
                if (Shared::exceedsChannelRange(value)) {
                    ++clamped;
                }
                pixel[c] = Shared::saturatingAdd(pixel[c], offsets[c]);
            }
        }
    }

    result.correctedImage = corrected;
    result.clampedChannels = clamped;
    result.success = true;

    if (clamped > 0) {
        LOG_DEBUG("Color correction saturated ", clamped, " channel values");
    }

    return result;
}

ColorMatcher::MatchResult ColorMatcher::matchRegions(const Types::Image& originalRegion,
                                                     const Types::Image& generatedRegion) const {
    MatchResult result;

    if (!validateRegion(originalRegion, result) || !validateRegion(generatedRegion, result)) {
        return result;
    }

    Domain::ColorStats originalStats = analyzer_.computeStats(originalRegion);
    Domain::ColorStats generatedStats = analyzer_.computeStats(generatedRegion);

    return apply(generatedRegion, match(originalStats, generatedStats));
}

void ColorMatcher::setSettings(const Settings& settings) {
    settings_ = settings;
}

ColorMatcher::Settings ColorMatcher::getSettings() const {
    return settings_;
}

bool ColorMatcher::validateRegion(const Types::Image& region, MatchResult& result) const {
    if (region.empty() || region.total() == 0) {
        result.error = Types::ErrorCode::EMPTY_REGION;
        result.errorMessage = "Color matching received an empty region";
        LOG_ERROR(result.errorMessage);
        return false;
    }

    if (!Types::isSupportedImage(region)) {
        result.error = Types::ErrorCode::UNSUPPORTED_FORMAT;
        result.errorMessage = "Color matching needs an 8-bit 3 or 4 channel region";
        LOG_ERROR(result.errorMessage);
        return false;
    }

    return true;
}

}  // namespace RegionComposite::Internal::Correction
