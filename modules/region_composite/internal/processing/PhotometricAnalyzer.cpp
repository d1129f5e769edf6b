#include "PhotometricAnalyzer.hpp"

namespace RegionComposite::Internal::Processing {

PhotometricAnalyzer::Settings::Settings()
    : brightThreshold(170.0),
      moderateThreshold(120.0),
      dimThreshold(70.0),
      warmThreshold(15.0),
      coolThreshold(-15.0) {}

PhotometricAnalyzer::PhotometricAnalyzer(const Settings& settings) : settings_(settings) {}

PhotometricAnalyzer::PhotometricResult PhotometricAnalyzer::analyze(
    const Types::Image& region) const {
    PhotometricResult result;

    if (region.empty() || region.total() == 0) {
        result.error = Types::ErrorCode::EMPTY_REGION;
        result.errorMessage = "Cannot analyze lighting of an empty region";
        LOG_ERROR(result.errorMessage);
        return result;
    }

    if (!Types::isSupportedImage(region)) {
        result.error = Types::ErrorCode::UNSUPPORTED_FORMAT;
        result.errorMessage = "Photometric analysis needs an 8-bit 3 or 4 channel region";
        LOG_ERROR(result.errorMessage);
        return result;
    }

    try {
        result.stats = computeStats(region);
        result.lighting = describe(result.stats);
        result.success = true;

        LOG_DEBUG("Lighting over ", result.stats.pixelCount, " pixels: ",
                  result.lighting.describe(), " [", result.lighting.diagnostics(), "]");

    } catch (const cv::Exception& e) {
        result.error = Types::ErrorCode::UNSUPPORTED_FORMAT;
        result.errorMessage = "OpenCV exception during photometric analysis: " + std::string(e.what());
        LOG_ERROR(result.errorMessage);
    }

    return result;
}

Domain::ColorStats PhotometricAnalyzer::computeStats(const Types::Image& region) const {
    if (!Types::isSupportedImage(region)) {
        return Domain::ColorStats();
    }

    // cv::mean accumulates in double over the full region, no sampling
    cv::Scalar means = cv::mean(region);
    return Domain::ColorStats(means[2], means[1], means[0], region.total());
}

Domain::LightingDescriptor PhotometricAnalyzer::describe(const Domain::ColorStats& stats) const {
    const double brightness = stats.brightness();
    const double delta = stats.colorTemperatureDelta();
    return Domain::LightingDescriptor(classifyBrightness(brightness), classifyTemperature(delta),
                                      brightness, delta);
}

Types::BrightnessLevel PhotometricAnalyzer::classifyBrightness(double brightness) const {
    if (brightness >= settings_.brightThreshold) return Types::BrightnessLevel::BRIGHT;
    if (brightness >= settings_.moderateThreshold) return Types::BrightnessLevel::MODERATE;
    if (brightness >= settings_.dimThreshold) return Types::BrightnessLevel::DIM;
    return Types::BrightnessLevel::DARK;
}

Types::ColorTemperature PhotometricAnalyzer::classifyTemperature(double temperatureDelta) const {
    if (temperatureDelta > settings_.warmThreshold) return Types::ColorTemperature::WARM;
    if (temperatureDelta < settings_.coolThreshold) return Types::ColorTemperature::COOL;
    return Types::ColorTemperature::NEUTRAL;
}

void PhotometricAnalyzer::setSettings(const Settings& settings) {
    settings_ = settings;
}

PhotometricAnalyzer::Settings PhotometricAnalyzer::getSettings() const {
    return settings_;
}

}  // namespace RegionComposite::Internal::Processing
