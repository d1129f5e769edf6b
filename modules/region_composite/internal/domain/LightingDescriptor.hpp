#pragma once

#include <shared/types/Common.hpp>
#include <iomanip>
#include <sstream>
#include <string>

namespace RegionComposite::Domain {

class LightingDescriptor {
  public:
    LightingDescriptor() = default;

    LightingDescriptor(Types::BrightnessLevel level, Types::ColorTemperature temperature,
                       double brightness, double temperatureDelta)
        : level_(level), temperature_(temperature), brightness_(brightness),
          temperatureDelta_(temperatureDelta) {}

    Types::BrightnessLevel getLevel() const { return level_; }
    Types::ColorTemperature getTemperature() const { return temperature_; }
    double getBrightness() const { return brightness_; }
    double getTemperatureDelta() const { return temperatureDelta_; }

    // e.g. "moderately bright, warm lighting"
    std::string describe() const {
        return std::string(levelPhrase(level_)) + ", " + Types::toString(temperature_) +
               " lighting";
    }

    // e.g. "brightness=150.0 (R-B delta +25.0)"
    std::string diagnostics() const {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << "brightness=" << brightness_
            << " (R-B delta " << std::showpos << temperatureDelta_ << ")";
        return oss.str();
    }

    static const char* levelPhrase(Types::BrightnessLevel level) {
        switch (level) {
            case Types::BrightnessLevel::BRIGHT: return "bright";
            case Types::BrightnessLevel::MODERATE: return "moderately bright";
            case Types::BrightnessLevel::DIM: return "dim";
            case Types::BrightnessLevel::DARK: return "dark";
        }
        return "unknown";
    }

  private:
    Types::BrightnessLevel level_ = Types::BrightnessLevel::MODERATE;
    Types::ColorTemperature temperature_ = Types::ColorTemperature::NEUTRAL;
    double brightness_ = 0.0;
    double temperatureDelta_ = 0.0;
};

}  // namespace RegionComposite::Domain
