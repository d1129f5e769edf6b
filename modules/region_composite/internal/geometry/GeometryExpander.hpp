#pragma once

#include "../domain/BoundingBox.hpp"
#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <string>

namespace RegionComposite::Internal::Geometry {

class GeometryExpander {
  public:
    struct Settings {
        double paddingFraction;   // Fraction of box width/height added on each side

        Settings();
    };

    struct ExpansionResult {
        Domain::BoundingBox box;
        Types::PixelRect pixelRect;

        bool success = false;
        Types::ErrorCode error = Types::ErrorCode::NONE;
        std::string errorMessage;

        bool isValid() const;
    };

    explicit GeometryExpander(const Settings& settings = Settings{});

    ExpansionResult expand(const Domain::BoundingBox& box, const Types::Size2D& imageSize) const;

    ExpansionResult expand(const Domain::BoundingBox& box, double paddingFraction,
                           const Types::Size2D& imageSize) const;

    void setSettings(const Settings& settings);
    Settings getSettings() const;

  private:
    Settings settings_;

    ExpansionResult fail(Types::ErrorCode code, const std::string& message) const;
};

}  // namespace RegionComposite::Internal::Geometry
