#pragma once

#include "../internal/correction/ColorMatcher.hpp"
#include "../internal/correction/Compositor.hpp"
#include "../internal/geometry/GeometryExpander.hpp"
#include "../internal/geometry/OrientationAnalyzer.hpp"
#include "../internal/processing/PhotometricAnalyzer.hpp"
#include "../internal/processing/ResizePlanner.hpp"
#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <opencv2/opencv.hpp>
#include <cmath>
#include <string>

namespace RegionComposite::Interface {

// Immutable settings for one pipeline instance. Defaults are the reference
// constants; tests and hosts build variants by copying and editing a value.
struct CompositeConfiguration {
    Internal::Geometry::GeometryExpander::Settings geometry;
    Internal::Geometry::OrientationAnalyzer::Settings orientation;
    Internal::Processing::PhotometricAnalyzer::Settings photometric;
    Internal::Processing::ResizePlanner::Settings resize;
    Internal::Correction::ColorMatcher::Settings colorMatch;
    Internal::Correction::Compositor::Settings compositor;

    // Force-fit generator output whose size differs from its input instead
    // of rejecting it with DIMENSION_MISMATCH.
    bool acceptResizedGeneratorOutput = false;

    // Every check is written so that NaN fails it
    std::string getValidationError() const {
        if (!(std::isfinite(geometry.paddingFraction) && geometry.paddingFraction >= 0.0)) {
            return "geometry.padding_fraction must be >= 0";
        }
        if (!(std::isfinite(orientation.referenceAspectRatio) &&
              orientation.referenceAspectRatio > 0.0)) {
            return "orientation.reference_aspect_ratio must be > 0";
        }
        if (!(std::isfinite(orientation.tiltTolerance) && orientation.tiltTolerance >= 0.0)) {
            return "orientation.tilt_tolerance must be >= 0";
        }
        if (!(std::isfinite(orientation.upperZoneLimit) && std::isfinite(orientation.lowerZoneLimit) &&
              orientation.upperZoneLimit <= orientation.lowerZoneLimit)) {
            return "orientation zone limits must be ordered";
        }
        if (!(std::isfinite(photometric.dimThreshold) &&
              std::isfinite(photometric.moderateThreshold) &&
              std::isfinite(photometric.brightThreshold) &&
              photometric.dimThreshold <= photometric.moderateThreshold &&
              photometric.moderateThreshold <= photometric.brightThreshold)) {
            return "photometric brightness thresholds must be ordered";
        }
        if (!(std::isfinite(photometric.coolThreshold) && std::isfinite(photometric.warmThreshold) &&
              photometric.coolThreshold <= photometric.warmThreshold)) {
            return "photometric cool threshold must not exceed warm threshold";
        }
        if (resize.maxDimension <= 0) {
            return "resize.max_dimension must be > 0";
        }
        if (!(colorMatch.minStrength >= 0.0 && colorMatch.maxStrength <= 1.0 &&
              colorMatch.minStrength <= colorMatch.maxStrength)) {
            return "color_match strengths must satisfy 0 <= min <= max <= 1";
        }
        if (!(std::isfinite(colorMatch.magnitudeScale) && colorMatch.magnitudeScale > 0.0)) {
            return "color_match.magnitude_scale must be > 0";
        }
        if (!(compositor.featherFraction >= 0.0 && compositor.featherFraction <= 1.0)) {
            return "compositor.feather_fraction must be within [0, 1]";
        }
        return std::string();
    }

    bool isValid() const { return getValidationError().empty(); }

    bool saveToFile(const std::string& filename) const {
        try {
            cv::FileStorage fs(filename, cv::FileStorage::WRITE);
            if (!fs.isOpened()) {
                LOG_ERROR("Cannot open configuration file for writing: ", filename);
                return false;
            }

            fs << "geometry" << "{";
            fs << "padding_fraction" << geometry.paddingFraction;
            fs << "}";

            fs << "orientation" << "{";
            fs << "reference_aspect_ratio" << orientation.referenceAspectRatio;
            fs << "tilt_tolerance" << orientation.tiltTolerance;
            fs << "upper_zone_limit" << orientation.upperZoneLimit;
            fs << "lower_zone_limit" << orientation.lowerZoneLimit;
            fs << "}";

            fs << "photometric" << "{";
            fs << "bright_threshold" << photometric.brightThreshold;
            fs << "moderate_threshold" << photometric.moderateThreshold;
            fs << "dim_threshold" << photometric.dimThreshold;
            fs << "warm_threshold" << photometric.warmThreshold;
            fs << "cool_threshold" << photometric.coolThreshold;
            fs << "}";

            fs << "resize" << "{";
            fs << "max_dimension" << resize.maxDimension;
            fs << "}";

            fs << "color_match" << "{";
            fs << "min_strength" << colorMatch.minStrength;
            fs << "max_strength" << colorMatch.maxStrength;
            fs << "magnitude_scale" << colorMatch.magnitudeScale;
            fs << "}";

            fs << "compositor" << "{";
            fs << "feather_fraction" << compositor.featherFraction;
            fs << "falloff" << std::string(Types::toString(compositor.falloff));
            fs << "}";

            fs << "accept_resized_generator_output" << static_cast<int>(acceptResizedGeneratorOutput);

            fs.release();
            LOG_INFO("Configuration saved to: ", filename);
            return true;

        } catch (const cv::Exception& e) {
            LOG_ERROR("OpenCV error while saving configuration: ", e.what());
            return false;
        }
    }

    // Keys absent from the file keep their current values
    bool loadFromFile(const std::string& filename) {
        try {
            cv::FileStorage fs(filename, cv::FileStorage::READ);
            if (!fs.isOpened()) {
                LOG_ERROR("Cannot open configuration file for reading: ", filename);
                return false;
            }

            CompositeConfiguration loaded = *this;

            cv::FileNode node = fs["geometry"];
            readValue(node, "padding_fraction", loaded.geometry.paddingFraction);

            node = fs["orientation"];
            readValue(node, "reference_aspect_ratio", loaded.orientation.referenceAspectRatio);
            readValue(node, "tilt_tolerance", loaded.orientation.tiltTolerance);
            readValue(node, "upper_zone_limit", loaded.orientation.upperZoneLimit);
            readValue(node, "lower_zone_limit", loaded.orientation.lowerZoneLimit);

            node = fs["photometric"];
            readValue(node, "bright_threshold", loaded.photometric.brightThreshold);
            readValue(node, "moderate_threshold", loaded.photometric.moderateThreshold);
            readValue(node, "dim_threshold", loaded.photometric.dimThreshold);
            readValue(node, "warm_threshold", loaded.photometric.warmThreshold);
            readValue(node, "cool_threshold", loaded.photometric.coolThreshold);

            node = fs["resize"];
            if (!node.empty() && !node["max_dimension"].empty()) {
                loaded.resize.maxDimension = static_cast<int>(node["max_dimension"]);
            }

            node = fs["color_match"];
            readValue(node, "min_strength", loaded.colorMatch.minStrength);
            readValue(node, "max_strength", loaded.colorMatch.maxStrength);
            readValue(node, "magnitude_scale", loaded.colorMatch.magnitudeScale);

            node = fs["compositor"];
            readValue(node, "feather_fraction", loaded.compositor.featherFraction);
            if (!node.empty() && !node["falloff"].empty()) {
                std::string falloff = static_cast<std::string>(node["falloff"]);
                loaded.compositor.falloff =
                    Types::falloffCurveFromString(falloff, loaded.compositor.falloff);
            }

            if (!fs["accept_resized_generator_output"].empty()) {
                loaded.acceptResizedGeneratorOutput =
                    static_cast<int>(fs["accept_resized_generator_output"]) != 0;
            }

            fs.release();

            std::string validationError = loaded.getValidationError();
            if (!validationError.empty()) {
                LOG_ERROR("Configuration in ", filename, " is invalid: ", validationError);
                return false;
            }

            *this = loaded;
            LOG_INFO("Configuration loaded from: ", filename);
            return true;

        } catch (const cv::Exception& e) {
            LOG_ERROR("OpenCV error while loading configuration: ", e.what());
            return false;
        }
    }

  private:
    static void readValue(const cv::FileNode& parent, const char* key, double& value) {
        if (parent.empty()) return;
        cv::FileNode child = parent[key];
        if (!child.empty()) {
            value = static_cast<double>(child);
        }
    }
};

}  // namespace RegionComposite::Interface
