#pragma once

// Main public API header - includes all interfaces
#include "CompositeConfiguration.hpp"
#include "IRegionCompositor.hpp"

#include <shared/types/Common.hpp>
#include <string>

namespace RegionComposite {

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

// File-based helpers for hosts that exchange images on disk
namespace SimpleAPI {

// Converts to 8-bit BGR or BGRA: 16-bit is scaled by 1/257, floating point
// from [0, 1], grayscale is expanded to BGR. Other depths yield an empty image.
Types::Image normalizeImage(const Types::Image& image);

// Reads a file with IMREAD_UNCHANGED and applies normalizeImage
Types::Image loadImage(const std::string& path);

// Writes the generator input crop to cropOutputPath and returns the
// generation context through contextOut.
bool prepareFromFile(const std::string& imagePath,
                     const Domain::BoundingBox& detectionBox,
                     const std::string& cropOutputPath,
                     std::string& contextOut,
                     const Interface::CompositeConfiguration& config = {});

// Composites a generated crop (as produced from prepareFromFile's output)
// back into the original image and writes the result.
bool compositeFromFiles(const std::string& originalPath,
                        const std::string& generatedPath,
                        const Domain::BoundingBox& detectionBox,
                        const std::string& outputPath,
                        const Interface::CompositeConfiguration& config = {});

}  // namespace SimpleAPI

}  // namespace RegionComposite
