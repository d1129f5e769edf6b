#include "../../interface/RegionCompositeAPI.hpp"
#include <shared/utils/Logger.hpp>
#include <opencv2/imgcodecs.hpp>

namespace RegionComposite::SimpleAPI {

Types::Image normalizeImage(const Types::Image& image) {
    if (image.empty()) {
        return Types::Image();
    }

    Types::Image converted;
    switch (image.depth()) {
        case CV_8U:
            converted = image;
            break;
        case CV_16U:
            image.convertTo(converted, CV_8U, 1.0 / 257.0);
            break;
        case CV_32F:
        case CV_64F:
            // Floating-point images are expected in [0, 1]
            image.convertTo(converted, CV_8U, 255.0);
            break;
        default:
            LOG_ERROR("Unsupported image depth ", image.depth());
            return Types::Image();
    }

    if (converted.channels() == 1) {
        cv::cvtColor(converted, converted, cv::COLOR_GRAY2BGR);
    }
    return converted;
}

Types::Image loadImage(const std::string& path) {
    try {
        // IMREAD_UNCHANGED keeps an alpha channel when the file has one
        Types::Image image = cv::imread(path, cv::IMREAD_UNCHANGED);
        if (image.empty()) {
            LOG_ERROR("Cannot load image: ", path);
            return image;
        }
        return normalizeImage(image);

    } catch (const cv::Exception& e) {
        LOG_ERROR("OpenCV error while loading ", path, ": ", e.what());
        return Types::Image();
    }
}

bool prepareFromFile(const std::string& imagePath,
                     const Domain::BoundingBox& detectionBox,
                     const std::string& cropOutputPath,
                     std::string& contextOut,
                     const Interface::CompositeConfiguration& config) {
    try {
        Types::Image original = loadImage(imagePath);
        if (original.empty()) return false;

        auto compositor = Interface::createRegionCompositor(config);
        Domain::PreparedRegion prepared = compositor->prepare(original, detectionBox);
        if (!prepared.success) {
            return false;
        }

        if (!cv::imwrite(cropOutputPath, prepared.generatorInput)) {
            LOG_ERROR("Failed to write generator input: ", cropOutputPath);
            return false;
        }

        contextOut = prepared.generationContext;
        return true;

    } catch (const cv::Exception& e) {
        LOG_ERROR("OpenCV error in prepareFromFile: ", e.what());
        return false;
    }
}

bool compositeFromFiles(const std::string& originalPath,
                        const std::string& generatedPath,
                        const Domain::BoundingBox& detectionBox,
                        const std::string& outputPath,
                        const Interface::CompositeConfiguration& config) {
    try {
        Types::Image original = loadImage(originalPath);
        if (original.empty()) return false;

        Types::Image generated = loadImage(generatedPath);
        if (generated.empty()) return false;

        // Preparation is deterministic, so the crop is rebuilt rather than stored
        auto compositor = Interface::createRegionCompositor(config);
        Domain::PreparedRegion prepared = compositor->prepare(original, detectionBox);
        if (!prepared.success) {
            return false;
        }

        Domain::CompositeResult result = compositor->finalize(original, prepared, generated);
        if (!result.success) {
            return false;
        }

        if (!cv::imwrite(outputPath, result.compositedImage)) {
            LOG_ERROR("Failed to write composite: ", outputPath);
            return false;
        }

        LOG_INFO(result.getSummary());
        return true;

    } catch (const cv::Exception& e) {
        LOG_ERROR("OpenCV error in compositeFromFiles: ", e.what());
        return false;
    }
}

}  // namespace RegionComposite::SimpleAPI
