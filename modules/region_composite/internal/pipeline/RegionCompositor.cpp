#include "RegionCompositor.hpp"
#include <chrono>

namespace RegionComposite::Internal::Pipeline {

RegionCompositor::RegionCompositor(const Interface::CompositeConfiguration& config)
    : config_(config),
      configError_(config.getValidationError()),
      expander_(config.geometry),
      orientationAnalyzer_(config.orientation),
      photometricAnalyzer_(config.photometric),
      resizePlanner_(config.resize),
      colorMatcher_(config.colorMatch),
      compositor_(config.compositor) {
    if (configError_.empty()) {
        LOG_INFO("Region compositor initialized (padding ", config_.geometry.paddingFraction,
                 ", max dimension ", config_.resize.maxDimension, ")");
    } else {
        LOG_ERROR("Region compositor created with invalid configuration: ", configError_);
    }
}

Domain::PreparedRegion RegionCompositor::prepare(const Types::Image& original,
                                                 const Domain::BoundingBox& detectionBox) const {
    if (!configError_.empty()) {
        return failPrepared(Types::ErrorCode::INVALID_CONFIGURATION, configError_);
    }

    if (original.empty()) {
        return failPrepared(Types::ErrorCode::EMPTY_REGION, "Original image is empty");
    }

    if (!Types::isSupportedImage(original)) {
        return failPrepared(Types::ErrorCode::UNSUPPORTED_FORMAT,
                            "Original image must be 8-bit with 3 or 4 channels");
    }

    try {
        auto expansion = expander_.expand(detectionBox, original.size());
        if (!expansion.success) {
            return failPrepared(expansion.error, expansion.errorMessage);
        }

        auto orientation = orientationAnalyzer_.analyze(detectionBox);
        if (!orientation.success) {
            return failPrepared(orientation.error, orientation.errorMessage);
        }

        Domain::PreparedRegion prepared;
        prepared.sourceSize = original.size();
        prepared.detectionBox = detectionBox;
        prepared.expandedBox = expansion.box;
        prepared.cropRect = expansion.pixelRect;
        prepared.originalCrop = original(expansion.pixelRect).clone();

        auto photometric = photometricAnalyzer_.analyze(prepared.originalCrop);
        if (!photometric.success) {
            return failPrepared(photometric.error, photometric.errorMessage);
        }

        prepared.originalStats = photometric.stats;
        prepared.lighting = photometric.lighting;
        prepared.orientation = orientation.descriptor;
        prepared.generationContext =
            Domain::PreparedRegion::composeContext(prepared.lighting, prepared.orientation);
        prepared.generatorInput = resizePlanner_.resizeForGeneration(prepared.originalCrop);
        prepared.success = true;

        LOG_INFO("Prepared ", prepared.cropRect.width, "x", prepared.cropRect.height,
                 " crop for generation at ", prepared.generatorInput.cols, "x",
                 prepared.generatorInput.rows, ": ", prepared.generationContext);

        return prepared;

    } catch (const cv::Exception& e) {
        return failPrepared(Types::ErrorCode::UNSUPPORTED_FORMAT,
                            "OpenCV exception while preparing region: " + std::string(e.what()));
    }
}

Domain::CompositeResult RegionCompositor::finalize(const Types::Image& original,
                                                   const Domain::PreparedRegion& prepared,
                                                   const Types::Image& generated) const {
    auto startTime = std::chrono::high_resolution_clock::now();

    if (!configError_.empty()) {
        return failComposite(Types::ErrorCode::INVALID_CONFIGURATION, configError_);
    }

    if (!prepared.isValid()) {
        Types::ErrorCode code = prepared.error != Types::ErrorCode::NONE
                                    ? prepared.error
                                    : Types::ErrorCode::EMPTY_REGION;
        return failComposite(code, "Cannot finalize an unprepared region");
    }

    if (original.size() != prepared.sourceSize) {
        return failComposite(Types::ErrorCode::DIMENSION_MISMATCH,
                             "Original is " + std::to_string(original.cols) + "x" +
                                 std::to_string(original.rows) + " but the region was prepared on " +
                                 std::to_string(prepared.sourceSize.width) + "x" +
                                 std::to_string(prepared.sourceSize.height));
    }

    if (generated.empty()) {
        return failComposite(Types::ErrorCode::GENERATOR_FAILURE,
                             "Generator returned an empty image");
    }

    if (generated.size() != prepared.generatorInput.size()) {
        std::string message = "Generator returned " + std::to_string(generated.cols) + "x" +
                               std::to_string(generated.rows) + " for a " +
                               std::to_string(prepared.generatorInput.cols) + "x" +
                               std::to_string(prepared.generatorInput.rows) + " input";
        if (!config_.acceptResizedGeneratorOutput) {
            return failComposite(Types::ErrorCode::DIMENSION_MISMATCH, message);
        }
        LOG_WARN(message, ", forcing it to the crop size");
    }

    try {
        Types::Image restored = resizePlanner_.restoreToCrop(generated, prepared.cropRect.size());
        if (restored.empty()) {
            return failComposite(Types::ErrorCode::GENERATOR_FAILURE,
                                 "Could not restore generator output to the crop size");
        }

        auto generatedStats = photometricAnalyzer_.computeStats(restored);
        if (generatedStats.pixelCount == 0) {
            return failComposite(Types::ErrorCode::UNSUPPORTED_FORMAT,
                                 "Generator output must be 8-bit with 3 or 4 channels");
        }

        auto correction = colorMatcher_.match(prepared.originalStats, generatedStats);
        auto matched = colorMatcher_.apply(restored, correction);
        if (!matched.success) {
            return failComposite(matched.error, matched.errorMessage);
        }

        auto blended = compositor_.composite(original, matched.correctedImage, prepared.cropRect);
        if (!blended.success) {
            return failComposite(blended.error, blended.errorMessage);
        }

        Domain::CompositeResult result;
        result.compositedImage = blended.compositedImage;
        result.correction = correction;
        result.lighting = prepared.lighting;
        result.orientation = prepared.orientation;
        result.generationContext = prepared.generationContext;
        result.expandedBox = prepared.expandedBox;
        result.compositedRect = blended.region;
        result.clampedChannels = matched.clampedChannels;
        result.success = true;

        auto endTime = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(endTime - startTime);
        result.processingTimeMs = duration.count() / 1000.0f;

        LOG_INFO("Composite finished in ", result.processingTimeMs, "ms with correction strength ",
                 result.appliedStrength());

        return result;

    } catch (const cv::Exception& e) {
        return failComposite(Types::ErrorCode::UNSUPPORTED_FORMAT,
                             "OpenCV exception while compositing: " + std::string(e.what()));
    }
}

Domain::CompositeResult RegionCompositor::run(const Types::Image& original,
                                              const Domain::BoundingBox& detectionBox,
                                              Interface::IImageGenerator& generator) const {
    Domain::PreparedRegion prepared = prepare(original, detectionBox);
    if (!prepared.success) {
        return failComposite(prepared.error, prepared.errorMessage);
    }

    LOG_DEBUG("Calling generator ", generator.getName());

    Types::Image generated;
    try {
        generated = generator.generate(prepared.generatorInput, prepared.generationContext);
    } catch (const std::exception& e) {
        return failComposite(Types::ErrorCode::GENERATOR_FAILURE,
                             "Generator " + generator.getName() + " failed: " + e.what());
    }

    return finalize(original, prepared, generated);
}

const Interface::CompositeConfiguration& RegionCompositor::getConfiguration() const {
    return config_;
}

Domain::PreparedRegion RegionCompositor::failPrepared(Types::ErrorCode code,
                                                      const std::string& message) {
    Domain::PreparedRegion prepared;
    prepared.error = code;
    prepared.errorMessage = message;
    LOG_ERROR("Region preparation failed: ", message);
    return prepared;
}

Domain::CompositeResult RegionCompositor::failComposite(Types::ErrorCode code,
                                                        const std::string& message) {
    Domain::CompositeResult result;
    result.error = code;
    result.errorMessage = message;
    LOG_ERROR("Region composite failed: ", message);
    return result;
}

}  // namespace RegionComposite::Internal::Pipeline

namespace RegionComposite::Interface {

std::unique_ptr<IRegionCompositor> createRegionCompositor(const CompositeConfiguration& config) {
    return std::make_unique<Internal::Pipeline::RegionCompositor>(config);
}

}  // namespace RegionComposite::Interface
