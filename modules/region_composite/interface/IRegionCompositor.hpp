#pragma once

#include "CompositeConfiguration.hpp"
#include "../internal/domain/BoundingBox.hpp"
#include "../internal/domain/CompositeResult.hpp"
#include "../internal/domain/PreparedRegion.hpp"
#include <shared/types/Common.hpp>
#include <memory>
#include <string>

namespace RegionComposite::Interface {

// External image generator. Receives the resized crop and the lighting and
// orientation context; must return an image of the same pixel size.
class IImageGenerator {
  public:
    virtual ~IImageGenerator() = default;

    virtual Types::Image generate(const Types::Image& regionInput, const std::string& context) = 0;

    virtual std::string getName() const = 0;
};

class IRegionCompositor {
  public:
    virtual ~IRegionCompositor() = default;

    // Everything that runs before the generation call
    virtual Domain::PreparedRegion prepare(const Types::Image& original,
                                           const Domain::BoundingBox& detectionBox) const = 0;

    // Everything that runs after it
    virtual Domain::CompositeResult finalize(const Types::Image& original,
                                             const Domain::PreparedRegion& prepared,
                                             const Types::Image& generated) const = 0;

    virtual Domain::CompositeResult run(const Types::Image& original,
                                        const Domain::BoundingBox& detectionBox,
                                        IImageGenerator& generator) const = 0;

    virtual const CompositeConfiguration& getConfiguration() const = 0;
};

std::unique_ptr<IRegionCompositor> createRegionCompositor(
    const CompositeConfiguration& config = CompositeConfiguration{});

}  // namespace RegionComposite::Interface
