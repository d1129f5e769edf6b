#pragma once

#include "../../interface/IRegionCompositor.hpp"
#include "../correction/ColorMatcher.hpp"
#include "../correction/Compositor.hpp"
#include "../geometry/GeometryExpander.hpp"
#include "../geometry/OrientationAnalyzer.hpp"
#include "../processing/PhotometricAnalyzer.hpp"
#include "../processing/ResizePlanner.hpp"
#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>

namespace RegionComposite::Internal::Pipeline {

// Runs every stage on the calling thread. Holds only immutable stage
// configuration, so one instance may serve concurrent requests.
class RegionCompositor : public Interface::IRegionCompositor {
  public:
    explicit RegionCompositor(const Interface::CompositeConfiguration& config);

    Domain::PreparedRegion prepare(const Types::Image& original,
                                   const Domain::BoundingBox& detectionBox) const override;

    Domain::CompositeResult finalize(const Types::Image& original,
                                     const Domain::PreparedRegion& prepared,
                                     const Types::Image& generated) const override;

    Domain::CompositeResult run(const Types::Image& original,
                                const Domain::BoundingBox& detectionBox,
                                Interface::IImageGenerator& generator) const override;

    const Interface::CompositeConfiguration& getConfiguration() const override;

  private:
    const Interface::CompositeConfiguration config_;
    const std::string configError_;

    const Geometry::GeometryExpander expander_;
    const Geometry::OrientationAnalyzer orientationAnalyzer_;
    const Processing::PhotometricAnalyzer photometricAnalyzer_;
    const Processing::ResizePlanner resizePlanner_;
    const Correction::ColorMatcher colorMatcher_;
    const Correction::Compositor compositor_;

    static Domain::PreparedRegion failPrepared(Types::ErrorCode code, const std::string& message);
    static Domain::CompositeResult failComposite(Types::ErrorCode code, const std::string& message);
};

}  // namespace RegionComposite::Internal::Pipeline
