#include "Compositor.hpp"
#include <algorithm>
#include <cmath>

namespace RegionComposite::Internal::Correction {

Compositor::Settings::Settings()
    : featherFraction(0.12),
      falloff(Types::FalloffCurve::COSINE) {}

bool Compositor::BlendResult::isValid() const {
    return success && !compositedImage.empty();
}

Compositor::Compositor(const Settings& settings) : settings_(settings) {}

Compositor::BlendResult Compositor::composite(const Types::Image& base,
                                              const Types::Image& correctedRegion,
                                              const Domain::BoundingBox& box) const {
    if (!box.isValid()) {
        return fail(Types::ErrorCode::INVALID_GEOMETRY,
                    "Cannot composite into invalid box " + box.toString());
    }
    if (base.empty()) {
        return fail(Types::ErrorCode::EMPTY_REGION, "Base image is empty");
    }
    return composite(base, correctedRegion, box.toPixelRect(base.size()));
}

Compositor::BlendResult Compositor::composite(const Types::Image& base,
                                              const Types::Image& correctedRegion,
                                              const Types::PixelRect& rect) const {
    if (base.empty() || correctedRegion.empty()) {
        return fail(Types::ErrorCode::EMPTY_REGION, "Compositing needs a base image and a region");
    }

    if (!Types::isSupportedImage(base) || !Types::isSupportedImage(correctedRegion)) {
        return fail(Types::ErrorCode::UNSUPPORTED_FORMAT,
                    "Compositing needs 8-bit 3 or 4 channel images");
    }

    const Types::PixelRect bounds(0, 0, base.cols, base.rows);
    if (rect.empty() || (rect & bounds) != rect) {
        return fail(Types::ErrorCode::INVALID_GEOMETRY, "Composite rectangle lies outside the base image");
    }

    if (correctedRegion.size() != rect.size()) {
        return fail(Types::ErrorCode::DIMENSION_MISMATCH,
                    "Region is " + std::to_string(correctedRegion.cols) + "x" +
                        std::to_string(correctedRegion.rows) + " but the box needs " +
                        std::to_string(rect.width) + "x" + std::to_string(rect.height));
    }

    BlendResult result;

    try {
        Types::Image overlay = correctedRegion;
        if (overlay.channels() != base.channels()) {
            cv::cvtColor(correctedRegion, overlay,
                         base.channels() == 4 ? cv::COLOR_BGR2BGRA : cv::COLOR_BGRA2BGR);
        }

        cv::Mat mask = createFeatherMask(rect.size());

        Types::Image output = base.clone();
        Types::Image target = output(rect);
        const int channels = output.channels();

        for (int y = 0; y < rect.height; ++y) {
            uchar* targetRow = target.ptr<uchar>(y);
            const uchar* overlayRow = overlay.ptr<uchar>(y);
            const float* weightRow = mask.ptr<float>(y);

            for (int x = 0; x < rect.width; ++x) {
                const double weight = weightRow[x];
                if (weight <= 0.0) continue;

                for (int c = 0; c < channels; ++c) {
                    const int index = x * channels + c;
                    targetRow[index] = Shared::saturatingBlend(targetRow[index], overlayRow[index], weight);
                }
            }
        }

        result.compositedImage = output;
        result.region = rect;
        result.success = true;

        LOG_DEBUG("Composited ", rect.width, "x", rect.height, " region at ", rect.x, ",", rect.y,
                  " with ", Types::toString(settings_.falloff), " feather ",
                  settings_.featherFraction);

    } catch (const cv::Exception& e) {
        return fail(Types::ErrorCode::UNSUPPORTED_FORMAT,
                    "OpenCV exception during compositing: " + std::string(e.what()));
    }

    return result;
}

cv::Mat Compositor::createFeatherMask(const Types::Size2D& size) const {
    cv::Mat mask(size, CV_32FC1, cv::Scalar(1.0f));
    if (size.width <= 0 || size.height <= 0) {
        return mask;
    }

    const double halfWidth = size.width / 2.0;
    const double halfHeight = size.height / 2.0;

    for (int y = 0; y < size.height; ++y) {
        float* row = mask.ptr<float>(y);
        const double dy = std::abs(y + 0.5 - halfHeight) / halfHeight;

        for (int x = 0; x < size.width; ++x) {
            const double dx = std::abs(x + 0.5 - halfWidth) / halfWidth;
            row[x] = static_cast<float>(featherWeight(std::max(dx, dy)));
        }
    }

    return mask;
}

double Compositor::featherWeight(double normalizedDistance) const {
    // A non-finite band falls back to a hard edge
    const double band =
        std::isfinite(settings_.featherFraction) ? std::clamp(settings_.featherFraction, 0.0, 1.0) : 0.0;

    if (normalizedDistance >= 1.0) return 0.0;
    if (band <= 0.0 || normalizedDistance <= 1.0 - band) return 1.0;

    const double t = (1.0 - normalizedDistance) / band;
    return std::clamp(applyFalloff(t), 0.0, 1.0);
}

void Compositor::setSettings(const Settings& settings) {
    settings_ = settings;
}

Compositor::Settings Compositor::getSettings() const {
    return settings_;
}

Compositor::BlendResult Compositor::fail(Types::ErrorCode code, const std::string& message) const {
    BlendResult result;
    result.error = code;
    result.errorMessage = message;
    LOG_ERROR(message);
    return result;
}

double Compositor::applyFalloff(double t) const {
    switch (settings_.falloff) {
        case Types::FalloffCurve::LINEAR:
            return t;
        case Types::FalloffCurve::QUADRATIC:
            // Smoothstep: zero slope at both ends of the band
            return t * t * (3.0 - 2.0 * t);
        case Types::FalloffCurve::COSINE:
        default:
            return 0.5 - 0.5 * std::cos(CV_PI * t);
    }
}

}  // namespace RegionComposite::Internal::Correction
