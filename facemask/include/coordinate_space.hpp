#pragma once

#include <opencv2/core.hpp>
#include <vector>

#include "face_types.hpp"

namespace facemask {

enum class Space { SOURCE, DETECTOR, DISPLAY };

// Per-axis scaling between two pixel spaces. Factors are always target / source.
class SpaceTransform {
public:
    SpaceTransform(cv::Size from, cv::Size to);

    float scale_x() const { return sx_; }
    float scale_y() const { return sy_; }

    // Composition: apply this transform, then `next`.
    SpaceTransform then(const SpaceTransform& next) const;

    cv::Point2f map(const cv::Point2f& p) const;
    cv::Rect2f map(const cv::Rect2f& r) const;
    FaceRegion map(const FaceRegion& f) const;
    std::vector<cv::Point2f> map(const std::vector<cv::Point2f>& points) const;

private:
    SpaceTransform(float sx, float sy) : sx_(sx), sy_(sy) {}

    float sx_{1.0f};
    float sy_{1.0f};
};

struct CoordinateSpaces {
    cv::Size source;
    cv::Size detector;
    cv::Size display;

    cv::Size size_of(Space s) const;
    SpaceTransform transform(Space from, Space to) const;
};

// Uniform downscale to fit `max`, never upscales; dimensions rounded.
cv::Size fit_within_bounds(cv::Size size, cv::Size max);

// Same rule for the detector canvas, dimensions floored.
cv::Size fit_detector_canvas(cv::Size size, cv::Size max);

// Rounds a float rectangle to whole pixels and intersects it with `bounds`.
cv::Rect to_pixel_rect(const cv::Rect2f& r, cv::Size bounds);

}  // namespace facemask
