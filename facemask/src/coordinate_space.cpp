#include "coordinate_space.hpp"

#include <algorithm>
#include <cmath>

namespace facemask {

namespace {
float safe_ratio(int target, int source) {
    if (source <= 0) return 0.0f;
    return static_cast<float>(target) / static_cast<float>(source);
}

double fit_ratio(cv::Size size, cv::Size max) {
    if (size.width <= 0 || size.height <= 0) return 1.0;
    const double wr = static_cast<double>(max.width) / size.width;
    const double hr = static_cast<double>(max.height) / size.height;
    return std::min({1.0, wr, hr});
}
}  // namespace

SpaceTransform::SpaceTransform(cv::Size from, cv::Size to)
    : sx_(safe_ratio(to.width, from.width)), sy_(safe_ratio(to.height, from.height)) {}

SpaceTransform SpaceTransform::then(const SpaceTransform& next) const {
    return SpaceTransform(sx_ * next.sx_, sy_ * next.sy_);
}

cv::Point2f SpaceTransform::map(const cv::Point2f& p) const {
    return cv::Point2f(p.x * sx_, p.y * sy_);
}

cv::Rect2f SpaceTransform::map(const cv::Rect2f& r) const {
    return cv::Rect2f(r.x * sx_, r.y * sy_, r.width * sx_, r.height * sy_);
}

FaceRegion SpaceTransform::map(const FaceRegion& f) const {
    FaceRegion out;
    out.x = f.x * sx_;
    out.y = f.y * sy_;
    out.width = f.width * sx_;
    out.height = f.height * sy_;
    out.confidence = f.confidence;
    return out;
}

std::vector<cv::Point2f> SpaceTransform::map(const std::vector<cv::Point2f>& points) const {
    std::vector<cv::Point2f> out;
    out.reserve(points.size());
    for (const auto& p : points) out.push_back(map(p));
    return out;
}

cv::Size CoordinateSpaces::size_of(Space s) const {
    switch (s) {
        case Space::DETECTOR: return detector;
        case Space::DISPLAY: return display;
        default: return source;
    }
}

SpaceTransform CoordinateSpaces::transform(Space from, Space to) const {
    return SpaceTransform(size_of(from), size_of(to));
}

cv::Size fit_within_bounds(cv::Size size, cv::Size max) {
    const double ratio = fit_ratio(size, max);
    return cv::Size(static_cast<int>(std::lround(size.width * ratio)),
                    static_cast<int>(std::lround(size.height * ratio)));
}

cv::Size fit_detector_canvas(cv::Size size, cv::Size max) {
    const double ratio = fit_ratio(size, max);
    if (ratio >= 1.0) return size;
    return cv::Size(static_cast<int>(std::floor(size.width * ratio)),
                    static_cast<int>(std::floor(size.height * ratio)));
}

cv::Rect to_pixel_rect(const cv::Rect2f& r, cv::Size bounds) {
    cv::Rect px(static_cast<int>(std::lround(r.x)), static_cast<int>(std::lround(r.y)),
                static_cast<int>(std::lround(r.width)), static_cast<int>(std::lround(r.height)));
    return px & cv::Rect(0, 0, bounds.width, bounds.height);
}

}  // namespace facemask
