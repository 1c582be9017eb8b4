#include "duplicate_resolver.hpp"

#include <algorithm>
#include <cmath>

namespace facemask {

float iou(const FaceRegion& a, const FaceRegion& b) {
    const float x1 = std::max(a.x, b.x);
    const float y1 = std::max(a.y, b.y);
    const float x2 = std::min(a.x + a.width, b.x + b.width);
    const float y2 = std::min(a.y + a.height, b.y + b.height);
    if (x2 <= x1 || y2 <= y1) return 0.0f;

    const float inter = (x2 - x1) * (y2 - y1);
    const float uni = a.width * a.height + b.width * b.height - inter;
    return uni > 0.0f ? inter / uni : 0.0f;
}

DuplicateResolver::DuplicateResolver(float iou_threshold, bool strict, float center_ratio, float size_ratio)
    : iou_threshold_(iou_threshold), strict_(strict), center_ratio_(center_ratio), size_ratio_(size_ratio) {}

bool DuplicateResolver::is_duplicate(const FaceRegion& candidate, const FaceRegion& accepted) const {
    if (iou(candidate, accepted) > iou_threshold_) return true;
    if (!strict_) return false;

    const float size_a = candidate.size();
    const float size_b = accepted.size();
    const float larger = std::max(size_a, size_b);
    if (larger <= 0.0f) return false;

    const float avg_size = 0.5f * (size_a + size_b);
    const cv::Point2f d = candidate.center() - accepted.center();
    const float dist = std::sqrt(d.x * d.x + d.y * d.y);
    const float ratio = std::min(size_a, size_b) / larger;
    return dist < center_ratio_ * avg_size && ratio > size_ratio_;
}

FaceSet DuplicateResolver::resolve(const FaceSet& faces) const {
    FaceSet sorted = faces;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const FaceRegion& a, const FaceRegion& b) { return a.confidence > b.confidence; });

    FaceSet kept;
    for (const auto& f : sorted) {
        bool dup = std::any_of(kept.begin(), kept.end(),
                               [&](const FaceRegion& k) { return is_duplicate(f, k); });
        if (!dup) kept.push_back(f);
    }
    return kept;
}

}  // namespace facemask
