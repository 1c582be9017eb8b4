#pragma once

#include "face_types.hpp"

namespace facemask {

// Intersection over union of two axis-aligned rectangles; 0 when disjoint.
float iou(const FaceRegion& a, const FaceRegion& b);

class DuplicateResolver {
public:
    explicit DuplicateResolver(float iou_threshold = 0.3f, bool strict = false,
                               float center_ratio = 0.3f, float size_ratio = 0.7f);

    // Greedy suppression, highest confidence first. Ties keep input order.
    FaceSet resolve(const FaceSet& faces) const;

    // True when `candidate` is taken to be the same face as `accepted`:
    // IoU above the threshold, or (strict only) centers closer than
    // center_ratio * average size with a size ratio above size_ratio.
    bool is_duplicate(const FaceRegion& candidate, const FaceRegion& accepted) const;

    float iou_threshold() const { return iou_threshold_; }
    bool strict() const { return strict_; }

private:
    float iou_threshold_;
    bool strict_;
    float center_ratio_;
    float size_ratio_;
};

}  // namespace facemask
