#pragma once

#include <opencv2/core.hpp>
#include <vector>

#include "config.hpp"
#include "face_types.hpp"

namespace facemask {

// Maps center-based normalized boxes on the Detector Canvas to clamped
// top-left rectangles in Source Image pixels. Boxes that end up with no
// width or height inside the image are dropped.
FaceSet normalize_detections(const std::vector<ScoredDetection>& detections,
                             cv::Size detector_size, cv::Size source_size);

// Size / aspect / confidence sanity filter. Only applied when cfg.post_filter is set.
FaceSet filter_plausible_faces(const FaceSet& faces, cv::Size source_size,
                               const DetectionConfig& cfg, float call_threshold);

}  // namespace facemask
