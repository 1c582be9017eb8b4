#include "detection_normalizer.hpp"

#include <algorithm>
#include <iostream>

#include "coordinate_space.hpp"

namespace facemask {

FaceSet normalize_detections(const std::vector<ScoredDetection>& detections,
                             cv::Size detector_size, cv::Size source_size) {
    FaceSet out;
    if (detector_size.area() <= 0 || source_size.area() <= 0) return out;

    const SpaceTransform to_source(detector_size, source_size);
    const float src_w = static_cast<float>(source_size.width);
    const float src_h = static_cast<float>(source_size.height);

    for (const auto& d : detections) {
        const NormalizedBox& b = d.box;
        cv::Rect2f det_px((b.x_center - b.width * 0.5f) * detector_size.width,
                          (b.y_center - b.height * 0.5f) * detector_size.height,
                          b.width * detector_size.width,
                          b.height * detector_size.height);
        cv::Rect2f r = to_source.map(det_px);

        FaceRegion f;
        f.x = std::max(0.0f, r.x);
        f.y = std::max(0.0f, r.y);
        f.width = std::min(r.width, src_w - f.x);
        f.height = std::min(r.height, src_h - f.y);
        f.confidence = d.confidence;
        if (f.width <= 0.0f || f.height <= 0.0f) continue;
        out.push_back(f);
    }
    return out;
}

FaceSet filter_plausible_faces(const FaceSet& faces, cv::Size source_size,
                               const DetectionConfig& cfg, float call_threshold) {
    const float image_area = static_cast<float>(source_size.area());
    if (image_area <= 0.0f) return {};
    const float min_conf = std::min(cfg.min_confidence_after_filter, call_threshold - 0.02f);

    FaceSet out;
    for (const auto& f : faces) {
        const float area_ratio = (f.width * f.height) / image_area;
        const float aspect = f.width / f.height;
        if (area_ratio < cfg.min_face_area_ratio || area_ratio > cfg.max_face_area_ratio ||
            aspect < cfg.min_aspect_ratio || aspect > cfg.max_aspect_ratio) {
            std::cout << "[INFO] Dropped implausible face: area " << cv::format("%.2f%%", area_ratio * 100.0f)
                      << ", aspect " << cv::format("%.2f", aspect) << std::endl;
            continue;
        }
        if (f.confidence < min_conf) continue;
        out.push_back(f);
    }
    return out;
}

}  // namespace facemask
