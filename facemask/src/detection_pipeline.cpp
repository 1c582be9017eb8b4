#include "detection_pipeline.hpp"

#include <iostream>
#include <opencv2/imgproc.hpp>

#include "coordinate_space.hpp"
#include "detection_normalizer.hpp"
#include "errors.hpp"

namespace facemask {

DetectionPipeline::DetectionPipeline(std::shared_ptr<InferenceAdapter> adapter, const DetectionConfig& cfg)
    : adapter_(std::move(adapter)), cfg_(cfg) {
    if (!adapter_) throw InferenceFailure("detection pipeline needs an inference adapter");
}

cv::Size DetectionPipeline::detector_size(cv::Size source_size) const {
    return fit_detector_canvas(source_size, cfg_.detector_max);
}

cv::Mat DetectionPipeline::render_detector_canvas(const cv::Mat& source) const {
    const cv::Size target = detector_size(source.size());
    cv::Mat canvas;
    if (target == source.size()) {
        canvas = source.clone();
    } else {
        cv::resize(source, canvas, target, 0, 0, cv::INTER_AREA);
    }
    return canvas;
}

float DetectionPipeline::threshold_for(DetectionContext ctx) const {
    return ctx == DetectionContext::MANUAL ? cfg_.manual_confidence_threshold
                                           : cfg_.auto_confidence_threshold;
}

DuplicateResolver DetectionPipeline::plain_resolver() const {
    return DuplicateResolver(cfg_.iou_threshold, false, cfg_.strict_center_ratio, cfg_.strict_size_ratio);
}

DuplicateResolver DetectionPipeline::strict_resolver() const {
    return DuplicateResolver(cfg_.iou_threshold, true, cfg_.strict_center_ratio, cfg_.strict_size_ratio);
}

FaceSet DetectionPipeline::detect(const cv::Mat& source, DetectionContext ctx) {
    if (source.empty()) return {};
    cv::Mat surface = render_detector_canvas(source);
    return detect_surface(surface, source.size(), ctx, cv::Mat(), plain_resolver());
}

FaceSet DetectionPipeline::detect_surface(const cv::Mat& surface, cv::Size source_size, DetectionContext ctx,
                                          const cv::Mat& region_mask, const DuplicateResolver& resolver) {
    const float threshold = threshold_for(ctx);
    auto scored = adapter_->detect(surface, threshold, region_mask);

    FaceSet faces;
    for (const auto& f : normalize_detections(scored, surface.size(), source_size)) {
        if (f.confidence >= threshold) faces.push_back(f);
    }
    if (cfg_.post_filter) faces = filter_plausible_faces(faces, source_size, cfg_, threshold);

    FaceSet resolved = resolver.resolve(faces);
    if (resolved.size() != faces.size()) {
        std::cout << "[INFO] Removed " << (faces.size() - resolved.size()) << " duplicate face(s)" << std::endl;
    }
    return resolved;
}

}  // namespace facemask
