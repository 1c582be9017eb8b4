#pragma once

#include <memory>
#include <opencv2/core.hpp>

#include "config.hpp"
#include "duplicate_resolver.hpp"
#include "face_types.hpp"
#include "inference_adapter.hpp"

namespace facemask {

// Source image -> detector canvas -> adapter -> normalized, de-duplicated FaceSet.
class DetectionPipeline {
public:
    DetectionPipeline(std::shared_ptr<InferenceAdapter> adapter, const DetectionConfig& cfg);

    cv::Size detector_size(cv::Size source_size) const;

    // Source resampled onto the detector canvas (copy when sizes match).
    cv::Mat render_detector_canvas(const cv::Mat& source) const;

    // Whole-image detection, resolved with the plain IoU resolver.
    FaceSet detect(const cv::Mat& source, DetectionContext ctx);

    // Detection on an already rendered detector surface. Results are in
    // Source pixels of an image of `source_size`.
    FaceSet detect_surface(const cv::Mat& surface, cv::Size source_size, DetectionContext ctx,
                           const cv::Mat& region_mask, const DuplicateResolver& resolver);

    float threshold_for(DetectionContext ctx) const;

    const DetectionConfig& config() const { return cfg_; }
    DuplicateResolver plain_resolver() const;
    DuplicateResolver strict_resolver() const;

private:
    std::shared_ptr<InferenceAdapter> adapter_;
    DetectionConfig cfg_;
};

}  // namespace facemask
