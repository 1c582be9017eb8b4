#pragma once

#include <opencv2/core.hpp>

#include "face_types.hpp"

namespace facemask {

// Paints masks over faces on the display canvas. Faces are given in Source
// pixels of an image of `source_size` and scaled to the canvas here.
class MaskApplier {
public:
    explicit MaskApplier(float margin_ratio = 0.10f) : margin_ratio_(margin_ratio) {}

    // `stamp_image` is only used by MaskTransform::STAMP; an empty one leaves faces untouched.
    void apply(cv::Mat& canvas, cv::Size source_size, const FaceSet& faces, MaskTransform transform,
               int intensity, const cv::Mat& stamp_image = cv::Mat()) const;

    // Face rectangle on the canvas grown by the margin and clamped. Empty when
    // nothing of the face is left.
    cv::Rect expanded_rect(const FaceRegion& face, cv::Size source_size, cv::Size canvas_size) const;

    // Outline preview of detected faces.
    void draw_highlights(cv::Mat& canvas, cv::Size source_size, const FaceSet& faces,
                         bool show_confidence) const;

    static int pixelation_cell_size(int min_side, int intensity);
    static double blur_sigma(int intensity);

private:
    void pixelate(cv::Mat& roi, int intensity) const;
    void blur(cv::Mat& roi, int intensity) const;
    void stamp(cv::Mat& canvas, const cv::Rect& area, const cv::Mat& stamp_image) const;

    float margin_ratio_;
};

}  // namespace facemask
