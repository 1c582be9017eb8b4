#include "mask_applier.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>
#include <opencv2/imgproc.hpp>

namespace facemask {

namespace {
int clamp_intensity(int intensity) {
    return std::min(5, std::max(1, intensity));
}

// Stamp pixels converted to the canvas channel layout plus a 0..1 alpha plane.
void split_stamp(const cv::Mat& stamp, int canvas_channels, cv::Mat& color, cv::Mat& alpha) {
    cv::Mat bgr;
    if (stamp.channels() == 4) {
        std::vector<cv::Mat> planes;
        cv::split(stamp, planes);
        planes[3].convertTo(alpha, CV_32F, 1.0 / 255.0);
        cv::cvtColor(stamp, bgr, cv::COLOR_BGRA2BGR);
    } else if (stamp.channels() == 1) {
        cv::cvtColor(stamp, bgr, cv::COLOR_GRAY2BGR);
        alpha = cv::Mat(stamp.size(), CV_32F, cv::Scalar(1.0));
    } else {
        bgr = stamp;
        alpha = cv::Mat(stamp.size(), CV_32F, cv::Scalar(1.0));
    }

    if (canvas_channels == 4) {
        cv::cvtColor(bgr, color, cv::COLOR_BGR2BGRA);
    } else {
        color = bgr;
    }
}
}  // namespace

int MaskApplier::pixelation_cell_size(int min_side, int intensity) {
    const double divisor = 15.0 - clamp_intensity(intensity) * 1.5;
    return std::max(2, static_cast<int>(std::floor(min_side / divisor)));
}

double MaskApplier::blur_sigma(int intensity) {
    return 2.0 + clamp_intensity(intensity) * 1.5;
}

cv::Rect MaskApplier::expanded_rect(const FaceRegion& face, cv::Size source_size, cv::Size canvas_size) const {
    if (source_size.width <= 0 || source_size.height <= 0) return cv::Rect();
    const double sx = static_cast<double>(canvas_size.width) / source_size.width;
    const double sy = static_cast<double>(canvas_size.height) / source_size.height;

    const int fx = static_cast<int>(std::floor(face.x * sx));
    const int fy = static_cast<int>(std::floor(face.y * sy));
    const int fw = static_cast<int>(std::floor(face.width * sx));
    const int fh = static_cast<int>(std::floor(face.height * sy));
    if (fw <= 0 || fh <= 0) return cv::Rect();

    const int mx = static_cast<int>(std::floor(fw * margin_ratio_));
    const int my = static_cast<int>(std::floor(fh * margin_ratio_));
    const int x = std::max(0, fx - mx);
    const int y = std::max(0, fy - my);
    const int w = std::min(canvas_size.width - x, fw + mx * 2);
    const int h = std::min(canvas_size.height - y, fh + my * 2);
    if (w <= 0 || h <= 0) return cv::Rect();
    return cv::Rect(x, y, w, h);
}

void MaskApplier::pixelate(cv::Mat& roi, int intensity) const {
    const int cell = pixelation_cell_size(std::min(roi.cols, roi.rows), intensity);
    for (int gy = 0; gy < roi.rows; gy += cell) {
        for (int gx = 0; gx < roi.cols; gx += cell) {
            cv::Mat block = roi(cv::Rect(gx, gy, std::min(cell, roi.cols - gx), std::min(cell, roi.rows - gy)));
            cv::Scalar mean = cv::mean(block);
            for (int c = 0; c < 4; ++c) mean[c] = std::floor(mean[c]);
            block.setTo(mean);
        }
    }
}

void MaskApplier::blur(cv::Mat& roi, int intensity) const {
    // Blur a detached copy so the kernel never reads pixels outside the region.
    cv::Mat patch = roi.clone();
    cv::GaussianBlur(patch, patch, cv::Size(0, 0), blur_sigma(intensity), 0.0, cv::BORDER_REPLICATE);
    patch.copyTo(roi);
}

void MaskApplier::stamp(cv::Mat& canvas, const cv::Rect& area, const cv::Mat& stamp_image) const {
    const double face_diag = std::hypot(static_cast<double>(area.width), static_cast<double>(area.height));
    const double stamp_diag = std::hypot(static_cast<double>(stamp_image.cols), static_cast<double>(stamp_image.rows));
    if (stamp_diag <= 0.0) return;
    const double scale = face_diag / stamp_diag * 1.1;

    const int dw = std::max(1, static_cast<int>(std::lround(stamp_image.cols * scale)));
    const int dh = std::max(1, static_cast<int>(std::lround(stamp_image.rows * scale)));
    const int dx = area.x + static_cast<int>(std::floor((area.width - dw) / 2.0));
    const int dy = area.y + static_cast<int>(std::floor((area.height - dh) / 2.0));

    const cv::Rect target(dx, dy, dw, dh);
    const cv::Rect visible = target & cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (visible.area() <= 0) return;

    cv::Mat resized;
    cv::resize(stamp_image, resized, target.size(), 0, 0, cv::INTER_LINEAR);
    cv::Mat color, alpha;
    split_stamp(resized, canvas.channels(), color, alpha);

    const cv::Rect src_rect(visible.x - dx, visible.y - dy, visible.width, visible.height);
    cv::Mat dst = canvas(visible);

    cv::Mat dst_f, color_f, alpha_n;
    dst.convertTo(dst_f, CV_32F);
    color(src_rect).convertTo(color_f, CV_32F);
    std::vector<cv::Mat> alpha_planes(static_cast<std::size_t>(canvas.channels()), alpha(src_rect));
    cv::merge(alpha_planes, alpha_n);

    cv::Mat blended = dst_f + (color_f - dst_f).mul(alpha_n);
    blended.convertTo(dst, canvas.type());
}

void MaskApplier::apply(cv::Mat& canvas, cv::Size source_size, const FaceSet& faces, MaskTransform transform,
                        int intensity, const cv::Mat& stamp_image) const {
    if (canvas.empty() || faces.empty()) return;
    if (transform == MaskTransform::STAMP && stamp_image.empty()) {
        std::cerr << "[WARN] No stamp image loaded; " << faces.size() << " face(s) left unmasked" << std::endl;
        return;
    }

    int masked = 0;
    for (const auto& face : faces) {
        const cv::Rect area = expanded_rect(face, source_size, canvas.size());
        if (area.empty()) continue;

        switch (transform) {
            case MaskTransform::PIXELATE: {
                cv::Mat roi = canvas(area);
                pixelate(roi, intensity);
                break;
            }
            case MaskTransform::BLUR: {
                cv::Mat roi = canvas(area);
                blur(roi, intensity);
                break;
            }
            case MaskTransform::STAMP:
                stamp(canvas, area, stamp_image);
                break;
        }
        masked++;
    }
    std::cout << "[INFO] Applied " << mask_transform_to_string(transform) << " to " << masked << " face(s)"
              << std::endl;
}

void MaskApplier::draw_highlights(cv::Mat& canvas, cv::Size source_size, const FaceSet& faces,
                                  bool show_confidence) const {
    if (canvas.empty() || source_size.width <= 0 || source_size.height <= 0) return;
    const cv::Scalar color(60, 180, 75);
    const double sx = static_cast<double>(canvas.cols) / source_size.width;
    const double sy = static_cast<double>(canvas.rows) / source_size.height;
    const cv::Rect bounds(0, 0, canvas.cols, canvas.rows);

    for (const auto& f : faces) {
        cv::Rect box(static_cast<int>(std::floor(f.x * sx)), static_cast<int>(std::floor(f.y * sy)),
                     static_cast<int>(std::floor(f.width * sx)), static_cast<int>(std::floor(f.height * sy)));
        box &= bounds;
        if (box.empty()) continue;

        cv::Mat roi = canvas(box);
        cv::Mat fill(roi.size(), roi.type(), color);
        cv::addWeighted(fill, 0.2, roi, 0.8, 0, roi);
        cv::rectangle(canvas, box, color, 2);
        if (show_confidence) {
            cv::putText(canvas, cv::format("%.0f%%", f.confidence * 100.0f),
                        cv::Point(box.x, std::max(12, box.y - 6)), cv::FONT_HERSHEY_SIMPLEX, 0.55, color, 2);
        }
    }
}

}  // namespace facemask
