#include "face_mask_session.hpp"

#include <iostream>
#include <opencv2/imgproc.hpp>

#include "coordinate_space.hpp"
#include "errors.hpp"

namespace facemask {

FaceMaskSession::FaceMaskSession(std::shared_ptr<InferenceAdapter> adapter, const DetectionConfig& cfg)
    : cfg_(cfg),
      pipeline_(std::move(adapter), cfg),
      region_engine_(pipeline_, cfg),
      applier_(cfg.margin_ratio) {
    // Restored sets go through the normal path; the history ignores the re-commit.
    history_.set_navigation_listener([this](const FaceSet& restored) { replace_faces(restored); });
}

void FaceMaskSession::replace_faces(const FaceSet& faces) {
    faces_ = faces;
    history_.commit(faces_);
}

void FaceMaskSession::load_image(const cv::Mat& source, cv::Size display_size) {
    source_ = source.clone();
    display_size_ = display_size.area() > 0 ? display_size : fit_within_bounds(source.size(), cfg_.display_max);
    faces_.clear();
    history_.reset();
    state_ = SessionState::IDLE;
    std::cout << "[INFO] Loaded " << source.cols << "x" << source.rows << " image (display "
              << display_size_.width << "x" << display_size_.height << ")" << std::endl;
}

FaceSet FaceMaskSession::detect_all() {
    if (!has_image()) return faces_;

    const SessionState prev = state_;
    state_ = SessionState::DETECTING;
    FaceSet found;
    try {
        found = pipeline_.detect(source_, DetectionContext::AUTO);
    } catch (const InferenceError&) {
        state_ = prev;
        throw;
    }

    replace_faces(found);
    state_ = SessionState::DETECTED;
    std::cout << "[INFO] Detected " << found.size() << " face(s)" << std::endl;
    return faces_;
}

FaceSet FaceMaskSession::detect_in_region(const SelectionPolygon& polygon, RegionMode mode) {
    if (!has_image()) return faces_;
    if (!is_valid_polygon(polygon, cfg_.close_tolerance_px)) {
        std::cerr << "[WARN] Selection ignored: needs at least 3 distinct points and a closed outline"
                  << std::endl;
        return faces_;
    }

    const SessionState prev = state_;
    state_ = SessionState::EDITING;
    FaceSet found;
    try {
        found = region_engine_.faces_in_region(source_, polygon, display_size_, nullptr, DetectionContext::MANUAL);
    } catch (const InferenceError&) {
        state_ = prev;
        throw;
    }

    const DuplicateResolver resolver(cfg_.iou_threshold, cfg_.strict_merge, cfg_.strict_center_ratio,
                                     cfg_.strict_size_ratio);
    const std::size_t before = faces_.size();
    FaceSet merged = mode == RegionMode::INCLUDE ? merge_include(faces_, found, resolver)
                                                 : merge_exclude(faces_, found, resolver);
    replace_faces(merged);
    state_ = SessionState::DETECTED;
    std::cout << "[INFO] " << region_mode_to_string(mode) << ": " << before << " -> " << faces_.size()
              << " face(s) (" << found.size() << " in region)" << std::endl;
    return faces_;
}

std::optional<FaceSet> FaceMaskSession::undo() {
    return history_.undo();
}

std::optional<FaceSet> FaceMaskSession::redo() {
    return history_.redo();
}

void FaceMaskSession::reset() {
    faces_.clear();
    history_.reset();
    if (has_image()) state_ = SessionState::DETECTED;
}

void FaceMaskSession::set_detection_mode(DetectionMode mode) {
    mode_ = mode;
    if (mode == DetectionMode::MANUAL) {
        faces_.clear();
        history_.reset();
        if (has_image()) state_ = SessionState::DETECTED;
        return;
    }
    if (has_image()) detect_all();
}

void FaceMaskSession::apply_mask(cv::Mat& canvas, const FaceSet& faces, MaskTransform transform, int intensity,
                                 const cv::Mat& stamp) const {
    applier_.apply(canvas, source_.size(), faces, transform, intensity, stamp);
}

cv::Mat FaceMaskSession::render_display() const {
    if (source_.empty()) return cv::Mat();
    if (display_size_ == source_.size()) return source_.clone();
    cv::Mat out;
    cv::resize(source_, out, display_size_, 0, 0, cv::INTER_AREA);
    return out;
}

}  // namespace facemask
