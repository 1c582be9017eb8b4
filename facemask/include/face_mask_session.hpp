#pragma once

#include <memory>
#include <optional>
#include <opencv2/core.hpp>

#include "config.hpp"
#include "detection_pipeline.hpp"
#include "face_types.hpp"
#include "inference_adapter.hpp"
#include "mask_applier.hpp"
#include "region_mask_engine.hpp"
#include "selection_history.hpp"

namespace facemask {

enum class SessionState { IDLE, DETECTING, DETECTED, EDITING };

// One image at a time: detection, region edits with undo/redo, and masking.
// Not thread-safe; the adapter underneath is.
class FaceMaskSession {
public:
    FaceMaskSession(std::shared_ptr<InferenceAdapter> adapter, const DetectionConfig& cfg);

    FaceMaskSession(const FaceMaskSession&) = delete;
    FaceMaskSession& operator=(const FaceMaskSession&) = delete;

    // Replaces the image and clears faces and history. An empty `display_size`
    // fits the source into DetectionConfig::display_max.
    void load_image(const cv::Mat& source, cv::Size display_size = cv::Size());

    // Whole-image detection. The result becomes the current set and is recorded.
    FaceSet detect_all();

    // Adds (INCLUDE) or removes (EXCLUDE) the faces found inside `polygon`,
    // given in display canvas pixels. An unusable polygon changes nothing.
    FaceSet detect_in_region(const SelectionPolygon& polygon, RegionMode mode);

    std::optional<FaceSet> undo();
    std::optional<FaceSet> redo();

    // Clears the current set and its history; the image stays loaded.
    void reset();

    // MANUAL clears faces and history. AUTO runs detection again when an image is loaded.
    void set_detection_mode(DetectionMode mode);

    void apply_mask(cv::Mat& canvas, const FaceSet& faces, MaskTransform transform, int intensity,
                    const cv::Mat& stamp = cv::Mat()) const;

    // Source scaled to the display canvas.
    cv::Mat render_display() const;

    const FaceSet& faces() const { return faces_; }
    SessionState state() const { return state_; }
    DetectionMode detection_mode() const { return mode_; }
    bool has_image() const { return !source_.empty(); }
    cv::Size source_size() const { return source_.size(); }
    cv::Size display_size() const { return display_size_; }
    const SelectionHistory& history() const { return history_; }
    const MaskApplier& mask_applier() const { return applier_; }

private:
    void replace_faces(const FaceSet& faces);

    DetectionConfig cfg_;
    DetectionPipeline pipeline_;
    RegionMaskEngine region_engine_;
    MaskApplier applier_;
    SelectionHistory history_;

    cv::Mat source_;
    cv::Size display_size_;
    FaceSet faces_;
    SessionState state_{SessionState::IDLE};
    DetectionMode mode_{DetectionMode::AUTO};
};

}  // namespace facemask
