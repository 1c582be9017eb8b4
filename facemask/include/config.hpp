#pragma once

#include <opencv2/core.hpp>
#include <string>

#include "face_types.hpp"

namespace facemask {

enum class RegionStrategyKind { CROP_REDETECT, CLASSIFY };
enum class DetectorBackend { ULTRAFACE, YUNET };

struct DetectionConfig {
    float auto_confidence_threshold{0.4f};
    float manual_confidence_threshold{0.25f};
    float fallback_confidence_epsilon{0.05f};  // added to the call threshold when no score is reported
    int inference_timeout_ms{10000};

    float iou_threshold{0.3f};
    float strict_center_ratio{0.3f};  // of the average face size
    float strict_size_ratio{0.7f};
    bool strict_merge{false};         // include-mode merges also use the center/size check

    float margin_ratio{0.10f};
    float close_tolerance_px{2.0f};

    cv::Size detector_max{2560, 1440};
    cv::Size display_max{1920, 1080};

    RegionStrategyKind region_strategy{RegionStrategyKind::CROP_REDETECT};

    // Plausibility filter on normalized detections, off unless asked for.
    bool post_filter{false};
    float min_face_area_ratio{0.02f};
    float max_face_area_ratio{0.5f};
    float min_aspect_ratio{0.6f};
    float max_aspect_ratio{1.5f};
    float min_confidence_after_filter{0.08f};
};

struct AppConfig {
    std::string image_path{};
    std::string output_path{"masked.png"};
    std::string stamp_path{};
    std::string polygon{};            // "x,y;x,y;..." in display canvas pixels
    RegionMode region_mode{RegionMode::INCLUDE};
    MaskTransform transform{MaskTransform::PIXELATE};
    int intensity{3};
    DetectorBackend backend{DetectorBackend::ULTRAFACE};
    std::string model_path{"models/version-RFB-320.onnx"};
    bool use_ort{true};               // use ONNX Runtime when available
    bool highlight{false};            // draw face outlines instead of masking
    DetectionConfig detection{};
};

AppConfig parse_args(int argc, char** argv);

// Parses "x,y;x,y;..." into a closed polygon. Malformed pairs are skipped.
SelectionPolygon parse_polygon(const std::string& text);

}  // namespace facemask
