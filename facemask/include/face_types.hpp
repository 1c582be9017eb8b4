#pragma once

#include <opencv2/core.hpp>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace facemask {

enum class MaskTransform { PIXELATE, BLUR, STAMP };
enum class DetectionMode { AUTO, MANUAL };
enum class RegionMode { INCLUDE, EXCLUDE };

// Which confidence floor applies to a detection request.
enum class DetectionContext { AUTO, MANUAL };

inline std::string mask_transform_to_string(MaskTransform t) {
    switch (t) {
        case MaskTransform::BLUR: return "blur";
        case MaskTransform::STAMP: return "stamp";
        default: return "pixelate";
    }
}

inline std::string region_mode_to_string(RegionMode m) {
    return m == RegionMode::EXCLUDE ? "exclude" : "include";
}

// Face rectangle in Source Image pixels.
struct FaceRegion {
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};
    float confidence{0.0f};

    cv::Rect2f rect() const { return cv::Rect2f(x, y, width, height); }
    cv::Point2f center() const { return cv::Point2f(x + width * 0.5f, y + height * 0.5f); }
    float size() const { return std::sqrt(width * height); }
};

using FaceSet = std::vector<FaceRegion>;

// Center-based box normalized to 0..1 of the Detector Canvas.
struct NormalizedBox {
    float x_center{0.0f};
    float y_center{0.0f};
    float width{0.0f};
    float height{0.0f};
};

struct LabelScore {
    int index{0};
    float value{0.0f};
};

// Detector output as the backends hand it over. Each backend fills whichever
// confidence carrier it has; none of them is guaranteed to be present.
struct RawDetection {
    NormalizedBox box;
    std::optional<float> score;
    std::vector<float> score_data;
    std::optional<float> confidence;
    std::vector<LabelScore> label_scores;
    std::optional<float> value;  // bare numeric score some runtimes attach
};

struct ScoredDetection {
    NormalizedBox box;
    float confidence{0.0f};
    bool measured{true};  // false when confidence is the synthetic fallback
};

// Freeform selection in Display Canvas pixels.
struct SelectionPolygon {
    std::vector<cv::Point2f> points;
    bool closed{false};
};

}  // namespace facemask
