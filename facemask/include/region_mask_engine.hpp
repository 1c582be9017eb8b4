#pragma once

#include <memory>
#include <opencv2/core.hpp>
#include <vector>

#include "config.hpp"
#include "detection_pipeline.hpp"
#include "face_types.hpp"

namespace facemask {

// A polygon is usable when it has at least three distinct vertices and is
// closed, either by flag or by a last point within `tolerance` of the first.
bool is_valid_polygon(const SelectionPolygon& polygon, float tolerance);

// Vertices without a duplicated closing point.
std::vector<cv::Point2f> open_vertices(const SelectionPolygon& polygon, float tolerance);

class RegionStrategy {
public:
    virtual ~RegionStrategy() = default;

    // `source_polygon` is in Source pixels. `known_faces` may be null.
    virtual FaceSet find(const cv::Mat& source, const std::vector<cv::Point2f>& source_polygon,
                         const FaceSet* known_faces, DetectionContext ctx) = 0;
    virtual const char* name() const = 0;
};

// Masks everything outside the polygon and runs the detector on what is left.
class CropRedetectStrategy : public RegionStrategy {
public:
    explicit CropRedetectStrategy(DetectionPipeline& pipeline) : pipeline_(pipeline) {}

    FaceSet find(const cv::Mat& source, const std::vector<cv::Point2f>& source_polygon,
                 const FaceSet* known_faces, DetectionContext ctx) override;
    const char* name() const override { return "crop_redetect"; }

private:
    DetectionPipeline& pipeline_;
};

// Detects on the whole image (or reuses known faces) and keeps the ones whose
// center falls inside the polygon.
class ClassifyStrategy : public RegionStrategy {
public:
    explicit ClassifyStrategy(DetectionPipeline& pipeline) : pipeline_(pipeline) {}

    FaceSet find(const cv::Mat& source, const std::vector<cv::Point2f>& source_polygon,
                 const FaceSet* known_faces, DetectionContext ctx) override;
    const char* name() const override { return "classify"; }

private:
    DetectionPipeline& pipeline_;
};

std::unique_ptr<RegionStrategy> make_region_strategy(RegionStrategyKind kind, DetectionPipeline& pipeline);

class RegionMaskEngine {
public:
    RegionMaskEngine(DetectionPipeline& pipeline, const DetectionConfig& cfg);

    // Faces inside `polygon` (Display pixels of a canvas of `display_size`).
    // An invalid polygon gives an empty set.
    FaceSet faces_in_region(const cv::Mat& source, const SelectionPolygon& polygon, cv::Size display_size,
                            const FaceSet* known_faces, DetectionContext ctx);

    const RegionStrategy& strategy() const { return *strategy_; }

private:
    DetectionPipeline& pipeline_;
    DetectionConfig cfg_;
    std::unique_ptr<RegionStrategy> strategy_;
};

}  // namespace facemask
