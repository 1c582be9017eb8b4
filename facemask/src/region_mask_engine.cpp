#include "region_mask_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <iterator>
#include <opencv2/imgproc.hpp>

#include "coordinate_space.hpp"

namespace facemask {

namespace {
float distance(const cv::Point2f& a, const cv::Point2f& b) {
    const cv::Point2f d = a - b;
    return std::sqrt(d.x * d.x + d.y * d.y);
}

cv::Mat rasterize(const std::vector<cv::Point2f>& polygon, cv::Size size) {
    cv::Mat mask = cv::Mat::zeros(size, CV_8UC1);
    std::vector<cv::Point> pts;
    pts.reserve(polygon.size());
    for (const auto& p : polygon) {
        pts.emplace_back(static_cast<int>(std::lround(p.x)), static_cast<int>(std::lround(p.y)));
    }
    std::vector<std::vector<cv::Point>> contours{pts};
    cv::fillPoly(mask, contours, cv::Scalar(255));
    return mask;
}

FaceSet apply_floor(const FaceSet& faces, float floor) {
    FaceSet out;
    std::copy_if(faces.begin(), faces.end(), std::back_inserter(out),
                 [floor](const FaceRegion& f) { return f.confidence >= floor; });
    return out;
}
}  // namespace

std::vector<cv::Point2f> open_vertices(const SelectionPolygon& polygon, float tolerance) {
    std::vector<cv::Point2f> pts = polygon.points;
    if (pts.size() > 1 && distance(pts.front(), pts.back()) <= tolerance) pts.pop_back();
    return pts;
}

bool is_valid_polygon(const SelectionPolygon& polygon, float tolerance) {
    if (polygon.points.size() < 3) return false;
    const bool closes_itself = distance(polygon.points.front(), polygon.points.back()) <= tolerance;
    if (!polygon.closed && !closes_itself) return false;

    std::vector<cv::Point2f> distinct;
    for (const auto& p : open_vertices(polygon, tolerance)) {
        bool seen = std::any_of(distinct.begin(), distinct.end(),
                                [&](const cv::Point2f& q) { return distance(p, q) <= tolerance; });
        if (!seen) distinct.push_back(p);
    }
    return distinct.size() >= 3;
}

FaceSet CropRedetectStrategy::find(const cv::Mat& source, const std::vector<cv::Point2f>& source_polygon,
                                   const FaceSet* /*known_faces*/, DetectionContext ctx) {
    cv::Mat surface = pipeline_.render_detector_canvas(source);
    const SpaceTransform to_detector(source.size(), surface.size());
    cv::Mat mask = rasterize(to_detector.map(source_polygon), surface.size());

    FaceSet found = pipeline_.detect_surface(surface, source.size(), ctx, mask, pipeline_.strict_resolver());

    // Masking is done at detector resolution; confirm the center in Source space.
    FaceSet inside;
    for (const auto& f : found) {
        if (cv::pointPolygonTest(source_polygon, f.center(), false) >= 0) inside.push_back(f);
    }
    return inside;
}

FaceSet ClassifyStrategy::find(const cv::Mat& source, const std::vector<cv::Point2f>& source_polygon,
                               const FaceSet* known_faces, DetectionContext ctx) {
    FaceSet candidates = known_faces ? *known_faces : pipeline_.detect(source, ctx);
    cv::Mat mask = rasterize(source_polygon, source.size());

    FaceSet inside;
    for (const auto& f : candidates) {
        const cv::Point2f c = f.center();
        const int cx = std::min(std::max(static_cast<int>(std::floor(c.x)), 0), mask.cols - 1);
        const int cy = std::min(std::max(static_cast<int>(std::floor(c.y)), 0), mask.rows - 1);
        if (mask.at<uchar>(cy, cx) != 0) inside.push_back(f);
    }
    return inside;
}

std::unique_ptr<RegionStrategy> make_region_strategy(RegionStrategyKind kind, DetectionPipeline& pipeline) {
    if (kind == RegionStrategyKind::CLASSIFY) return std::make_unique<ClassifyStrategy>(pipeline);
    return std::make_unique<CropRedetectStrategy>(pipeline);
}

RegionMaskEngine::RegionMaskEngine(DetectionPipeline& pipeline, const DetectionConfig& cfg)
    : pipeline_(pipeline), cfg_(cfg), strategy_(make_region_strategy(cfg.region_strategy, pipeline)) {}

FaceSet RegionMaskEngine::faces_in_region(const cv::Mat& source, const SelectionPolygon& polygon,
                                          cv::Size display_size, const FaceSet* known_faces,
                                          DetectionContext ctx) {
    if (source.empty() || display_size.area() <= 0) return {};
    if (!is_valid_polygon(polygon, cfg_.close_tolerance_px)) {
        std::cerr << "[WARN] Ignoring selection with " << polygon.points.size()
                  << " point(s): not a closed polygon" << std::endl;
        return {};
    }

    const SpaceTransform to_source(display_size, source.size());
    const std::vector<cv::Point2f> source_polygon = to_source.map(open_vertices(polygon, cfg_.close_tolerance_px));

    const int64 t0 = cv::getTickCount();
    FaceSet found = apply_floor(strategy_->find(source, source_polygon, known_faces, ctx),
                                pipeline_.threshold_for(ctx));
    const double elapsed_ms = (cv::getTickCount() - t0) * 1000.0 / cv::getTickFrequency();
    std::cout << "[INFO] Region search (" << strategy_->name() << "): " << found.size() << " face(s) in "
              << cv::format("%.1f", elapsed_ms) << " ms" << std::endl;
    return found;
}

}  // namespace facemask
