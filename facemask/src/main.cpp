#include <chrono>
#include <iostream>
#include <memory>

#include <opencv2/opencv.hpp>

#include "config.hpp"
#include "errors.hpp"
#include "face_mask_session.hpp"
#include "inference_adapter.hpp"
#include "ultraface_service.hpp"
#include "yunet_service.hpp"

namespace {
std::unique_ptr<facemask::FaceInferenceService> make_service(const facemask::AppConfig& cfg) {
    if (cfg.backend == facemask::DetectorBackend::YUNET) {
        return std::make_unique<facemask::YuNetService>(cfg.model_path);
    }
    return std::make_unique<facemask::UltraFaceService>(cfg.model_path, cfg.use_ort);
}
}  // namespace

int main(int argc, char** argv) {
    facemask::AppConfig cfg = facemask::parse_args(argc, argv);
    if (cfg.image_path.empty()) {
        std::cerr << "[ERROR] --image is required (see --help)" << std::endl;
        return 2;
    }

    std::cout << "[INFO] Starting facemask\n";
    std::cout << "       image    : " << cfg.image_path << "\n";
    std::cout << "       model    : " << cfg.model_path << "\n";
    std::cout << "       transform: " << facemask::mask_transform_to_string(cfg.transform)
              << " (intensity " << cfg.intensity << ")\n";
    std::cout << "       ORT      : " << (cfg.use_ort ? "enabled" : "disabled (OpenCV DNN fallback)") << "\n";

    cv::Mat source = cv::imread(cfg.image_path, cv::IMREAD_COLOR);
    if (source.empty()) {
        std::cerr << "[ERROR] Could not read image: " << cfg.image_path << std::endl;
        return 1;
    }

    cv::Mat stamp;
    if (cfg.transform == facemask::MaskTransform::STAMP) {
        stamp = cv::imread(cfg.stamp_path, cv::IMREAD_UNCHANGED);
        if (stamp.empty()) std::cerr << "[WARN] Could not read stamp image: " << cfg.stamp_path << std::endl;
    }

    auto adapter = facemask::InferenceAdapter::create(
        make_service(cfg), std::chrono::milliseconds(cfg.detection.inference_timeout_ms),
        cfg.detection.fallback_confidence_epsilon);

    int rc = 0;
    try {
        adapter->initialize(cfg.detection.auto_confidence_threshold);

        facemask::FaceMaskSession session(adapter, cfg.detection);
        session.load_image(source);
        session.detect_all();

        if (!cfg.polygon.empty()) {
            session.detect_in_region(facemask::parse_polygon(cfg.polygon), cfg.region_mode);
        }

        cv::Mat canvas = session.render_display();
        if (cfg.highlight) {
            session.mask_applier().draw_highlights(canvas, session.source_size(), session.faces(), true);
        } else {
            session.apply_mask(canvas, session.faces(), cfg.transform, cfg.intensity, stamp);
        }

        if (!cv::imwrite(cfg.output_path, canvas)) {
            std::cerr << "[ERROR] Could not write " << cfg.output_path << std::endl;
            rc = 1;
        } else {
            std::cout << "[INFO] Wrote " << cfg.output_path << " with " << session.faces().size()
                      << " face(s) " << (cfg.highlight ? "highlighted" : "masked") << std::endl;
        }
    } catch (const facemask::InferenceError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        rc = 1;
    } catch (const cv::Exception& e) {
        std::cerr << "[ERROR] OpenCV: " << e.what() << std::endl;
        rc = 1;
    }

    adapter->dispose();
    std::cout << "[INFO] Stopped facemask\n";
    return rc;
}
