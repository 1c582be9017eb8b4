#include "yunet_service.hpp"

#include <algorithm>
#include <iostream>
#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>

#include "errors.hpp"

namespace facemask {

YuNetService::YuNetService(const std::string& model_path, float nms_threshold, int top_k)
    : model_path_(model_path), nms_threshold_(nms_threshold), top_k_(top_k) {}

void YuNetService::initialize(float confidence_threshold) {
    score_threshold_ = confidence_threshold;
    if (yunet_) {
        yunet_->setScoreThreshold(score_threshold_);
        return;
    }

    try {
        yunet_ = cv::FaceDetectorYN::create(model_path_, "", cv::Size(320, 320),
                                            score_threshold_, nms_threshold_, top_k_,
                                            cv::dnn::DNN_BACKEND_OPENCV, cv::dnn::DNN_TARGET_CPU);
    } catch (const cv::Exception& e) {
        yunet_.release();
        throw InferenceFailure(std::string("YuNet create failed: ") + e.what());
    }
    if (!yunet_) throw InferenceFailure("YuNet not ready: " + model_path_);

    input_size_ = cv::Size(0, 0);
    std::cout << "[INFO] Loaded YuNet face model: " << model_path_
              << " (thr=" << score_threshold_ << "/" << nms_threshold_ << ")" << std::endl;
}

std::vector<RawDetection> YuNetService::parse(const cv::Mat& dets, cv::Size surface_size) {
    std::vector<RawDetection> out;
    if (dets.empty() || dets.cols < 15) return out;

    const float sw = static_cast<float>(surface_size.width);
    const float sh = static_cast<float>(surface_size.height);
    for (int i = 0; i < dets.rows; ++i) {
        const float x = dets.at<float>(i, 0);
        const float y = dets.at<float>(i, 1);
        const float w = dets.at<float>(i, 2);
        const float h = dets.at<float>(i, 3);
        if (w <= 0.0f || h <= 0.0f) continue;

        RawDetection d;
        d.box = NormalizedBox{(x + 0.5f * w) / sw, (y + 0.5f * h) / sh, w / sw, h / sh};
        d.score = dets.at<float>(i, 14);
        out.push_back(std::move(d));
    }
    return out;
}

std::vector<RawDetection> YuNetService::infer(const cv::Mat& surface) {
    if (!yunet_) throw InferenceFailure("YuNet used before initialize");
    if (surface.empty()) return {};

    cv::Mat bgr = surface;
    if (surface.channels() == 4) {
        cv::cvtColor(surface, bgr, cv::COLOR_BGRA2BGR);
    } else if (surface.channels() == 1) {
        cv::cvtColor(surface, bgr, cv::COLOR_GRAY2BGR);
    }

    cv::Mat dets;
    try {
        if (bgr.size() != input_size_) {
            yunet_->setInputSize(bgr.size());
            input_size_ = bgr.size();
        }
        yunet_->detect(bgr, dets);
    } catch (const cv::Exception& e) {
        throw InferenceFailure(std::string("YuNet detect failed: ") + e.what());
    }
    return parse(dets, bgr.size());
}

}  // namespace facemask
