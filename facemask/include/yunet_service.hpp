#pragma once

#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>
#include <string>
#include <vector>

#include "inference_service.hpp"

namespace facemask {

// OpenCV FaceDetectorYN wrapper. Rows are [x, y, w, h, 10 landmark coords, score]
// in pixels of the surface it was run on.
class YuNetService : public FaceInferenceService {
public:
    explicit YuNetService(const std::string& model_path, float nms_threshold = 0.3f, int top_k = 5000);

    void initialize(float confidence_threshold) override;
    std::vector<RawDetection> infer(const cv::Mat& surface) override;
    std::string name() const override { return "yunet"; }

    // Converts detector rows to boxes normalized to `surface_size`.
    static std::vector<RawDetection> parse(const cv::Mat& dets, cv::Size surface_size);

private:
    std::string model_path_;
    float score_threshold_{0.4f};
    float nms_threshold_{0.3f};
    int top_k_{5000};
    cv::Ptr<cv::FaceDetectorYN> yunet_;
    cv::Size input_size_{0, 0};
};

}  // namespace facemask
