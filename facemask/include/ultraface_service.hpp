#pragma once

#include <opencv2/dnn.hpp>
#include <memory>
#include <string>
#include <vector>

#include "inference_service.hpp"

#ifdef USE_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

namespace facemask {

// UltraFace RFB-320 detector. Outputs "scores" [1,N,2] and "boxes" [1,N,4]
// with corner-form boxes already normalized to the input.
class UltraFaceService : public FaceInferenceService {
public:
    UltraFaceService(const std::string& model_path, bool use_onnxruntime);

    void initialize(float confidence_threshold) override;
    std::vector<RawDetection> infer(const cv::Mat& surface) override;
    std::string name() const override { return "ultraface"; }

    bool ready() const { return ready_; }

    // `scores` is [count, 2] (background, face), `boxes` is [count, 4] corner
    // form normalized to the input. Keeps faces scoring at least `threshold`.
    static std::vector<RawDetection> decode(const float* scores, const float* boxes, int count, float threshold);

private:
    void load_model();
    cv::Mat make_blob(const cv::Mat& surface) const;

#ifdef USE_ONNXRUNTIME
    std::vector<RawDetection> run_ort(const cv::Mat& surface);
#endif
    std::vector<RawDetection> run_opencv(const cv::Mat& surface);

    std::string model_path_;
    cv::dnn::Net net_;
    float conf_threshold_{0.4f};
    bool load_attempted_{false};
    bool ready_{false};
    bool use_ort_{false};

    static constexpr int kInputWidth = 320;
    static constexpr int kInputHeight = 240;

#ifdef USE_ONNXRUNTIME
    Ort::Env env_{ORT_LOGGING_LEVEL_WARNING, "facemask"};
    std::unique_ptr<Ort::Session> session_;
    Ort::MemoryInfo mem_info_{Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU)};
    std::vector<std::string> input_name_strs_;
    std::vector<const char*> input_names_;
    std::vector<std::string> output_name_strs_;
    std::vector<const char*> output_names_;
#endif
};

}  // namespace facemask
