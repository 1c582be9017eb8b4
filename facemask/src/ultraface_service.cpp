#include "ultraface_service.hpp"

#include <algorithm>
#include <iostream>
#include <opencv2/imgproc.hpp>

#include "errors.hpp"

namespace facemask {

#ifdef USE_ONNXRUNTIME
namespace {
int find_output(const std::vector<std::string>& names, const std::string& wanted, int fallback) {
    for (size_t i = 0; i < names.size(); ++i) {
        if (names[i] == wanted) return static_cast<int>(i);
    }
    return fallback;
}
}  // namespace
#endif

UltraFaceService::UltraFaceService(const std::string& model_path, bool use_onnxruntime)
    : model_path_(model_path), use_ort_(use_onnxruntime) {}

void UltraFaceService::initialize(float confidence_threshold) {
    conf_threshold_ = confidence_threshold;
    if (!load_attempted_) {
        load_attempted_ = true;
        load_model();
    }
    if (!ready_) {
        throw InferenceFailure("UltraFace model is not loaded: " + model_path_);
    }
}

void UltraFaceService::load_model() {
#ifdef USE_ONNXRUNTIME
    if (use_ort_) {
        try {
            Ort::SessionOptions opts;
            opts.SetGraphOptimizationLevel(ORT_ENABLE_ALL);
            opts.SetIntraOpNumThreads(1);
            session_ = std::make_unique<Ort::Session>(env_, model_path_.c_str(), opts);

            Ort::AllocatorWithDefaultOptions allocator;
            const size_t in_count = session_->GetInputCount();
            for (size_t i = 0; i < in_count; ++i) {
                auto name = session_->GetInputNameAllocated(i, allocator);
                input_name_strs_.push_back(name.get());
            }
            const size_t out_count = session_->GetOutputCount();
            for (size_t i = 0; i < out_count; ++i) {
                auto name = session_->GetOutputNameAllocated(i, allocator);
                output_name_strs_.push_back(name.get());
            }
            for (const auto& s : input_name_strs_) input_names_.push_back(s.c_str());
            for (const auto& s : output_name_strs_) output_names_.push_back(s.c_str());

            ready_ = true;
            std::cout << "[INFO] Loaded ORT face model: " << model_path_ << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[WARN] ONNX Runtime load failed (" << e.what() << "); falling back to OpenCV DNN." << std::endl;
            use_ort_ = false;
        }
    }
#else
    use_ort_ = false;
#endif

    if (!use_ort_) {
        try {
            net_ = cv::dnn::readNet(model_path_);
            net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
            net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
            ready_ = !net_.empty();
            if (ready_) std::cout << "[INFO] Loaded OpenCV DNN face model: " << model_path_ << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] Could not load face model: " << e.what() << std::endl;
            ready_ = false;
        }
    }
}

std::vector<RawDetection> UltraFaceService::infer(const cv::Mat& surface) {
    if (!ready_) throw InferenceFailure("UltraFace model is not loaded: " + model_path_);
    if (surface.empty()) return {};
    try {
#ifdef USE_ONNXRUNTIME
        if (use_ort_ && session_) {
            return run_ort(surface);
        }
#endif
        return run_opencv(surface);
    } catch (const cv::Exception& e) {
        throw InferenceFailure(std::string("UltraFace inference failed: ") + e.what());
    }
}

cv::Mat UltraFaceService::make_blob(const cv::Mat& surface) const {
    cv::Mat bgr = surface;
    if (surface.channels() == 4) {
        cv::cvtColor(surface, bgr, cv::COLOR_BGRA2BGR);
    } else if (surface.channels() == 1) {
        cv::cvtColor(surface, bgr, cv::COLOR_GRAY2BGR);
    }
    // RGB, (pixel - 127) / 128, NCHW
    return cv::dnn::blobFromImage(bgr, 1.0 / 128.0, cv::Size(kInputWidth, kInputHeight),
                                  cv::Scalar(127, 127, 127), true, false);
}

std::vector<RawDetection> UltraFaceService::decode(const float* scores, const float* boxes, int count,
                                                   float threshold) {
    std::vector<RawDetection> out;
    for (int i = 0; i < count; ++i) {
        const float face = scores[i * 2 + 1];
        if (face < threshold) continue;

        const float x1 = std::clamp(boxes[i * 4 + 0], 0.0f, 1.0f);
        const float y1 = std::clamp(boxes[i * 4 + 1], 0.0f, 1.0f);
        const float x2 = std::clamp(boxes[i * 4 + 2], 0.0f, 1.0f);
        const float y2 = std::clamp(boxes[i * 4 + 3], 0.0f, 1.0f);
        const float w = x2 - x1;
        const float h = y2 - y1;
        if (w <= 0.0f || h <= 0.0f) continue;

        RawDetection d;
        d.box = NormalizedBox{x1 + 0.5f * w, y1 + 0.5f * h, w, h};
        d.score_data.push_back(face);
        out.push_back(std::move(d));
    }
    return out;
}

#ifdef USE_ONNXRUNTIME
std::vector<RawDetection> UltraFaceService::run_ort(const cv::Mat& surface) {
    cv::Mat blob = make_blob(surface);
    std::vector<int64_t> input_shape{1, 3, kInputHeight, kInputWidth};
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(mem_info_, blob.ptr<float>(), blob.total(),
                                                              input_shape.data(), input_shape.size());
    std::vector<Ort::Value> outputs;
    try {
        outputs = session_->Run(Ort::RunOptions{nullptr},
                                input_names_.data(), &input_tensor, 1,
                                output_names_.data(), output_names_.size());
    } catch (const Ort::Exception& e) {
        throw InferenceFailure(std::string("ONNX Runtime run failed: ") + e.what());
    }
    if (outputs.size() < 2) return {};

    const int si = find_output(output_name_strs_, "scores", 0);
    const int bi = find_output(output_name_strs_, "boxes", 1);
    auto shape = outputs[si].GetTensorTypeAndShapeInfo().GetShape();
    if (shape.size() != 3 || shape[2] != 2) return {};

    const int count = static_cast<int>(shape[1]);
    return decode(outputs[si].GetTensorData<float>(), outputs[bi].GetTensorData<float>(), count, conf_threshold_);
}
#endif

std::vector<RawDetection> UltraFaceService::run_opencv(const cv::Mat& surface) {
    net_.setInput(make_blob(surface));

    std::vector<cv::Mat> outs;
    std::vector<cv::String> names{"scores", "boxes"};
    net_.forward(outs, names);
    if (outs.size() < 2 || outs[0].dims != 3 || outs[0].size[2] != 2) return {};

    const int count = outs[0].size[1];
    return decode(outs[0].ptr<float>(), outs[1].ptr<float>(), count, conf_threshold_);
}

}  // namespace facemask
