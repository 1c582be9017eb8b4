#include "inference_adapter.hpp"

#include <iostream>
#include <string>
#include <opencv2/imgproc.hpp>

#include "confidence.hpp"
#include "errors.hpp"

namespace facemask {

std::shared_ptr<InferenceAdapter> InferenceAdapter::create(std::unique_ptr<FaceInferenceService> service,
                                                           std::chrono::milliseconds timeout,
                                                           float fallback_epsilon) {
    if (!service) throw InferenceFailure("inference adapter needs a detector service");
    return std::shared_ptr<InferenceAdapter>(new InferenceAdapter(std::move(service), timeout, fallback_epsilon));
}

InferenceAdapter::InferenceAdapter(std::unique_ptr<FaceInferenceService> service,
                                   std::chrono::milliseconds timeout, float fallback_epsilon)
    : service_(std::move(service)), timeout_(timeout), fallback_epsilon_(fallback_epsilon) {}

InferenceAdapter::~InferenceAdapter() {
    dispose();
}

void InferenceAdapter::start_locked() {
    if (started_) return;
    started_ = true;
    worker_ = std::thread(&InferenceAdapter::run, this);
}

void InferenceAdapter::initialize(float confidence_threshold) {
    std::lock_guard<std::mutex> lock(call_mu_);
    if (disposed_) throw InferenceFailure("inference adapter has been disposed");
    start_locked();
    // Warm-up job: loads the detector on the worker thread.
    submit_locked(cv::Mat(), confidence_threshold);
}

void InferenceAdapter::dispose() {
    std::lock_guard<std::mutex> lock(call_mu_);
    disposed_ = true;
    queue_.stop();
    if (worker_.joinable()) worker_.join();
}

void InferenceAdapter::run() {
    Job job;
    while (queue_.pop(job)) {
        job.started->set_value();
        try {
            service_->initialize(job.threshold);
            if (job.surface.empty()) {
                job.result->set_value(std::vector<RawDetection>());
            } else {
                job.result->set_value(service_->infer(job.surface));
            }
        } catch (...) {
            // Delivered to the waiting caller, or dropped if that caller timed out.
            job.result->set_exception(std::current_exception());
        }
        job = Job();
    }
}

std::vector<RawDetection> InferenceAdapter::submit_locked(const cv::Mat& surface, float threshold) {
    Job job;
    job.surface = surface;
    job.threshold = threshold;
    job.started = std::make_shared<std::promise<void>>();
    job.result = std::make_shared<std::promise<std::vector<RawDetection>>>();
    auto started = job.started->get_future();
    auto future = job.result->get_future();

    if (!queue_.try_push(std::move(job))) {
        throw InferenceFailure("face detector is unavailable (stopped or still busy with timed out calls)");
    }

    busy_ = true;
    started.wait();
    if (future.wait_for(timeout_) != std::future_status::ready) {
        busy_ = false;
        std::cerr << "[WARN] Face detector timed out after " << timeout_.count() << " ms" << std::endl;
        throw InferenceTimeout("face detector exceeded " + std::to_string(timeout_.count()) + " ms");
    }
    busy_ = false;

    try {
        return future.get();
    } catch (const InferenceError&) {
        throw;
    } catch (const std::exception& e) {
        throw InferenceFailure(std::string("face detector failed: ") + e.what());
    }
}

std::vector<ScoredDetection> InferenceAdapter::detect(const cv::Mat& surface, float confidence_threshold,
                                                      const cv::Mat& region_mask) {
    std::lock_guard<std::mutex> lock(call_mu_);
    if (disposed_) throw InferenceFailure("inference adapter has been disposed");
    start_locked();

    // The worker may keep using its copy after a timeout, so never hand it the caller's buffer.
    cv::Mat input;
    if (!region_mask.empty()) {
        cv::Mat mask = region_mask;
        if (mask.size() != surface.size()) {
            cv::resize(region_mask, mask, surface.size(), 0, 0, cv::INTER_NEAREST);
        }
        input = cv::Mat::zeros(surface.size(), surface.type());
        surface.copyTo(input, mask);
    } else {
        input = surface.clone();
    }

    const int64 t0 = cv::getTickCount();
    std::vector<RawDetection> raw = submit_locked(input, confidence_threshold);
    const double elapsed_ms = (cv::getTickCount() - t0) * 1000.0 / cv::getTickFrequency();

    std::vector<ScoredDetection> out;
    out.reserve(raw.size());
    int approximated = 0;
    for (const auto& d : raw) {
        ScoredDetection s = extract_confidence(d, confidence_threshold, fallback_epsilon_);
        if (!s.measured) approximated++;
        out.push_back(s);
    }

    std::cout << "[INFO] " << service_->name() << ": " << out.size() << " raw detections on "
              << surface.cols << "x" << surface.rows << " in " << cv::format("%.1f", elapsed_ms) << " ms"
              << std::endl;
    if (approximated > 0) {
        std::cerr << "[WARN] " << approximated << " detections carried no score; using threshold + "
                  << fallback_epsilon_ << std::endl;
    }
    return out;
}

}  // namespace facemask
