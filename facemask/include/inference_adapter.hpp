#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>

#include "face_types.hpp"
#include "inference_service.hpp"
#include "work_queue.hpp"

namespace facemask {

// Serializes access to a FaceInferenceService. All detector calls run on one
// worker thread. A caller first waits, without a time limit, for the worker to
// pick its job up (an abandoned timed-out call may still be running), then
// gives the detector call itself the configured timeout.
class InferenceAdapter {
public:
    static std::shared_ptr<InferenceAdapter> create(std::unique_ptr<FaceInferenceService> service,
                                                    std::chrono::milliseconds timeout,
                                                    float fallback_epsilon = 0.05f);
    ~InferenceAdapter();

    InferenceAdapter(const InferenceAdapter&) = delete;
    InferenceAdapter& operator=(const InferenceAdapter&) = delete;

    // Starts the worker and loads the detector. Safe to call repeatedly.
    void initialize(float confidence_threshold);

    // Stops the worker. Waits for a detector call that is still running.
    void dispose();

    // Raw detections on `surface`, normalized to its size. A non-empty
    // `region_mask` (CV_8U, surface size) blacks out everything outside it first.
    std::vector<ScoredDetection> detect(const cv::Mat& surface, float confidence_threshold,
                                        const cv::Mat& region_mask = cv::Mat());

    bool busy() const { return busy_; }
    bool disposed() const { return disposed_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    InferenceAdapter(std::unique_ptr<FaceInferenceService> service,
                     std::chrono::milliseconds timeout, float fallback_epsilon);

    struct Job {
        cv::Mat surface;  // empty for a warm-up job
        float threshold{0.0f};
        std::shared_ptr<std::promise<void>> started;  // set when the worker picks the job up
        std::shared_ptr<std::promise<std::vector<RawDetection>>> result;
    };

    void start_locked();
    void run();
    std::vector<RawDetection> submit_locked(const cv::Mat& surface, float threshold);

    std::unique_ptr<FaceInferenceService> service_;
    std::chrono::milliseconds timeout_;
    float fallback_epsilon_;

    std::mutex call_mu_;  // one logical inference at a time
    WorkQueue<Job> queue_{4};
    std::thread worker_;
    bool started_{false};
    std::atomic<bool> busy_{false};
    std::atomic<bool> disposed_{false};
};

}  // namespace facemask
