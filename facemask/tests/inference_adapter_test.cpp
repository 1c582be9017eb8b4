#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include <opencv2/core.hpp>

#include "errors.hpp"
#include "fake_inference_service.hpp"
#include "inference_adapter.hpp"
#include "work_queue.hpp"

using namespace facemask;
using namespace std::chrono_literals;
using fakes::FakeScript;
using fakes::make_fake_adapter;
using fakes::scored_box;

namespace {
cv::Mat gray_surface(int w = 100, int h = 100) {
    return cv::Mat(h, w, CV_8UC3, cv::Scalar(128, 128, 128));
}
}  // namespace

TEST(WorkQueueTest, TryPushFailsWhenFullOrStopped) {
    WorkQueue<int> q(2);
    EXPECT_TRUE(q.try_push(1));
    EXPECT_TRUE(q.try_push(2));
    EXPECT_FALSE(q.try_push(3));

    int v = 0;
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, 1);

    q.stop();
    EXPECT_FALSE(q.push(4));
    ASSERT_TRUE(q.pop(v));  // queued items drain after stop
    EXPECT_EQ(v, 2);
    EXPECT_FALSE(q.pop(v));
}

TEST(InferenceAdapterTest, RejectsMissingService) {
    EXPECT_THROW(InferenceAdapter::create(nullptr, 100ms), InferenceFailure);
}

TEST(InferenceAdapterTest, InitializeLoadsWithoutInferring) {
    auto script = std::make_shared<FakeScript>();
    auto adapter = make_fake_adapter(script);
    adapter->initialize(0.4f);

    std::lock_guard<std::mutex> lock(script->mu);
    EXPECT_GE(script->init_calls, 1);
    EXPECT_EQ(script->infer_calls, 0);
    EXPECT_FLOAT_EQ(script->last_threshold, 0.4f);
}

TEST(InferenceAdapterTest, ReturnsScoredDetections) {
    auto script = std::make_shared<FakeScript>();
    script->detections = {scored_box(0.5f, 0.5f, 0.2f, 0.2f, 0.83f)};
    auto adapter = make_fake_adapter(script);

    auto dets = adapter->detect(gray_surface(), 0.4f);
    ASSERT_EQ(dets.size(), 1u);
    EXPECT_FLOAT_EQ(dets[0].confidence, 0.83f);
    EXPECT_TRUE(dets[0].measured);
    EXPECT_FALSE(adapter->busy());
}

TEST(InferenceAdapterTest, UnscoredDetectionsGetFallbackConfidence) {
    auto script = std::make_shared<FakeScript>();
    RawDetection bare;
    bare.box = NormalizedBox{0.5f, 0.5f, 0.2f, 0.2f};
    script->detections = {bare};
    auto adapter = make_fake_adapter(script);

    auto dets = adapter->detect(gray_surface(), 0.25f);
    ASSERT_EQ(dets.size(), 1u);
    EXPECT_NEAR(dets[0].confidence, 0.30f, 1e-6f);
    EXPECT_FALSE(dets[0].measured);
}

TEST(InferenceAdapterTest, RegionMaskBlanksSurfaceOutsideSelection) {
    auto script = std::make_shared<FakeScript>();
    script->detections = {scored_box(0.25f, 0.5f, 0.2f, 0.2f, 0.9f), scored_box(0.75f, 0.5f, 0.2f, 0.2f, 0.9f)};
    auto adapter = make_fake_adapter(script);

    cv::Mat mask = cv::Mat::zeros(100, 100, CV_8UC1);
    mask(cv::Rect(0, 0, 50, 100)).setTo(255);
    auto dets = adapter->detect(gray_surface(), 0.4f, mask);
    ASSERT_EQ(dets.size(), 1u);
    EXPECT_FLOAT_EQ(dets[0].box.x_center, 0.25f);
}

TEST(InferenceAdapterTest, TimeoutClearsBusyAndAdapterRecovers) {
    auto script = std::make_shared<FakeScript>();
    script->delay = 400ms;
    script->detections = {scored_box(0.5f, 0.5f, 0.2f, 0.2f, 0.9f)};
    auto adapter = make_fake_adapter(script, 100ms);

    EXPECT_THROW(adapter->detect(gray_surface(), 0.4f), InferenceTimeout);
    EXPECT_FALSE(adapter->busy());

    {
        std::lock_guard<std::mutex> lock(script->mu);
        script->delay = 0ms;
    }

    // The abandoned call is still running; waiting for it must not eat this call's budget.
    std::vector<ScoredDetection> dets;
    EXPECT_NO_THROW(dets = adapter->detect(gray_surface(), 0.4f));
    EXPECT_EQ(dets.size(), 1u);
    EXPECT_FALSE(adapter->busy());
}

TEST(InferenceAdapterTest, RepeatedCallsAfterTimeoutDoNotFillTheQueue) {
    auto script = std::make_shared<FakeScript>();
    script->delay = 300ms;
    auto adapter = make_fake_adapter(script, 50ms);

    EXPECT_THROW(adapter->detect(gray_surface(), 0.4f), InferenceTimeout);
    {
        std::lock_guard<std::mutex> lock(script->mu);
        script->delay = 0ms;
    }
    for (int i = 0; i < 6; ++i) {
        EXPECT_NO_THROW(adapter->detect(gray_surface(), 0.4f));
    }
    std::lock_guard<std::mutex> lock(script->mu);
    EXPECT_EQ(script->infer_calls, 7);
}

TEST(InferenceAdapterTest, DetectorExceptionBecomesInferenceFailure) {
    auto script = std::make_shared<FakeScript>();
    script->fail = true;
    auto adapter = make_fake_adapter(script);

    EXPECT_THROW(adapter->detect(gray_surface(), 0.4f), InferenceFailure);
    EXPECT_FALSE(adapter->busy());

    {
        std::lock_guard<std::mutex> lock(script->mu);
        script->fail = false;
    }
    EXPECT_NO_THROW(adapter->detect(gray_surface(), 0.4f));
}

TEST(InferenceAdapterTest, ConcurrentCallersAreSerialized) {
    auto script = std::make_shared<FakeScript>();
    script->delay = 50ms;
    script->detections = {scored_box(0.5f, 0.5f, 0.2f, 0.2f, 0.9f)};
    auto adapter = make_fake_adapter(script);

    std::size_t first = 0;
    std::size_t second = 0;
    std::thread a([&] { first = adapter->detect(gray_surface(), 0.4f).size(); });
    std::thread b([&] { second = adapter->detect(gray_surface(80, 60), 0.4f).size(); });
    a.join();
    b.join();

    EXPECT_EQ(first, 1u);
    EXPECT_EQ(second, 1u);
    std::lock_guard<std::mutex> lock(script->mu);
    EXPECT_EQ(script->infer_calls, 2);
    EXPECT_EQ(script->max_active, 1);
}

TEST(InferenceAdapterTest, DisposedAdapterRefusesWork) {
    auto script = std::make_shared<FakeScript>();
    auto adapter = make_fake_adapter(script);
    adapter->initialize(0.4f);
    adapter->dispose();

    EXPECT_TRUE(adapter->disposed());
    EXPECT_THROW(adapter->detect(gray_surface(), 0.4f), InferenceFailure);
    EXPECT_THROW(adapter->initialize(0.4f), InferenceFailure);
    EXPECT_NO_THROW(adapter->dispose());
}
