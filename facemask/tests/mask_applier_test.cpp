#include <gtest/gtest.h>

#include <cmath>

#include <opencv2/core.hpp>

#include "mask_applier.hpp"

using namespace facemask;

namespace {
cv::Mat noise_canvas(int w = 100, int h = 100) {
    cv::Mat m(h, w, CV_8UC3);
    cv::RNG rng(1234);
    rng.fill(m, cv::RNG::UNIFORM, 0, 256);
    return m;
}

bool same_pixels(const cv::Mat& a, const cv::Mat& b) {
    cv::Mat diff;
    cv::absdiff(a, b, diff);
    return cv::countNonZero(diff.reshape(1)) == 0;
}

// Everything outside `area` must be untouched.
bool outside_unchanged(const cv::Mat& before, const cv::Mat& after, const cv::Rect& area) {
    cv::Mat a = before.clone();
    cv::Mat b = after.clone();
    a(area).setTo(cv::Scalar::all(0));
    b(area).setTo(cv::Scalar::all(0));
    return same_pixels(a, b);
}
}  // namespace

TEST(MaskApplierTest, PixelationCellSize) {
    EXPECT_EQ(MaskApplier::pixelation_cell_size(10, 3), 2);
    EXPECT_EQ(MaskApplier::pixelation_cell_size(100, 1), 7);
    EXPECT_EQ(MaskApplier::pixelation_cell_size(100, 5), 13);
    EXPECT_EQ(MaskApplier::pixelation_cell_size(100, 9), 13);
    EXPECT_DOUBLE_EQ(MaskApplier::blur_sigma(3), 6.5);
}

TEST(MaskApplierTest, ExpandedRectScalesAddsMarginAndClamps) {
    MaskApplier applier(0.10f);
    EXPECT_EQ(applier.expanded_rect(FaceRegion{20, 20, 40, 40, 0.9f}, cv::Size(200, 200), cv::Size(100, 100)),
              cv::Rect(8, 8, 24, 24));
    EXPECT_EQ(applier.expanded_rect(FaceRegion{0, 0, 40, 40, 0.9f}, cv::Size(100, 100), cv::Size(100, 100)),
              cv::Rect(0, 0, 48, 48));
    EXPECT_TRUE(applier.expanded_rect(FaceRegion{10, 10, 1, 1, 0.9f}, cv::Size(200, 200), cv::Size(100, 100))
                    .empty());
}

TEST(MaskApplierTest, PixelateFlattensCellsInsideTheRegion) {
    MaskApplier applier(0.10f);
    cv::Mat canvas = noise_canvas();
    const cv::Mat before = canvas.clone();
    applier.apply(canvas, canvas.size(), {FaceRegion{20, 20, 40, 40, 0.9f}}, MaskTransform::PIXELATE, 3);

    const cv::Rect area(16, 16, 48, 48);
    EXPECT_TRUE(outside_unchanged(before, canvas, area));

    const int cell = MaskApplier::pixelation_cell_size(48, 3);
    cv::Mat first_cell = canvas(cv::Rect(area.x, area.y, cell, cell));
    const cv::Vec3b expected = first_cell.at<cv::Vec3b>(0, 0);
    for (int y = 0; y < cell; ++y) {
        for (int x = 0; x < cell; ++x) {
            EXPECT_EQ(first_cell.at<cv::Vec3b>(y, x), expected);
        }
    }

    const cv::Scalar mean = cv::mean(before(cv::Rect(area.x, area.y, cell, cell)));
    EXPECT_EQ(expected[0], static_cast<uchar>(std::floor(mean[0])));
}

TEST(MaskApplierTest, BlurSmoothsOnlyTheRegion) {
    MaskApplier applier(0.10f);
    cv::Mat canvas = noise_canvas();
    const cv::Mat before = canvas.clone();
    applier.apply(canvas, canvas.size(), {FaceRegion{20, 20, 40, 40, 0.9f}}, MaskTransform::BLUR, 3);

    const cv::Rect area(16, 16, 48, 48);
    EXPECT_TRUE(outside_unchanged(before, canvas, area));

    cv::Scalar mean_before, std_before, mean_after, std_after;
    cv::meanStdDev(before(area), mean_before, std_before);
    cv::meanStdDev(canvas(area), mean_after, std_after);
    EXPECT_LT(std_after[0], std_before[0] * 0.5);
}

TEST(MaskApplierTest, StampCoversTheFaceCenter) {
    MaskApplier applier(0.10f);
    cv::Mat canvas(100, 100, CV_8UC3, cv::Scalar(0, 0, 0));
    cv::Mat stamp(10, 10, CV_8UC3, cv::Scalar(0, 0, 255));
    applier.apply(canvas, canvas.size(), {FaceRegion{40, 40, 20, 20, 0.9f}}, MaskTransform::STAMP, 3, stamp);

    EXPECT_EQ(canvas.at<cv::Vec3b>(50, 50), cv::Vec3b(0, 0, 255));
    EXPECT_EQ(canvas.at<cv::Vec3b>(2, 2), cv::Vec3b(0, 0, 0));
}

TEST(MaskApplierTest, StampRespectsAlphaAndClipsAtTheBorder) {
    MaskApplier applier(0.10f);
    cv::Mat canvas(100, 100, CV_8UC3, cv::Scalar(10, 10, 10));
    cv::Mat transparent(10, 10, CV_8UC4, cv::Scalar(0, 0, 255, 0));
    applier.apply(canvas, canvas.size(), {FaceRegion{0, 0, 30, 30, 0.9f}}, MaskTransform::STAMP, 3, transparent);
    EXPECT_EQ(canvas.at<cv::Vec3b>(10, 10), cv::Vec3b(10, 10, 10));

    cv::Mat opaque(10, 10, CV_8UC4, cv::Scalar(255, 0, 0, 255));
    applier.apply(canvas, canvas.size(), {FaceRegion{0, 0, 30, 30, 0.9f}}, MaskTransform::STAMP, 3, opaque);
    EXPECT_EQ(canvas.at<cv::Vec3b>(0, 0), cv::Vec3b(255, 0, 0));
}

TEST(MaskApplierTest, MissingStampAndEmptyFacesLeaveCanvasAlone) {
    MaskApplier applier(0.10f);
    cv::Mat canvas = noise_canvas();
    const cv::Mat before = canvas.clone();

    applier.apply(canvas, canvas.size(), {FaceRegion{20, 20, 40, 40, 0.9f}}, MaskTransform::STAMP, 3);
    applier.apply(canvas, canvas.size(), {FaceRegion{20, 20, 0, 40, 0.9f}}, MaskTransform::PIXELATE, 3);
    applier.apply(canvas, canvas.size(), {FaceRegion{150, 150, 10, 10, 0.9f}}, MaskTransform::BLUR, 3);
    EXPECT_TRUE(same_pixels(before, canvas));
}

TEST(MaskApplierTest, HighlightsDrawOnTheFace) {
    MaskApplier applier;
    cv::Mat canvas(100, 100, CV_8UC3, cv::Scalar(0, 0, 0));
    applier.draw_highlights(canvas, canvas.size(), {FaceRegion{20, 20, 40, 40, 0.87f}}, true);
    EXPECT_NE(canvas.at<cv::Vec3b>(20, 20), cv::Vec3b(0, 0, 0));
    EXPECT_EQ(canvas.at<cv::Vec3b>(95, 95), cv::Vec3b(0, 0, 0));
}
