#include <gtest/gtest.h>

#include "coordinate_space.hpp"

using namespace facemask;

TEST(CoordinateSpaceTest, MapsPointsPerAxis) {
    SpaceTransform t(cv::Size(200, 100), cv::Size(100, 50));
    cv::Point2f p = t.map(cv::Point2f(50.0f, 20.0f));
    EXPECT_FLOAT_EQ(p.x, 25.0f);
    EXPECT_FLOAT_EQ(p.y, 10.0f);
}

TEST(CoordinateSpaceTest, SourceDetectorRoundTripWithinOnePixel) {
    CoordinateSpaces spaces;
    spaces.source = cv::Size(4000, 3000);
    spaces.detector = fit_detector_canvas(spaces.source, cv::Size(2560, 1440));
    spaces.display = fit_within_bounds(spaces.source, cv::Size(1920, 1080));

    const cv::Rect2f face(1234.5f, 987.0f, 321.0f, 402.0f);
    cv::Rect2f det = spaces.transform(Space::SOURCE, Space::DETECTOR).map(face);
    cv::Rect2f back = spaces.transform(Space::DETECTOR, Space::SOURCE).map(det);

    EXPECT_NEAR(back.x, face.x, 1.0f);
    EXPECT_NEAR(back.y, face.y, 1.0f);
    EXPECT_NEAR(back.width, face.width, 1.0f);
    EXPECT_NEAR(back.height, face.height, 1.0f);
}

TEST(CoordinateSpaceTest, CompositionMatchesDirectTransform) {
    CoordinateSpaces spaces{cv::Size(3000, 2000), cv::Size(2160, 1440), cv::Size(1620, 1080)};
    SpaceTransform chained = spaces.transform(Space::DISPLAY, Space::SOURCE)
                                 .then(spaces.transform(Space::SOURCE, Space::DETECTOR));
    SpaceTransform direct = spaces.transform(Space::DISPLAY, Space::DETECTOR);
    EXPECT_NEAR(chained.scale_x(), direct.scale_x(), 1e-5f);
    EXPECT_NEAR(chained.scale_y(), direct.scale_y(), 1e-5f);
}

TEST(CoordinateSpaceTest, FitNeverUpscales) {
    EXPECT_EQ(fit_within_bounds(cv::Size(640, 480), cv::Size(1920, 1080)), cv::Size(640, 480));
    EXPECT_EQ(fit_detector_canvas(cv::Size(640, 480), cv::Size(2560, 1440)), cv::Size(640, 480));
}

TEST(CoordinateSpaceTest, DetectorCanvasKeepsAspectAndFloors) {
    EXPECT_EQ(fit_detector_canvas(cv::Size(3000, 2000), cv::Size(2560, 1440)), cv::Size(2160, 1440));
    EXPECT_EQ(fit_within_bounds(cv::Size(3840, 2160), cv::Size(1920, 1080)), cv::Size(1920, 1080));
}

TEST(CoordinateSpaceTest, DegenerateSourceGivesZeroScale) {
    SpaceTransform t(cv::Size(0, 0), cv::Size(100, 100));
    EXPECT_EQ(t.scale_x(), 0.0f);
    EXPECT_EQ(t.scale_y(), 0.0f);
}

TEST(CoordinateSpaceTest, PixelRectIsClampedToBounds) {
    cv::Rect r = to_pixel_rect(cv::Rect2f(-5.2f, 10.4f, 30.0f, 200.0f), cv::Size(100, 100));
    EXPECT_EQ(r, cv::Rect(0, 10, 25, 90));
}
