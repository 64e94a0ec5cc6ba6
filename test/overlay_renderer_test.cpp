#include "app/OverlayRenderer.h"

#include <set>

#include <opencv2/core.hpp>

#include "gtest/gtest.h"

namespace {

TEST(OverlayLayoutTest, FixedModeReusesOneAnchorPerSide) {
    OverlayLayout layout(OverlayLayoutMode::kFixed);
    EXPECT_EQ(layout.nextTextPosition(HandSide::kLeft), cv::Point(10, 30));
    EXPECT_EQ(layout.nextTextPosition(HandSide::kRight), cv::Point(10, 60));
    EXPECT_EQ(layout.nextTextPosition(HandSide::kLeft), cv::Point(10, 30));
    EXPECT_EQ(layout.nextTextPosition(HandSide::kRight), cv::Point(10, 60));
}

TEST(OverlayLayoutTest, StackedModeMovesExtraHandsDown) {
    OverlayLayout layout(OverlayLayoutMode::kStacked);
    EXPECT_EQ(layout.nextTextPosition(HandSide::kLeft), cv::Point(10, 30));
    EXPECT_EQ(layout.nextTextPosition(HandSide::kLeft), cv::Point(10, 90));
    EXPECT_EQ(layout.nextTextPosition(HandSide::kRight), cv::Point(10, 60));
    EXPECT_EQ(layout.nextTextPosition(HandSide::kLeft), cv::Point(10, 150));
    EXPECT_EQ(layout.nextTextPosition(HandSide::kRight), cv::Point(10, 120));
}

TEST(OverlayLayoutTest, StackedAnchorsNeverCollide) {
    OverlayLayout layout(OverlayLayoutMode::kStacked);
    std::set<int> rows;
    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(rows.insert(layout.nextTextPosition(HandSide::kLeft).y).second);
        EXPECT_TRUE(rows.insert(layout.nextTextPosition(HandSide::kRight).y).second);
    }
}

TEST(OverlayLayoutTest, ResetStartsAFreshFrame) {
    OverlayLayout layout;
    layout.nextTextPosition(HandSide::kLeft);
    layout.nextTextPosition(HandSide::kRight);
    layout.nextTextPosition(HandSide::kRight);
    layout.reset();
    EXPECT_EQ(layout.nextTextPosition(HandSide::kLeft), cv::Point(10, 30));
    EXPECT_EQ(layout.nextTextPosition(HandSide::kRight), cv::Point(10, 60));
}

TEST(OverlayRendererTest, FormatsLabel) {
    EXPECT_EQ(FormatFingerCountLabel(HandSide::kLeft, 3), "Left Hand Fingers: 3");
    EXPECT_EQ(FormatFingerCountLabel(HandSide::kRight, 0), "Right Hand Fingers: 0");
}

TEST(OverlayRendererTest, ConnectionsCoverEveryLandmark) {
    const auto& connections = HandConnections();
    EXPECT_EQ(connections.size(), 21u);
    std::set<int> touched;
    for (const auto& connection : connections) {
        ASSERT_GE(connection.first, 0);
        ASSERT_LT(connection.second, kNumHandLandmarks);
        touched.insert(connection.first);
        touched.insert(connection.second);
    }
    EXPECT_EQ(touched.size(), static_cast<size_t>(kNumHandLandmarks));
}

TEST(OverlayRendererTest, DrawsSkeletonAndText) {
    cv::Mat frame = cv::Mat::zeros(240, 320, CV_8UC3);
    HandLandmarks hand(kNumHandLandmarks);
    for (int i = 0; i < kNumHandLandmarks; ++i) {
        hand[i] = {100 + 4 * i, 200 - 6 * i};
    }
    DrawHandSkeleton(frame, hand);
    EXPECT_GT(cv::countNonZero(frame.reshape(1)), 0);

    cv::Mat text_frame = cv::Mat::zeros(240, 320, CV_8UC3);
    DrawFingerCount(text_frame, HandSide::kLeft, 2, cv::Point(10, 30));
    EXPECT_GT(cv::countNonZero(text_frame.reshape(1)), 0);
}

TEST(OverlayRendererTest, SkipsMalformedHands) {
    cv::Mat frame = cv::Mat::zeros(120, 160, CV_8UC3);
    DrawHandSkeleton(frame, HandLandmarks(4, Landmark{50, 50}));
    EXPECT_EQ(cv::countNonZero(frame.reshape(1)), 0);
}

}  // namespace
