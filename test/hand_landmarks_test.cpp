#include "app/hand_landmarks.h"

#include "gtest/gtest.h"

namespace {

TEST(HandSideTest, WristLeftOfMidpointIsLeft) {
    EXPECT_EQ(LabelHandSide({0, 100}, 640), HandSide::kLeft);
    EXPECT_EQ(LabelHandSide({319, 100}, 640), HandSide::kLeft);
}

TEST(HandSideTest, MidpointBelongsToRight) {
    EXPECT_EQ(LabelHandSide({320, 100}, 640), HandSide::kRight);
    EXPECT_EQ(LabelHandSide({639, 0}, 640), HandSide::kRight);
}

TEST(HandSideTest, OddWidthUsesIntegerHalf) {
    // 641 / 2 == 320
    EXPECT_EQ(LabelHandSide({319, 0}, 641), HandSide::kLeft);
    EXPECT_EQ(LabelHandSide({320, 0}, 641), HandSide::kRight);
}

TEST(HandSideTest, Names) {
    EXPECT_EQ(HandSideName(HandSide::kLeft), "Left");
    EXPECT_EQ(HandSideName(HandSide::kRight), "Right");
}

TEST(HandLandmarksTest, ValidateRequiresTwentyOnePoints) {
    EXPECT_TRUE(ValidateHandLandmarks(HandLandmarks(kNumHandLandmarks)).ok());
    EXPECT_EQ(ValidateHandLandmarks(HandLandmarks(5)).code(),
              absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(ValidateHandLandmarks(HandLandmarks(22)).code(),
              absl::StatusCode::kInvalidArgument);
}

}  // namespace
