#include "app/ThresholdSliders.h"

#include <limits>

#include "gtest/gtest.h"

namespace {

TEST(ThresholdSlidersTest, DefaultThresholdStartsAtTen) {
    EXPECT_EQ(ThresholdToSliderPosition(0.1), 10);
    EXPECT_EQ(ThresholdToSliderPosition(0.29), 29);
}

TEST(ThresholdSlidersTest, PositionsMapToHundredths) {
    EXPECT_DOUBLE_EQ(SliderPositionToThreshold(0), 0.0);
    EXPECT_DOUBLE_EQ(SliderPositionToThreshold(37), 0.37);
    EXPECT_DOUBLE_EQ(SliderPositionToThreshold(kSliderMax), 1.0);
}

TEST(ThresholdSlidersTest, EveryPositionSurvivesConversion) {
    for (int position = 0; position <= kSliderMax; ++position) {
        EXPECT_EQ(ThresholdToSliderPosition(SliderPositionToThreshold(position)), position);
    }
}

TEST(ThresholdSlidersTest, OutOfRangeValuesAreClamped) {
    EXPECT_EQ(ThresholdToSliderPosition(-0.4), 0);
    EXPECT_EQ(ThresholdToSliderPosition(12.0), kSliderMax);
    EXPECT_EQ(ThresholdToSliderPosition(std::numeric_limits<double>::quiet_NaN()), 0);
    EXPECT_DOUBLE_EQ(SliderPositionToThreshold(-3), 0.0);
    EXPECT_DOUBLE_EQ(SliderPositionToThreshold(250), 1.0);
}

TEST(SliderBindingTest, InitialPositionKeepsAConfiguredPixelThreshold) {
    FingerThresholds thresholds{15.0, 0.125};
    SliderBinding thumb_index(&thresholds.thumb_index);
    SliderBinding index_middle(&thresholds.index_middle);
    EXPECT_EQ(thumb_index.initialPosition(), kSliderMax);
    EXPECT_TRUE(thumb_index.approximated());
    EXPECT_TRUE(index_middle.approximated());

    thumb_index.arm();
    index_middle.arm();
    // setTrackbarPos reports the starting position back through the callback.
    thumb_index.onPosition(thumb_index.initialPosition());
    index_middle.onPosition(index_middle.initialPosition());
    EXPECT_DOUBLE_EQ(thresholds.thumb_index, 15.0);
    EXPECT_DOUBLE_EQ(thresholds.index_middle, 0.125);
}

TEST(SliderBindingTest, PositionsBeforeArmAreIgnored) {
    double threshold = 0.1;
    SliderBinding binding(&threshold);
    binding.onPosition(0);
    binding.onPosition(55);
    EXPECT_DOUBLE_EQ(threshold, 0.1);
}

TEST(SliderBindingTest, MovingTheSliderTakesOver) {
    double threshold = 15.0;
    SliderBinding binding(&threshold);
    binding.arm();
    binding.onPosition(40);
    EXPECT_DOUBLE_EQ(threshold, 0.4);
    // Once moved, returning to the start position applies it too.
    binding.onPosition(kSliderMax);
    EXPECT_DOUBLE_EQ(threshold, 1.0);
}

TEST(SliderBindingTest, ExactThresholdsAreNotApproximated) {
    double threshold = 0.1;
    SliderBinding binding(&threshold);
    EXPECT_EQ(binding.initialPosition(), 10);
    EXPECT_FALSE(binding.approximated());
}

}  // namespace
