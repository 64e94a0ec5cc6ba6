#pragma once

#include <string>

#include "finger_counter.h"

// Trackbar positions run 0..kSliderMax and map to thresholds 0.00..1.00.
constexpr int kSliderMax = 100;

int ThresholdToSliderPosition(double threshold);
double SliderPositionToThreshold(int position);

// Connects one trackbar to one threshold. The configured threshold is kept
// until the trackbar leaves its starting position, so values the slider
// cannot show (above 1.0, finer than 0.01) survive the initial
// setTrackbarPos callback.
class SliderBinding {
public:
    explicit SliderBinding(double* threshold);

    int initialPosition() const { return startPosition; }
    // True when the configured threshold has no exact slider position.
    bool approximated() const;

    // Positions reported before arm() are ignored.
    void arm() { armed = true; }
    void onPosition(int position);

private:
    double* threshold;
    int startPosition;
    bool armed;
    bool moved;
};

// A HighGUI window with one trackbar per threshold. The trackbars write
// straight into the FingerThresholds they were created with. Callbacks fire
// from inside cv::waitKey, on the thread running the frame loop.
class ThresholdSliders {
public:
    static constexpr char kWindowName[] = "Threshold Sliders";
    static constexpr char kThumbIndexTrackbar[] = "Thumb-Index Threshold";
    static constexpr char kIndexMiddleTrackbar[] = "Index-Middle Threshold";

    explicit ThresholdSliders(FingerThresholds* thresholds);
    ~ThresholdSliders();

    ThresholdSliders(const ThresholdSliders&) = delete;
    ThresholdSliders& operator=(const ThresholdSliders&) = delete;

private:
    static void onThumbIndexChange(int value, void* userdata);
    static void onIndexMiddleChange(int value, void* userdata);

    SliderBinding thumbIndex;
    SliderBinding indexMiddle;
};
