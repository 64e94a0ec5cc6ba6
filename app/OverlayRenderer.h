#pragma once

#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>

#include "hand_landmarks.h"

// Where per-hand text goes.
//   kFixed   - one anchor per side. A second hand on the same side overwrites.
//   kStacked - every extra hand on a side moves down by kStackStep pixels.
enum class OverlayLayoutMode { kFixed, kStacked };

class OverlayLayout {
public:
    static constexpr int kTextX = 10;
    static constexpr int kLeftTextY = 30;
    static constexpr int kRightTextY = 60;
    static constexpr int kStackStep = 60;

    explicit OverlayLayout(OverlayLayoutMode mode = OverlayLayoutMode::kStacked);

    // Call at the start of every frame.
    void reset();

    cv::Point nextTextPosition(HandSide side);

private:
    OverlayLayoutMode layoutMode;
    int leftHands;
    int rightHands;
};

// The 21 landmark pairs drawn as the hand skeleton.
const std::vector<std::pair<int, int>>& HandConnections();

std::string FormatFingerCountLabel(HandSide side, int finger_count);

void DrawHandSkeleton(cv::Mat& frame, const HandLandmarks& landmarks);
void DrawFingerCount(cv::Mat& frame, HandSide side, int finger_count, cv::Point anchor);
