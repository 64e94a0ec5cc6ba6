#include "OverlayRenderer.h"

#include <opencv2/imgproc.hpp>

#include "absl/strings/str_cat.h"

namespace {

const cv::Scalar kConnectionColor(224, 224, 224);
const cv::Scalar kLandmarkColor(0, 0, 255);
const cv::Scalar kTextColor(255, 255, 0);
constexpr int kLineThickness = 2;
constexpr int kLandmarkRadius = 2;

}  // namespace

OverlayLayout::OverlayLayout(OverlayLayoutMode mode)
    : layoutMode(mode), leftHands(0), rightHands(0) {}

void OverlayLayout::reset() {
    leftHands = 0;
    rightHands = 0;
}

cv::Point OverlayLayout::nextTextPosition(HandSide side) {
    int& seen = side == HandSide::kLeft ? leftHands : rightHands;
    const int base_y = side == HandSide::kLeft ? kLeftTextY : kRightTextY;
    const int offset = layoutMode == OverlayLayoutMode::kStacked ? seen * kStackStep : 0;
    ++seen;
    return cv::Point(kTextX, base_y + offset);
}

const std::vector<std::pair<int, int>>& HandConnections() {
    static const std::vector<std::pair<int, int>> connections = {
        {kWrist, kThumbCmc},     {kThumbCmc, kThumbMcp},   {kThumbMcp, kThumbIp},
        {kThumbIp, kThumbTip},   {kWrist, kIndexMcp},      {kIndexMcp, kIndexPip},
        {kIndexPip, kIndexDip},  {kIndexDip, kIndexTip},   {kIndexMcp, kMiddleMcp},
        {kMiddleMcp, kMiddlePip}, {kMiddlePip, kMiddleDip}, {kMiddleDip, kMiddleTip},
        {kMiddleMcp, kRingMcp},  {kRingMcp, kRingPip},     {kRingPip, kRingDip},
        {kRingDip, kRingTip},    {kRingMcp, kPinkyMcp},    {kWrist, kPinkyMcp},
        {kPinkyMcp, kPinkyPip},  {kPinkyPip, kPinkyDip},   {kPinkyDip, kPinkyTip},
    };
    return connections;
}

std::string FormatFingerCountLabel(HandSide side, int finger_count) {
    return absl::StrCat(HandSideName(side), " Hand Fingers: ", finger_count);
}

void DrawHandSkeleton(cv::Mat& frame, const HandLandmarks& landmarks) {
    if (landmarks.size() != static_cast<size_t>(kNumHandLandmarks)) {
        return;
    }
    for (const auto& connection : HandConnections()) {
        const Landmark& from = landmarks[connection.first];
        const Landmark& to = landmarks[connection.second];
        cv::line(frame, cv::Point(from.x, from.y), cv::Point(to.x, to.y),
                 kConnectionColor, kLineThickness);
    }
    for (const Landmark& lm : landmarks) {
        cv::circle(frame, cv::Point(lm.x, lm.y), kLandmarkRadius, kLandmarkColor,
                   kLineThickness);
    }
}

void DrawFingerCount(cv::Mat& frame, HandSide side, int finger_count, cv::Point anchor) {
    cv::putText(frame, FormatFingerCountLabel(side, finger_count), anchor,
                cv::FONT_HERSHEY_SIMPLEX, 1, kTextColor, 2);
}
