#pragma once

#include <string>
#include <vector>

#include "absl/status/status.h"

// MediaPipe hand landmark order.
constexpr int kWrist = 0;
constexpr int kThumbCmc = 1;
constexpr int kThumbMcp = 2;
constexpr int kThumbIp = 3;
constexpr int kThumbTip = 4;
constexpr int kIndexMcp = 5;
constexpr int kIndexPip = 6;
constexpr int kIndexDip = 7;
constexpr int kIndexTip = 8;
constexpr int kMiddleMcp = 9;
constexpr int kMiddlePip = 10;
constexpr int kMiddleDip = 11;
constexpr int kMiddleTip = 12;
constexpr int kRingMcp = 13;
constexpr int kRingPip = 14;
constexpr int kRingDip = 15;
constexpr int kRingTip = 16;
constexpr int kPinkyMcp = 17;
constexpr int kPinkyPip = 18;
constexpr int kPinkyDip = 19;
constexpr int kPinkyTip = 20;
constexpr int kNumHandLandmarks = 21;

// A landmark in frame pixel space. y grows downwards.
struct Landmark {
    int x = 0;
    int y = 0;
};

using HandLandmarks = std::vector<Landmark>;

enum class HandSide { kLeft, kRight };

// Returns InvalidArgument unless the list holds exactly kNumHandLandmarks
// points.
absl::Status ValidateHandLandmarks(const HandLandmarks& landmarks);

// Left when the wrist lies strictly left of frame_width / 2, Right otherwise.
HandSide LabelHandSide(const Landmark& wrist, int frame_width);

std::string HandSideName(HandSide side);
