#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "absl/status/statusor.h"
#include "hand_landmarks.h"

// Produces per-hand landmark lists for one RGB frame. Landmarks are in the
// pixel space of that frame. An empty result means no hand was found.
class HandDetector {
public:
    virtual ~HandDetector() = default;

    virtual absl::StatusOr<std::vector<HandLandmarks>> detect(const cv::Mat& rgb_frame) = 0;
};
