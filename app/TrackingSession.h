#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "finger_counter.h"
#include "FrameDisplay.h"
#include "hand_detector.h"
#include "hand_landmarks.h"
#include "OverlayRenderer.h"
#include "hal/frame_source.h"

struct SessionConfig {
    FingerThresholds thresholds;
    FingerCountOptions options;
    OverlayLayoutMode overlay_layout = OverlayLayoutMode::kStacked;
};

// One classified hand from one frame.
struct HandReport {
    HandSide side = HandSide::kRight;
    FingerState fingers;
    HandLandmarks landmarks;
    cv::Point text_position;
};

// Holds everything the frame loop touches: the camera, the detector, the
// display and the live classifier settings. The camera, detector and display
// are borrowed and must outlive the session.
class TrackingSession {
public:
    TrackingSession(FrameSource& camera, HandDetector& detector, FrameDisplay& display,
                    const SessionConfig& config);

    // Mirrors a BGR frame in place, runs detection and classification, and
    // draws the overlay onto it. Hands with malformed landmarks are skipped.
    absl::StatusOr<std::vector<HandReport>> processFrame(cv::Mat& frame);

    // Runs until the camera stops delivering frames or 'q' is pressed.
    // UnavailableError when the camera cannot be opened.
    absl::Status run();

    const FingerThresholds& thresholds() const { return currentThresholds; }
    void setThresholds(const FingerThresholds& thresholds) { currentThresholds = thresholds; }

    int framesProcessed() const { return frameCount; }

private:
    FrameSource& camera;
    HandDetector& detector;
    FrameDisplay& display;
    FingerThresholds currentThresholds;
    FingerCountOptions countOptions;
    OverlayLayout layout;
    int frameCount;
};
