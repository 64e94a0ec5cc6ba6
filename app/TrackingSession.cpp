#include "TrackingSession.h"

#include <utility>

#include <opencv2/imgproc.hpp>

#include "absl/cleanup/cleanup.h"
#include "absl/log/absl_log.h"

namespace {

constexpr int kQuitKey = 'q';

}  // namespace

TrackingSession::TrackingSession(FrameSource& camera, HandDetector& detector,
                                 FrameDisplay& display, const SessionConfig& config)
    : camera(camera),
      detector(detector),
      display(display),
      currentThresholds(config.thresholds),
      countOptions(config.options),
      layout(config.overlay_layout),
      frameCount(0) {}

absl::StatusOr<std::vector<HandReport>> TrackingSession::processFrame(cv::Mat& frame) {
    if (frame.empty()) {
        return absl::InvalidArgumentError("Cannot process an empty frame");
    }

    // Flip the frame horizontally for a mirrored view.
    cv::flip(frame, frame, /*flipcode=HORIZONTAL*/ 1);

    cv::Mat rgb_frame;
    cv::cvtColor(frame, rgb_frame, cv::COLOR_BGR2RGB);

    absl::StatusOr<std::vector<HandLandmarks>> hands = detector.detect(rgb_frame);
    if (!hands.ok()) {
        return hands.status();
    }

    layout.reset();
    ++frameCount;

    std::vector<HandReport> reports;
    for (HandLandmarks& landmarks : *hands) {
        absl::StatusOr<FingerState> fingers =
            ClassifyFingers(landmarks, currentThresholds, countOptions);
        if (!fingers.ok()) {
            ABSL_LOG_EVERY_N(WARNING, 30) << "Skipping hand: " << fingers.status().message();
            continue;
        }

        HandReport report;
        report.side = LabelHandSide(landmarks[kWrist], frame.cols);
        report.fingers = *fingers;
        report.text_position = layout.nextTextPosition(report.side);
        report.landmarks = std::move(landmarks);

        DrawHandSkeleton(frame, report.landmarks);
        DrawFingerCount(frame, report.side, report.fingers.num_fingers_held_up,
                        report.text_position);
        reports.push_back(std::move(report));
    }
    return reports;
}

absl::Status TrackingSession::run() {
    if (!camera.openCamera()) {
        return absl::UnavailableError("Could not open camera " + camera.describe());
    }

    // Release the display and the camera on every exit, including a
    // display that fails to open.
    absl::Cleanup release_resources = [this] {
        display.close();
        camera.closeCamera();
        ABSL_LOG(INFO) << "Processed " << frameCount << " frames.";
    };

    display.open(&currentThresholds);

    ABSL_LOG(INFO) << "Start grabbing and processing frames.";
    while (true) {
        cv::Mat frame;
        if (!camera.captureFrame(frame)) {
            ABSL_LOG(INFO) << "Camera returned no frame, stopping.";
            break;
        }

        absl::StatusOr<std::vector<HandReport>> reports = processFrame(frame);
        if (!reports.ok()) {
            return reports.status();
        }

        display.show(frame);
        const int pressed_key = display.pollKey();
        if ((pressed_key & 0xFF) == kQuitKey) {
            ABSL_LOG(INFO) << "Quit key pressed.";
            break;
        }
    }
    return absl::OkStatus();
}
