#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "hand_detector.h"
#include "mediapipe/framework/calculator_framework.h"
#include "mediapipe/framework/formats/landmark.pb.h"

// Truncates normalized coordinates to pixels of a width x height frame.
HandLandmarks ToPixelLandmarks(const mediapipe::NormalizedLandmarkList& landmark_list,
                               int width, int height);

// Runs a MediaPipe hand tracking graph, one frame at a time.
class MediaPipeHandDetector : public HandDetector {
public:
    static constexpr char kInputStream[] = "input_video";
    static constexpr char kOutputStream[] = "landmarks";

    // Reads a text-format CalculatorGraphConfig and starts the graph.
    static absl::StatusOr<std::unique_ptr<MediaPipeHandDetector>> create(
        const std::string& graph_config_path);

    ~MediaPipeHandDetector() override;

    absl::StatusOr<std::vector<HandLandmarks>> detect(const cv::Mat& rgb_frame) override;

private:
    MediaPipeHandDetector() = default;

    absl::Status start(const mediapipe::CalculatorGraphConfig& config);
    int64_t nextTimestampUs();

    mediapipe::CalculatorGraph graph;
    std::unique_ptr<mediapipe::OutputStreamPoller> poller;
    int64_t lastTimestampUs = -1;
    bool running = false;
};
