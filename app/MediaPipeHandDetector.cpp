#include "MediaPipeHandDetector.h"

#include <utility>

#include "absl/log/absl_log.h"
#include "absl/memory/memory.h"
#include "mediapipe/framework/formats/image_frame.h"
#include "mediapipe/framework/formats/image_frame_opencv.h"
#include "mediapipe/framework/port/file_helpers.h"
#include "mediapipe/framework/port/opencv_core_inc.h"
#include "mediapipe/framework/port/parse_text_proto.h"
#include "mediapipe/framework/port/ret_check.h"
#include "mediapipe/framework/port/status.h"

HandLandmarks ToPixelLandmarks(const mediapipe::NormalizedLandmarkList& landmark_list,
                               int width, int height) {
    HandLandmarks landmarks;
    landmarks.reserve(landmark_list.landmark_size());
    for (int i = 0; i < landmark_list.landmark_size(); ++i) {
        const mediapipe::NormalizedLandmark& landmark = landmark_list.landmark(i);
        Landmark lm;
        lm.x = static_cast<int>(landmark.x() * width);
        lm.y = static_cast<int>(landmark.y() * height);
        landmarks.push_back(lm);
    }
    return landmarks;
}

absl::StatusOr<std::unique_ptr<MediaPipeHandDetector>> MediaPipeHandDetector::create(
    const std::string& graph_config_path) {
    std::string calculator_graph_config_contents;
    MP_RETURN_IF_ERROR(mediapipe::file::GetContents(
        graph_config_path, &calculator_graph_config_contents));
    ABSL_LOG(INFO) << "Get calculator graph config contents: "
                   << calculator_graph_config_contents;

    mediapipe::CalculatorGraphConfig config;
    RET_CHECK(mediapipe::ParseTextProto<mediapipe::CalculatorGraphConfig>(
        calculator_graph_config_contents, &config))
        << "Cannot parse calculator graph config " << graph_config_path;

    auto detector = absl::WrapUnique(new MediaPipeHandDetector());
    MP_RETURN_IF_ERROR(detector->start(config));
    return detector;
}

absl::Status MediaPipeHandDetector::start(const mediapipe::CalculatorGraphConfig& config) {
    ABSL_LOG(INFO) << "Initialize the calculator graph.";
    MP_RETURN_IF_ERROR(graph.Initialize(config));

    MP_ASSIGN_OR_RETURN(mediapipe::OutputStreamPoller landmark_poller,
                        graph.AddOutputStreamPoller(kOutputStream));
    poller = std::make_unique<mediapipe::OutputStreamPoller>(std::move(landmark_poller));

    ABSL_LOG(INFO) << "Start running the calculator graph.";
    MP_RETURN_IF_ERROR(graph.StartRun({}));
    running = true;
    return absl::OkStatus();
}

MediaPipeHandDetector::~MediaPipeHandDetector() {
    if (!running) {
        return;
    }
    ABSL_LOG(INFO) << "Shutting down the calculator graph.";
    absl::Status status = graph.CloseInputStream(kInputStream);
    if (status.ok()) {
        status = graph.WaitUntilDone();
    }
    if (!status.ok()) {
        ABSL_LOG(WARNING) << "Graph shutdown failed: " << status.message();
    }
}

int64_t MediaPipeHandDetector::nextTimestampUs() {
    int64_t timestamp_us = static_cast<int64_t>(
        (double)cv::getTickCount() / (double)cv::getTickFrequency() * 1e6);
    // Graph timestamps must strictly increase.
    if (timestamp_us <= lastTimestampUs) {
        timestamp_us = lastTimestampUs + 1;
    }
    lastTimestampUs = timestamp_us;
    return timestamp_us;
}

absl::StatusOr<std::vector<HandLandmarks>> MediaPipeHandDetector::detect(
    const cv::Mat& rgb_frame) {
    RET_CHECK(running) << "Hand tracking graph is not running";
    RET_CHECK(!rgb_frame.empty()) << "Empty frame";
    RET_CHECK_EQ(rgb_frame.type(), CV_8UC3) << "Expected an 8-bit RGB frame";

    // Wrap Mat into an ImageFrame.
    auto input_frame = absl::make_unique<mediapipe::ImageFrame>(
        mediapipe::ImageFormat::SRGB, rgb_frame.cols, rgb_frame.rows,
        mediapipe::ImageFrame::kDefaultAlignmentBoundary);
    cv::Mat input_frame_mat = mediapipe::formats::MatView(input_frame.get());
    rgb_frame.copyTo(input_frame_mat);

    MP_RETURN_IF_ERROR(graph.AddPacketToInputStream(
        kInputStream, mediapipe::Adopt(input_frame.release())
                          .At(mediapipe::Timestamp(nextTimestampUs()))));
    // No packet is emitted on the landmark stream for frames without a hand,
    // so wait for the graph to settle instead of blocking on the poller.
    MP_RETURN_IF_ERROR(graph.WaitUntilIdle());

    std::vector<HandLandmarks> hands;
    if (poller->QueueSize() == 0) {
        ABSL_LOG_EVERY_N(INFO, 30) << "No hand landmarks in frame.";
        return hands;
    }

    mediapipe::Packet detection_packet;
    RET_CHECK(poller->Next(&detection_packet)) << "Landmark stream closed";

    const auto& output_landmarks =
        detection_packet.Get<std::vector<mediapipe::NormalizedLandmarkList>>();
    hands.reserve(output_landmarks.size());
    for (const mediapipe::NormalizedLandmarkList& landmark_list : output_landmarks) {
        hands.push_back(ToPixelLandmarks(landmark_list, rgb_frame.cols, rgb_frame.rows));
    }
    return hands;
}
