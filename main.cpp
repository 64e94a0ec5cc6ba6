// Webcam finger counter. Mirrors the camera feed, runs MediaPipe hand
// tracking on it and shows how many fingers each hand holds up.
#include <cstdlib>
#include <memory>
#include <string>

#include "absl/flags/commandlineflag.h"
#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/absl_log.h"
#include "absl/log/initialize.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "app/classifier_settings.h"
#include "app/FrameDisplay.h"
#include "app/MediaPipeHandDetector.h"
#include "app/TrackingSession.h"
#include "hal/camera_hal.h"

ABSL_FLAG(std::string, calculator_graph_config_file, "graphs/hand_tracking_cpu.pbtxt",
          "Name of file containing text format CalculatorGraphConfig proto.");
ABSL_FLAG(int, camera_index, 0, "Index of the camera to open.");
ABSL_FLAG(std::string, camera_device, "",
          "V4L2 device path such as /dev/video3. Overrides --camera_index.");
ABSL_FLAG(bool, threshold_sliders, true,
          "Show a \"Threshold Sliders\" window to tune the fist thresholds live.");
ABSL_FLAG(double, thumb_index_threshold, 0.1,
          "Thumb-index tip distance (pixels) under which the hand may be a fist.");
ABSL_FLAG(double, index_middle_threshold, 0.1,
          "Index-middle tip distance (pixels) under which the hand may be a fist.");
ABSL_FLAG(std::string, little_finger_rule, "always_up",
          "always_up: the little finger always counts. "
          "tip_above_base: it counts when its tip is above its base joint.");
ABSL_FLAG(bool, fist_shortcut, true,
          "Report 0 fingers when both tip distances are under their thresholds.");
ABSL_FLAG(std::string, overlay_layout, "stacked",
          "fixed: one text line per side. stacked: one line per hand.");
ABSL_FLAG(std::string, settings_file, "",
          "Optional JSON settings file. Flags given on the command line win.");
ABSL_FLAG(bool, save_settings, false,
          "Write the final thresholds back to --settings_file on exit.");

namespace {

template <typename T>
bool FlagWasSet(const absl::Flag<T>& flag) {
    return absl::GetFlagReflectionHandle(flag).IsSpecifiedOnCommandLine();
}

absl::StatusOr<ClassifierSettings> ResolveSettings() {
    ClassifierSettings settings;
    settings.thresholds.thumb_index = absl::GetFlag(FLAGS_thumb_index_threshold);
    settings.thresholds.index_middle = absl::GetFlag(FLAGS_index_middle_threshold);
    settings.options.fist_shortcut = absl::GetFlag(FLAGS_fist_shortcut);

    absl::StatusOr<LittleFingerRule> rule =
        ParseLittleFingerRule(absl::GetFlag(FLAGS_little_finger_rule));
    if (!rule.ok()) return rule.status();
    settings.options.little_finger = *rule;

    absl::StatusOr<OverlayLayoutMode> layout =
        ParseOverlayLayoutMode(absl::GetFlag(FLAGS_overlay_layout));
    if (!layout.ok()) return layout.status();
    settings.overlay_layout = *layout;

    const std::string settings_file = absl::GetFlag(FLAGS_settings_file);
    if (settings_file.empty()) {
        absl::Status status = ValidateThresholds(settings.thresholds);
        if (!status.ok()) return status;
        return settings;
    }

    absl::StatusOr<ClassifierSettings> loaded = LoadClassifierSettings(settings_file, settings);
    if (absl::IsNotFound(loaded.status())) {
        ABSL_LOG(WARNING) << loaded.status().message() << ". Using default values.";
        absl::Status status = ValidateThresholds(settings.thresholds);
        if (!status.ok()) return status;
        return settings;
    }
    if (!loaded.ok()) return loaded.status();

    // Explicit command line flags take precedence over the file.
    if (FlagWasSet(FLAGS_thumb_index_threshold)) {
        loaded->thresholds.thumb_index = settings.thresholds.thumb_index;
    }
    if (FlagWasSet(FLAGS_index_middle_threshold)) {
        loaded->thresholds.index_middle = settings.thresholds.index_middle;
    }
    if (FlagWasSet(FLAGS_fist_shortcut)) {
        loaded->options.fist_shortcut = settings.options.fist_shortcut;
    }
    if (FlagWasSet(FLAGS_little_finger_rule)) {
        loaded->options.little_finger = settings.options.little_finger;
    }
    if (FlagWasSet(FLAGS_overlay_layout)) {
        loaded->overlay_layout = settings.overlay_layout;
    }
    absl::Status status = ValidateThresholds(loaded->thresholds);
    if (!status.ok()) return status;
    return loaded;
}

absl::Status RunFingerCounter() {
    absl::StatusOr<ClassifierSettings> settings = ResolveSettings();
    if (!settings.ok()) return settings.status();

    ABSL_LOG(INFO) << "Thresholds: thumb-index=" << settings->thresholds.thumb_index
                   << " index-middle=" << settings->thresholds.index_middle
                   << ", little finger rule "
                   << LittleFingerRuleName(settings->options.little_finger)
                   << ", fist shortcut " << (settings->options.fist_shortcut ? "on" : "off");

    absl::StatusOr<std::unique_ptr<MediaPipeHandDetector>> detector =
        MediaPipeHandDetector::create(absl::GetFlag(FLAGS_calculator_graph_config_file));
    if (!detector.ok()) return detector.status();

    const std::string camera_device = absl::GetFlag(FLAGS_camera_device);
    std::unique_ptr<CameraHAL> camera =
        camera_device.empty() ? std::make_unique<CameraHAL>(absl::GetFlag(FLAGS_camera_index))
                              : std::make_unique<CameraHAL>(camera_device);

    HighGuiDisplay display("Hand Tracking", absl::GetFlag(FLAGS_threshold_sliders));

    SessionConfig config;
    config.thresholds = settings->thresholds;
    config.options = settings->options;
    config.overlay_layout = settings->overlay_layout;

    TrackingSession session(*camera, **detector, display, config);
    absl::Status run_status = session.run();

    if (absl::GetFlag(FLAGS_save_settings)) {
        const std::string settings_file = absl::GetFlag(FLAGS_settings_file);
        if (settings_file.empty()) {
            ABSL_LOG(WARNING) << "--save_settings needs --settings_file, nothing saved.";
        } else {
            ClassifierSettings final_settings = *settings;
            final_settings.thresholds = session.thresholds();
            absl::Status save_status = SaveClassifierSettings(settings_file, final_settings);
            if (!save_status.ok() && run_status.ok()) {
                run_status = save_status;
            }
        }
    }
    return run_status;
}

}  // namespace

int main(int argc, char** argv) {
    absl::SetProgramUsageMessage(
        "Counts raised fingers on a live webcam feed using MediaPipe hand tracking.");
    absl::ParseCommandLine(argc, argv);
    absl::InitializeLog();

    absl::Status run_status = RunFingerCounter();
    if (!run_status.ok()) {
        ABSL_LOG(ERROR) << "Finger counter failed: " << run_status.message();
        return EXIT_FAILURE;
    }
    ABSL_LOG(INFO) << "Success!";
    return EXIT_SUCCESS;
}
