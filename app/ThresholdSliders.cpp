#include "ThresholdSliders.h"

#include <algorithm>
#include <cmath>

#include <opencv2/highgui.hpp>

#include "absl/log/absl_log.h"

int ThresholdToSliderPosition(double threshold) {
    if (!std::isfinite(threshold)) {
        return 0;
    }
    const long position = std::lround(threshold * kSliderMax);
    return static_cast<int>(std::clamp<long>(position, 0, kSliderMax));
}

double SliderPositionToThreshold(int position) {
    return std::clamp(position, 0, kSliderMax) / static_cast<double>(kSliderMax);
}

SliderBinding::SliderBinding(double* threshold)
    : threshold(threshold),
      startPosition(ThresholdToSliderPosition(*threshold)),
      armed(false),
      moved(false) {}

bool SliderBinding::approximated() const {
    return SliderPositionToThreshold(startPosition) != *threshold;
}

void SliderBinding::onPosition(int position) {
    if (!armed || (!moved && position == startPosition)) {
        return;
    }
    moved = true;
    *threshold = SliderPositionToThreshold(position);
}

ThresholdSliders::ThresholdSliders(FingerThresholds* thresholds)
    : thumbIndex(&thresholds->thumb_index), indexMiddle(&thresholds->index_middle) {
    if (thumbIndex.approximated()) {
        ABSL_LOG(WARNING) << "Thumb-index threshold " << thresholds->thumb_index
                          << " is shown as slider position " << thumbIndex.initialPosition()
                          << " and kept until the slider is moved.";
    }
    if (indexMiddle.approximated()) {
        ABSL_LOG(WARNING) << "Index-middle threshold " << thresholds->index_middle
                          << " is shown as slider position " << indexMiddle.initialPosition()
                          << " and kept until the slider is moved.";
    }

    cv::namedWindow(kWindowName);
    cv::createTrackbar(kThumbIndexTrackbar, kWindowName, nullptr, kSliderMax,
                       &ThresholdSliders::onThumbIndexChange, this);
    cv::createTrackbar(kIndexMiddleTrackbar, kWindowName, nullptr, kSliderMax,
                       &ThresholdSliders::onIndexMiddleChange, this);
    cv::setTrackbarPos(kThumbIndexTrackbar, kWindowName, thumbIndex.initialPosition());
    cv::setTrackbarPos(kIndexMiddleTrackbar, kWindowName, indexMiddle.initialPosition());
    thumbIndex.arm();
    indexMiddle.arm();
}

ThresholdSliders::~ThresholdSliders() {
    cv::destroyWindow(kWindowName);
}

void ThresholdSliders::onThumbIndexChange(int value, void* userdata) {
    auto* sliders = static_cast<ThresholdSliders*>(userdata);
    sliders->thumbIndex.onPosition(value);
    ABSL_LOG(INFO) << "Thumb-index slider at " << value;
}

void ThresholdSliders::onIndexMiddleChange(int value, void* userdata) {
    auto* sliders = static_cast<ThresholdSliders*>(userdata);
    sliders->indexMiddle.onPosition(value);
    ABSL_LOG(INFO) << "Index-middle slider at " << value;
}
