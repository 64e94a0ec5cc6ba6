#include "FrameDisplay.h"

#include <opencv2/highgui.hpp>

HighGuiDisplay::HighGuiDisplay(const std::string& window_name, bool threshold_sliders)
    : windowName(window_name), showSliders(threshold_sliders), windowOpen(false) {}

HighGuiDisplay::~HighGuiDisplay() {
    close();
}

void HighGuiDisplay::open(FingerThresholds* thresholds) {
    cv::namedWindow(windowName, cv::WINDOW_AUTOSIZE);
    windowOpen = true;
    if (showSliders) {
        sliders = std::make_unique<ThresholdSliders>(thresholds);
    }
}

void HighGuiDisplay::show(const cv::Mat& frame) {
    cv::imshow(windowName, frame);
}

int HighGuiDisplay::pollKey() {
    return cv::waitKey(1);
}

void HighGuiDisplay::close() {
    sliders.reset();
    if (windowOpen) {
        cv::destroyWindow(windowName);
        windowOpen = false;
    }
}
