#pragma once

#include <memory>
#include <string>

#include <opencv2/core.hpp>

#include "finger_counter.h"
#include "ThresholdSliders.h"

// Where the frame loop shows its output and reads the keyboard.
class FrameDisplay {
public:
    virtual ~FrameDisplay() = default;

    // thresholds may be edited live by the display until close().
    virtual void open(FingerThresholds* thresholds) = 0;
    virtual void show(const cv::Mat& frame) = 0;
    // Last key pressed, or -1.
    virtual int pollKey() = 0;
    // Safe to call after a partial or failed open().
    virtual void close() = 0;
};

// The "Hand Tracking" HighGUI window, plus the slider window when enabled.
class HighGuiDisplay : public FrameDisplay {
public:
    explicit HighGuiDisplay(const std::string& window_name = "Hand Tracking",
                            bool threshold_sliders = true);
    ~HighGuiDisplay() override;

    void open(FingerThresholds* thresholds) override;
    void show(const cv::Mat& frame) override;
    int pollKey() override;
    void close() override;

private:
    std::string windowName;
    bool showSliders;
    bool windowOpen;
    std::unique_ptr<ThresholdSliders> sliders;
};
