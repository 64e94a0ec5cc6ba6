#ifndef CAMERA_HAL_H
#define CAMERA_HAL_H

#include <string>
#include <opencv2/videoio.hpp>

#include "frame_source.h"

// Owns the capture device for one session. Opened once, released on
// closeCamera() or destruction.
class CameraHAL : public FrameSource {
public:
    explicit CameraHAL(int device_index = 0);
    // Opens a V4L2 device node such as "/dev/video3" instead of an index.
    explicit CameraHAL(const std::string& device_path);
    ~CameraHAL() override;

    CameraHAL(const CameraHAL&) = delete;
    CameraHAL& operator=(const CameraHAL&) = delete;

    bool openCamera() override;
    void closeCamera() override;
    bool captureFrame(cv::Mat &frame) override;

    std::string describe() const override;

private:
    int deviceIndex;
    std::string devicePath;
    cv::VideoCapture cap;
};

#endif
