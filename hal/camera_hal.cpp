#include "camera_hal.h"

#include "absl/log/absl_log.h"

CameraHAL::CameraHAL(int device_index) : deviceIndex(device_index) {}

CameraHAL::CameraHAL(const std::string& device_path)
    : deviceIndex(-1), devicePath(device_path) {}

CameraHAL::~CameraHAL() {
    closeCamera();
}

bool CameraHAL::openCamera() {
    if (cap.isOpened()) {
        return true;
    }
    if (devicePath.empty()) {
        cap.open(deviceIndex);
    } else {
        cap.open(devicePath, cv::CAP_V4L2);
    }
    if (!cap.isOpened()) {
        ABSL_LOG(ERROR) << "Could not open camera " << describe();
        return false;
    }
    ABSL_LOG(INFO) << "Opened camera " << describe();
    return true;
}

void CameraHAL::closeCamera() {
    if (cap.isOpened()) {
        cap.release();
        ABSL_LOG(INFO) << "Released camera " << describe();
    }
}

bool CameraHAL::captureFrame(cv::Mat &frame) {
    if (!cap.isOpened()) {
        return false;
    }
    return cap.read(frame) && !frame.empty();
}

std::string CameraHAL::describe() const {
    if (devicePath.empty()) {
        return "index " + std::to_string(deviceIndex);
    }
    return devicePath;
}
