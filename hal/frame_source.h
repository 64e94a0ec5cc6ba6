#ifndef FRAME_SOURCE_H
#define FRAME_SOURCE_H

#include <string>
#include <opencv2/core.hpp>

// Anything the frame loop can pull BGR frames from.
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual bool openCamera() = 0;
    virtual void closeCamera() = 0;
    // False once no more frames can be read.
    virtual bool captureFrame(cv::Mat &frame) = 0;
    virtual std::string describe() const = 0;
};

#endif
