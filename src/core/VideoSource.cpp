#include "core/FrameSource.hpp"
#include "core/Logger.hpp"

namespace core {

VideoSource::VideoSource(Config config)
    : config_(std::move(config)) {
}

VideoSource::~VideoSource() {
    release();
}

bool VideoSource::open() {
    bool ok = config_.path.empty() ? cap_.open(config_.cameraIndex)
                                   : cap_.open(config_.path);
    if (!ok || !cap_.isOpened()) {
        Logger::error("VideoSource: Could not open ", describe());
        return false;
    }

    if (config_.path.empty()) {
        cap_.set(cv::CAP_PROP_FRAME_WIDTH, config_.width);
        cap_.set(cv::CAP_PROP_FRAME_HEIGHT, config_.height);
        cap_.set(cv::CAP_PROP_FPS, config_.fps);
    }

    consecutiveFailures_ = 0;
    Logger::info("VideoSource opened: ", describe(), " ",
                 static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH)), "x",
                 static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT)));
    return true;
}

ReadStatus VideoSource::read(cv::Mat& frame) {
    if (!cap_.isOpened()) {
        return ReadStatus::Lost;
    }

    if (!cap_.read(frame)) {
        // End of file is final; a camera may just not have a frame yet
        if (!config_.path.empty() || ++consecutiveFailures_ > config_.maxConsecutiveFailures) {
            Logger::warn("VideoSource: Lost ", describe());
            return ReadStatus::Lost;
        }
        return ReadStatus::NotReady;
    }

    consecutiveFailures_ = 0;
    if (frame.empty() || frame.cols <= 0 || frame.rows <= 0) {
        return ReadStatus::NotReady;
    }
    return ReadStatus::Ok;
}

void VideoSource::release() {
    if (cap_.isOpened()) {
        cap_.release();
        Logger::info("VideoSource released: ", describe());
    }
}

bool VideoSource::isOpen() const {
    return cap_.isOpened();
}

std::string VideoSource::describe() const {
    return config_.path.empty() ? "camera " + std::to_string(config_.cameraIndex) : config_.path;
}

} // namespace core
