#pragma once

#include <string>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace core {

enum class ReadStatus {
    Ok,        // Frame delivered
    NotReady,  // Nothing buffered yet, retry on the next tick
    Lost       // Source ended or disconnected
};

/**
 * Video frame provider polled once per pipeline tick.
 */
class FrameSource {
public:
    virtual ~FrameSource() = default;

    virtual bool open() = 0;
    virtual ReadStatus read(cv::Mat& frame) = 0;
    virtual void release() = 0;
    [[nodiscard]] virtual bool isOpen() const = 0;
    [[nodiscard]] virtual std::string describe() const = 0;
};

/**
 * cv::VideoCapture backed source: camera index or file / stream URL.
 */
class VideoSource : public FrameSource {
public:
    struct Config {
        int cameraIndex = 0;
        std::string path;       // Used instead of cameraIndex when set
        int width = 1280;
        int height = 720;
        float fps = 60.0f;
        int maxConsecutiveFailures = 30;
    };

    explicit VideoSource(Config config);
    ~VideoSource() override;

    // Non-copyable
    VideoSource(const VideoSource&) = delete;
    VideoSource& operator=(const VideoSource&) = delete;

    bool open() override;
    ReadStatus read(cv::Mat& frame) override;
    void release() override;
    [[nodiscard]] bool isOpen() const override;
    [[nodiscard]] std::string describe() const override;

private:
    Config config_;
    cv::VideoCapture cap_;
    int consecutiveFailures_ = 0;
};

} // namespace core
