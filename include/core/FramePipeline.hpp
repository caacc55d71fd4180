#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include <opencv2/core.hpp>

#include "Types.hpp"
#include "Config.hpp"
#include "CollisionDetector.hpp"
#include "FrameSink.hpp"
#include "FrameSource.hpp"
#include "LandmarkSmoother.hpp"
#include "inference/Detector.hpp"
#include "math/CoordinateMapper.hpp"
#include "record/SessionRecorder.hpp"

namespace core {

enum class PipelineState {
    Idle,
    DetectorsReady,
    Streaming,
    Stopped
};

[[nodiscard]] const char* toString(PipelineState state);

/**
 * Cross-frame state of the pipeline. Owned by FramePipeline and handed to
 * each stage; nothing outside the loop thread mutates it.
 */
struct PipelineContext {
    explicit PipelineContext(const AppConfig& config);

    math::CoordinateMapper mapper;
    LandmarkSmoother smoother;
    CollisionHistory history;
    std::vector<Target> targets;
    record::SessionRecorder recorder;

    uint32_t nextFrameIndex = 0;
    double lastHandTimestampMs = -1.0;
};

/**
 * Per-frame fusion of pose and hand detection.
 *
 * Idle -> DetectorsReady (initDetectors) -> Streaming (start) -> Stopped (stop or source loss).
 *
 * With a FrameSource attached, start() runs a dedicated loop thread that reads one
 * frame per tick and processes it to completion before reading the next. Without
 * a source the caller drives processFrame() itself.
 */
class FramePipeline {
public:
    FramePipeline(std::unique_ptr<inference::PoseBackend> pose,
                  std::unique_ptr<inference::HandBackend> hand,
                  AppConfig config,
                  std::shared_ptr<FrameSource> source = nullptr);
    ~FramePipeline();

    // Non-copyable
    FramePipeline(const FramePipeline&) = delete;
    FramePipeline& operator=(const FramePipeline&) = delete;

    /**
     * Initialize both backends. A hand backend failure degrades to pose-only.
     * @throws std::runtime_error if the pose backend cannot be initialized
     */
    void initDetectors();

    /**
     * Begin streaming. Returns false unless the detectors are ready.
     */
    bool start();

    /**
     * Stop streaming, finish any recording and release the backends. Idempotent.
     */
    void stop();

    /**
     * Run one frame through detection, mapping, smoothing, collision and recording.
     * @param frame Source frame; an empty frame counts as not ready and is skipped
     * @param nowMs Monotonic timestamp of the frame
     * @return true if a fused frame was produced and delivered
     */
    bool processFrame(const cv::Mat& frame, double nowMs);

    void setViewport(int width, int height);
    void setTargets(std::vector<Target> targets);
    void addSink(std::shared_ptr<FrameSink> sink);

    record::RecordingStatus startRecording(const std::string& actionLabel);
    record::RecordingStatus startRecording(const std::string& actionLabel, double nowMs);

    /**
     * Stop a running recording and save it. Returns the artifacts if anything was recorded.
     * Check lastSaveFailed() to learn whether the files were written.
     */
    std::optional<record::SessionArtifacts> stopRecording();

    /**
     * True when the most recently finished session could not be written to disk.
     */
    [[nodiscard]] bool lastSaveFailed() const { return _lastSaveFailed; }

    [[nodiscard]] PipelineState state() const { return _state; }
    [[nodiscard]] bool isStreaming() const { return _state == PipelineState::Streaming; }
    [[nodiscard]] bool handModelActive() const { return _handActive; }
    [[nodiscard]] bool isRecording() const;
    [[nodiscard]] uint32_t framesProduced() const;

    /**
     * Collisions still inside the relevance window at nowMs.
     * Each FusedFrame carries the same list as of its own timestamp.
     */
    [[nodiscard]] std::vector<CollisionHistory::ActiveEvent> activeCollisions(int64_t nowMs) const;

    /**
     * Most recent session written by this pipeline.
     */
    [[nodiscard]] std::optional<record::SessionArtifacts> lastSession() const;

    /**
     * Monotonic clock in milliseconds used for frame timestamps.
     */
    [[nodiscard]] static double monotonicMs();

private:
    void loop();
    void shutdown();
    void finishSession(std::optional<record::SessionArtifacts> artifacts);
    std::optional<FusedFrame> produceFrame(const cv::Mat& frame, double nowMs,
                                           std::vector<std::shared_ptr<FrameSink>>& sinks);
    double nextHandTimestamp(double nowMs);
    FusedFrame fuse(const std::optional<inference::PoseResult>& pose,
                    std::vector<HandObservation> hands, double nowMs);
    static void deliver(const std::vector<std::shared_ptr<FrameSink>>& sinks,
                        const FusedFrame& frame);
    void countFps();

    std::unique_ptr<inference::PoseBackend> _pose;
    std::unique_ptr<inference::HandBackend> _hand;
    std::shared_ptr<FrameSource> _source;
    AppConfig _config;

    mutable std::mutex _contextMutex;
    PipelineContext _context;
    std::optional<record::SessionArtifacts> _lastSession;
    std::vector<std::shared_ptr<FrameSink>> _sinks;

    std::atomic<PipelineState> _state{PipelineState::Idle};
    std::atomic<bool> _handActive{false};
    std::atomic<bool> _inFlight{false};
    std::atomic<bool> _running{false};
    std::atomic<bool> _lastSaveFailed{false};
    std::thread _thread;

    // FPS Counting
    std::chrono::steady_clock::time_point _lastFpsTime;
    int _frameCount = 0;
    float _currentFps = 0.0f;
};

} // namespace core
