#include "core/FramePipeline.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace core {

namespace {

// Clears the in-flight flag when a frame leaves processFrame()
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~InFlightGuard() { flag_ = false; }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

const char* toString(PipelineState state) {
    switch (state) {
        case PipelineState::Idle:           return "Idle";
        case PipelineState::DetectorsReady: return "DetectorsReady";
        case PipelineState::Streaming:      return "Streaming";
        case PipelineState::Stopped:        return "Stopped";
    }
    return "Unknown";
}

PipelineContext::PipelineContext(const AppConfig& config)
    : smoother(config.tracking),
      history(config.tracking.collisionHistorySize, config.tracking.collisionRelevanceMs),
      targets(config.tracking.targets),
      recorder(config.recorder) {
    mapper.setViewport(config.viewportWidth, config.viewportHeight);
}

FramePipeline::FramePipeline(std::unique_ptr<inference::PoseBackend> pose,
                             std::unique_ptr<inference::HandBackend> hand,
                             AppConfig config,
                             std::shared_ptr<FrameSource> source)
    : _pose(std::move(pose)),
      _hand(std::move(hand)),
      _source(std::move(source)),
      _config(std::move(config)),
      _context(_config) {
    if (!_pose) {
        throw std::invalid_argument("FramePipeline requires a pose backend");
    }
}

FramePipeline::~FramePipeline() {
    stop();
}

double FramePipeline::monotonicMs() {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

void FramePipeline::initDetectors() {
    if (_state != PipelineState::Idle) {
        Logger::warn("FramePipeline: initDetectors() in state ", toString(_state));
        return;
    }

    if (!_pose->init()) {
        throw std::runtime_error("Pose backend '" + _pose->name() + "' failed to initialize");
    }
    Logger::info("FramePipeline: Pose backend ready (", _pose->name(), ")");

    if (!_hand) {
        Logger::warn("FramePipeline: No hand backend, running pose-only");
    } else if (!_hand->init()) {
        Logger::warn("FramePipeline: Hand backend '", _hand->name(),
                     "' failed to initialize, running pose-only");
    } else {
        _handActive = true;
        Logger::info("FramePipeline: Hand backend ready (", _hand->name(), ")");
    }

    _state = PipelineState::DetectorsReady;
}

bool FramePipeline::start() {
    if (_state != PipelineState::DetectorsReady) {
        Logger::error("FramePipeline: Cannot start from state ", toString(_state));
        return false;
    }

    if (_source && !_source->isOpen() && !_source->open()) {
        Logger::error("FramePipeline: Video source unavailable");
        return false;
    }

    _lastFpsTime = std::chrono::steady_clock::now();
    _frameCount = 0;
    _state = PipelineState::Streaming;

    if (_source) {
        _running = true;
        _thread = std::thread(&FramePipeline::loop, this);
    }
    Logger::info("FramePipeline started.");
    return true;
}

void FramePipeline::stop() {
    _running = false;
    if (_thread.joinable()) {
        _thread.join();
    }
    shutdown();
}

void FramePipeline::shutdown() {
    std::lock_guard<std::mutex> lock(_contextMutex);
    if (_state == PipelineState::Stopped) return;

    bool wasActive = _state != PipelineState::Idle;
    _state = PipelineState::Stopped;
    if (!wasActive) return;

    // A recording in progress is finished and saved
    finishSession(_context.recorder.stop());

    _pose->close();
    if (_hand) {
        _hand->close();
    }
    _handActive = false;

    if (_source) {
        _source->release();
    }
    Logger::info("FramePipeline stopped after ", _context.nextFrameIndex, " frames.");
}

void FramePipeline::loop() {
    const auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / std::max(_config.tickHz, 1.0f)));
    auto nextTick = std::chrono::steady_clock::now();
    cv::Mat frame;

    while (_running) {
        nextTick += period;

        ReadStatus status = _source->read(frame);
        if (status == ReadStatus::Lost) {
            Logger::warn("FramePipeline: Video source lost, stopping");
            _running = false;
            shutdown();
            break;
        }

        if (status == ReadStatus::Ok) {
            if (processFrame(frame, monotonicMs())) {
                countFps();
            }
        } else {
            // Nothing to detect, but the recording timer keeps running
            processFrame(cv::Mat(), monotonicMs());
        }

        auto now = std::chrono::steady_clock::now();
        if (nextTick > now) {
            std::this_thread::sleep_until(nextTick);
        } else {
            // Slow frame, schedule the next one right away instead of catching up
            nextTick = now;
        }
    }
}

void FramePipeline::countFps() {
    _frameCount++;
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - _lastFpsTime).count();
    if (elapsed >= 1000) {
        _currentFps = _frameCount * 1000.0f / elapsed;
        _frameCount = 0;
        _lastFpsTime = now;
        Logger::info("FramePipeline: ", _currentFps, " fps, hands model: ",
                     _handActive ? "on" : "off");
    }
}

bool FramePipeline::processFrame(const cv::Mat& frame, double nowMs) {
    if (_state != PipelineState::Streaming) return false;

    // Never two frames in flight
    if (_inFlight.exchange(true)) {
        Logger::debug("FramePipeline: Frame still in flight, skipping");
        return false;
    }
    InFlightGuard guard(_inFlight);

    std::vector<std::shared_ptr<FrameSink>> sinks;
    auto fused = produceFrame(frame, nowMs, sinks);
    if (!fused) return false;

    // Sinks run outside the lock so they may query the pipeline from consume()
    deliver(sinks, *fused);
    return true;
}

std::optional<FusedFrame> FramePipeline::produceFrame(const cv::Mat& frame, double nowMs,
                                                      std::vector<std::shared_ptr<FrameSink>>& sinks) {
    std::lock_guard<std::mutex> lock(_contextMutex);
    auto& ctx = _context;

    // Advance the recording timer first so a frame at the cut-off is not recorded
    if (auto artifacts = ctx.recorder.tick(nowMs)) {
        finishSession(std::move(artifacts));
    }

    if (frame.empty() || frame.cols <= 0 || frame.rows <= 0) {
        return std::nullopt;
    }

    if (ctx.mapper.setSource(frame.cols, frame.rows)) {
        const auto& rs = ctx.mapper.state();
        Logger::info("FramePipeline: Source ", frame.cols, "x", frame.rows, " -> viewport ",
                     ctx.mapper.viewportWidth(), "x", ctx.mapper.viewportHeight(),
                     " scale ", rs.scale, " offset (", rs.offsetX, ", ", rs.offsetY, ")");
    }

    std::optional<inference::PoseResult> pose;
    std::vector<HandObservation> hands;
    try {
        pose = _pose->detect(frame, nowMs);
        if (_hand && _handActive) {
            hands = _hand->detect(frame, nextHandTimestamp(nowMs));
        }
    } catch (const inference::DetectorError& e) {
        Logger::error("FramePipeline: Detection failed: ", e.what());
        return std::nullopt;
    } catch (const cv::Exception& e) {
        Logger::error("FramePipeline: OpenCV error during detection: ", e.what());
        return std::nullopt;
    } catch (const std::exception& e) {
        Logger::error("FramePipeline: Unexpected detection error: ", e.what());
        return std::nullopt;
    }

    FusedFrame fused = fuse(pose, std::move(hands), nowMs);

    ctx.recorder.recordFrame(fused);
    sinks = _sinks;
    return fused;
}

double FramePipeline::nextHandTimestamp(double nowMs) {
    auto& ctx = _context;
    double ts = nowMs;
    if (ts <= ctx.lastHandTimestampMs) {
        ts = ctx.lastHandTimestampMs + 0.001;
        Logger::warn("FramePipeline: Non-increasing frame time ", nowMs,
                     " ms, hand timestamp bumped to ", ts);
    }
    ctx.lastHandTimestampMs = ts;
    return ts;
}

FusedFrame FramePipeline::fuse(const std::optional<inference::PoseResult>& pose,
                               std::vector<HandObservation> hands, double nowMs) {
    auto& ctx = _context;
    const auto& mapper = ctx.mapper;

    FusedFrame fused;
    fused.frameIndex = ctx.nextFrameIndex++;
    fused.timestampMs = nowMs;
    fused.renderState = mapper.state();
    fused.handModelActive = _handActive;

    if (pose) {
        fused.rawKeypoints = pose->keypoints;
        fused.keypoints.reserve(pose->keypoints.size());
        for (const auto& kp : pose->keypoints) {
            Keypoint2D mapped = kp;
            Point2D p = mapper.map(kp.x, kp.y);
            mapped.x = p.x;
            mapped.y = p.y;
            fused.keypoints.push_back(std::move(mapped));

            if ((kp.name == "left_wrist" || kp.name == "right_wrist") &&
                kp.score > _config.tracking.minKeypointScore) {
                fused.wristCount++;
            }
        }
    }

    if (hands.size() > MAX_HANDS) {
        hands.resize(MAX_HANDS);
    }
    fused.displayHands = hands;
    for (auto& hand : fused.displayHands) {
        for (auto& lm : hand.landmarks) {
            Point2D p = mapper.mapNormalized(lm.x, lm.y);
            lm.x = p.x;
            lm.y = p.y;
        }
    }
    fused.hands = std::move(hands);

    // Zones keep updating while no pose is found, parts are simply absent
    fused.trackedZones = ctx.smoother.update(fused.keypoints, nowMs);

    fused.collisions = CollisionDetector::detect(fused.trackedZones, ctx.targets,
                                                 static_cast<int64_t>(nowMs));
    ctx.history.append(fused.collisions);
    fused.activeCollisions = ctx.history.active(static_cast<int64_t>(nowMs));
    for (const auto& event : fused.collisions) {
        Logger::debug("FramePipeline: Collision ", event.bodyPart, " -> ", event.targetId);
    }

    return fused;
}

void FramePipeline::deliver(const std::vector<std::shared_ptr<FrameSink>>& sinks,
                            const FusedFrame& frame) {
    for (const auto& sink : sinks) {
        try {
            sink->consume(frame);
        } catch (const std::exception& e) {
            Logger::error("FramePipeline: Sink failed on frame ", frame.frameIndex, ": ", e.what());
        }
    }
}

void FramePipeline::finishSession(std::optional<record::SessionArtifacts> artifacts) {
    if (!artifacts) return;

    const auto& dir = _config.recorder.outputDir;
    bool failed = !dir.empty() && !record::SessionRecorder::save(*artifacts, dir);
    if (failed) {
        Logger::error("FramePipeline: Session ", artifacts->metadata.sessionId,
                      " was recorded but could not be written to ", dir);
    }
    _lastSaveFailed = failed;
    _lastSession = std::move(artifacts);
}

void FramePipeline::setViewport(int width, int height) {
    std::lock_guard<std::mutex> lock(_contextMutex);
    if (_context.mapper.setViewport(width, height)) {
        Logger::info("FramePipeline: Viewport ", width, "x", height);
    }
}

void FramePipeline::setTargets(std::vector<Target> targets) {
    std::lock_guard<std::mutex> lock(_contextMutex);
    _context.targets = std::move(targets);
}

void FramePipeline::addSink(std::shared_ptr<FrameSink> sink) {
    std::lock_guard<std::mutex> lock(_contextMutex);
    if (sink) {
        _sinks.push_back(std::move(sink));
    }
}

record::RecordingStatus FramePipeline::startRecording(const std::string& actionLabel) {
    return startRecording(actionLabel, monotonicMs());
}

record::RecordingStatus FramePipeline::startRecording(const std::string& actionLabel, double nowMs) {
    std::lock_guard<std::mutex> lock(_contextMutex);
    return _context.recorder.start(actionLabel, isStreaming(), nowMs);
}

std::optional<record::SessionArtifacts> FramePipeline::stopRecording() {
    std::lock_guard<std::mutex> lock(_contextMutex);
    auto artifacts = _context.recorder.stop();
    if (!artifacts) return std::nullopt;

    finishSession(artifacts);
    return artifacts;
}

bool FramePipeline::isRecording() const {
    std::lock_guard<std::mutex> lock(_contextMutex);
    return _context.recorder.isRecording();
}

uint32_t FramePipeline::framesProduced() const {
    std::lock_guard<std::mutex> lock(_contextMutex);
    return _context.nextFrameIndex;
}

std::vector<CollisionHistory::ActiveEvent> FramePipeline::activeCollisions(int64_t nowMs) const {
    std::lock_guard<std::mutex> lock(_contextMutex);
    return _context.history.active(nowMs);
}

std::optional<record::SessionArtifacts> FramePipeline::lastSession() const {
    std::lock_guard<std::mutex> lock(_contextMutex);
    return _lastSession;
}

} // namespace core
