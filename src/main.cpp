#include "core/Config.hpp"
#include "core/FramePipeline.hpp"
#include "core/FrameSource.hpp"
#include "core/Logger.hpp"
#include "inference/HandLandmark.hpp"
#include "inference/MoveNetDetector.hpp"
#include "net/OscSender.hpp"
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>

#ifndef POSEFUSION_VERSION
#define POSEFUSION_VERSION "dev"
#endif

// Global flag for shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signum) {
    (void)signum;
    g_running = false;
}

int main(int argc, char** argv) {
    // Register signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    core::Logger::info("Starting PoseFusion ", POSEFUSION_VERSION, "...");

    core::AppConfig config;
    try {
        if (argc > 1) {
            config = core::loadConfig(argv[1]);
        } else {
            core::Logger::info("No config file given, using defaults");
        }
    } catch (const std::exception& e) {
        core::Logger::error(e.what());
        return 1;
    }
    core::Logger::setLevel(*core::Logger::parseLevel(config.logLevel));

    try {
        // 1. Video source
        core::VideoSource::Config sourceConfig;
        sourceConfig.cameraIndex = config.cameraIndex;
        sourceConfig.path = config.videoPath;
        sourceConfig.width = config.captureWidth;
        sourceConfig.height = config.captureHeight;
        sourceConfig.fps = config.tickHz;
        auto source = std::make_shared<core::VideoSource>(sourceConfig);

        // 2. Detector backends
        inference::MoveNetDetector::Config poseConfig;
        poseConfig.modelPath = config.poseModelPath;
        poseConfig.inputSize = config.poseInputSize;

        inference::HandLandmark::Config handConfig;
        handConfig.modelPath = config.handModelPath;
        handConfig.inputSize = config.handInputSize;
        handConfig.presenceThreshold = config.handPresenceThreshold;

        core::FramePipeline pipeline(std::make_unique<inference::MoveNetDetector>(poseConfig),
                                     std::make_unique<inference::HandLandmark>(handConfig),
                                     config, source);
        pipeline.initDetectors();

        // 3. Start OSC Sender
        std::shared_ptr<net::OscSender> oscSender;
        if (config.oscEnabled) {
            oscSender = std::make_shared<net::OscSender>(config.oscHost, config.oscPort);
            if (oscSender->start()) {
                pipeline.addSink(oscSender);
            }
        }

        // 4. Start the detection loop
        if (!pipeline.start()) {
            core::Logger::error("Pipeline failed to start.");
            return 1;
        }

        if (!config.recordAction.empty()) {
            auto status = pipeline.startRecording(config.recordAction);
            if (status != record::RecordingStatus::Started) {
                core::Logger::warn("Recording not started: ", record::toString(status));
            }
        }

        core::Logger::info("Service running. Press Ctrl+C to exit.");

        // Main loop (Orchestrator)
        while (g_running) {
            if (pipeline.state() == core::PipelineState::Stopped) {
                core::Logger::warn("Pipeline stopped (video source ended or lost).");
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        // Shutdown: pipeline first so the last frames and session are flushed
        core::Logger::info("Stopping modules...");
        pipeline.stop();
        if (oscSender) {
            oscSender->stop();
        }

        if (auto session = pipeline.lastSession()) {
            core::Logger::info("Last session: ", session->metadata.sessionId, " (",
                               session->metadata.frameCount, " frames)");
        }
    } catch (const std::exception& e) {
        core::Logger::error("Fatal error: ", e.what());
        return 1;
    }

    core::Logger::info("Service stopped cleanly.");
    return 0;
}
