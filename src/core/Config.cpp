#include "core/Config.hpp"
#include "core/Logger.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace core {

namespace {

template<typename T>
void assign(const YAML::Node& node, const char* key, T& out) {
    if (node && node[key]) out = node[key].as<T>();
}

void applyTracking(const YAML::Node& node, TrackingConfig& tracking) {
    if (!node) return;

    assign(node, "min_score", tracking.minKeypointScore);
    assign(node, "smoothing_alpha", tracking.smoothingAlpha);
    assign(node, "history_size", tracking.collisionHistorySize);
    assign(node, "relevance_ms", tracking.collisionRelevanceMs);

    if (tracking.minKeypointScore < 0.0f || tracking.minKeypointScore > 1.0f) {
        throw std::runtime_error("tracking.min_score must be within [0, 1]");
    }
    if (tracking.smoothingAlpha < 0.0f || tracking.smoothingAlpha >= 1.0f) {
        throw std::runtime_error("tracking.smoothing_alpha must be within [0, 1)");
    }
    if (tracking.collisionHistorySize == 0) {
        throw std::runtime_error("tracking.history_size must be positive");
    }

    if (const auto radii = node["zone_radii"]) {
        tracking.zoneRadii.clear();
        for (const auto& entry : radii) {
            auto name = entry.first.as<std::string>();
            auto radius = entry.second.as<float>();
            if (radius <= 0.0f) {
                throw std::runtime_error("tracking.zone_radii." + name + " must be positive");
            }
            tracking.zoneRadii[name] = radius;
        }
    }

    if (const auto targets = node["targets"]) {
        tracking.targets.clear();
        for (const auto& t : targets) {
            Target target;
            target.id = t["id"].as<std::string>();
            target.position.x = t["x"].as<float>();
            target.position.y = t["y"].as<float>();
            target.radius = t["radius"].as<float>();
            if (target.radius <= 0.0f) {
                throw std::runtime_error("target '" + target.id + "' radius must be positive");
            }
            tracking.targets.push_back(std::move(target));
        }
    }
}

void applyRecorder(const YAML::Node& node, AppConfig& config) {
    if (!node) return;

    auto& recorder = config.recorder;
    assign(node, "action", config.recordAction);
    assign(node, "tick_ms", recorder.tickMs);
    assign(node, "max_duration_sec", recorder.maxDurationSec);
    assign(node, "output_dir", recorder.outputDir);
    assign(node, "inline_hand_count", recorder.inlineHandCount);

    if (recorder.tickMs <= 0.0 || recorder.maxDurationSec <= 0.0) {
        throw std::runtime_error("record.tick_ms and record.max_duration_sec must be positive");
    }
    recorder.schemaVersion = recorder.inlineHandCount ? "1.1" : "1.0";
}

void applyRoot(const YAML::Node& root, AppConfig& config) {
    if (const auto source = root["source"]) {
        assign(source, "camera_index", config.cameraIndex);
        assign(source, "video_path", config.videoPath);
        assign(source, "width", config.captureWidth);
        assign(source, "height", config.captureHeight);
    }

    if (const auto viewport = root["viewport"]) {
        assign(viewport, "width", config.viewportWidth);
        assign(viewport, "height", config.viewportHeight);
    }

    assign(root, "tick_hz", config.tickHz);
    if (config.tickHz <= 0.0f) {
        throw std::runtime_error("tick_hz must be positive");
    }

    if (const auto pose = root["pose"]) {
        assign(pose, "model_path", config.poseModelPath);
        assign(pose, "input_size", config.poseInputSize);
    }

    if (const auto hand = root["hand"]) {
        assign(hand, "model_path", config.handModelPath);
        assign(hand, "input_size", config.handInputSize);
        assign(hand, "presence_threshold", config.handPresenceThreshold);
    }

    if (const auto osc = root["osc"]) {
        assign(osc, "enabled", config.oscEnabled);
        assign(osc, "host", config.oscHost);
        assign(osc, "port", config.oscPort);
    }

    assign(root, "log_level", config.logLevel);
    if (!Logger::parseLevel(config.logLevel)) {
        throw std::runtime_error("log_level must be one of debug, info, warn, error");
    }

    applyTracking(root["tracking"], config.tracking);
    applyRecorder(root["record"], config);
}

} // namespace

AppConfig loadConfig(const std::string& path) {
    AppConfig config;
    try {
        YAML::Node root = YAML::LoadFile(path);
        applyRoot(root, config);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config '" + path + "': " + e.what());
    }
    Logger::info("Config loaded from ", path, " (", config.tracking.targets.size(), " targets)");
    return config;
}

void applyConfig(AppConfig& config, const std::string& yamlText) {
    try {
        applyRoot(YAML::Load(yamlText), config);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Failed to parse config: ") + e.what());
    }
}

} // namespace core
