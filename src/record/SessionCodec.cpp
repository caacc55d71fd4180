#include "record/SessionCodec.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <sys/utsname.h>

#ifndef POSEFUSION_VERSION
#define POSEFUSION_VERSION "dev"
#endif

namespace record {

namespace {

/**
 * Writes little-endian values into a pre-sized buffer.
 */
class BinaryWriter {
public:
    explicit BinaryWriter(size_t capacity) : buffer_(capacity) {}

    void u8(uint8_t v) {
        ensure(1);
        buffer_[offset_++] = v;
    }

    void u32(uint32_t v) {
        ensure(4);
        for (int i = 0; i < 4; ++i) {
            buffer_[offset_++] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
        }
    }

    void u64(uint64_t v) {
        ensure(8);
        for (int i = 0; i < 8; ++i) {
            buffer_[offset_++] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
        }
    }

    void f32(float v) {
        uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        u32(bits);
    }

    void f64(double v) {
        uint64_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        u64(bits);
    }

    std::vector<uint8_t> finish() {
        buffer_.resize(offset_);
        return std::move(buffer_);
    }

private:
    void ensure(size_t n) {
        if (offset_ + n > buffer_.size()) {
            buffer_.resize(std::max(buffer_.size() * 2, offset_ + n));
        }
    }

    std::vector<uint8_t> buffer_;
    size_t offset_ = 0;
};

class BinaryReader {
public:
    explicit BinaryReader(const std::vector<uint8_t>& data) : data_(data) {}

    uint8_t u8() {
        require(1);
        return data_[offset_++];
    }

    uint32_t u32() {
        require(4);
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<uint32_t>(data_[offset_++]) << (8 * i);
        }
        return v;
    }

    uint64_t u64() {
        require(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v |= static_cast<uint64_t>(data_[offset_++]) << (8 * i);
        }
        return v;
    }

    float f32() {
        uint32_t bits = u32();
        float v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    double f64() {
        uint64_t bits = u64();
        double v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    [[nodiscard]] size_t remaining() const { return data_.size() - offset_; }

private:
    void require(size_t n) const {
        if (offset_ + n > data_.size()) {
            throw std::runtime_error("Session data truncated at byte " + std::to_string(offset_));
        }
    }

    const std::vector<uint8_t>& data_;
    size_t offset_ = 0;
};

std::vector<core::Keypoint3D> readHand(BinaryReader& reader) {
    std::vector<core::Keypoint3D> hand(core::HAND_LANDMARK_COUNT);
    for (auto& p : hand) {
        p.x = reader.f32();
        p.y = reader.f32();
        p.z = reader.f32();
    }
    return hand;
}

} // namespace

DeviceInfo DeviceInfo::current() {
    DeviceInfo info;
    info.userAgent = std::string("PoseFusion/") + POSEFUSION_VERSION;

    struct utsname name{};
    if (uname(&name) == 0) {
        info.platform = std::string(name.sysname) + " " + name.machine;
    } else {
        info.platform = "unknown";
    }

    const char* lang = std::getenv("LANG");
    info.language = (lang && *lang) ? lang : "C";
    return info;
}

uint32_t encodedHandCount(const FrameRecord& frame) {
    return static_cast<uint32_t>(std::min(frame.hands2d.size(), core::MAX_HANDS));
}

std::vector<uint8_t> encodeSession(const std::vector<FrameRecord>& frames, const EncodeOptions& options) {
    const size_t perFrameBound = sizeof(double) + sizeof(uint32_t) + 1 +
                                 POSE_BYTES_PER_FRAME + core::MAX_HANDS * HAND_BYTES;
    BinaryWriter writer(sizeof(uint32_t) + frames.size() * perFrameBound);

    writer.u32(static_cast<uint32_t>(frames.size()));

    for (const auto& frame : frames) {
        writer.f64(frame.timestampMs);
        writer.u32(frame.frameIndex);

        uint32_t hands = encodedHandCount(frame);
        if (options.inlineHandCount) {
            writer.u8(static_cast<uint8_t>(hands));
        }

        // Always 17 triples; missing keypoints are written as zeros
        for (size_t i = 0; i < core::BODY_KEYPOINT_COUNT; ++i) {
            if (i < frame.pose2d.size()) {
                const auto& kp = frame.pose2d[i];
                writer.f32(kp.x);
                writer.f32(kp.y);
                writer.f32(kp.score);
            } else {
                writer.f32(0.0f);
                writer.f32(0.0f);
                writer.f32(0.0f);
            }
        }

        for (uint32_t h = 0; h < hands; ++h) {
            const auto& hand = frame.hands2d[h];
            for (size_t i = 0; i < core::HAND_LANDMARK_COUNT; ++i) {
                core::Keypoint3D p = i < hand.size() ? hand[i] : core::Keypoint3D{};
                writer.f32(p.x);
                writer.f32(p.y);
                writer.f32(p.z);
            }
        }
    }

    return writer.finish();
}

std::vector<FrameRecord> decodeSession(const std::vector<uint8_t>& data,
                                       const std::vector<uint32_t>& handCounts,
                                       bool inlineHandCount) {
    BinaryReader reader(data);
    uint32_t frameCount = reader.u32();

    if (!inlineHandCount && !handCounts.empty() && handCounts.size() != frameCount) {
        throw std::runtime_error("Hand count list has " + std::to_string(handCounts.size()) +
                                 " entries for " + std::to_string(frameCount) + " frames");
    }

    std::vector<FrameRecord> frames;
    frames.reserve(frameCount);

    for (uint32_t f = 0; f < frameCount; ++f) {
        FrameRecord frame;
        frame.timestampMs = reader.f64();
        frame.frameIndex = reader.u32();

        uint32_t hands = 0;
        if (inlineHandCount) {
            hands = reader.u8();
        } else if (!handCounts.empty()) {
            hands = handCounts[f];
        }
        if (hands > core::MAX_HANDS) {
            throw std::runtime_error("Frame " + std::to_string(f) + " claims " +
                                     std::to_string(hands) + " hands");
        }

        frame.pose2d.reserve(core::BODY_KEYPOINT_COUNT);
        for (size_t i = 0; i < core::BODY_KEYPOINT_COUNT; ++i) {
            core::Keypoint2D kp;
            kp.name = core::BODY_KEYPOINT_NAMES[i];
            kp.x = reader.f32();
            kp.y = reader.f32();
            kp.score = reader.f32();
            frame.pose2d.push_back(std::move(kp));
        }

        for (uint32_t h = 0; h < hands; ++h) {
            frame.hands2d.push_back(readHand(reader));
            frame.handedness.emplace_back(std::nullopt);
        }

        frames.push_back(std::move(frame));
    }

    if (reader.remaining() != 0) {
        throw std::runtime_error(std::to_string(reader.remaining()) +
                                 " trailing bytes, per-frame hand counts required");
    }
    return frames;
}

nlohmann::json toJson(const SessionMetadata& metadata) {
    nlohmann::json json;
    json["sessionId"] = metadata.sessionId;
    json["timestamp"] = metadata.timestampIso;
    json["duration"] = metadata.durationSec;
    json["frameCount"] = metadata.frameCount;
    json["fps"] = metadata.fps;
    if (metadata.actionLabel) {
        json["action"] = *metadata.actionLabel;
    } else {
        json["action"] = nullptr;
    }
    json["device"] = {
        {"userAgent", metadata.device.userAgent},
        {"platform", metadata.device.platform},
        {"language", metadata.device.language}
    };
    json["schemaVersion"] = metadata.schemaVersion;
    json["handCounts"] = metadata.handCounts;
    return json;
}

SessionMetadata metadataFromJson(const nlohmann::json& json) {
    SessionMetadata metadata;
    metadata.sessionId = json.at("sessionId").get<std::string>();
    metadata.timestampIso = json.at("timestamp").get<std::string>();
    metadata.durationSec = json.at("duration").get<double>();
    metadata.frameCount = json.at("frameCount").get<uint32_t>();
    metadata.fps = json.at("fps").get<double>();

    const auto& action = json.at("action");
    if (!action.is_null()) {
        metadata.actionLabel = action.get<std::string>();
    }

    const auto& device = json.at("device");
    metadata.device.userAgent = device.value("userAgent", "");
    metadata.device.platform = device.value("platform", "");
    metadata.device.language = device.value("language", "");

    metadata.schemaVersion = json.value("schemaVersion", "1.0");
    if (json.contains("handCounts")) {
        metadata.handCounts = json.at("handCounts").get<std::vector<uint32_t>>();
    }
    return metadata;
}

} // namespace record
