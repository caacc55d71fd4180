#include "net/OscSender.hpp"
#include "core/Logger.hpp"

#include <vector>

namespace net {

OscSender::OscSender(const std::string& host, const std::string& port,
                     std::chrono::milliseconds latencyLimit)
    : _host(host), _port(port), _latencyLimit(latencyLimit), _running(false) {
}

OscSender::~OscSender() {
    stop();
    if (_loAddress) {
        lo_address_free(_loAddress);
    }
}

bool OscSender::start() {
    if (_running) return true;

    if (!_loAddress) {
        _loAddress = lo_address_new(_host.c_str(), _port.c_str());
    }
    if (!_loAddress) {
        core::Logger::error("OscSender: Failed to create LO address for ", _host, ":", _port);
        return false;
    }

    _running = true;
    _thread = std::thread(&OscSender::loop, this);
    core::Logger::info("OscSender started. Target: ", _host, ":", _port);
    return true;
}

void OscSender::stop() {
    if (!_running) return;
    _running = false;
    if (_thread.joinable()) {
        _thread.join();
    }
    core::Logger::info("OscSender stopped. Sent ", _sent.load(), ", dropped ", _dropped.load());
}

void OscSender::consume(const core::FusedFrame& frame) {
    if (_slot.publish(Outgoing{frame, std::chrono::steady_clock::now()})) {
        // The sender never saw the previous frame
        ++_dropped;
    }
}

void OscSender::loop() {
    while (_running) {
        auto item = _slot.take(std::chrono::milliseconds(10));
        if (!item) continue;

        auto latency = std::chrono::steady_clock::now() - item->enqueued;
        if (latency > _latencyLimit) {
            ++_dropped;
            continue;
        }

        send(item->frame);
        ++_sent;
    }
}

void OscSender::send(const core::FusedFrame& frame) {
    if (!_loAddress) return;

    lo_message frameMsg = lo_message_new();
    lo_message_add_int32(frameMsg, static_cast<int32_t>(frame.frameIndex));
    lo_message_add_int32(frameMsg, static_cast<int32_t>(frame.trackedZones.size()));
    lo_message_add_int32(frameMsg, static_cast<int32_t>(frame.hands.size()));
    int ret = lo_send_message(_loAddress, "/pose/frame", frameMsg);
    lo_message_free(frameMsg);
    if (ret == -1) {
        core::Logger::error("OscSender: Failed to send message: ", lo_address_errstr(_loAddress));
        return;
    }

    for (const auto& zone : frame.trackedZones) {
        lo_message msg = lo_message_new();
        lo_message_add_string(msg, zone.bodyPart.c_str());
        lo_message_add_float(msg, zone.x);
        lo_message_add_float(msg, zone.y);
        lo_message_add_float(msg, zone.score);
        lo_message_add_float(msg, zone.radius);
        lo_send_message(_loAddress, "/pose/zone", msg);
        lo_message_free(msg);
    }

    for (const auto& event : frame.collisions) {
        lo_message msg = lo_message_new();
        lo_message_add_string(msg, event.bodyPart.c_str());
        lo_message_add_string(msg, event.targetId.c_str());
        lo_message_add_float(msg, event.position.x);
        lo_message_add_float(msg, event.position.y);
        lo_message_add_int64(msg, event.timestampMs);
        lo_send_message(_loAddress, "/pose/collision", msg);
        lo_message_free(msg);
    }

    std::vector<float> packed;
    packed.reserve(core::HAND_LANDMARK_COUNT * 3);
    for (size_t h = 0; h < frame.hands.size(); ++h) {
        const auto& hand = frame.hands[h];

        packed.clear();
        for (const auto& p : hand.landmarks) {
            packed.push_back(p.x);
            packed.push_back(p.y);
            packed.push_back(p.z);
        }

        lo_message msg = lo_message_new();
        lo_message_add_int32(msg, static_cast<int32_t>(h));
        lo_message_add_string(msg, hand.handedness ? hand.handedness->category.c_str() : "Unknown");
        lo_blob blob = lo_blob_new(static_cast<int32_t>(packed.size() * sizeof(float)), packed.data());
        lo_message_add_blob(msg, blob);
        lo_send_message(_loAddress, "/hand/landmarks", msg);
        lo_blob_free(blob);
        lo_message_free(msg);
    }
}

} // namespace net
