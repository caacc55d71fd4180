#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <lo/lo.h>

#include "core/FrameSink.hpp"
#include "core/SnapshotSlot.hpp"
#include "core/Types.hpp"

namespace net {

/**
 * Publishes fused frames over OSC (UDP) from its own thread.
 *
 * The pipeline thread only copies the frame into a single snapshot slot. A frame
 * the sender has not picked up yet is replaced by the newer one, and a frame that
 * waited longer than the latency limit is discarded by the sender.
 *
 * Address space:
 *   /pose/frame      i i i      frameIndex, zone count, hand count
 *   /pose/zone       s f f f f  bodyPart, x, y, score, radius (display pixels)
 *   /pose/collision  s s f f h  bodyPart, targetId, x, y, timestampMs
 *   /hand/landmarks  i s b      hand index, handedness, 21 x (x,y,z) float32 normalized
 */
class OscSender : public core::FrameSink {
public:
    OscSender(const std::string& host, const std::string& port,
              std::chrono::milliseconds latencyLimit = std::chrono::milliseconds(50));
    ~OscSender() override;

    // Non-copyable
    OscSender(const OscSender&) = delete;
    OscSender& operator=(const OscSender&) = delete;

    bool start();
    void stop();

    void consume(const core::FusedFrame& frame) override;

    [[nodiscard]] bool isRunning() const { return _running; }
    [[nodiscard]] bool hasPending() const { return _slot.hasValue(); }
    [[nodiscard]] uint64_t droppedFrames() const { return _dropped; }
    [[nodiscard]] uint64_t sentFrames() const { return _sent; }

private:
    struct Outgoing {
        core::FusedFrame frame;
        std::chrono::steady_clock::time_point enqueued;
    };

    void loop();
    void send(const core::FusedFrame& frame);

    std::string _host;
    std::string _port;
    std::chrono::milliseconds _latencyLimit;

    lo_address _loAddress = nullptr;

    core::SnapshotSlot<Outgoing> _slot;
    std::atomic<uint64_t> _dropped{0};
    std::atomic<uint64_t> _sent{0};

    std::atomic<bool> _running;
    std::thread _thread;
};

} // namespace net
