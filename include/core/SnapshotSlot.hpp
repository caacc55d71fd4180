#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

namespace core {

/**
 * Hand-off of the newest per-frame snapshot from the pipeline thread to a sink thread.
 *
 * Holds at most one value. Publishing over an unread value replaces it, so a slow
 * consumer always sees the latest frame and never a backlog.
 */
template<typename T>
class SnapshotSlot {
public:
    SnapshotSlot() = default;

    // Non-copyable
    SnapshotSlot(const SnapshotSlot&) = delete;
    SnapshotSlot& operator=(const SnapshotSlot&) = delete;

    /**
     * Store a value, waking a waiting consumer.
     * @return true if an unread value was overwritten
     */
    bool publish(T value) {
        bool replaced;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            replaced = _value.has_value();
            _value = std::move(value);
        }
        _cv.notify_one();
        return replaced;
    }

    /**
     * Take the stored value, waiting up to timeout for one to arrive.
     */
    template<typename Rep, typename Period>
    std::optional<T> take(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(_mutex);
        _cv.wait_for(lock, timeout, [this] { return _value.has_value(); });
        std::optional<T> out = std::move(_value);
        _value.reset();
        return out;
    }

    [[nodiscard]] bool hasValue() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _value.has_value();
    }

private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::optional<T> _value;
};

} // namespace core
