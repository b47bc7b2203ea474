// =============================================================================
// CastLink - Event Channel
// =============================================================================
// Thread-safe FIFO between the session's worker threads and the caller.
// Workers push; the caller drains with tryPop()/waitPop() on its own thread,
// so no callback ever runs on a transport thread.
//
// When bounded, data events past the capacity are dropped (counted); lifecycle
// events are always accepted so a terminal notification is never lost.
// =============================================================================
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace castlink {

template<typename T>
class EventChannel {
public:
    // capacity 0 = unbounded
    explicit EventChannel(size_t capacity = 0) : capacity_(capacity) {}

    // Returns false if dropped for capacity. `essential` bypasses the bound.
    bool push(T event, bool essential = true) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (!essential && capacity_ > 0 && queue_.size() >= capacity_) {
                dropped_++;
                return false;
            }
            queue_.push_back(std::move(event));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mtx_);
        if (queue_.empty()) return std::nullopt;
        T ev = std::move(queue_.front());
        queue_.pop_front();
        return ev;
    }

    template<typename Rep, typename Period>
    std::optional<T> waitPop(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
            return std::nullopt;
        }
        T ev = std::move(queue_.front());
        queue_.pop_front();
        return ev;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.size();
    }

    uint64_t dropped() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return dropped_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        queue_.clear();
    }

private:
    const size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    uint64_t dropped_ = 0;
};

} // namespace castlink
