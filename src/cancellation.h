#pragma once

#include <atomic>
#include <chrono>

namespace malsand {

// Shared between the serializer (which cancels) and the guest process
// driver (which polls). The deadline is the job timeout.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() : deadline_(Clock::time_point::max()) {}
    explicit CancellationToken(Clock::time_point deadline) : deadline_(deadline) {}

    void cancel() { cancelled_ = true; }
    bool cancelled() const { return cancelled_; }
    bool expired() const { return Clock::now() >= deadline_; }
    bool stop_requested() const { return cancelled() || expired(); }

    std::chrono::milliseconds remaining() const {
        if (deadline_ == Clock::time_point::max()) {
            return std::chrono::milliseconds::max();
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

private:
    std::atomic<bool> cancelled_{false};
    Clock::time_point deadline_;
};

} // namespace malsand
