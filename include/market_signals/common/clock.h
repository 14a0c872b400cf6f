/**
 * Time source abstraction for scheduling and quota windows
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace market_signals {
namespace common {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using Duration = SteadyClock::duration;
using WallTime = std::chrono::system_clock::time_point;

// Clock interface. All time-dependent components take one by reference so that
// tests can drive them with virtual time.
class Clock {
public:
    virtual ~Clock() = default;

    // Monotonic time used for windows, backoff and deadlines
    virtual TimePoint now() const = 0;

    // Calendar time used for market session checks and report timestamps
    virtual WallTime wallTime() const = 0;

    // Block on cv until ready() holds or the clock reaches deadline.
    // TimePoint::max() means no deadline. Returns ready().
    virtual bool waitUntil(std::unique_lock<std::mutex>& lock,
                           std::condition_variable& cv,
                           TimePoint deadline,
                           const std::function<bool()>& ready) = 0;
};

// Real time
class SystemClock : public Clock {
public:
    TimePoint now() const override;
    WallTime wallTime() const override;
    bool waitUntil(std::unique_lock<std::mutex>& lock,
                   std::condition_variable& cv,
                   TimePoint deadline,
                   const std::function<bool()>& ready) override;
};

// Virtual clock. Time only moves through advance()/advanceTo() or when a waiter
// has seen no wakeup within the real-time grace period, in which case the clock
// jumps straight to the waiter's deadline.
class ManualClock : public Clock {
public:
    explicit ManualClock(std::chrono::milliseconds grace = std::chrono::milliseconds(50));

    TimePoint now() const override;
    WallTime wallTime() const override;
    bool waitUntil(std::unique_lock<std::mutex>& lock,
                   std::condition_variable& cv,
                   TimePoint deadline,
                   const std::function<bool()>& ready) override;

    void advance(Duration delta);
    void advanceTo(TimePoint target);
    void setWallTime(WallTime wall);

    // Virtual time elapsed since construction
    Duration elapsed() const;

private:
    const TimePoint origin_;
    std::atomic<Duration::rep> offset_{0};
    std::atomic<WallTime::duration::rep> wall_origin_;
    std::chrono::milliseconds grace_;
};

} // namespace common
} // namespace market_signals
