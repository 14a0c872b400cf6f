/**
 * Clock implementations
 */

#include "market_signals/common/clock.h"

namespace market_signals {
namespace common {

TimePoint SystemClock::now() const {
    return SteadyClock::now();
}

WallTime SystemClock::wallTime() const {
    return std::chrono::system_clock::now();
}

bool SystemClock::waitUntil(std::unique_lock<std::mutex>& lock,
                            std::condition_variable& cv,
                            TimePoint deadline,
                            const std::function<bool()>& ready) {
    if (deadline == TimePoint::max()) {
        cv.wait(lock, ready);
        return true;
    }
    return cv.wait_until(lock, deadline, ready);
}

ManualClock::ManualClock(std::chrono::milliseconds grace)
    : origin_(TimePoint() + std::chrono::hours(24)),
      wall_origin_(std::chrono::system_clock::now().time_since_epoch().count()),
      grace_(grace) {
}

TimePoint ManualClock::now() const {
    return origin_ + Duration(offset_.load());
}

WallTime ManualClock::wallTime() const {
    return WallTime(WallTime::duration(wall_origin_.load())) +
           std::chrono::duration_cast<WallTime::duration>(elapsed());
}

bool ManualClock::waitUntil(std::unique_lock<std::mutex>& lock,
                            std::condition_variable& cv,
                            TimePoint deadline,
                            const std::function<bool()>& ready) {
    // Give real work (fetches on worker threads) a chance to report first
    if (cv.wait_for(lock, grace_, ready)) {
        return true;
    }

    if (deadline == TimePoint::max()) {
        cv.wait(lock, ready);
        return true;
    }

    advanceTo(deadline);
    return ready();
}

void ManualClock::advance(Duration delta) {
    if (delta.count() > 0) {
        offset_.fetch_add(delta.count());
    }
}

void ManualClock::advanceTo(TimePoint target) {
    Duration::rep wanted = (target - origin_).count();
    Duration::rep current = offset_.load();
    while (wanted > current && !offset_.compare_exchange_weak(current, wanted)) {
    }
}

void ManualClock::setWallTime(WallTime wall) {
    // Rebase so that wallTime() reports `wall` at the current virtual instant
    auto base = wall - std::chrono::duration_cast<WallTime::duration>(elapsed());
    wall_origin_ = base.time_since_epoch().count();
}

Duration ManualClock::elapsed() const {
    return Duration(offset_.load());
}

} // namespace common
} // namespace market_signals
