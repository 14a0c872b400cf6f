/**
 * Per endpoint-class call budgets
 */

#pragma once

#include <array>
#include <mutex>
#include <string>

#include "market_signals/common/clock.h"
#include "market_signals/common/config.h"

namespace market_signals {
namespace scheduler {

// Category of upstream calls sharing one budget
enum class EndpointClass {
    HISTORICAL,
    QUOTE,
    OPTION_CHAIN,
    ORDER,
    OTHER
};

constexpr size_t kEndpointClassCount = 5;

// Answer to "may I call now"
struct Reservation {
    enum class Kind {
        ALLOWED,
        DEFERRED,       // Window full; retry after `wait`
        COOLING_DOWN    // Class blocked after a server rejection until `until`
    };

    Kind kind = Kind::ALLOWED;
    common::Duration wait{0};
    common::TimePoint until{};

    bool allowed() const { return kind == Kind::ALLOWED; }
};

// Snapshot of one class's window
struct QuotaWindow {
    int calls_made = 0;
    int max_calls = 0;
    common::TimePoint window_start{};
    common::TimePoint cooldown_until{};
};

/**
 * Tracks how many calls each endpoint class made in the current fixed window.
 * Windows are aligned to the tracker's creation time; a call exactly on a
 * boundary counts toward the window starting there. Thread-safe.
 */
class QuotaTracker {
public:
    QuotaTracker(const common::QuotaConfig& config, const common::Clock& clock);

    // Atomic check-and-increment. Counts the call only when ALLOWED is returned.
    Reservation reserve(EndpointClass endpoint_class);

    // Server said "slow down": block the class for max(suggested, minimum retry
    // delay) and reset its counter
    void recordRejection(EndpointClass endpoint_class, common::Duration server_suggested_delay);

    QuotaWindow getWindow(EndpointClass endpoint_class) const;

    common::Duration getWindowLength() const { return window_length_; }

private:
    const common::Clock& clock_;
    const common::Duration window_length_;
    const common::Duration min_retry_delay_;
    const common::TimePoint origin_;

    std::array<QuotaWindow, kEndpointClassCount> windows_;
    mutable std::mutex mutex_;

    // Roll the window forward if `now` has left it. Caller holds mutex_.
    void rollWindow(QuotaWindow& window, common::TimePoint now) const;
    common::TimePoint alignedWindowStart(common::TimePoint now) const;
};

// Convert endpoint class to string
std::string endpointClassToString(EndpointClass endpoint_class);

// Convert reservation kind to string
std::string reservationKindToString(Reservation::Kind kind);

} // namespace scheduler
} // namespace market_signals
