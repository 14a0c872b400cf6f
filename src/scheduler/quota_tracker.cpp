/**
 * Per endpoint-class call budgets implementation
 */

#include <algorithm>

#include "market_signals/common/logging.h"
#include "market_signals/scheduler/quota_tracker.h"

namespace market_signals {
namespace scheduler {

namespace {

size_t indexOf(EndpointClass endpoint_class) {
    return static_cast<size_t>(endpoint_class);
}

} // namespace

QuotaTracker::QuotaTracker(const common::QuotaConfig& config, const common::Clock& clock)
    : clock_(clock),
      window_length_(std::chrono::milliseconds(config.window_ms)),
      min_retry_delay_(std::chrono::milliseconds(config.min_retry_delay_ms)),
      origin_(clock.now()) {
    if (config.window_ms <= 0) {
        throw common::ConfigError("Quota window length must be positive");
    }

    const int limits[kEndpointClassCount] = {
        config.historical_per_window,
        config.quote_per_window,
        config.option_chain_per_window,
        config.order_per_window,
        config.other_per_window,
    };

    for (size_t i = 0; i < kEndpointClassCount; ++i) {
        if (limits[i] <= 0) {
            throw common::ConfigError("Quota limit for " +
                                      endpointClassToString(static_cast<EndpointClass>(i)) +
                                      " must be positive");
        }
        windows_[i].max_calls = limits[i];
        windows_[i].window_start = origin_;
        windows_[i].cooldown_until = origin_;
    }
}

Reservation QuotaTracker::reserve(EndpointClass endpoint_class) {
    std::lock_guard<std::mutex> lock(mutex_);

    common::TimePoint now = clock_.now();
    QuotaWindow& window = windows_[indexOf(endpoint_class)];

    Reservation reservation;
    if (now < window.cooldown_until) {
        reservation.kind = Reservation::Kind::COOLING_DOWN;
        reservation.until = window.cooldown_until;
        reservation.wait = window.cooldown_until - now;
        return reservation;
    }

    rollWindow(window, now);

    if (window.calls_made < window.max_calls) {
        ++window.calls_made;
        reservation.kind = Reservation::Kind::ALLOWED;
        return reservation;
    }

    reservation.kind = Reservation::Kind::DEFERRED;
    reservation.until = window.window_start + window_length_;
    reservation.wait = reservation.until - now;
    return reservation;
}

void QuotaTracker::recordRejection(EndpointClass endpoint_class,
                                   common::Duration server_suggested_delay) {
    std::lock_guard<std::mutex> lock(mutex_);

    common::TimePoint now = clock_.now();
    QuotaWindow& window = windows_[indexOf(endpoint_class)];

    common::Duration delay = std::max(server_suggested_delay, min_retry_delay_);
    window.cooldown_until = std::max(window.cooldown_until, now + delay);
    window.window_start = alignedWindowStart(now);
    window.calls_made = 0;

    LOG_WARNING("Rate limit hit for " + endpointClassToString(endpoint_class) +
                " calls, cooling down for " +
                std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                    window.cooldown_until - now).count()) + " ms");
}

QuotaWindow QuotaTracker::getWindow(EndpointClass endpoint_class) const {
    std::lock_guard<std::mutex> lock(mutex_);
    QuotaWindow window = windows_[indexOf(endpoint_class)];
    rollWindow(window, clock_.now());
    return window;
}

void QuotaTracker::rollWindow(QuotaWindow& window, common::TimePoint now) const {
    if (now >= window.window_start + window_length_) {
        window.window_start = alignedWindowStart(now);
        window.calls_made = 0;
    }
}

common::TimePoint QuotaTracker::alignedWindowStart(common::TimePoint now) const {
    if (now <= origin_) {
        return origin_;
    }
    auto windows_elapsed = (now - origin_) / window_length_;
    return origin_ + windows_elapsed * window_length_;
}

std::string endpointClassToString(EndpointClass endpoint_class) {
    switch (endpoint_class) {
        case EndpointClass::HISTORICAL: return "historical";
        case EndpointClass::QUOTE: return "quote";
        case EndpointClass::OPTION_CHAIN: return "option_chain";
        case EndpointClass::ORDER: return "order";
        case EndpointClass::OTHER: return "other";
        default: return "unknown";
    }
}

std::string reservationKindToString(Reservation::Kind kind) {
    switch (kind) {
        case Reservation::Kind::ALLOWED: return "ALLOWED";
        case Reservation::Kind::DEFERRED: return "DEFERRED";
        case Reservation::Kind::COOLING_DOWN: return "COOLING_DOWN";
        default: return "UNKNOWN";
    }
}

} // namespace scheduler
} // namespace market_signals
