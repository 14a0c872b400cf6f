#include <atomic>
#include <thread>
#include <vector>
#include <gtest/gtest.h>

#include "market_signals/common/clock.h"
#include "market_signals/common/config.h"
#include "market_signals/scheduler/quota_tracker.h"

using namespace market_signals;
using scheduler::EndpointClass;
using scheduler::QuotaTracker;
using scheduler::Reservation;

namespace {

common::QuotaConfig minuteQuota(int historical) {
    common::QuotaConfig config;
    config.window_ms = 60000;
    config.min_retry_delay_ms = 60000;
    config.historical_per_window = historical;
    return config;
}

} // namespace

TEST(QuotaTrackerTest, AllowsUpToLimitThenDefers) {
    common::ManualClock clock;
    QuotaTracker quota(minuteQuota(5), clock);

    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(quota.reserve(EndpointClass::HISTORICAL).allowed()) << "call " << i;
    }

    Reservation sixth = quota.reserve(EndpointClass::HISTORICAL);
    EXPECT_EQ(sixth.kind, Reservation::Kind::DEFERRED);
    EXPECT_EQ(sixth.wait, std::chrono::milliseconds(60000));
    EXPECT_EQ(quota.getWindow(EndpointClass::HISTORICAL).calls_made, 5);
}

TEST(QuotaTrackerTest, NeverAllowsPastLimitWithinWindow) {
    common::ManualClock clock;
    QuotaTracker quota(minuteQuota(3), clock);

    int allowed = 0;
    for (int i = 0; i < 20; ++i) {
        clock.advance(std::chrono::milliseconds(1000));
        if (quota.reserve(EndpointClass::HISTORICAL).allowed()) {
            ++allowed;
        }
        EXPECT_LE(quota.getWindow(EndpointClass::HISTORICAL).calls_made, 3);
    }
    EXPECT_EQ(allowed, 3);
}

TEST(QuotaTrackerTest, CallAtBoundaryStartsNewWindow) {
    common::ManualClock clock;
    QuotaTracker quota(minuteQuota(2), clock);

    EXPECT_TRUE(quota.reserve(EndpointClass::HISTORICAL).allowed());
    EXPECT_TRUE(quota.reserve(EndpointClass::HISTORICAL).allowed());

    clock.advance(std::chrono::milliseconds(59999));
    EXPECT_EQ(quota.reserve(EndpointClass::HISTORICAL).kind, Reservation::Kind::DEFERRED);

    clock.advance(std::chrono::milliseconds(1));
    EXPECT_TRUE(quota.reserve(EndpointClass::HISTORICAL).allowed());

    scheduler::QuotaWindow window = quota.getWindow(EndpointClass::HISTORICAL);
    EXPECT_EQ(window.calls_made, 1);
    EXPECT_EQ(window.window_start, clock.now());
}

TEST(QuotaTrackerTest, WindowsStayAlignedToOrigin) {
    common::ManualClock clock;
    common::TimePoint origin = clock.now();
    QuotaTracker quota(minuteQuota(1), clock);

    clock.advance(std::chrono::milliseconds(150000));
    EXPECT_TRUE(quota.reserve(EndpointClass::HISTORICAL).allowed());

    Reservation next = quota.reserve(EndpointClass::HISTORICAL);
    EXPECT_EQ(next.kind, Reservation::Kind::DEFERRED);
    EXPECT_EQ(next.until, origin + std::chrono::milliseconds(180000));
    EXPECT_EQ(next.wait, std::chrono::milliseconds(30000));
}

TEST(QuotaTrackerTest, RejectionCoolsDownClassAndResetsCounter) {
    common::ManualClock clock;
    QuotaTracker quota(minuteQuota(5), clock);

    EXPECT_TRUE(quota.reserve(EndpointClass::HISTORICAL).allowed());
    EXPECT_TRUE(quota.reserve(EndpointClass::HISTORICAL).allowed());

    quota.recordRejection(EndpointClass::HISTORICAL, std::chrono::milliseconds(5000));

    scheduler::QuotaWindow window = quota.getWindow(EndpointClass::HISTORICAL);
    EXPECT_EQ(window.calls_made, 0);
    // Configured minimum beats the smaller server hint
    EXPECT_EQ(window.cooldown_until, clock.now() + std::chrono::milliseconds(60000));

    Reservation blocked = quota.reserve(EndpointClass::HISTORICAL);
    EXPECT_EQ(blocked.kind, Reservation::Kind::COOLING_DOWN);
    EXPECT_EQ(blocked.until, window.cooldown_until);

    clock.advance(std::chrono::milliseconds(59999));
    EXPECT_EQ(quota.reserve(EndpointClass::HISTORICAL).kind, Reservation::Kind::COOLING_DOWN);

    clock.advance(std::chrono::milliseconds(1));
    EXPECT_TRUE(quota.reserve(EndpointClass::HISTORICAL).allowed());
}

TEST(QuotaTrackerTest, ServerDelayLongerThanMinimumWins) {
    common::ManualClock clock;
    QuotaTracker quota(minuteQuota(5), clock);

    quota.recordRejection(EndpointClass::QUOTE, std::chrono::milliseconds(120000));
    EXPECT_EQ(quota.getWindow(EndpointClass::QUOTE).cooldown_until,
              clock.now() + std::chrono::milliseconds(120000));
}

TEST(QuotaTrackerTest, ClassesAreIndependent) {
    common::ManualClock clock;
    QuotaTracker quota(minuteQuota(1), clock);

    EXPECT_TRUE(quota.reserve(EndpointClass::HISTORICAL).allowed());
    EXPECT_FALSE(quota.reserve(EndpointClass::HISTORICAL).allowed());
    EXPECT_TRUE(quota.reserve(EndpointClass::QUOTE).allowed());

    quota.recordRejection(EndpointClass::OPTION_CHAIN, std::chrono::milliseconds(0));
    EXPECT_EQ(quota.reserve(EndpointClass::OPTION_CHAIN).kind, Reservation::Kind::COOLING_DOWN);
    EXPECT_TRUE(quota.reserve(EndpointClass::QUOTE).allowed());
}

TEST(QuotaTrackerTest, RejectsInvalidLimits) {
    common::ManualClock clock;

    common::QuotaConfig zero_limit = minuteQuota(0);
    EXPECT_THROW({ QuotaTracker tracker(zero_limit, clock); }, common::ConfigError);

    common::QuotaConfig zero_window = minuteQuota(5);
    zero_window.window_ms = 0;
    EXPECT_THROW({ QuotaTracker tracker(zero_window, clock); }, common::ConfigError);
}

TEST(QuotaTrackerTest, ConcurrentReservationsRespectLimit) {
    common::ManualClock clock;
    QuotaTracker quota(minuteQuota(50), clock);

    std::atomic<int> allowed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 100; ++i) {
                if (quota.reserve(EndpointClass::HISTORICAL).allowed()) {
                    ++allowed;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(allowed.load(), 50);
    EXPECT_EQ(quota.getWindow(EndpointClass::HISTORICAL).calls_made, 50);
}
