#include <map>
#include <string>
#include <vector>
#include <gtest/gtest.h>

#include "market_signals/common/clock.h"
#include "market_signals/scheduler/fetch_scheduler.h"
#include "test_helpers.h"

using namespace market_signals;
using scheduler::EndpointClass;
using scheduler::FetchRequest;
using scheduler::FetchResult;
using scheduler::FetchResultStatus;
using scheduler::FetchScheduler;
using test_support::FakeMarketDataSource;

namespace {

FetchRequest makeRequest(const std::string& symbol, EndpointClass endpoint_class) {
    FetchRequest request;
    request.symbol = symbol;
    request.endpoint_class = endpoint_class;
    request.priority = scheduler::defaultPriority(endpoint_class);
    return request;
}

class FetchSchedulerTest : public ::testing::Test {
protected:
    FetchSchedulerTest() {
        quota_config_.window_ms = 60000;
        quota_config_.min_retry_delay_ms = 60000;
        quota_config_.historical_per_window = 5;
        quota_config_.quote_per_window = 100;
        quota_config_.option_chain_per_window = 100;

        scheduler_config_.worker_pool_size = 4;
        scheduler_config_.max_retries = 3;
        scheduler_config_.backoff_floor_ms = 2000;
        scheduler_config_.max_backoff_ms = 300000;
    }

    common::ManualClock clock_;
    common::QuotaConfig quota_config_;
    common::SchedulerConfig scheduler_config_;
    FakeMarketDataSource source_;
};

std::chrono::milliseconds sinceStart(common::TimePoint start, common::TimePoint at) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(at - start);
}

} // namespace

TEST_F(FetchSchedulerTest, SixthRequestWaitsForNextQuotaWindow) {
    scheduler::QuotaTracker quota(quota_config_, clock_);
    FetchScheduler fetcher(scheduler_config_, quota, source_, clock_);
    common::TimePoint start = clock_.now();

    for (int i = 0; i < 6; ++i) {
        fetcher.submit(makeRequest("SYM" + std::to_string(i), EndpointClass::HISTORICAL));
    }

    std::vector<FetchResult> results = fetcher.run();
    ASSERT_EQ(results.size(), 6u);

    int immediate = 0;
    int delayed = 0;
    for (const auto& result : results) {
        EXPECT_TRUE(result.ok());
        if (sinceStart(start, result.request.last_attempt) < std::chrono::milliseconds(60000)) {
            ++immediate;
        } else {
            ++delayed;
        }
    }
    EXPECT_EQ(immediate, 5);
    EXPECT_EQ(delayed, 1);

    scheduler::SchedulerStats stats = fetcher.getStats();
    EXPECT_GE(stats.deferred, 1);
    EXPECT_EQ(stats.dispatched, 6);
    EXPECT_EQ(stats.completed, 6);
    EXPECT_EQ(source_.calls(EndpointClass::HISTORICAL), 6);
}

TEST_F(FetchSchedulerTest, DispatchesByPriorityThenFifo) {
    scheduler_config_.worker_pool_size = 1;
    scheduler::QuotaTracker quota(quota_config_, clock_);
    FetchScheduler fetcher(scheduler_config_, quota, source_, clock_);

    fetcher.submit(makeRequest("HIST1", EndpointClass::HISTORICAL));
    fetcher.submit(makeRequest("QUOTE1", EndpointClass::QUOTE));
    fetcher.submit(makeRequest("CHAIN1", EndpointClass::OPTION_CHAIN));
    fetcher.submit(makeRequest("HIST2", EndpointClass::HISTORICAL));
    fetcher.submit(makeRequest("QUOTE2", EndpointClass::QUOTE));

    std::vector<FetchResult> results = fetcher.run();
    ASSERT_EQ(results.size(), 5u);

    std::vector<std::string> order;
    for (const auto& result : results) {
        order.push_back(result.request.symbol);
    }
    EXPECT_EQ(order, (std::vector<std::string>{"QUOTE1", "QUOTE2", "CHAIN1", "HIST1", "HIST2"}));
}

TEST_F(FetchSchedulerTest, RateLimitedRequestWaitsForCooldown) {
    scheduler::QuotaTracker quota(quota_config_, clock_);
    FetchScheduler fetcher(scheduler_config_, quota, source_, clock_);
    common::TimePoint start = clock_.now();

    source_.enqueue(EndpointClass::HISTORICAL, "AAA",
                    data::FetchOutcome::rateLimited(std::chrono::milliseconds(2000), "Too many requests"));
    fetcher.submit(makeRequest("AAA", EndpointClass::HISTORICAL));

    std::vector<FetchResult> results = fetcher.run();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].ok());
    EXPECT_EQ(results[0].attempts, 2);
    EXPECT_GE(sinceStart(start, results[0].request.last_attempt), std::chrono::milliseconds(60000));

    scheduler::SchedulerStats stats = fetcher.getStats();
    EXPECT_EQ(stats.rate_limited, 1);
    EXPECT_EQ(stats.retried, 1);
    EXPECT_EQ(source_.calls(EndpointClass::HISTORICAL), 2);
}

TEST_F(FetchSchedulerTest, RateLimitBlocksWholeClass) {
    scheduler_config_.worker_pool_size = 1;
    scheduler::QuotaTracker quota(quota_config_, clock_);
    FetchScheduler fetcher(scheduler_config_, quota, source_, clock_);
    common::TimePoint start = clock_.now();

    source_.enqueue(EndpointClass::HISTORICAL, "AAA",
                    data::FetchOutcome::rateLimited(std::chrono::milliseconds(0), "rate limit exceeded"));
    fetcher.submit(makeRequest("AAA", EndpointClass::HISTORICAL));
    fetcher.submit(makeRequest("BBB", EndpointClass::HISTORICAL));

    std::vector<FetchResult> results = fetcher.run();
    ASSERT_EQ(results.size(), 2u);
    for (const auto& result : results) {
        EXPECT_TRUE(result.ok());
        EXPECT_GE(sinceStart(start, result.request.last_attempt), std::chrono::milliseconds(60000))
            << result.request.symbol;
    }
}

TEST_F(FetchSchedulerTest, TransientErrorsBackOffExponentially) {
    scheduler::QuotaTracker quota(quota_config_, clock_);
    FetchScheduler fetcher(scheduler_config_, quota, source_, clock_);
    common::TimePoint start = clock_.now();

    source_.enqueue(EndpointClass::QUOTE, "AAA", data::FetchOutcome::transientError("HTTP 502"));
    source_.enqueue(EndpointClass::QUOTE, "AAA", data::FetchOutcome::transientError("HTTP 503"));
    fetcher.submit(makeRequest("AAA", EndpointClass::QUOTE));

    std::vector<FetchResult> results = fetcher.run();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].ok());
    EXPECT_EQ(results[0].attempts, 3);
    // 2 s after the first failure, 4 s after the second
    EXPECT_GE(sinceStart(start, results[0].request.last_attempt), std::chrono::milliseconds(6000));
    EXPECT_LT(sinceStart(start, results[0].request.last_attempt), std::chrono::milliseconds(60000));
    EXPECT_EQ(fetcher.getStats().rate_limited, 0);
}

TEST_F(FetchSchedulerTest, ExhaustedRetriesReportedExactlyOnce) {
    scheduler::QuotaTracker quota(quota_config_, clock_);
    FetchScheduler fetcher(scheduler_config_, quota, source_, clock_);

    source_.failAlways(EndpointClass::QUOTE, data::FetchOutcome::transientError("connection reset"));

    std::map<uint64_t, int> callbacks;
    fetcher.setResultCallback([&callbacks](const FetchResult& result) { ++callbacks[result.request.id]; });

    uint64_t id = fetcher.submit(makeRequest("AAA", EndpointClass::QUOTE));
    std::vector<FetchResult> results = fetcher.run();

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].status, FetchResultStatus::FAILED);
    EXPECT_EQ(results[0].request.retry_count, 4);
    EXPECT_EQ(callbacks.size(), 1u);
    EXPECT_EQ(callbacks[id], 1);

    scheduler::SchedulerStats stats = fetcher.getStats();
    EXPECT_EQ(stats.failed, 1);
    EXPECT_EQ(stats.retried, 3);
    EXPECT_EQ(source_.calls(EndpointClass::QUOTE), 4);
}

TEST_F(FetchSchedulerTest, PermanentErrorIsNotRetried) {
    scheduler::QuotaTracker quota(quota_config_, clock_);
    FetchScheduler fetcher(scheduler_config_, quota, source_, clock_);

    source_.enqueue(EndpointClass::HISTORICAL, "NOPE", data::FetchOutcome::permanentError("unknown symbol"));
    fetcher.submit(makeRequest("NOPE", EndpointClass::HISTORICAL));

    std::vector<FetchResult> results = fetcher.run();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].status, FetchResultStatus::FAILED);
    EXPECT_EQ(results[0].error, "unknown symbol");
    EXPECT_EQ(fetcher.getStats().retried, 0);
    EXPECT_EQ(source_.calls(EndpointClass::HISTORICAL), 1);
}

TEST_F(FetchSchedulerTest, ConcurrencyNeverExceedsPoolSize) {
    scheduler_config_.worker_pool_size = 3;
    scheduler::QuotaTracker quota(quota_config_, clock_);
    FetchScheduler fetcher(scheduler_config_, quota, source_, clock_);
    source_.setCallDelay(std::chrono::milliseconds(10));

    for (int i = 0; i < 20; ++i) {
        fetcher.submit(makeRequest("SYM" + std::to_string(i), EndpointClass::QUOTE));
    }

    std::vector<FetchResult> results = fetcher.run();
    EXPECT_EQ(results.size(), 20u);
    EXPECT_LE(source_.maxConcurrent(), 3);
    EXPECT_LE(fetcher.getStats().max_concurrent, 3);
    EXPECT_EQ(fetcher.getWorkerPoolSize(), 3);
}

TEST_F(FetchSchedulerTest, ZeroDeadlineTimesOutWithoutFetching) {
    scheduler::QuotaTracker quota(quota_config_, clock_);
    FetchScheduler fetcher(scheduler_config_, quota, source_, clock_);

    for (int i = 0; i < 4; ++i) {
        fetcher.submit(makeRequest("SYM" + std::to_string(i), EndpointClass::HISTORICAL));
    }

    std::vector<FetchResult> results = fetcher.run(clock_.now());
    ASSERT_EQ(results.size(), 4u);
    for (const auto& result : results) {
        EXPECT_EQ(result.status, FetchResultStatus::TIMED_OUT);
    }
    EXPECT_EQ(source_.totalCalls(), 0);
    EXPECT_EQ(fetcher.getStats().dispatched, 0);
    EXPECT_EQ(fetcher.getStats().timed_out, 4);
}

TEST_F(FetchSchedulerTest, DeadlineAbandonsParkedRetries) {
    scheduler::QuotaTracker quota(quota_config_, clock_);
    FetchScheduler fetcher(scheduler_config_, quota, source_, clock_);
    common::TimePoint start = clock_.now();

    source_.failAlways(EndpointClass::HISTORICAL,
                       data::FetchOutcome::rateLimited(std::chrono::milliseconds(0), "Too many requests"));
    fetcher.submit(makeRequest("AAA", EndpointClass::HISTORICAL));
    fetcher.submit(makeRequest("BBB", EndpointClass::HISTORICAL));

    std::vector<FetchResult> results = fetcher.run(start + std::chrono::milliseconds(30000));
    ASSERT_EQ(results.size(), 2u);
    for (const auto& result : results) {
        EXPECT_EQ(result.status, FetchResultStatus::TIMED_OUT);
    }
    EXPECT_EQ(fetcher.getStats().timed_out, 2);
    EXPECT_LE(clock_.now(), start + std::chrono::milliseconds(30000));
}

TEST_F(FetchSchedulerTest, RequestsWithoutFetchOperationFail) {
    scheduler::QuotaTracker quota(quota_config_, clock_);
    FetchScheduler fetcher(scheduler_config_, quota, source_, clock_);

    fetcher.submit(makeRequest("AAA", EndpointClass::ORDER));
    std::vector<FetchResult> results = fetcher.run();

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].status, FetchResultStatus::FAILED);
    EXPECT_EQ(source_.totalCalls(), 0);
}

TEST_F(FetchSchedulerTest, RejectsEmptyWorkerPool) {
    scheduler_config_.worker_pool_size = 0;
    scheduler::QuotaTracker quota(quota_config_, clock_);
    EXPECT_THROW({ FetchScheduler fetcher(scheduler_config_, quota, source_, clock_); }, common::ConfigError);
}

TEST_F(FetchSchedulerTest, InstanceServesSeveralRuns) {
    scheduler::QuotaTracker quota(quota_config_, clock_);
    FetchScheduler fetcher(scheduler_config_, quota, source_, clock_);

    fetcher.submit(makeRequest("INFY", EndpointClass::QUOTE));
    fetcher.submit(makeRequest("TCS", EndpointClass::QUOTE));
    std::vector<FetchResult> first = fetcher.run();
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(fetcher.getStats().completed, 2);

    fetcher.resetStats();
    EXPECT_EQ(fetcher.getStats().submitted, 0);

    uint64_t id = fetcher.submit(makeRequest("WIPRO", EndpointClass::QUOTE));
    std::vector<FetchResult> second = fetcher.run();

    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].request.id, id);
    EXPECT_EQ(second[0].request.symbol, "WIPRO");
    EXPECT_EQ(fetcher.getStats().submitted, 1);
    EXPECT_EQ(fetcher.getStats().completed, 1);
}
