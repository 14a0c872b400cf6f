#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <gtest/gtest.h>

#include "market_signals/common/clock.h"
#include "market_signals/orchestrator/batch_orchestrator.h"
#include "test_helpers.h"

using namespace market_signals;
using report::ReportStatus;
using scheduler::EndpointClass;
using test_support::FakeMarketDataSource;
using test_support::MemoryReportSink;

namespace {

// Wednesday 2024-01-10 10:30 IST
constexpr int64_t kSessionOpen = 1704862800;
// Saturday 2024-01-06 10:30 IST
constexpr int64_t kWeekend = 1704517200;

const char* kBaseConfig = R"(
quota:
  window_ms: 1000
  limits:
    historical: 100
    quote: 100
    option_chain: 100
scheduler:
  worker_pool_size: 4
  max_retries: 1
  backoff_floor_ms: 100
  max_backoff_ms: 1000
batch:
  compute_threads: 2
)";

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

class BatchOrchestratorTest : public ::testing::Test {
protected:
    // Generous grace so in-flight fake calls never look idle to the virtual clock
    common::ManualClock clock_{std::chrono::milliseconds(1000)};
    FakeMarketDataSource source_;
    MemoryReportSink sink_;

    void SetUp() override {
        clock_.setWallTime(common::WallTime(std::chrono::seconds(kSessionOpen)));
    }

    // batch_yaml holds extra keys for the batch section, indented two spaces
    report::BatchSummary run(const std::string& batch_yaml, const std::vector<std::string>& symbols) {
        config_ = std::make_unique<common::Config>(common::Config::fromString(std::string(kBaseConfig) + batch_yaml));
        quota_ = std::make_unique<scheduler::QuotaTracker>(config_->getQuotaConfig(), clock_);
        orchestrator_ = std::make_unique<orchestrator::BatchOrchestrator>(*config_, *quota_, source_, sink_, clock_);
        return orchestrator_->runCycle(symbols);
    }

    std::unique_ptr<common::Config> config_;
    std::unique_ptr<scheduler::QuotaTracker> quota_;
    std::unique_ptr<orchestrator::BatchOrchestrator> orchestrator_;
};

TEST_F(BatchOrchestratorTest, ProducesOneReportPerSymbol) {
    report::BatchSummary summary = run("", {"INFY", "TCS", "RELIANCE"});

    EXPECT_EQ(summary.total, 3);
    EXPECT_EQ(summary.ok, 3);
    EXPECT_EQ(summary.failed + summary.degraded + summary.timed_out, 0);
    EXPECT_EQ(sink_.published(), 3);
    EXPECT_EQ(sink_.closed(), 1);

    EXPECT_EQ(source_.calls(EndpointClass::HISTORICAL), 3);
    EXPECT_EQ(source_.calls(EndpointClass::QUOTE), 3);
    EXPECT_EQ(source_.calls(EndpointClass::OPTION_CHAIN), 3);
    EXPECT_EQ(summary.scheduler.completed, 9);

    const report::SymbolReport& infy = sink_.get("INFY");
    EXPECT_EQ(infy.status, ReportStatus::OK);
    ASSERT_TRUE(infy.has_signal);
    EXPECT_EQ(infy.fetch_messages.at("historical"), "ok");
    EXPECT_EQ(infy.fetch_messages.at("quote"), "ok");
    EXPECT_EQ(infy.fetch_messages.at("option_chain"), "ok");
    EXPECT_EQ(infy.signal.symbol, "INFY");
    EXPECT_EQ(infy.signal.direction, signals::Direction::BULLISH);
    EXPECT_DOUBLE_EQ(infy.signal.current_price, 219.0);
    EXPECT_TRUE(infy.signal.has_option);
    EXPECT_EQ(infy.signal.timestamp, kSessionOpen);
    EXPECT_EQ(sink_.summary().total, 3);
}

TEST_F(BatchOrchestratorTest, DuplicateSymbolsRunOnce) {
    report::BatchSummary summary = run("", {"INFY", "INFY", "TCS"});

    EXPECT_EQ(summary.total, 2);
    EXPECT_EQ(sink_.published(), 2);
    EXPECT_EQ(source_.calls(EndpointClass::HISTORICAL), 2);
}

TEST_F(BatchOrchestratorTest, MissingQuoteDegradesSymbol) {
    source_.failAlways(EndpointClass::QUOTE, data::FetchOutcome::permanentError("quote feed down"));

    report::BatchSummary summary = run("", {"INFY"});

    EXPECT_EQ(summary.degraded, 1);
    const report::SymbolReport& infy = sink_.get("INFY");
    EXPECT_EQ(infy.status, ReportStatus::DEGRADED);
    ASSERT_TRUE(infy.has_signal);
    EXPECT_TRUE(infy.signal.degraded);
    EXPECT_TRUE(contains(infy.signal.unavailable_inputs, "quote"));
    EXPECT_NE(infy.fetch_messages.at("quote").find("quote feed down"), std::string::npos);
    // Falls back to the last close
    EXPECT_DOUBLE_EQ(infy.signal.current_price, 219.0);
}

TEST_F(BatchOrchestratorTest, MissingChainDegradesSymbol) {
    source_.failAlways(EndpointClass::OPTION_CHAIN, data::FetchOutcome::permanentError("no options"));

    run("", {"INFY"});

    const report::SymbolReport& infy = sink_.get("INFY");
    EXPECT_EQ(infy.status, ReportStatus::DEGRADED);
    EXPECT_FALSE(infy.signal.has_option);
    EXPECT_TRUE(contains(infy.signal.unavailable_inputs, "option_chain"));
}

TEST_F(BatchOrchestratorTest, HistoricalFailureFailsOnlyThatSymbol) {
    source_.enqueue(EndpointClass::HISTORICAL, "BAD", data::FetchOutcome::permanentError("unknown symbol"));

    report::BatchSummary summary = run("", {"INFY", "BAD"});

    EXPECT_EQ(summary.ok, 1);
    EXPECT_EQ(summary.failed, 1);
    const report::SymbolReport& bad = sink_.get("BAD");
    EXPECT_EQ(bad.status, ReportStatus::FAILED);
    EXPECT_FALSE(bad.has_signal);
    EXPECT_NE(bad.error.find("unknown symbol"), std::string::npos);
    EXPECT_EQ(sink_.get("INFY").status, ReportStatus::OK);
}

TEST_F(BatchOrchestratorTest, TransientHistoricalErrorIsRetried) {
    source_.enqueue(EndpointClass::HISTORICAL, "INFY", data::FetchOutcome::transientError("connection reset"));

    report::BatchSummary summary = run("", {"INFY"});

    EXPECT_EQ(summary.ok, 1);
    EXPECT_EQ(source_.calls(EndpointClass::HISTORICAL), 2);
    EXPECT_EQ(summary.scheduler.retried, 1);
}

TEST_F(BatchOrchestratorTest, ZeroDeadlineTimesOutEverySymbol) {
    report::BatchSummary summary = run("  deadline_ms: 0\n", {"INFY", "TCS"});

    EXPECT_EQ(summary.timed_out, 2);
    EXPECT_EQ(summary.ok + summary.degraded + summary.failed, 0);
    EXPECT_EQ(source_.totalCalls(), 0);
    EXPECT_EQ(sink_.published(), 2);
    EXPECT_EQ(sink_.get("TCS").status, ReportStatus::TIMED_OUT);
    EXPECT_FALSE(sink_.get("TCS").has_signal);
    EXPECT_EQ(sink_.closed(), 1);
}

TEST_F(BatchOrchestratorTest, SkipsQuotesWhenMarketClosed) {
    clock_.setWallTime(common::WallTime(std::chrono::seconds(kWeekend)));

    report::BatchSummary summary = run("", {"INFY"});

    EXPECT_EQ(summary.ok, 1);
    EXPECT_EQ(source_.calls(EndpointClass::QUOTE), 0);
    const report::SymbolReport& infy = sink_.get("INFY");
    EXPECT_EQ(infy.fetch_messages.at("quote"), "skipped: market closed");
    EXPECT_FALSE(infy.signal.degraded);
}

TEST_F(BatchOrchestratorTest, HistoricalOnlyCycle) {
    report::BatchSummary summary =
        run("  fetch_quotes: false\n  fetch_option_chains: false\n", {"INFY", "TCS"});

    EXPECT_EQ(summary.ok, 2);
    EXPECT_EQ(source_.totalCalls(), 2);
    EXPECT_FALSE(sink_.get("TCS").signal.has_option);
    EXPECT_EQ(sink_.get("TCS").fetch_messages.count("quote"), 0u);
}

TEST_F(BatchOrchestratorTest, ShortHistoryStillProducesSignal) {
    source_.setDefaultBars(20);

    run("  fetch_option_chains: false\n", {"INFY"});

    const report::SymbolReport& infy = sink_.get("INFY");
    EXPECT_EQ(infy.status, ReportStatus::OK);
    ASSERT_TRUE(infy.has_signal);
    EXPECT_TRUE(contains(infy.signal.insufficient_inputs, "trend"));
    EXPECT_TRUE(contains(infy.signal.insufficient_inputs, "macd"));
}

TEST_F(BatchOrchestratorTest, SecondCycleUsesHistoricalCache) {
    std::filesystem::path dir = std::filesystem::path(::testing::TempDir()) / "market_signals_cache_test";
    std::filesystem::remove_all(dir);

    std::string yaml = "  fetch_quotes: false\n  fetch_option_chains: false\n  cache_dir: \"" +
                       dir.string() + "\"\n";
    run(yaml, {"INFY", "TCS"});
    EXPECT_EQ(source_.calls(EndpointClass::HISTORICAL), 2);

    report::BatchSummary second = orchestrator_->runCycle({"INFY", "TCS"});

    EXPECT_EQ(source_.calls(EndpointClass::HISTORICAL), 2);
    EXPECT_EQ(second.cache_hits, 2);
    EXPECT_EQ(second.ok, 2);
    EXPECT_EQ(sink_.get("INFY").fetch_messages.at("historical"), "cache hit");
    EXPECT_EQ(sink_.get("INFY").signal.current_price, 219.0);

    std::filesystem::remove_all(dir);
}

TEST_F(BatchOrchestratorTest, CorruptCacheEntryFallsBackToFetch) {
    std::filesystem::path dir = std::filesystem::path(::testing::TempDir()) / "market_signals_corrupt_cache";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    {
        std::ofstream file(dir / "INFY_day.json");
        file << R"({"saved_at":"yesterday","bars":[]})";
    }

    std::string yaml = "  fetch_quotes: false\n  fetch_option_chains: false\n  cache_dir: \"" +
                       dir.string() + "\"\n";
    run(yaml, {"INFY", "TCS"});

    EXPECT_EQ(source_.calls(EndpointClass::HISTORICAL), 2);
    EXPECT_EQ(sink_.get("INFY").status, ReportStatus::OK);
    EXPECT_EQ(sink_.get("TCS").status, ReportStatus::OK);
    EXPECT_EQ(sink_.summary().cache_hits, 0);

    std::filesystem::remove_all(dir);
}

TEST_F(BatchOrchestratorTest, DeadlineDoesNotWaitForAbandonedFetches) {
    source_.setCallDelay(std::chrono::milliseconds(3000));

    auto started = std::chrono::steady_clock::now();
    report::BatchSummary first = run("  deadline_ms: 50\n  fetch_quotes: false\n  fetch_option_chains: false\n",
                                     {"INFY"});
    auto elapsed = std::chrono::steady_clock::now() - started;

    // The virtual clock reaches the deadline after its one second grace period
    EXPECT_LT(elapsed, std::chrono::milliseconds(2500));
    EXPECT_EQ(first.timed_out, 1);
    EXPECT_EQ(first.scheduler.timed_out, 1);
    EXPECT_EQ(sink_.get("INFY").status, ReportStatus::TIMED_OUT);

    // The same scheduler serves the next cycle with fresh counters
    source_.setCallDelay(std::chrono::milliseconds(0));
    report::BatchSummary second = orchestrator_->runCycle({"TCS"});

    EXPECT_EQ(second.ok, 1);
    EXPECT_EQ(second.scheduler.dispatched, 1);
    EXPECT_EQ(second.scheduler.timed_out, 0);
}
