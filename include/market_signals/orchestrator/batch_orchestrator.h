/**
 * Drives one fetch-compute-report cycle over a symbol list
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "market_signals/common/clock.h"
#include "market_signals/common/config.h"
#include "market_signals/data/historical_cache.h"
#include "market_signals/data/market_data_source.h"
#include "market_signals/indicators/indicator_pipeline.h"
#include "market_signals/report/report_sink.h"
#include "market_signals/scheduler/quota_tracker.h"
#include "market_signals/signals/signal_aggregator.h"

namespace market_signals {
namespace orchestrator {

/**
 * Per cycle: submits each symbol's fetches to a fresh FetchScheduler, hands a
 * symbol to the compute pool as soon as all of its fetches are terminal, and
 * publishes exactly one SymbolReport per symbol. Fetch failures degrade or fail
 * a single symbol; they never abort the cycle.
 */
class BatchOrchestrator {
public:
    BatchOrchestrator(const common::Config& config,
                      scheduler::QuotaTracker& quota,
                      data::MarketDataSource& source,
                      report::ReportSink& sink,
                      common::Clock& clock);
    ~BatchOrchestrator();

    BatchOrchestrator(const BatchOrchestrator&) = delete;
    BatchOrchestrator& operator=(const BatchOrchestrator&) = delete;

    // Duplicate symbols are processed once. Throws only when the sink cannot close.
    report::BatchSummary runCycle(const std::vector<std::string>& symbols);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace orchestrator
} // namespace market_signals
