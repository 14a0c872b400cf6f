/**
 * Destination for per-symbol reports
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "market_signals/scheduler/fetch_scheduler.h"
#include "market_signals/signals/signal.h"

namespace market_signals {
namespace report {

enum class ReportStatus {
    OK,
    DEGRADED,   // Signal produced with at least one input unavailable
    TIMED_OUT,  // Batch deadline passed before the symbol finished
    FAILED      // No signal could be produced
};

struct SymbolReport {
    std::string symbol;
    ReportStatus status = ReportStatus::FAILED;

    bool has_signal = false;
    signals::Signal signal;

    // Input name (historical, quote, option_chain) -> fetch outcome message
    std::map<std::string, std::string> fetch_messages;

    std::string error;
};

struct BatchSummary {
    int total = 0;
    int ok = 0;
    int degraded = 0;
    int timed_out = 0;
    int failed = 0;
    int cache_hits = 0;
    int64_t started_at = 0;     // Wall clock, seconds
    int64_t duration_ms = 0;
    scheduler::SchedulerStats scheduler;
};

// Report sink interface
class ReportSink {
public:
    virtual ~ReportSink() = default;

    // Called once per symbol, possibly from several compute threads
    virtual void publish(const SymbolReport& report) = 0;

    // Batch totals, published once per cycle before close()
    virtual void publishSummary(const BatchSummary& summary) = 0;

    // Flush the cycle's output
    virtual void close() = 0;
};

// Convert report status to string
std::string reportStatusToString(ReportStatus status);

} // namespace report
} // namespace market_signals
