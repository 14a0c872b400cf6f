/**
 * Upstream market data source interface
 */

#pragma once

#include <chrono>
#include <string>

#include "market_signals/data/market_data.h"

namespace market_signals {
namespace data {

// Result classification of one upstream call
enum class FetchStatus {
    OK,
    RATE_LIMITED,       // Server rejected the call for quota reasons
    TRANSIENT_ERROR,    // Network failure or server error, worth retrying
    PERMANENT_ERROR     // Unknown symbol, malformed payload; retrying will not help
};

// Outcome of one call to the source. Only the payload matching the call is filled.
struct FetchOutcome {
    FetchStatus status = FetchStatus::OK;
    std::chrono::milliseconds retry_after{0};
    std::string error;

    OHLCVSeries series;
    Quote quote;
    OptionChainSnapshot chain;

    bool ok() const { return status == FetchStatus::OK; }

    static FetchOutcome rateLimited(std::chrono::milliseconds retry_after, const std::string& message);
    static FetchOutcome transientError(const std::string& message);
    static FetchOutcome permanentError(const std::string& message);
};

// Capability-typed collaborator the fetch scheduler drives. Implementations must be
// safe to call from several worker threads at once and report failures through
// FetchOutcome rather than by throwing.
class MarketDataSource {
public:
    virtual ~MarketDataSource() = default;

    virtual FetchOutcome fetchHistorical(const std::string& symbol, const DateRange& range) = 0;
    virtual FetchOutcome fetchQuote(const std::string& symbol) = 0;
    virtual FetchOutcome fetchOptionChain(const std::string& symbol) = 0;

    virtual std::string getName() const = 0;
};

// Convert fetch status to string
std::string fetchStatusToString(FetchStatus status);

} // namespace data
} // namespace market_signals
