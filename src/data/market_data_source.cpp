/**
 * Market data source helpers
 */

#include "market_signals/data/market_data_source.h"

namespace market_signals {
namespace data {

FetchOutcome FetchOutcome::rateLimited(std::chrono::milliseconds retry_after, const std::string& message) {
    FetchOutcome outcome;
    outcome.status = FetchStatus::RATE_LIMITED;
    outcome.retry_after = retry_after;
    outcome.error = message;
    return outcome;
}

FetchOutcome FetchOutcome::transientError(const std::string& message) {
    FetchOutcome outcome;
    outcome.status = FetchStatus::TRANSIENT_ERROR;
    outcome.error = message;
    return outcome;
}

FetchOutcome FetchOutcome::permanentError(const std::string& message) {
    FetchOutcome outcome;
    outcome.status = FetchStatus::PERMANENT_ERROR;
    outcome.error = message;
    return outcome;
}

std::string fetchStatusToString(FetchStatus status) {
    switch (status) {
        case FetchStatus::OK: return "OK";
        case FetchStatus::RATE_LIMITED: return "RATE_LIMITED";
        case FetchStatus::TRANSIENT_ERROR: return "TRANSIENT_ERROR";
        case FetchStatus::PERMANENT_ERROR: return "PERMANENT_ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace data
} // namespace market_signals
