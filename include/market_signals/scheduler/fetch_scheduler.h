/**
 * Rate-limited concurrent fetch scheduler
 */

#pragma once

#include <array>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/asio/thread_pool.hpp>

#include "market_signals/common/clock.h"
#include "market_signals/common/config.h"
#include "market_signals/data/market_data_source.h"
#include "market_signals/scheduler/quota_tracker.h"

namespace market_signals {
namespace scheduler {

// One unit of upstream work for one symbol
struct FetchRequest {
    uint64_t id = 0;
    std::string symbol;
    EndpointClass endpoint_class = EndpointClass::HISTORICAL;
    int priority = 0;
    int retry_count = 0;
    common::TimePoint last_attempt{};
    data::DateRange range;      // HISTORICAL only
};

// Higher runs first. Quotes are cheap and time-sensitive, historical calls are
// the scarcest budget and tolerate delay.
int defaultPriority(EndpointClass endpoint_class);

enum class FetchResultStatus {
    COMPLETED,
    FAILED,         // Permanent error or retries exhausted
    TIMED_OUT       // Abandoned at the batch deadline
};

// Terminal result; exactly one per submitted request
struct FetchResult {
    FetchRequest request;
    FetchResultStatus status = FetchResultStatus::COMPLETED;
    data::FetchOutcome outcome;     // Payload when COMPLETED
    std::string error;
    int attempts = 0;

    bool ok() const { return status == FetchResultStatus::COMPLETED; }
};

struct SchedulerStats {
    int submitted = 0;
    int dispatched = 0;
    int completed = 0;
    int deferred = 0;
    int cooled_down = 0;
    int rate_limited = 0;
    int retried = 0;
    int failed = 0;
    int timed_out = 0;
    int max_concurrent = 0;
};

/**
 * Drains FetchRequests through a bounded worker pool.
 *
 * A single dispatcher loop (the thread calling run()) owns every scheduling
 * decision: it asks the QuotaTracker before each dispatch, keeps requests of a
 * deferred or cooling-down class queued without occupying a worker, parks
 * retried requests until their backoff expires and waits on the injected clock
 * between events. Workers only perform the network call.
 *
 * An instance may serve several runs. run() returns at its deadline without
 * waiting for abandoned network calls; only destruction waits for them.
 */
class FetchScheduler {
public:
    using ResultCallback = std::function<void(const FetchResult&)>;

    FetchScheduler(const common::SchedulerConfig& config,
                   QuotaTracker& quota,
                   data::MarketDataSource& source,
                   common::Clock& clock);
    ~FetchScheduler();

    FetchScheduler(const FetchScheduler&) = delete;
    FetchScheduler& operator=(const FetchScheduler&) = delete;

    // Queue a request; returns its assigned id
    uint64_t submit(FetchRequest request);

    // Invoked on the dispatcher thread, without internal locks held, once per
    // terminal result
    void setResultCallback(ResultCallback callback);

    // Run until every submitted request has a terminal result or the deadline
    // passes. Returns the results produced by this call.
    std::vector<FetchResult> run(common::TimePoint deadline = common::TimePoint::max());

    SchedulerStats getStats() const;

    // Zero the counters before a new run on the same instance. Fetches
    // abandoned by an earlier run keep their workers busy until they return,
    // and their outcomes are discarded.
    void resetStats();

    int getWorkerPoolSize() const { return worker_pool_size_; }

private:
    struct ReadyEntry {
        int priority;
        uint64_t sequence;
        FetchRequest request;
    };

    struct ReadyOrder {
        bool operator()(const ReadyEntry& a, const ReadyEntry& b) const {
            if (a.priority != b.priority) {
                return a.priority > b.priority;
            }
            return a.sequence < b.sequence;
        }
    };

    struct Completion {
        FetchRequest request;
        data::FetchOutcome outcome;
    };

    const int worker_pool_size_;
    const int max_retries_;
    const common::Duration backoff_floor_;
    const common::Duration max_backoff_;

    QuotaTracker& quota_;
    data::MarketDataSource& source_;
    common::Clock& clock_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::set<ReadyEntry, ReadyOrder> ready_;
    std::multimap<common::TimePoint, FetchRequest> parked_;
    std::unordered_map<uint64_t, FetchRequest> in_flight_;
    std::deque<Completion> completions_;
    std::array<common::TimePoint, kEndpointClassCount> class_blocked_until_{};

    std::vector<FetchResult> results_;
    std::vector<FetchResult> pending_callbacks_;
    ResultCallback callback_;

    uint64_t next_id_ = 1;
    uint64_t next_sequence_ = 0;
    uint64_t completion_seq_ = 0;
    int active_fetches_ = 0;
    SchedulerStats stats_;

    // Last member: joined first on destruction
    boost::asio::thread_pool pool_;

    // All helpers below expect mutex_ held
    void enqueueReady(const FetchRequest& request);
    void processCompletions(common::TimePoint now);
    void releaseParked(common::TimePoint now);
    void dispatchReady(common::TimePoint now);
    void launch(FetchRequest request, common::TimePoint now);
    void retryOrFail(FetchRequest request, const data::FetchOutcome& outcome,
                     common::TimePoint now, bool rate_limited);
    void emit(const FetchRequest& request, FetchResultStatus status,
              data::FetchOutcome outcome, const std::string& error);
    void timeoutAll();
    bool idle() const;
    common::TimePoint nextWake(common::TimePoint now, common::TimePoint deadline) const;
    common::Duration backoffFor(int retry_count) const;

    data::FetchOutcome execute(const FetchRequest& request);
};

// Convert result status to string
std::string fetchResultStatusToString(FetchResultStatus status);

} // namespace scheduler
} // namespace market_signals
