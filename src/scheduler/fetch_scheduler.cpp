/**
 * Rate-limited concurrent fetch scheduler implementation
 */

#include <algorithm>
#include <utility>
#include <boost/asio/post.hpp>

#include "market_signals/common/logging.h"
#include "market_signals/scheduler/fetch_scheduler.h"

namespace market_signals {
namespace scheduler {

namespace {

int checkedPoolSize(const common::SchedulerConfig& config) {
    if (config.worker_pool_size <= 0) {
        throw common::ConfigError("Worker pool size must be positive");
    }
    if (config.max_retries < 0) {
        throw common::ConfigError("Max retries must not be negative");
    }
    if (config.backoff_floor_ms <= 0) {
        throw common::ConfigError("Retry backoff floor must be positive");
    }
    return config.worker_pool_size;
}

size_t indexOf(EndpointClass endpoint_class) {
    return static_cast<size_t>(endpoint_class);
}

std::string describe(const FetchRequest& request) {
    return endpointClassToString(request.endpoint_class) + " request #" +
           std::to_string(request.id) + " for " + request.symbol;
}

} // namespace

int defaultPriority(EndpointClass endpoint_class) {
    switch (endpoint_class) {
        case EndpointClass::QUOTE: return 30;
        case EndpointClass::OPTION_CHAIN: return 20;
        case EndpointClass::HISTORICAL: return 10;
        case EndpointClass::ORDER: return 5;
        case EndpointClass::OTHER: return 0;
        default: return 0;
    }
}

FetchScheduler::FetchScheduler(const common::SchedulerConfig& config,
                               QuotaTracker& quota,
                               data::MarketDataSource& source,
                               common::Clock& clock)
    : worker_pool_size_(checkedPoolSize(config)),
      max_retries_(config.max_retries),
      backoff_floor_(std::chrono::milliseconds(config.backoff_floor_ms)),
      max_backoff_(std::chrono::milliseconds(std::max(config.max_backoff_ms, config.backoff_floor_ms))),
      quota_(quota),
      source_(source),
      clock_(clock),
      pool_(static_cast<size_t>(worker_pool_size_)) {
}

FetchScheduler::~FetchScheduler() {
    // Abandoned fetches still hold `this`; let them finish before members go away
    pool_.join();
}

uint64_t FetchScheduler::submit(FetchRequest request) {
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        request.id = next_id_++;
        id = request.id;
        enqueueReady(request);
        ++stats_.submitted;
        ++completion_seq_;
    }
    cv_.notify_all();
    return id;
}

void FetchScheduler::setResultCallback(ResultCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

std::vector<FetchResult> FetchScheduler::run(common::TimePoint deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    results_.clear();

    while (true) {
        common::TimePoint now = clock_.now();
        processCompletions(now);

        if (now >= deadline) {
            if (!idle()) {
                LOG_WARNING("Fetch deadline reached with " +
                            std::to_string(ready_.size() + parked_.size() + in_flight_.size()) +
                            " requests outstanding");
                timeoutAll();
            }
        } else {
            releaseParked(now);
            dispatchReady(now);
        }

        if (!pending_callbacks_.empty()) {
            std::vector<FetchResult> batch;
            batch.swap(pending_callbacks_);
            ResultCallback callback = callback_;

            lock.unlock();
            if (callback) {
                for (const auto& result : batch) {
                    callback(result);
                }
            }
            lock.lock();
            continue;
        }

        if (idle()) {
            break;
        }

        uint64_t seen = completion_seq_;
        common::TimePoint wake = nextWake(clock_.now(), deadline);
        clock_.waitUntil(lock, cv_, wake, [this, seen]() { return completion_seq_ != seen; });
    }

    std::vector<FetchResult> finished;
    finished.swap(results_);
    return finished;
}

SchedulerStats FetchScheduler::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void FetchScheduler::resetStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = SchedulerStats();
}

void FetchScheduler::enqueueReady(const FetchRequest& request) {
    ready_.insert(ReadyEntry{request.priority, next_sequence_++, request});
}

void FetchScheduler::processCompletions(common::TimePoint now) {
    while (!completions_.empty()) {
        Completion completion = std::move(completions_.front());
        completions_.pop_front();

        auto it = in_flight_.find(completion.request.id);
        if (it == in_flight_.end()) {
            // Abandoned at a deadline; the result is discarded
            continue;
        }
        in_flight_.erase(it);

        FetchRequest& request = completion.request;
        const data::FetchOutcome& outcome = completion.outcome;

        switch (outcome.status) {
            case data::FetchStatus::OK:
                ++stats_.completed;
                emit(request, FetchResultStatus::COMPLETED, std::move(completion.outcome), "");
                break;

            case data::FetchStatus::RATE_LIMITED:
                ++stats_.rate_limited;
                quota_.recordRejection(request.endpoint_class, outcome.retry_after);
                retryOrFail(request, outcome, now, true);
                break;

            case data::FetchStatus::TRANSIENT_ERROR:
                retryOrFail(request, outcome, now, false);
                break;

            case data::FetchStatus::PERMANENT_ERROR:
            default:
                ++stats_.failed;
                LOG_ERROR(describe(request) + " failed: " + outcome.error);
                emit(request, FetchResultStatus::FAILED, outcome, outcome.error);
                break;
        }
    }
}

void FetchScheduler::releaseParked(common::TimePoint now) {
    while (!parked_.empty() && parked_.begin()->first <= now) {
        enqueueReady(parked_.begin()->second);
        parked_.erase(parked_.begin());
    }
}

void FetchScheduler::dispatchReady(common::TimePoint now) {
    auto it = ready_.begin();
    while (it != ready_.end() && active_fetches_ < worker_pool_size_) {
        EndpointClass endpoint_class = it->request.endpoint_class;
        common::TimePoint& blocked_until = class_blocked_until_[indexOf(endpoint_class)];

        if (now < blocked_until) {
            ++it;
            continue;
        }

        Reservation reservation = quota_.reserve(endpoint_class);
        switch (reservation.kind) {
            case Reservation::Kind::ALLOWED: {
                FetchRequest request = it->request;
                it = ready_.erase(it);
                launch(std::move(request), now);
                break;
            }

            case Reservation::Kind::DEFERRED:
                ++stats_.deferred;
                blocked_until = now + reservation.wait;
                LOG_DEBUG("Quota window full for " + endpointClassToString(endpoint_class) +
                          ", deferring " + describe(it->request));
                ++it;
                break;

            case Reservation::Kind::COOLING_DOWN:
                ++stats_.cooled_down;
                blocked_until = reservation.until;
                LOG_DEBUG(endpointClassToString(endpoint_class) + " class cooling down, parking " +
                          describe(it->request));
                ++it;
                break;
        }
    }
}

void FetchScheduler::launch(FetchRequest request, common::TimePoint now) {
    request.last_attempt = now;
    in_flight_[request.id] = request;
    ++active_fetches_;
    ++stats_.dispatched;
    stats_.max_concurrent = std::max(stats_.max_concurrent, active_fetches_);

    boost::asio::post(pool_, [this, request]() {
        data::FetchOutcome outcome;
        try {
            outcome = execute(request);
        } catch (const std::exception& e) {
            outcome = data::FetchOutcome::transientError(
                std::string("Market data source threw: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_fetches_;
            completions_.push_back(Completion{request, std::move(outcome)});
            ++completion_seq_;
        }
        cv_.notify_all();
    });
}

void FetchScheduler::retryOrFail(FetchRequest request, const data::FetchOutcome& outcome,
                                 common::TimePoint now, bool rate_limited) {
    ++request.retry_count;

    if (request.retry_count > max_retries_) {
        ++stats_.failed;
        std::string error = "Gave up after " + std::to_string(request.retry_count) +
                            " attempts: " + outcome.error;
        LOG_ERROR(describe(request) + ": " + error);
        emit(request, FetchResultStatus::FAILED, outcome, error);
        return;
    }

    ++stats_.retried;
    common::TimePoint wake = now + backoffFor(request.retry_count);

    if (rate_limited) {
        common::TimePoint cooldown = quota_.getWindow(request.endpoint_class).cooldown_until;
        wake = std::max(wake, cooldown);
        common::TimePoint& blocked_until = class_blocked_until_[indexOf(request.endpoint_class)];
        blocked_until = std::max(blocked_until, cooldown);
    }

    LOG_WARNING(describe(request) + " attempt " + std::to_string(request.retry_count) +
                " failed (" + data::fetchStatusToString(outcome.status) + ": " + outcome.error +
                "), retrying in " +
                std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(wake - now).count()) +
                " ms");

    parked_.emplace(wake, std::move(request));
}

void FetchScheduler::emit(const FetchRequest& request, FetchResultStatus status,
                          data::FetchOutcome outcome, const std::string& error) {
    FetchResult result;
    result.request = request;
    result.status = status;
    result.outcome = std::move(outcome);
    result.error = error;

    switch (status) {
        case FetchResultStatus::COMPLETED:
            result.attempts = request.retry_count + 1;
            break;
        case FetchResultStatus::FAILED:
            result.attempts = std::max(request.retry_count, 1);
            if (result.outcome.status == data::FetchStatus::PERMANENT_ERROR) {
                result.attempts = request.retry_count + 1;
            }
            break;
        case FetchResultStatus::TIMED_OUT:
            result.attempts = request.retry_count;
            break;
    }

    results_.push_back(result);
    pending_callbacks_.push_back(std::move(result));
}

void FetchScheduler::timeoutAll() {
    auto timeout = [this](const FetchRequest& request, int extra_attempt) {
        FetchRequest copy = request;
        copy.retry_count += extra_attempt;
        ++stats_.timed_out;
        emit(copy, FetchResultStatus::TIMED_OUT,
             data::FetchOutcome::transientError("Deadline exceeded"), "Deadline exceeded");
    };

    for (const auto& entry : ready_) {
        timeout(entry.request, 0);
    }
    for (const auto& entry : parked_) {
        timeout(entry.second, 0);
    }
    for (const auto& entry : in_flight_) {
        timeout(entry.second, 1);
    }

    ready_.clear();
    parked_.clear();
    in_flight_.clear();
}

bool FetchScheduler::idle() const {
    return ready_.empty() && parked_.empty() && in_flight_.empty();
}

common::TimePoint FetchScheduler::nextWake(common::TimePoint now, common::TimePoint deadline) const {
    common::TimePoint wake = deadline;

    if (!parked_.empty()) {
        wake = std::min(wake, parked_.begin()->first);
    }

    if (active_fetches_ < worker_pool_size_) {
        for (const auto& entry : ready_) {
            common::TimePoint blocked_until = class_blocked_until_[indexOf(entry.request.endpoint_class)];
            if (blocked_until > now) {
                wake = std::min(wake, blocked_until);
            }
        }
    }

    return wake;
}

common::Duration FetchScheduler::backoffFor(int retry_count) const {
    int exponent = std::min(std::max(retry_count - 1, 0), 20);
    common::Duration delay = backoff_floor_ * (int64_t{1} << exponent);
    return std::min(delay, max_backoff_);
}

data::FetchOutcome FetchScheduler::execute(const FetchRequest& request) {
    switch (request.endpoint_class) {
        case EndpointClass::HISTORICAL:
            return source_.fetchHistorical(request.symbol, request.range);
        case EndpointClass::QUOTE:
            return source_.fetchQuote(request.symbol);
        case EndpointClass::OPTION_CHAIN:
            return source_.fetchOptionChain(request.symbol);
        default:
            return data::FetchOutcome::permanentError(
                "No fetch operation for " + endpointClassToString(request.endpoint_class) + " requests");
    }
}

std::string fetchResultStatusToString(FetchResultStatus status) {
    switch (status) {
        case FetchResultStatus::COMPLETED: return "COMPLETED";
        case FetchResultStatus::FAILED: return "FAILED";
        case FetchResultStatus::TIMED_OUT: return "TIMED_OUT";
        default: return "UNKNOWN";
    }
}

} // namespace scheduler
} // namespace market_signals
