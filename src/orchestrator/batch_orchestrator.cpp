/**
 * Drives one fetch-compute-report cycle over a symbol list
 */

#include <chrono>
#include <mutex>
#include <set>
#include <unordered_map>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "market_signals/common/logging.h"
#include "market_signals/orchestrator/batch_orchestrator.h"
#include "market_signals/orchestrator/market_session.h"
#include "market_signals/scheduler/fetch_scheduler.h"

namespace market_signals {
namespace orchestrator {

namespace {

constexpr int64_t kSecondsPerDay = 86400;

int64_t wallSeconds(common::WallTime wall) {
    return std::chrono::duration_cast<std::chrono::seconds>(wall.time_since_epoch()).count();
}

std::string describe(const scheduler::FetchResult& result) {
    if (result.ok()) {
        return "ok";
    }
    std::string message = scheduler::fetchResultStatusToString(result.status);
    if (!result.error.empty()) {
        message += ": " + result.error;
    }
    return message;
}

} // namespace

class BatchOrchestrator::Impl {
public:
    Impl(const common::Config& config,
         scheduler::QuotaTracker& quota,
         data::MarketDataSource& source,
         report::ReportSink& sink,
         common::Clock& clock)
        : config_(config),
          quota_(quota),
          source_(source),
          sink_(sink),
          clock_(clock),
          cache_(config.getBatchConfig().cache_dir,
                 std::chrono::seconds(config.getBatchConfig().cache_max_age_s),
                 clock),
          pipeline_(config.getIndicatorConfig()),
          aggregator_(config),
          fetcher_(config.getSchedulerConfig(), quota, source, clock) {
    }

    report::BatchSummary runCycle(const std::vector<std::string>& symbols) {
        const auto& batch = config_.getBatchConfig();
        const auto& data_source = config_.getDataSourceConfig();

        report::BatchSummary summary;
        summary_ = report::BatchSummary();
        const common::TimePoint started = clock_.now();
        const common::TimePoint deadline = started + std::chrono::milliseconds(batch.deadline_ms);
        const int64_t now_seconds = wallSeconds(clock_.wallTime());
        summary_.started_at = now_seconds;

        states_.clear();
        std::set<std::string> seen;
        for (const auto& symbol : symbols) {
            if (!seen.insert(symbol).second) {
                LOG_WARNING("Duplicate symbol " + symbol + " ignored");
                continue;
            }
            SymbolState state;
            state.report.symbol = symbol;
            states_.push_back(std::move(state));
        }

        bool session_open = isSessionOpen(clock_.wallTime(), batch.session);
        bool want_quotes = batch.fetch_quotes && session_open;
        if (batch.fetch_quotes && !session_open) {
            LOG_INFO("Market session closed, using last close as current price");
        }

        LOG_INFO("Starting cycle for " + std::to_string(states_.size()) + " symbols via " +
                 source_.getName());

        fetcher_.resetStats();
        boost::asio::thread_pool compute(static_cast<size_t>(batch.compute_threads));
        std::unordered_map<uint64_t, size_t> owner;

        data::DateRange range;
        range.from = now_seconds - static_cast<int64_t>(data_source.history_days) * kSecondsPerDay;
        range.to = now_seconds;

        for (size_t i = 0; i < states_.size(); ++i) {
            SymbolState& state = states_[i];
            const std::string& symbol = state.report.symbol;

            if (cache_.load(symbol, data_source.interval, state.series)) {
                state.historical_from_cache = true;
                state.report.fetch_messages["historical"] = "cache hit";
                ++summary_.cache_hits;
            } else {
                owner[fetcher_.submit(makeRequest(symbol, scheduler::EndpointClass::HISTORICAL, range))] = i;
                ++state.pending;
            }

            if (want_quotes) {
                state.quote_requested = true;
                owner[fetcher_.submit(makeRequest(symbol, scheduler::EndpointClass::QUOTE, range))] = i;
                ++state.pending;
            } else if (batch.fetch_quotes) {
                state.report.fetch_messages["quote"] = "skipped: market closed";
            }

            if (batch.fetch_option_chains) {
                state.chain_requested = true;
                owner[fetcher_.submit(makeRequest(symbol, scheduler::EndpointClass::OPTION_CHAIN, range))] = i;
                ++state.pending;
            }
        }

        // Results arrive on this thread, which runs the dispatcher loop
        fetcher_.setResultCallback([this, &owner, &compute, deadline](const scheduler::FetchResult& result) {
            auto it = owner.find(result.request.id);
            if (it == owner.end()) {
                LOG_ERROR("Result for unknown request " + std::to_string(result.request.id));
                return;
            }
            size_t index = it->second;
            SymbolState& state = states_[index];

            switch (result.request.endpoint_class) {
                case scheduler::EndpointClass::HISTORICAL:
                    state.historical = result;
                    state.report.fetch_messages["historical"] = describe(result);
                    break;
                case scheduler::EndpointClass::QUOTE:
                    state.quote = result;
                    state.report.fetch_messages["quote"] = describe(result);
                    break;
                case scheduler::EndpointClass::OPTION_CHAIN:
                    state.chain = result;
                    state.report.fetch_messages["option_chain"] = describe(result);
                    break;
                default:
                    break;
            }

            if (--state.pending == 0) {
                boost::asio::post(compute, [this, index, deadline]() { computeSymbol(index, deadline); });
            }
        });

        for (size_t i = 0; i < states_.size(); ++i) {
            if (states_[i].pending == 0) {
                boost::asio::post(compute, [this, i, deadline]() { computeSymbol(i, deadline); });
            }
        }

        // Returns at the deadline; calls it abandoned finish on the scheduler's
        // workers while later cycles run
        fetcher_.run(deadline);
        fetcher_.setResultCallback(nullptr);
        compute.join();

        {
            std::lock_guard<std::mutex> lock(summary_mutex_);
            summary = summary_;
        }
        summary.total = static_cast<int>(states_.size());
        summary.scheduler = fetcher_.getStats();
        summary.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(clock_.now() - started).count();

        LOG_INFO("Cycle complete: " + std::to_string(summary.total) + " symbols, " +
                 std::to_string(summary.ok) + " ok, " +
                 std::to_string(summary.degraded) + " degraded, " +
                 std::to_string(summary.timed_out) + " timed out, " +
                 std::to_string(summary.failed) + " failed; " +
                 std::to_string(summary.scheduler.dispatched) + " fetches dispatched, " +
                 std::to_string(summary.scheduler.rate_limited) + " rate limited, " +
                 std::to_string(summary.cache_hits) + " cache hits");

        sink_.publishSummary(summary);
        sink_.close();
        return summary;
    }

private:
    struct SymbolState {
        int pending = 0;
        bool historical_from_cache = false;
        bool quote_requested = false;
        bool chain_requested = false;

        scheduler::FetchResult historical;
        scheduler::FetchResult quote;
        scheduler::FetchResult chain;

        data::OHLCVSeries series;
        report::SymbolReport report;
    };

    const common::Config& config_;
    scheduler::QuotaTracker& quota_;
    data::MarketDataSource& source_;
    report::ReportSink& sink_;
    common::Clock& clock_;

    data::HistoricalCache cache_;
    indicators::IndicatorPipeline pipeline_;
    signals::SignalAggregator aggregator_;

    // Outlives single cycles so a deadline never waits on abandoned calls
    scheduler::FetchScheduler fetcher_;

    // Sized before the scheduler starts; each entry is touched by one compute task
    std::vector<SymbolState> states_;

    std::mutex summary_mutex_;
    report::BatchSummary summary_;

    static scheduler::FetchRequest makeRequest(const std::string& symbol,
                                               scheduler::EndpointClass endpoint_class,
                                               const data::DateRange& range) {
        scheduler::FetchRequest request;
        request.symbol = symbol;
        request.endpoint_class = endpoint_class;
        request.priority = scheduler::defaultPriority(endpoint_class);
        if (endpoint_class == scheduler::EndpointClass::HISTORICAL) {
            request.range = range;
        }
        return request;
    }

    bool anyTimedOut(const SymbolState& state) const {
        auto timed_out = [](const scheduler::FetchResult& result) {
            return result.status == scheduler::FetchResultStatus::TIMED_OUT;
        };
        return (!state.historical_from_cache && timed_out(state.historical)) ||
               (state.quote_requested && timed_out(state.quote)) ||
               (state.chain_requested && timed_out(state.chain));
    }

    void computeSymbol(size_t index, common::TimePoint deadline) {
        SymbolState& state = states_[index];
        report::SymbolReport& report = state.report;
        const std::string& symbol = report.symbol;

        try {
            if (anyTimedOut(state) || clock_.now() >= deadline) {
                report.status = report::ReportStatus::TIMED_OUT;
                report.error = "batch deadline reached";
            } else if (!state.historical_from_cache && !state.historical.ok()) {
                report.status = report::ReportStatus::FAILED;
                report.error = "historical data unavailable: " + state.historical.error;
            } else {
                if (!state.historical_from_cache) {
                    state.series = state.historical.outcome.series;
                    cache_.store(symbol, config_.getDataSourceConfig().interval, state.series);
                }
                buildSignal(state);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Signal computation failed for " + symbol + ": " + e.what());
            report.status = report::ReportStatus::FAILED;
            report.has_signal = false;
            report.error = e.what();
        }

        try {
            sink_.publish(report);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to publish report for " + symbol + ": " + e.what());
        }

        std::lock_guard<std::mutex> lock(summary_mutex_);
        switch (report.status) {
            case report::ReportStatus::OK: ++summary_.ok; break;
            case report::ReportStatus::DEGRADED: ++summary_.degraded; break;
            case report::ReportStatus::TIMED_OUT: ++summary_.timed_out; break;
            case report::ReportStatus::FAILED: ++summary_.failed; break;
        }
    }

    void buildSignal(SymbolState& state) {
        report::SymbolReport& report = state.report;

        if (state.series.empty()) {
            report.status = report::ReportStatus::FAILED;
            report.error = "no historical bars";
            return;
        }

        std::vector<std::string> unavailable;
        if (state.quote_requested && !state.quote.ok()) {
            unavailable.push_back("quote");
        }
        const data::OptionChainSnapshot* chain = nullptr;
        if (state.chain_requested) {
            if (state.chain.ok()) {
                chain = &state.chain.outcome.chain;
            } else {
                unavailable.push_back("option_chain");
            }
        }

        double current_price = state.series.back().close;
        if (state.quote_requested && state.quote.ok() && state.quote.outcome.quote.last_price > 0.0) {
            current_price = state.quote.outcome.quote.last_price;
        }

        indicators::IndicatorSet indicators = pipeline_.compute(state.series);
        report.signal = aggregator_.aggregate(report.symbol, current_price, indicators, chain, unavailable,
                                              wallSeconds(clock_.wallTime()));
        report.has_signal = true;
        report.status = report.signal.degraded ? report::ReportStatus::DEGRADED : report::ReportStatus::OK;

        LOG_DEBUG("Signal for " + report.symbol + ": " + signals::directionToString(report.signal.direction) +
                  " confidence " + std::to_string(report.signal.confidence));
    }
};

BatchOrchestrator::BatchOrchestrator(const common::Config& config,
                                     scheduler::QuotaTracker& quota,
                                     data::MarketDataSource& source,
                                     report::ReportSink& sink,
                                     common::Clock& clock)
    : impl_(std::make_unique<Impl>(config, quota, source, sink, clock)) {
}

BatchOrchestrator::~BatchOrchestrator() = default;

report::BatchSummary BatchOrchestrator::runCycle(const std::vector<std::string>& symbols) {
    return impl_->runCycle(symbols);
}

} // namespace orchestrator
} // namespace market_signals
