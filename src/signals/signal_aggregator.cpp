/**
 * Combines indicators and option metrics into one signal per symbol
 */

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "market_signals/common/logging.h"
#include "market_signals/signals/signal_aggregator.h"

namespace market_signals {
namespace signals {

namespace {

constexpr int kDefaultDaysToTarget = 10;
constexpr int kMinDaysToTarget = 1;
constexpr int kMaxDaysToTarget = 60;

double clamp01(double value) {
    return std::max(0.0, std::min(1.0, value));
}

int voteOf(double score, double deadband) {
    if (score > deadband) {
        return 1;
    } else if (score < -deadband) {
        return -1;
    }
    return 0;
}

Direction directionOf(int vote) {
    if (vote > 0) {
        return Direction::BULLISH;
    } else if (vote < 0) {
        return Direction::BEARISH;
    }
    return Direction::NEUTRAL;
}

} // namespace

SignalAggregator::SignalAggregator(const common::Config& config)
    : config_(config.getSignalConfig()),
      sr_fallback_pct_(config.getIndicatorConfig().sr_fallback_pct),
      analyzer_(config.getOptionsConfig()),
      sizer_(config.getRiskConfig()) {
}

bool SignalAggregator::directionalScore(const indicators::IndicatorSet& indicators,
                                        const std::string& name,
                                        double& score) {
    const indicators::IndicatorValue* value = indicators.find(name);
    if (value == nullptr || !value->available()) {
        return false;
    }

    if (name == "momentum") {
        // RSI centred on 50
        score = (value->value - 50.0) / 50.0;
    } else {
        score = value->value;
    }
    score = std::max(-1.0, std::min(1.0, score));
    return true;
}

Direction SignalAggregator::vote(const indicators::IndicatorSet& indicators) const {
    int bullish = 0;
    int bearish = 0;
    int momentum_vote = 0;

    for (const char* name : {"trend", "momentum", "macd"}) {
        double score = 0.0;
        if (!directionalScore(indicators, name, score)) {
            continue;
        }
        int v = voteOf(score, config_.vote_deadband);
        if (v > 0) {
            ++bullish;
        } else if (v < 0) {
            ++bearish;
        }
        if (std::string(name) == "momentum") {
            momentum_vote = v;
        }
    }

    if (bullish > bearish) {
        return Direction::BULLISH;
    } else if (bearish > bullish) {
        return Direction::BEARISH;
    }
    return directionOf(momentum_vote);
}

double SignalAggregator::weightedConfidence(const indicators::IndicatorSet& indicators,
                                            Direction direction) const {
    double weighted = 0.0;
    double total_weight = 0.0;

    for (const auto& entry : config_.weights) {
        double score = 0.0;
        if (entry.second <= 0.0 || !directionalScore(indicators, entry.first, score)) {
            continue;
        }

        double aligned = 0.0;
        switch (direction) {
            case Direction::BULLISH: aligned = clamp01(score); break;
            case Direction::BEARISH: aligned = clamp01(-score); break;
            default: aligned = clamp01(1.0 - std::fabs(score)); break;
        }

        weighted += entry.second * aligned;
        total_weight += entry.second;
    }

    return total_weight > 0.0 ? weighted / total_weight : 0.0;
}

double SignalAggregator::adxFactor(const indicators::IndicatorSet& indicators,
                                   double weak_factor, double strong_factor) const {
    const indicators::IndicatorValue* adx = indicators.find("adx");
    if (adx == nullptr || !adx->available()) {
        return 1.0;
    }
    if (adx->value < config_.adx_weak_below) {
        return weak_factor;
    } else if (adx->value > config_.adx_strong_above) {
        return strong_factor;
    }
    return 1.0;
}

double SignalAggregator::profitProbability(const indicators::IndicatorSet& indicators,
                                           Direction direction,
                                           double confidence) const {
    if (direction == Direction::NEUTRAL) {
        return 0.0;
    }

    double probability = confidence * adxFactor(indicators, config_.profit_adx_weak_factor,
                                                config_.profit_adx_strong_factor);

    // High annualized volatility makes the target less likely to be reached first
    const indicators::IndicatorValue* volatility = indicators.find("volatility");
    if (volatility != nullptr && volatility->available()) {
        probability *= std::max(0.0, 1.0 - volatility->value / 100.0 * config_.profit_volatility_weight);
    }
    return clamp01(probability);
}

int SignalAggregator::estimateDaysToTarget(const indicators::IndicatorSet& indicators,
                                           double current_price,
                                           double target_price) const {
    const indicators::IndicatorValue* volatility = indicators.find("volatility");
    if (volatility == nullptr || !volatility->available()) {
        return kDefaultDaysToTarget;
    }

    double daily_change = volatility->component("avg_abs_change_pct");
    if (!(daily_change > 0.0)) {
        return kDefaultDaysToTarget;
    }

    double move_pct = std::fabs(target_price - current_price) / current_price * 100.0;
    double days = std::round(move_pct / daily_change);
    return static_cast<int>(std::max<double>(kMinDaysToTarget, std::min<double>(kMaxDaysToTarget, days)));
}

Signal SignalAggregator::aggregate(const std::string& symbol,
                                   double current_price,
                                   const indicators::IndicatorSet& indicators,
                                   const data::OptionChainSnapshot* option_chain,
                                   const std::vector<std::string>& unavailable_inputs,
                                   int64_t timestamp) const {
    if (!(current_price > 0.0) || !std::isfinite(current_price)) {
        throw std::invalid_argument("Current price for " + symbol + " must be positive");
    }

    Signal signal;
    signal.symbol = symbol;
    signal.timestamp = timestamp;
    signal.current_price = current_price;
    signal.indicators = indicators;
    signal.unavailable_inputs = unavailable_inputs;
    signal.degraded = !unavailable_inputs.empty();
    signal.insufficient_inputs = indicators.insufficientNames();
    for (const auto& name : indicators.failedNames()) {
        signal.insufficient_inputs.push_back(name);
    }

    signal.raw_direction = vote(indicators);

    // Band around the price; percentage fallback when the levels were not computed
    const indicators::IndicatorValue* levels = indicators.find("support_resistance");
    if (levels != nullptr && levels->available() && levels->upper > levels->lower) {
        signal.support = levels->lower;
        signal.resistance = levels->upper;
    } else {
        signal.support = current_price * (1.0 - sr_fallback_pct_ / 100.0);
        signal.resistance = current_price * (1.0 + sr_fallback_pct_ / 100.0);
    }

    double band = (signal.resistance - signal.support) * config_.target_band_multiple;
    double min_stop_distance = current_price * config_.min_stop_distance_pct / 100.0;

    switch (signal.raw_direction) {
        case Direction::BULLISH:
            signal.target_price = current_price + band;
            signal.stop_loss = std::min(signal.support, current_price - min_stop_distance);
            break;
        case Direction::BEARISH:
            signal.target_price = std::max(0.0, current_price - band);
            signal.stop_loss = std::max(signal.resistance, current_price + min_stop_distance);
            break;
        default:
            signal.target_price = current_price;
            signal.stop_loss = std::min(signal.support, current_price - min_stop_distance);
            break;
    }

    double reward = std::fabs(signal.target_price - current_price);
    double risk = std::fabs(current_price - signal.stop_loss);
    signal.risk_reward = risk > 0.0 ? reward / risk : 0.0;

    signal.direction = signal.raw_direction;
    if (signal.direction != Direction::NEUTRAL && signal.risk_reward < config_.risk_reward_threshold) {
        LOG_DEBUG("Risk/reward " + std::to_string(signal.risk_reward) + " below threshold for " +
                  symbol + ", downgrading to NEUTRAL");
        signal.direction = Direction::NEUTRAL;
    }

    signal.days_to_target = estimateDaysToTarget(indicators, current_price, signal.target_price);

    if (option_chain != nullptr) {
        signal.has_option = true;
        signal.option = analyzer_.analyze(*option_chain, current_price, signal.target_price,
                                          signal.stop_loss, signal.direction);
        if (signal.option.reduced()) {
            signal.insufficient_inputs.push_back("option_chain");
        }
    }

    double confidence = weightedConfidence(indicators, signal.raw_direction);
    if (signal.raw_direction != Direction::NEUTRAL) {
        confidence *= adxFactor(indicators, config_.adx_weak_factor, config_.adx_strong_factor);
    }
    if (!signal.insufficient_inputs.empty()) {
        confidence *= 1.0 - config_.insufficient_data_penalty;
    }
    if (signal.degraded) {
        confidence *= 1.0 - config_.degraded_penalty;
    }
    signal.confidence = clamp01(confidence);
    signal.profit_probability = profitProbability(indicators, signal.direction, signal.confidence);

    signal.position = sizer_.calculate(signal.direction, current_price, signal.stop_loss,
                                       signal.target_price, signal.confidence);

    return signal;
}

} // namespace signals
} // namespace market_signals
