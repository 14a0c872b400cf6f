/**
 * Position sizing for a directional signal
 */

#include <algorithm>
#include <cmath>

#include "market_signals/risk/position_sizer.h"

namespace market_signals {
namespace risk {

PositionSizer::PositionSizer(const common::RiskConfig& config)
    : config_(config) {
}

PositionSize PositionSizer::calculate(signals::Direction direction,
                                      double price,
                                      double stop_loss,
                                      double target,
                                      double confidence) const {
    PositionSize result;
    result.method = config_.sizing_method;

    if (direction == signals::Direction::NEUTRAL || !(price > 0.0)) {
        return result;
    }

    // A stop at the entry price would mean unbounded size; assume 1% risk per share instead
    double risk_per_share = std::fabs(price - stop_loss);
    if (risk_per_share <= 0.0) {
        risk_per_share = price * 0.01;
    }
    double reward_per_share = std::fabs(target - price);

    double value = 0.0;
    if (config_.sizing_method == "fixed") {
        // Fixed percentage of account
        value = config_.account_size * (config_.max_position_pct / 100.0);
    } else if (config_.sizing_method == "kelly") {
        value = calculateKellyValue(reward_per_share, risk_per_share, confidence);
    } else {
        value = calculateRiskBasedValue(price, risk_per_share);
    }

    double max_value = config_.account_size * (config_.max_position_pct / 100.0);
    if (value > max_value) {
        value = max_value;
        result.capped = true;
    }

    result.shares = static_cast<int64_t>(std::floor(value / price));
    result.position_value = result.shares * price;
    result.risk_amount = result.shares * risk_per_share;
    result.account_pct = result.position_value / config_.account_size * 100.0;
    return result;
}

double PositionSizer::calculateRiskBasedValue(double price, double risk_per_share) const {
    double risk_budget = config_.account_size * (config_.risk_per_trade_pct / 100.0);
    return std::floor(risk_budget / risk_per_share) * price;
}

double PositionSizer::calculateKellyValue(double reward_per_share, double risk_per_share,
                                          double confidence) const {
    // Kelly formula: f* = (bp - q) / b
    // b = reward/risk odds, p = confidence as win probability
    if (reward_per_share <= 0.0) {
        return 0.0;
    }

    double p = std::max(0.0, std::min(1.0, confidence));
    double q = 1.0 - p;
    double b = reward_per_share / risk_per_share;

    double f = (b * p - q) / b;
    f = std::max(0.0, f) * config_.kelly_fraction;

    return config_.account_size * f;
}

} // namespace risk
} // namespace market_signals
