/**
 * Combines indicators and option metrics into one signal per symbol
 */

#pragma once

#include <string>
#include <vector>

#include "market_signals/common/config.h"
#include "market_signals/data/market_data.h"
#include "market_signals/indicators/indicator_pipeline.h"
#include "market_signals/options/option_chain_analyzer.h"
#include "market_signals/risk/position_sizer.h"
#include "market_signals/signals/signal.h"

namespace market_signals {
namespace signals {

class SignalAggregator {
public:
    explicit SignalAggregator(const common::Config& config);

    /**
     * Build the signal for one symbol.
     *
     * current_price must be positive. option_chain is null when no chain was
     * requested; a requested chain that could not be fetched is named in
     * unavailable_inputs instead. Throws std::invalid_argument for a
     * non-positive price.
     */
    Signal aggregate(const std::string& symbol,
                     double current_price,
                     const indicators::IndicatorSet& indicators,
                     const data::OptionChainSnapshot* option_chain,
                     const std::vector<std::string>& unavailable_inputs,
                     int64_t timestamp) const;

    // Majority vote of the directional indicators
    Direction vote(const indicators::IndicatorSet& indicators) const;

    // Weighted confidence before penalties
    double weightedConfidence(const indicators::IndicatorSet& indicators, Direction direction) const;

    // Signed score of a directional indicator in [-1, 1]; false when unavailable
    static bool directionalScore(const indicators::IndicatorSet& indicators,
                                 const std::string& name,
                                 double& score);

private:
    common::SignalConfig config_;
    double sr_fallback_pct_;
    options::OptionChainAnalyzer analyzer_;
    risk::PositionSizer sizer_;

    // weak_factor below the weak ADX threshold, strong_factor above the strong one, else 1
    double adxFactor(const indicators::IndicatorSet& indicators,
                     double weak_factor, double strong_factor) const;

    double profitProbability(const indicators::IndicatorSet& indicators,
                             Direction direction,
                             double confidence) const;

    int estimateDaysToTarget(const indicators::IndicatorSet& indicators,
                             double current_price,
                             double target_price) const;
};

} // namespace signals
} // namespace market_signals
