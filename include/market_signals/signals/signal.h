/**
 * Trading signals
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "market_signals/indicators/indicator_pipeline.h"
#include "market_signals/options/option_chain_analyzer.h"
#include "market_signals/risk/position_sizer.h"
#include "market_signals/signals/direction.h"

namespace market_signals {
namespace signals {

// Trading signal for one symbol and one cycle
struct Signal {
    // Basic signal info
    std::string symbol;
    Direction direction = Direction::NEUTRAL;
    Direction raw_direction = Direction::NEUTRAL;  // Vote before the risk/reward filter
    double confidence = 0.0;
    double profit_probability = 0.0;  // Chance the target is reached, 0 for NEUTRAL
    int64_t timestamp = 0;

    // Price levels
    double current_price = 0.0;
    double target_price = 0.0;
    double stop_loss = 0.0;
    double support = 0.0;
    double resistance = 0.0;
    double risk_reward = 0.0;
    int days_to_target = 0;

    // Position sizing
    risk::PositionSize position;

    // Option recommendation, present when a chain was analyzed
    bool has_option = false;
    options::OptionAnalysis option;

    // Supporting indicators
    indicators::IndicatorSet indicators;

    // Inputs that could not be fetched, and indicators that could not be computed
    bool degraded = false;
    std::vector<std::string> unavailable_inputs;
    std::vector<std::string> insufficient_inputs;

    bool isActionable() const {
        return direction != Direction::NEUTRAL && confidence > 0.0 && current_price > 0.0;
    }
};

} // namespace signals
} // namespace market_signals
