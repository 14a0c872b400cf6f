/**
 * Position sizing for a directional signal
 */

#pragma once

#include <cstdint>
#include <string>

#include "market_signals/common/config.h"
#include "market_signals/signals/direction.h"

namespace market_signals {
namespace risk {

struct PositionSize {
    int64_t shares = 0;
    double position_value = 0.0;
    double risk_amount = 0.0;
    double account_pct = 0.0;
    std::string method;

    // True when max_position_pct cut the size
    bool capped = false;
};

class PositionSizer {
public:
    explicit PositionSizer(const common::RiskConfig& config);

    // Neutral signals and non-positive prices size to zero
    PositionSize calculate(signals::Direction direction,
                           double price,
                           double stop_loss,
                           double target,
                           double confidence) const;

    const common::RiskConfig& getConfig() const { return config_; }

private:
    common::RiskConfig config_;

    // Dollar value before the position cap
    double calculateRiskBasedValue(double price, double risk_per_share) const;
    double calculateKellyValue(double reward_per_share, double risk_per_share, double confidence) const;
};

} // namespace risk
} // namespace market_signals
