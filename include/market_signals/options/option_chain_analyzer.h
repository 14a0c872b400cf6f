/**
 * Option chain metrics: IV percentile, max pain, strike selection
 */

#pragma once

#include <string>
#include <vector>

#include "market_signals/common/config.h"
#include "market_signals/data/market_data.h"
#include "market_signals/signals/direction.h"

namespace market_signals {
namespace options {

enum class Moneyness {
    ITM,
    ATM,
    OTM
};

struct OpenInterestAnalysis {
    bool has_calls = false;
    bool has_puts = false;

    double max_call_oi_strike = 0.0;
    double max_put_oi_strike = 0.0;
    double total_call_oi = 0.0;
    double total_put_oi = 0.0;

    // Strikes whose OI exceeds high_oi_multiple times the side's mean, ascending
    std::vector<double> high_call_oi_strikes;
    std::vector<double> high_put_oi_strikes;

    // 0 when there is no call open interest
    double put_call_ratio = 0.0;

    std::string summary;
};

struct OptionAnalysis {
    // False only for an empty chain
    bool has_recommendation = false;

    double iv_percentile = 50.0;
    double atm_iv = 0.0;
    double max_pain = 0.0;

    // Recommended contract
    double recommended_strike = 0.0;
    data::OptionType recommended_type = data::OptionType::CALL;
    std::string expiry;
    std::string contract_symbol;
    Moneyness moneyness = Moneyness::ATM;
    bool low_liquidity = false;

    // Estimated premiums for the recommended contract
    double option_current_price = 0.0;
    double option_target_price = 0.0;
    double option_stop_price = 0.0;

    OpenInterestAnalysis open_interest;

    // 1 for a multi-expiry chain, reduced for a single expiry, 0 for an empty chain
    double confidence = 0.0;

    bool reduced() const { return confidence < 1.0; }
};

class OptionChainAnalyzer {
public:
    explicit OptionChainAnalyzer(const common::OptionsConfig& config);

    // Pure; never throws for empty or single-expiry chains
    OptionAnalysis analyze(const data::OptionChainSnapshot& chain,
                           double current_price,
                           double target_price,
                           double stop_price,
                           signals::Direction direction) const;

    // Mid-rank percentile of the ATM IV among all positive IVs; 50 when degenerate
    static double ivPercentile(const std::vector<data::OptionContract>& contracts, double current_price);

    // Strike minimizing total writer payout; independent of contract order
    static double maxPain(const std::vector<data::OptionContract>& contracts, double current_price);

    // Strike in the chain nearest the price, lower strike on ties. Requires a non-empty chain.
    static double nearestStrike(const std::vector<data::OptionContract>& contracts, double price);

    OpenInterestAnalysis analyzeOpenInterest(const std::vector<data::OptionContract>& contracts) const;

    // SYMBOL + EXPIRY + STRIKE + CE/PE, e.g. INFY24JAN1500CE
    static std::string contractSymbol(const std::string& symbol, const std::string& expiry,
                                      double strike, data::OptionType type);

private:
    common::OptionsConfig config_;
};

std::string moneynessToString(Moneyness moneyness);

} // namespace options
} // namespace market_signals
