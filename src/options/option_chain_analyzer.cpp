/**
 * Option chain metrics: IV percentile, max pain, strike selection
 */

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>
#include <tuple>

#include "market_signals/options/option_chain_analyzer.h"

namespace market_signals {
namespace options {

namespace {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

// Payouts that differ only by summation noise count as equal
bool nearlyEqual(double a, double b) {
    return std::fabs(a - b) <= 1e-9 * std::max({1.0, std::fabs(a), std::fabs(b)});
}

bool canonicalLess(const data::OptionContract& a, const data::OptionContract& b) {
    return std::make_tuple(a.strike, static_cast<int>(a.type), a.expiry, a.open_interest,
                           a.implied_volatility, a.last_price, a.volume) <
           std::make_tuple(b.strike, static_cast<int>(b.type), b.expiry, b.open_interest,
                           b.implied_volatility, b.last_price, b.volume);
}

std::vector<data::OptionContract> canonical(const std::vector<data::OptionContract>& contracts) {
    std::vector<data::OptionContract> sorted = contracts;
    std::sort(sorted.begin(), sorted.end(), canonicalLess);
    return sorted;
}

double intrinsic(data::OptionType type, double strike, double spot) {
    return type == data::OptionType::CALL ? std::max(0.0, spot - strike)
                                          : std::max(0.0, strike - spot);
}

std::string formatStrike(double strike) {
    std::ostringstream out;
    if (strike == std::floor(strike)) {
        out << static_cast<long long>(strike);
    } else {
        out << std::fixed << std::setprecision(2) << strike;
        std::string text = out.str();
        text.erase(text.find_last_not_of('0') + 1);
        return text;
    }
    return out.str();
}

} // namespace

OptionChainAnalyzer::OptionChainAnalyzer(const common::OptionsConfig& config)
    : config_(config) {
}

double OptionChainAnalyzer::nearestStrike(const std::vector<data::OptionContract>& contracts, double price) {
    double best = contracts.front().strike;
    for (const auto& contract : contracts) {
        double distance = std::fabs(contract.strike - price);
        double best_distance = std::fabs(best - price);
        if (distance < best_distance || (distance == best_distance && contract.strike < best)) {
            best = contract.strike;
        }
    }
    return best;
}

double OptionChainAnalyzer::ivPercentile(const std::vector<data::OptionContract>& contracts,
                                         double current_price) {
    std::vector<double> ivs;
    std::vector<data::OptionContract> quoted;
    for (const auto& contract : contracts) {
        if (contract.implied_volatility > 0.0) {
            ivs.push_back(contract.implied_volatility);
            quoted.push_back(contract);
        }
    }

    std::set<double> distinct(ivs.begin(), ivs.end());
    if (distinct.size() < 2) {
        return 50.0;
    }

    double atm_strike = nearestStrike(quoted, current_price);
    double sum = 0.0;
    int count = 0;
    for (const auto& contract : quoted) {
        if (contract.strike == atm_strike) {
            sum += contract.implied_volatility;
            ++count;
        }
    }
    double atm_iv = sum / count;

    double below = 0.0;
    double equal = 0.0;
    for (double iv : ivs) {
        if (iv < atm_iv) {
            below += 1.0;
        } else if (iv == atm_iv) {
            equal += 1.0;
        }
    }

    return (below + 0.5 * equal) / ivs.size() * 100.0;
}

double OptionChainAnalyzer::maxPain(const std::vector<data::OptionContract>& contracts,
                                    double current_price) {
    if (contracts.empty()) {
        return 0.0;
    }

    std::vector<data::OptionContract> sorted = canonical(contracts);
    std::vector<double> strikes;
    for (const auto& contract : sorted) {
        if (strikes.empty() || strikes.back() != contract.strike) {
            strikes.push_back(contract.strike);
        }
    }

    double best_strike = strikes.front();
    double best_payout = 0.0;
    bool first = true;

    for (double candidate : strikes) {
        double payout = 0.0;
        for (const auto& contract : sorted) {
            if (contract.type == data::OptionType::CALL) {
                payout += contract.open_interest * std::max(0.0, candidate - contract.strike);
            } else {
                payout += contract.open_interest * std::max(0.0, contract.strike - candidate);
            }
        }

        if (first || (payout < best_payout && !nearlyEqual(payout, best_payout))) {
            best_strike = candidate;
            best_payout = payout;
            first = false;
            continue;
        }

        // Strikes ascend, so on a tie the lower one is already held unless the new one is nearer
        if (nearlyEqual(payout, best_payout) &&
            std::fabs(candidate - current_price) < std::fabs(best_strike - current_price)) {
            best_strike = candidate;
            best_payout = std::min(payout, best_payout);
        }
    }

    return best_strike;
}

OpenInterestAnalysis OptionChainAnalyzer::analyzeOpenInterest(
    const std::vector<data::OptionContract>& contracts) const {
    OpenInterestAnalysis result;
    std::vector<data::OptionContract> sorted = canonical(contracts);

    double max_call_oi = -1.0;
    double max_put_oi = -1.0;
    int calls = 0;
    int puts = 0;

    for (const auto& contract : sorted) {
        if (contract.type == data::OptionType::CALL) {
            ++calls;
            result.total_call_oi += contract.open_interest;
            if (contract.open_interest > max_call_oi) {
                max_call_oi = contract.open_interest;
                result.max_call_oi_strike = contract.strike;
            }
        } else {
            ++puts;
            result.total_put_oi += contract.open_interest;
            if (contract.open_interest > max_put_oi) {
                max_put_oi = contract.open_interest;
                result.max_put_oi_strike = contract.strike;
            }
        }
    }

    result.has_calls = calls > 0;
    result.has_puts = puts > 0;

    double call_mean = calls > 0 ? result.total_call_oi / calls : 0.0;
    double put_mean = puts > 0 ? result.total_put_oi / puts : 0.0;

    for (const auto& contract : sorted) {
        bool is_call = contract.type == data::OptionType::CALL;
        double threshold = (is_call ? call_mean : put_mean) * config_.high_oi_multiple;
        if (contract.open_interest <= threshold) {
            continue;
        }
        std::vector<double>& strikes = is_call ? result.high_call_oi_strikes : result.high_put_oi_strikes;
        if (strikes.empty() || strikes.back() != contract.strike) {
            strikes.push_back(contract.strike);
        }
    }

    if (result.total_call_oi > 0.0) {
        result.put_call_ratio = result.total_put_oi / result.total_call_oi;
    }

    std::ostringstream summary;
    if (result.has_calls) {
        summary << "Maximum call OI at strike " << formatStrike(result.max_call_oi_strike) << ". ";
    }
    if (result.has_puts) {
        summary << "Maximum put OI at strike " << formatStrike(result.max_put_oi_strike) << ". ";
    }
    if (result.total_call_oi > 0.0) {
        summary << "Put/call OI ratio " << std::fixed << std::setprecision(2) << result.put_call_ratio << ".";
    }
    result.summary = summary.str();
    if (!result.summary.empty() && result.summary.back() == ' ') {
        result.summary.pop_back();
    }

    return result;
}

std::string OptionChainAnalyzer::contractSymbol(const std::string& symbol, const std::string& expiry,
                                                double strike, data::OptionType type) {
    std::string compact_expiry;
    for (char c : expiry) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            compact_expiry += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return symbol + compact_expiry + formatStrike(strike) + data::optionTypeToString(type);
}

OptionAnalysis OptionChainAnalyzer::analyze(const data::OptionChainSnapshot& chain,
                                            double current_price,
                                            double target_price,
                                            double stop_price,
                                            signals::Direction direction) const {
    OptionAnalysis result;
    if (chain.empty()) {
        return result;
    }

    const std::vector<data::OptionContract>& contracts = chain.contracts;

    result.iv_percentile = ivPercentile(contracts, current_price);
    result.max_pain = maxPain(contracts, current_price);
    result.open_interest = analyzeOpenInterest(contracts);

    double atm_strike = nearestStrike(contracts, current_price);
    double iv_sum = 0.0;
    int iv_count = 0;
    for (const auto& contract : contracts) {
        if (contract.strike == atm_strike && contract.implied_volatility > 0.0) {
            iv_sum += contract.implied_volatility;
            ++iv_count;
        }
    }
    result.atm_iv = iv_count > 0 ? iv_sum / iv_count : 0.0;

    auto matchesDirection = [direction](const data::OptionContract& contract) {
        switch (direction) {
            case signals::Direction::BULLISH: return contract.type == data::OptionType::CALL;
            case signals::Direction::BEARISH: return contract.type == data::OptionType::PUT;
            default: return true;
        }
    };

    // Nearest target, then nearest current price, then lower strike, calls first, earliest expiry
    auto rank = [&](const data::OptionContract& contract) {
        return std::make_tuple(std::fabs(contract.strike - target_price),
                               std::fabs(contract.strike - current_price),
                               contract.strike,
                               static_cast<int>(contract.type),
                               contract.expiry);
    };

    const data::OptionContract* chosen = nullptr;
    for (const auto& contract : contracts) {
        if (!matchesDirection(contract) || contract.open_interest < config_.min_open_interest) {
            continue;
        }
        if (chosen == nullptr || rank(contract) < rank(*chosen)) {
            chosen = &contract;
        }
    }

    if (chosen == nullptr) {
        result.low_liquidity = true;
        for (const auto& contract : contracts) {
            if (chosen == nullptr || rank(contract) < rank(*chosen)) {
                chosen = &contract;
            }
        }
    }

    result.has_recommendation = true;
    result.recommended_strike = chosen->strike;
    result.recommended_type = chosen->type;
    result.expiry = chosen->expiry;
    result.contract_symbol = contractSymbol(chain.symbol, chosen->expiry, chosen->strike, chosen->type);

    if (chosen->strike == atm_strike) {
        result.moneyness = Moneyness::ATM;
    } else if (intrinsic(chosen->type, chosen->strike, current_price) > 0.0) {
        result.moneyness = Moneyness::ITM;
    } else {
        result.moneyness = Moneyness::OTM;
    }

    // Premium estimates: chain price when quoted, otherwise intrinsic plus a flat time value
    double current_premium = chosen->last_price > 0.0
        ? chosen->last_price
        : intrinsic(chosen->type, chosen->strike, current_price) + current_price * 0.03;
    double target_premium = intrinsic(chosen->type, chosen->strike, target_price) + target_price * 0.02;
    double stop_premium = intrinsic(chosen->type, chosen->strike, stop_price) + current_price * 0.02;
    if (stop_premium >= current_premium) {
        stop_premium = current_premium * 0.7;
    }

    result.option_current_price = round2(current_premium);
    result.option_target_price = round2(target_premium);
    result.option_stop_price = round2(stop_premium);

    result.confidence = chain.expiryCount() > 1 ? 1.0 : config_.single_expiry_confidence;
    return result;
}

std::string moneynessToString(Moneyness moneyness) {
    switch (moneyness) {
        case Moneyness::ITM: return "ITM";
        case Moneyness::ATM: return "ATM";
        case Moneyness::OTM: return "OTM";
        default: return "UNKNOWN";
    }
}

} // namespace options
} // namespace market_signals
