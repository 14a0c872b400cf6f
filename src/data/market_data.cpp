/**
 * Market data structures implementation
 */

#include <algorithm>
#include <set>
#include <stdexcept>

#include "market_signals/data/market_data.h"

namespace market_signals {
namespace data {

OHLCVSeries::OHLCVSeries(std::string symbol, std::vector<Bar> bars)
    : symbol_(std::move(symbol)),
      bars_(std::move(bars)) {
    for (size_t i = 1; i < bars_.size(); ++i) {
        if (bars_[i].timestamp == bars_[i - 1].timestamp) {
            throw std::invalid_argument("Duplicate bar timestamp " +
                                        std::to_string(bars_[i].timestamp) + " for " + symbol_);
        }
        if (bars_[i].timestamp < bars_[i - 1].timestamp) {
            throw std::invalid_argument("Bars for " + symbol_ + " are not in chronological order");
        }
    }
}

OHLCVSeries OHLCVSeries::fromUnordered(std::string symbol, std::vector<Bar> bars) {
    std::stable_sort(bars.begin(), bars.end(),
                     [](const Bar& a, const Bar& b) { return a.timestamp < b.timestamp; });

    std::vector<Bar> unique;
    unique.reserve(bars.size());
    for (const auto& bar : bars) {
        if (!unique.empty() && unique.back().timestamp == bar.timestamp) {
            unique.back() = bar;
        } else {
            unique.push_back(bar);
        }
    }

    return OHLCVSeries(std::move(symbol), std::move(unique));
}

std::vector<double> OHLCVSeries::closes() const {
    std::vector<double> out;
    out.reserve(bars_.size());
    for (const auto& bar : bars_) {
        out.push_back(bar.close);
    }
    return out;
}

std::vector<double> OHLCVSeries::highs() const {
    std::vector<double> out;
    out.reserve(bars_.size());
    for (const auto& bar : bars_) {
        out.push_back(bar.high);
    }
    return out;
}

std::vector<double> OHLCVSeries::lows() const {
    std::vector<double> out;
    out.reserve(bars_.size());
    for (const auto& bar : bars_) {
        out.push_back(bar.low);
    }
    return out;
}

std::vector<double> OHLCVSeries::volumes() const {
    std::vector<double> out;
    out.reserve(bars_.size());
    for (const auto& bar : bars_) {
        out.push_back(bar.volume);
    }
    return out;
}

size_t OptionChainSnapshot::expiryCount() const {
    std::set<std::string> expiries;
    for (const auto& contract : contracts) {
        expiries.insert(contract.expiry);
    }
    return expiries.size();
}

std::string optionTypeToString(OptionType type) {
    switch (type) {
        case OptionType::CALL: return "CE";
        case OptionType::PUT: return "PE";
        default: return "UNKNOWN";
    }
}

OptionType stringToOptionType(const std::string& str) {
    if (str == "CE" || str == "CALL" || str == "call") {
        return OptionType::CALL;
    } else if (str == "PE" || str == "PUT" || str == "put") {
        return OptionType::PUT;
    }
    throw std::invalid_argument("Unknown option type: " + str);
}

} // namespace data
} // namespace market_signals
