/**
 * Market data structures
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace market_signals {
namespace data {

// One OHLCV bar. Timestamp is seconds since the Unix epoch.
struct Bar {
    int64_t timestamp = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

// Chronologically ordered bars for one symbol with unique timestamps.
// Immutable after construction.
class OHLCVSeries {
public:
    OHLCVSeries() = default;

    // Throws std::invalid_argument unless bars are strictly increasing in time
    OHLCVSeries(std::string symbol, std::vector<Bar> bars);

    // Sorts bars and drops duplicate timestamps (last one wins)
    static OHLCVSeries fromUnordered(std::string symbol, std::vector<Bar> bars);

    const std::string& symbol() const { return symbol_; }
    const std::vector<Bar>& bars() const { return bars_; }
    size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }
    const Bar& back() const { return bars_.back(); }

    std::vector<double> closes() const;
    std::vector<double> highs() const;
    std::vector<double> lows() const;
    std::vector<double> volumes() const;

private:
    std::string symbol_;
    std::vector<Bar> bars_;
};

// Latest traded price for a symbol
struct Quote {
    std::string symbol;
    double last_price = 0.0;
    double previous_close = 0.0;
    double volume = 0.0;
    int64_t timestamp = 0;
};

enum class OptionType {
    CALL,
    PUT
};

// One option contract inside a chain snapshot
struct OptionContract {
    double strike = 0.0;
    std::string expiry;           // YYYY-MM-DD
    OptionType type = OptionType::CALL;
    double open_interest = 0.0;
    double implied_volatility = 0.0;
    double last_price = 0.0;
    double volume = 0.0;
};

// Option chain for one underlying at one point in time
struct OptionChainSnapshot {
    std::string symbol;
    int64_t timestamp = 0;
    std::vector<OptionContract> contracts;

    bool empty() const { return contracts.empty(); }

    // Number of distinct expiries present
    size_t expiryCount() const;
};

// Inclusive historical range, seconds since the Unix epoch
struct DateRange {
    int64_t from = 0;
    int64_t to = 0;
};

// Convert option type to exchange suffix (CE/PE)
std::string optionTypeToString(OptionType type);

// Parse CE/PE/CALL/PUT; throws std::invalid_argument otherwise
OptionType stringToOptionType(const std::string& str);

} // namespace data
} // namespace market_signals
