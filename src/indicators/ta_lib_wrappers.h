/**
 * Thin vector wrappers over the TA-Lib C API
 */

#pragma once

#include <string>
#include <vector>

namespace market_signals {
namespace indicators {
namespace ta {

// Output of a single-line TA-Lib function. values[i] belongs to input index begin + i.
struct Line {
    int begin = 0;
    std::vector<double> values;

    bool empty() const { return values.empty(); }
    double last() const { return values.back(); }
};

struct MacdLines {
    int begin = 0;
    std::vector<double> macd;
    std::vector<double> signal;
    std::vector<double> histogram;
};

// TA_Initialize once per process; throws std::runtime_error on failure
void ensureInitialized();

Line sma(const std::vector<double>& input, int period);
Line rsi(const std::vector<double>& input, int period);
Line stddev(const std::vector<double>& input, int period);
MacdLines macd(const std::vector<double>& input, int fast, int slow, int signal);
Line adx(const std::vector<double>& highs, const std::vector<double>& lows,
         const std::vector<double>& closes, int period);

// Bars each function needs before its first output
int smaLookback(int period);
int rsiLookback(int period);
int macdLookback(int fast, int slow, int signal);
int adxLookback(int period);

} // namespace ta
} // namespace indicators
} // namespace market_signals
