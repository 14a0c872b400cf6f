/**
 * Thin vector wrappers over the TA-Lib C API
 */

#include <mutex>
#include <stdexcept>
#include <ta-lib/ta_libc.h>

#include "ta_lib_wrappers.h"

namespace market_signals {
namespace indicators {
namespace ta {

namespace {

void check(TA_RetCode code, const char* function) {
    if (code != TA_SUCCESS) {
        throw std::runtime_error(std::string(function) + " failed with TA-Lib code " +
                                 std::to_string(static_cast<int>(code)));
    }
}

int lastIndex(const std::vector<double>& input) {
    return static_cast<int>(input.size()) - 1;
}

} // namespace

void ensureInitialized() {
    static std::once_flag once;
    static TA_RetCode init_code = TA_SUCCESS;
    std::call_once(once, []() { init_code = TA_Initialize(); });
    check(init_code, "TA_Initialize");
}

Line sma(const std::vector<double>& input, int period) {
    ensureInitialized();
    Line out;
    if (input.empty()) {
        return out;
    }

    out.values.resize(input.size());
    int outBegIdx = 0;
    int outNbElement = 0;
    check(TA_SMA(0, lastIndex(input), input.data(), period,
                 &outBegIdx, &outNbElement, out.values.data()), "TA_SMA");
    out.begin = outBegIdx;
    out.values.resize(outNbElement);
    return out;
}

Line rsi(const std::vector<double>& input, int period) {
    ensureInitialized();
    Line out;
    if (input.empty()) {
        return out;
    }

    out.values.resize(input.size());
    int outBegIdx = 0;
    int outNbElement = 0;
    check(TA_RSI(0, lastIndex(input), input.data(), period,
                 &outBegIdx, &outNbElement, out.values.data()), "TA_RSI");
    out.begin = outBegIdx;
    out.values.resize(outNbElement);
    return out;
}

Line stddev(const std::vector<double>& input, int period) {
    ensureInitialized();
    Line out;
    if (input.empty()) {
        return out;
    }

    out.values.resize(input.size());
    int outBegIdx = 0;
    int outNbElement = 0;
    check(TA_STDDEV(0, lastIndex(input), input.data(), period, 1.0,
                    &outBegIdx, &outNbElement, out.values.data()), "TA_STDDEV");
    out.begin = outBegIdx;
    out.values.resize(outNbElement);
    return out;
}

MacdLines macd(const std::vector<double>& input, int fast, int slow, int signal) {
    ensureInitialized();
    MacdLines out;
    if (input.empty()) {
        return out;
    }

    out.macd.resize(input.size());
    out.signal.resize(input.size());
    out.histogram.resize(input.size());
    int outBegIdx = 0;
    int outNbElement = 0;
    check(TA_MACD(0, lastIndex(input), input.data(), fast, slow, signal,
                  &outBegIdx, &outNbElement,
                  out.macd.data(), out.signal.data(), out.histogram.data()), "TA_MACD");
    out.begin = outBegIdx;
    out.macd.resize(outNbElement);
    out.signal.resize(outNbElement);
    out.histogram.resize(outNbElement);
    return out;
}

Line adx(const std::vector<double>& highs, const std::vector<double>& lows,
         const std::vector<double>& closes, int period) {
    ensureInitialized();
    Line out;
    if (closes.empty() || highs.size() != closes.size() || lows.size() != closes.size()) {
        return out;
    }

    out.values.resize(closes.size());
    int outBegIdx = 0;
    int outNbElement = 0;
    check(TA_ADX(0, lastIndex(closes), highs.data(), lows.data(), closes.data(), period,
                 &outBegIdx, &outNbElement, out.values.data()), "TA_ADX");
    out.begin = outBegIdx;
    out.values.resize(outNbElement);
    return out;
}

int smaLookback(int period) {
    ensureInitialized();
    return TA_SMA_Lookback(period);
}

int rsiLookback(int period) {
    ensureInitialized();
    return TA_RSI_Lookback(period);
}

int macdLookback(int fast, int slow, int signal) {
    ensureInitialized();
    return TA_MACD_Lookback(fast, slow, signal);
}

int adxLookback(int period) {
    ensureInitialized();
    return TA_ADX_Lookback(period);
}

} // namespace ta
} // namespace indicators
} // namespace market_signals
