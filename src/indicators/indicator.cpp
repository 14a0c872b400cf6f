/**
 * Technical indicator implementations
 */

#include <algorithm>
#include <cmath>
#include <functional>
#include <stdexcept>

#include "market_signals/indicators/indicator.h"
#include "ta_lib_wrappers.h"

namespace market_signals {
namespace indicators {

namespace {

double clamp(double value, double lo, double hi) {
    return std::max(lo, std::min(hi, value));
}

void requirePositivePrice(double price, const char* what) {
    if (!(price > 0.0) || !std::isfinite(price)) {
        throw std::runtime_error(std::string(what) + " is not a positive price");
    }
}

// Collapse levels closer than min_separation, keeping the first of each run
std::vector<double> collapseLevels(std::vector<double> levels, double min_separation) {
    std::vector<double> collapsed;
    for (double level : levels) {
        if (collapsed.empty() || std::fabs(level - collapsed.back()) > min_separation) {
            collapsed.push_back(level);
        }
    }
    return collapsed;
}

} // namespace

IndicatorValue IndicatorValue::insufficient(const std::string& name, size_t required, size_t actual) {
    IndicatorValue value;
    value.name = name;
    value.status = IndicatorStatus::INSUFFICIENT_DATA;
    value.note = "needs " + std::to_string(required) + " bars, have " + std::to_string(actual);
    return value;
}

IndicatorValue IndicatorValue::failed(const std::string& name, const std::string& reason) {
    IndicatorValue value;
    value.name = name;
    value.status = IndicatorStatus::FAILED;
    value.note = reason;
    return value;
}

// Factory method to create indicator based on type
std::unique_ptr<Indicator> Indicator::create(const std::string& type) {
    if (type == "trend") {
        return std::make_unique<TrendIndicator>();
    } else if (type == "momentum") {
        return std::make_unique<MomentumIndicator>();
    } else if (type == "macd") {
        return std::make_unique<MacdIndicator>();
    } else if (type == "support_resistance") {
        return std::make_unique<SupportResistanceIndicator>();
    } else if (type == "adx") {
        return std::make_unique<AdxIndicator>();
    } else if (type == "volatility") {
        return std::make_unique<VolatilityIndicator>();
    } else if (type == "volume_change") {
        return std::make_unique<VolumeChangeIndicator>();
    }
    throw std::invalid_argument("Unknown indicator type: " + type);
}

// Trend

size_t TrendIndicator::getLookback(const IndicatorParams& params) const {
    size_t slow = static_cast<size_t>(ta::smaLookback(params.trend_slow) + 1);
    size_t fast = static_cast<size_t>(ta::smaLookback(params.trend_fast) + 1 + params.trend_slope_bars);
    return std::max(slow, fast);
}

IndicatorValue TrendIndicator::compute(const data::OHLCVSeries& series,
                                       const IndicatorParams& params) const {
    std::vector<double> closes = series.closes();
    ta::Line fast = ta::sma(closes, params.trend_fast);
    ta::Line slow = ta::sma(closes, params.trend_slow);

    if (fast.values.size() <= static_cast<size_t>(params.trend_slope_bars) || slow.empty()) {
        return IndicatorValue::insufficient(getName(), getLookback(params), closes.size());
    }

    double close = closes.back();
    double fast_now = fast.last();
    double fast_before = fast.values[fast.values.size() - 1 - params.trend_slope_bars];
    double slow_now = slow.last();
    requirePositivePrice(fast_now, "fast SMA");
    requirePositivePrice(fast_before, "fast SMA");
    requirePositivePrice(slow_now, "slow SMA");

    double price_vs_fast = close / fast_now - 1.0;
    double crossover = fast_now / slow_now - 1.0;
    double slope = fast_now / fast_before - 1.0;

    // 2% above the fast average, or a 1% move of the average, counts as a strong reading
    double score = 0.4 * std::tanh(price_vs_fast / 0.02) +
                   0.3 * std::tanh(crossover / 0.02) +
                   0.3 * std::tanh(slope / 0.01);

    IndicatorValue result;
    result.name = getName();
    result.value = clamp(score, -1.0, 1.0);
    result.components["sma_fast"] = fast_now;
    result.components["sma_slow"] = slow_now;
    result.components["price_vs_fast_pct"] = price_vs_fast * 100.0;
    result.components["crossover_pct"] = crossover * 100.0;
    result.components["slope_pct"] = slope * 100.0;
    return result;
}

// Momentum

size_t MomentumIndicator::getLookback(const IndicatorParams& params) const {
    return static_cast<size_t>(ta::rsiLookback(params.rsi_period) + 1);
}

IndicatorValue MomentumIndicator::compute(const data::OHLCVSeries& series,
                                          const IndicatorParams& params) const {
    ta::Line rsi = ta::rsi(series.closes(), params.rsi_period);
    if (rsi.empty()) {
        return IndicatorValue::insufficient(getName(), getLookback(params), series.size());
    }

    double value = clamp(rsi.last(), 0.0, 100.0);

    IndicatorValue result;
    result.name = getName();
    result.value = value;
    result.has_range = true;
    result.lower = 0.0;
    result.upper = 100.0;
    result.components["rsi"] = value;
    result.components["normalized"] = (value - 50.0) / 50.0;
    return result;
}

// MACD

size_t MacdIndicator::getLookback(const IndicatorParams& params) const {
    return static_cast<size_t>(ta::macdLookback(params.macd_fast, params.macd_slow, params.macd_signal) + 1);
}

IndicatorValue MacdIndicator::compute(const data::OHLCVSeries& series,
                                      const IndicatorParams& params) const {
    std::vector<double> closes = series.closes();
    ta::MacdLines lines = ta::macd(closes, params.macd_fast, params.macd_slow, params.macd_signal);
    if (lines.macd.empty()) {
        return IndicatorValue::insufficient(getName(), getLookback(params), closes.size());
    }

    double close = closes.back();
    requirePositivePrice(close, "close");

    double macd = lines.macd.back();
    double signal = lines.signal.back();
    double histogram = lines.histogram.back();

    double macd_pct = macd / close * 100.0;
    double histogram_pct = histogram / close * 100.0;
    double score = 0.7 * std::tanh(macd_pct) + 0.3 * std::tanh(2.0 * histogram_pct);

    IndicatorValue result;
    result.name = getName();
    result.value = clamp(score, -1.0, 1.0);
    result.components["macd"] = macd;
    result.components["signal"] = signal;
    result.components["histogram"] = histogram;
    result.components["signal_delta_pct"] = histogram_pct;
    return result;
}

// Support and resistance

size_t SupportResistanceIndicator::getLookback(const IndicatorParams& params) const {
    return static_cast<size_t>(2 * params.sr_window + 1);
}

std::vector<double> SupportResistanceIndicator::findSupportLevels(const std::vector<double>& lows,
                                                                  int window,
                                                                  double min_separation) {
    std::vector<double> levels;
    const int n = static_cast<int>(lows.size());
    for (int i = window; i + window < n; ++i) {
        double lowest = *std::min_element(lows.begin() + (i - window), lows.begin() + (i + window + 1));
        if (lows[i] <= lowest) {
            levels.push_back(lows[i]);
        }
    }

    // Ascending: the lower level of a near-duplicate pair survives
    std::sort(levels.begin(), levels.end());
    return collapseLevels(levels, min_separation);
}

std::vector<double> SupportResistanceIndicator::findResistanceLevels(const std::vector<double>& highs,
                                                                     int window,
                                                                     double min_separation) {
    std::vector<double> levels;
    const int n = static_cast<int>(highs.size());
    for (int i = window; i + window < n; ++i) {
        double highest = *std::max_element(highs.begin() + (i - window), highs.begin() + (i + window + 1));
        if (highs[i] >= highest) {
            levels.push_back(highs[i]);
        }
    }

    // Descending: the higher level of a near-duplicate pair survives
    std::sort(levels.begin(), levels.end(), std::greater<double>());
    return collapseLevels(levels, min_separation);
}

IndicatorValue SupportResistanceIndicator::compute(const data::OHLCVSeries& series,
                                                   const IndicatorParams& params) const {
    if (series.size() < getLookback(params)) {
        return IndicatorValue::insufficient(getName(), getLookback(params), series.size());
    }

    size_t count = std::min(series.size(), static_cast<size_t>(params.sr_lookback));
    std::vector<double> lows = series.lows();
    std::vector<double> highs = series.highs();
    lows.erase(lows.begin(), lows.end() - count);
    highs.erase(highs.begin(), highs.end() - count);

    double close = series.back().close;
    requirePositivePrice(close, "close");
    double separation = close * params.sr_min_separation_pct / 100.0;

    std::vector<double> supports;
    for (double level : findSupportLevels(lows, params.sr_window, separation)) {
        if (level < close) {
            supports.push_back(level);
        }
    }
    std::vector<double> resistances;
    for (double level : findResistanceLevels(highs, params.sr_window, separation)) {
        if (level > close) {
            resistances.push_back(level);
        }
    }

    // Nearest first
    std::sort(supports.begin(), supports.end(), std::greater<double>());
    std::sort(resistances.begin(), resistances.end());

    IndicatorValue result;
    result.name = getName();
    result.has_range = true;

    if (supports.empty()) {
        result.lower = close * (1.0 - params.sr_fallback_pct / 100.0);
        result.components["support_fallback"] = 1.0;
    } else {
        result.lower = supports.front();
        result.components["support_fallback"] = 0.0;
    }

    if (resistances.empty()) {
        result.upper = close * (1.0 + params.sr_fallback_pct / 100.0);
        result.components["resistance_fallback"] = 1.0;
    } else {
        result.upper = resistances.front();
        result.components["resistance_fallback"] = 0.0;
    }

    for (size_t i = 0; i < std::min<size_t>(3, supports.size()); ++i) {
        result.components["support_" + std::to_string(i + 1)] = supports[i];
    }
    for (size_t i = 0; i < std::min<size_t>(3, resistances.size()); ++i) {
        result.components["resistance_" + std::to_string(i + 1)] = resistances[i];
    }

    double width = result.upper - result.lower;
    result.components["support"] = result.lower;
    result.components["resistance"] = result.upper;
    result.components["band_width"] = width;

    // Position of the close inside the band, 0 at support and 1 at resistance
    result.value = width > 0.0 ? clamp((close - result.lower) / width, 0.0, 1.0) : 0.5;
    return result;
}

// ADX

size_t AdxIndicator::getLookback(const IndicatorParams& params) const {
    return static_cast<size_t>(ta::adxLookback(params.adx_period) + 1);
}

IndicatorValue AdxIndicator::compute(const data::OHLCVSeries& series,
                                     const IndicatorParams& params) const {
    ta::Line adx = ta::adx(series.highs(), series.lows(), series.closes(), params.adx_period);
    if (adx.empty()) {
        return IndicatorValue::insufficient(getName(), getLookback(params), series.size());
    }

    IndicatorValue result;
    result.name = getName();
    result.value = clamp(adx.last(), 0.0, 100.0);
    result.has_range = true;
    result.lower = 0.0;
    result.upper = 100.0;
    return result;
}

// Volatility

size_t VolatilityIndicator::getLookback(const IndicatorParams& params) const {
    return static_cast<size_t>(params.volatility_window + 1);
}

IndicatorValue VolatilityIndicator::compute(const data::OHLCVSeries& series,
                                            const IndicatorParams& params) const {
    std::vector<double> closes = series.closes();
    if (closes.size() < getLookback(params)) {
        return IndicatorValue::insufficient(getName(), getLookback(params), closes.size());
    }

    std::vector<double> returns;
    returns.reserve(params.volatility_window);
    double abs_sum = 0.0;
    for (size_t i = closes.size() - params.volatility_window; i < closes.size(); ++i) {
        requirePositivePrice(closes[i - 1], "close");
        double change = closes[i] / closes[i - 1] - 1.0;
        returns.push_back(change);
        abs_sum += std::fabs(change);
    }

    ta::Line deviation = ta::stddev(returns, params.volatility_window);
    if (deviation.empty()) {
        return IndicatorValue::insufficient(getName(), getLookback(params), closes.size());
    }

    double annualized = deviation.last() * std::sqrt(252.0) * 100.0;

    IndicatorValue result;
    result.name = getName();
    result.value = annualized;
    result.components["annualized_pct"] = annualized;
    result.components["avg_abs_change_pct"] = abs_sum / returns.size() * 100.0;
    return result;
}

// Volume change

size_t VolumeChangeIndicator::getLookback(const IndicatorParams& params) const {
    return static_cast<size_t>(ta::smaLookback(params.volume_window) + 1);
}

IndicatorValue VolumeChangeIndicator::compute(const data::OHLCVSeries& series,
                                              const IndicatorParams& params) const {
    std::vector<double> volumes = series.volumes();
    ta::Line average = ta::sma(volumes, params.volume_window);
    if (average.empty()) {
        return IndicatorValue::insufficient(getName(), getLookback(params), volumes.size());
    }

    IndicatorValue result;
    result.name = getName();
    result.components["volume"] = volumes.back();
    result.components["volume_sma"] = average.last();

    if (average.last() <= 0.0) {
        result.value = 0.0;
        result.note = "no traded volume in window";
        return result;
    }

    result.value = (volumes.back() / average.last() - 1.0) * 100.0;
    return result;
}

std::string indicatorStatusToString(IndicatorStatus status) {
    switch (status) {
        case IndicatorStatus::OK: return "OK";
        case IndicatorStatus::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
        case IndicatorStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

} // namespace indicators
} // namespace market_signals
