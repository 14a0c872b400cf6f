/**
 * Ordered composition of indicators over one series
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "market_signals/indicators/indicator.h"

namespace market_signals {
namespace indicators {

// Result of one pipeline run, keyed by indicator name. Insertion order is kept.
class IndicatorSet {
public:
    void add(IndicatorValue value);

    bool contains(const std::string& name) const;

    // nullptr when the indicator was not configured
    const IndicatorValue* find(const std::string& name) const;

    // True when the indicator exists and computed successfully
    bool available(const std::string& name) const;

    const std::vector<IndicatorValue>& values() const { return values_; }
    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    // Names of indicators that are insufficient or failed
    std::vector<std::string> insufficientNames() const;
    std::vector<std::string> failedNames() const;

private:
    std::vector<IndicatorValue> values_;
    std::map<std::string, size_t> index_;
};

// Stateless pipeline; safe to share across compute threads
class IndicatorPipeline {
public:
    explicit IndicatorPipeline(const IndicatorParams& params);

    IndicatorSet compute(const data::OHLCVSeries& series) const;

    // Largest lookback of the configured indicators
    size_t getRequiredBars() const;

    const IndicatorParams& getParams() const { return params_; }

private:
    IndicatorParams params_;
    std::vector<std::unique_ptr<Indicator>> indicators_;
};

} // namespace indicators
} // namespace market_signals
