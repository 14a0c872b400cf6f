/**
 * Ordered composition of indicators over one series
 */

#include <algorithm>
#include <stdexcept>

#include "market_signals/common/logging.h"
#include "market_signals/indicators/indicator_pipeline.h"

namespace market_signals {
namespace indicators {

void IndicatorSet::add(IndicatorValue value) {
    auto it = index_.find(value.name);
    if (it != index_.end()) {
        values_[it->second] = std::move(value);
        return;
    }
    index_[value.name] = values_.size();
    values_.push_back(std::move(value));
}

bool IndicatorSet::contains(const std::string& name) const {
    return index_.count(name) > 0;
}

const IndicatorValue* IndicatorSet::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &values_[it->second];
}

bool IndicatorSet::available(const std::string& name) const {
    const IndicatorValue* value = find(name);
    return value != nullptr && value->available();
}

std::vector<std::string> IndicatorSet::insufficientNames() const {
    std::vector<std::string> names;
    for (const auto& value : values_) {
        if (value.status == IndicatorStatus::INSUFFICIENT_DATA) {
            names.push_back(value.name);
        }
    }
    return names;
}

std::vector<std::string> IndicatorSet::failedNames() const {
    std::vector<std::string> names;
    for (const auto& value : values_) {
        if (value.status == IndicatorStatus::FAILED) {
            names.push_back(value.name);
        }
    }
    return names;
}

IndicatorPipeline::IndicatorPipeline(const IndicatorParams& params)
    : params_(params) {
    for (const auto& name : params_.enabled) {
        indicators_.push_back(Indicator::create(name));
    }
}

IndicatorSet IndicatorPipeline::compute(const data::OHLCVSeries& series) const {
    IndicatorSet result;

    for (const auto& indicator : indicators_) {
        const std::string name = indicator->getName();
        try {
            size_t required = indicator->getLookback(params_);
            if (series.size() < required) {
                result.add(IndicatorValue::insufficient(name, required, series.size()));
                continue;
            }
            result.add(indicator->compute(series, params_));
        } catch (const std::exception& e) {
            LOG_WARNING("Indicator " + name + " failed for " + series.symbol() + ": " + e.what());
            result.add(IndicatorValue::failed(name, e.what()));
        }
    }

    return result;
}

size_t IndicatorPipeline::getRequiredBars() const {
    size_t required = 0;
    for (const auto& indicator : indicators_) {
        required = std::max(required, indicator->getLookback(params_));
    }
    return required;
}

} // namespace indicators
} // namespace market_signals
