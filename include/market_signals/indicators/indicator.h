/**
 * Technical indicator interface
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "market_signals/common/config.h"
#include "market_signals/data/market_data.h"

namespace market_signals {
namespace indicators {

using IndicatorParams = common::IndicatorConfig;

enum class IndicatorStatus {
    OK,
    INSUFFICIENT_DATA,  // Series shorter than the lookback window
    FAILED              // Computation raised; absorbed by the pipeline
};

// One computed indicator. Band-type indicators also fill lower/upper.
struct IndicatorValue {
    std::string name;
    IndicatorStatus status = IndicatorStatus::OK;
    double value = 0.0;

    bool has_range = false;
    double lower = 0.0;
    double upper = 0.0;

    std::map<std::string, double> components;
    std::string note;

    bool available() const { return status == IndicatorStatus::OK; }

    double component(const std::string& key, double fallback = 0.0) const {
        auto it = components.find(key);
        return it == components.end() ? fallback : it->second;
    }

    static IndicatorValue insufficient(const std::string& name, size_t required, size_t actual);
    static IndicatorValue failed(const std::string& name, const std::string& reason);
};

// Indicator interface
class Indicator {
public:
    virtual ~Indicator() = default;

    virtual std::string getName() const = 0;

    // Bars required before compute() yields a value
    virtual size_t getLookback(const IndicatorParams& params) const = 0;

    // Pure function of the series. Callers check the lookback first.
    virtual IndicatorValue compute(const data::OHLCVSeries& series,
                                   const IndicatorParams& params) const = 0;

    // Factory method to create an indicator by name; throws std::invalid_argument
    static std::unique_ptr<Indicator> create(const std::string& type);
};

// Moving-average trend score in [-1, 1]
class TrendIndicator : public Indicator {
public:
    std::string getName() const override { return "trend"; }
    size_t getLookback(const IndicatorParams& params) const override;
    IndicatorValue compute(const data::OHLCVSeries& series, const IndicatorParams& params) const override;
};

// RSI in [0, 100]
class MomentumIndicator : public Indicator {
public:
    std::string getName() const override { return "momentum"; }
    size_t getLookback(const IndicatorParams& params) const override;
    IndicatorValue compute(const data::OHLCVSeries& series, const IndicatorParams& params) const override;
};

// MACD line and histogram folded into [-1, 1]
class MacdIndicator : public Indicator {
public:
    std::string getName() const override { return "macd"; }
    size_t getLookback(const IndicatorParams& params) const override;
    IndicatorValue compute(const data::OHLCVSeries& series, const IndicatorParams& params) const override;
};

// Nearest sustained local extrema around the last close
class SupportResistanceIndicator : public Indicator {
public:
    std::string getName() const override { return "support_resistance"; }
    size_t getLookback(const IndicatorParams& params) const override;
    IndicatorValue compute(const data::OHLCVSeries& series, const IndicatorParams& params) const override;

    // Candidate levels after near-duplicate collapse. Supports ascending,
    // resistances descending.
    static std::vector<double> findSupportLevels(const std::vector<double>& lows, int window,
                                                 double min_separation);
    static std::vector<double> findResistanceLevels(const std::vector<double>& highs, int window,
                                                    double min_separation);
};

// Average directional index in [0, 100]
class AdxIndicator : public Indicator {
public:
    std::string getName() const override { return "adx"; }
    size_t getLookback(const IndicatorParams& params) const override;
    IndicatorValue compute(const data::OHLCVSeries& series, const IndicatorParams& params) const override;
};

// Annualized volatility of daily returns, percent
class VolatilityIndicator : public Indicator {
public:
    std::string getName() const override { return "volatility"; }
    size_t getLookback(const IndicatorParams& params) const override;
    IndicatorValue compute(const data::OHLCVSeries& series, const IndicatorParams& params) const override;
};

// Last volume against its moving average, percent
class VolumeChangeIndicator : public Indicator {
public:
    std::string getName() const override { return "volume_change"; }
    size_t getLookback(const IndicatorParams& params) const override;
    IndicatorValue compute(const data::OHLCVSeries& series, const IndicatorParams& params) const override;
};

// Convert indicator status to string
std::string indicatorStatusToString(IndicatorStatus status);

} // namespace indicators
} // namespace market_signals
