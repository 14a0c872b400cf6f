/**
 * On-disk cache of historical series
 */

#pragma once

#include <chrono>
#include <mutex>
#include <string>

#include "market_signals/common/clock.h"
#include "market_signals/data/market_data.h"

namespace market_signals {
namespace data {

// Stores one JSON file per (symbol, interval). Entries older than max_age are
// treated as misses. A disabled cache (empty directory) never hits.
class HistoricalCache {
public:
    HistoricalCache(const std::string& directory, std::chrono::seconds max_age,
                    const common::Clock& clock);

    bool enabled() const { return !directory_.empty(); }

    // Returns true and fills series on a fresh hit. Unreadable entries are
    // logged and reported as misses.
    bool load(const std::string& symbol, const std::string& interval, OHLCVSeries& series) const;

    // Best effort; failures are logged, never thrown
    void store(const std::string& symbol, const std::string& interval, const OHLCVSeries& series);

private:
    std::string directory_;
    std::chrono::seconds max_age_;
    const common::Clock& clock_;
    mutable std::mutex mutex_;

    std::string pathFor(const std::string& symbol, const std::string& interval) const;
};

} // namespace data
} // namespace market_signals
