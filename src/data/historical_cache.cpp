/**
 * On-disk cache of historical series implementation
 */

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

#include "market_signals/common/logging.h"
#include "market_signals/data/historical_cache.h"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace market_signals {
namespace data {

HistoricalCache::HistoricalCache(const std::string& directory, std::chrono::seconds max_age,
                                 const common::Clock& clock)
    : directory_(directory),
      max_age_(max_age),
      clock_(clock) {
}

std::string HistoricalCache::pathFor(const std::string& symbol, const std::string& interval) const {
    return (fs::path(directory_) / (symbol + "_" + interval + ".json")).string();
}

bool HistoricalCache::load(const std::string& symbol, const std::string& interval,
                           OHLCVSeries& series) const {
    if (!enabled()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream file(pathFor(symbol, interval));
    if (!file.is_open()) {
        return false;
    }

    json cached = json::parse(file, nullptr, false);
    if (cached.is_discarded() || !cached.is_object()) {
        LOG_WARNING("Ignoring corrupt cache entry for " + symbol);
        return false;
    }

    try {
        const json& saved_at_node = cached.at("saved_at");
        if (!saved_at_node.is_number_integer()) {
            LOG_WARNING("Ignoring cache entry for " + symbol + " without a numeric saved_at");
            return false;
        }
        int64_t saved_at = saved_at_node.get<int64_t>();
        int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
            clock_.wallTime().time_since_epoch()).count();
        if (now - saved_at > max_age_.count()) {
            return false;
        }

        std::vector<Bar> bars;
        for (const auto& row : cached.at("bars")) {
            Bar bar;
            bar.timestamp = row.at(0).get<int64_t>();
            bar.open = row.at(1).get<double>();
            bar.high = row.at(2).get<double>();
            bar.low = row.at(3).get<double>();
            bar.close = row.at(4).get<double>();
            bar.volume = row.at(5).get<double>();
            bars.push_back(bar);
        }
        series = OHLCVSeries(symbol, std::move(bars));
    } catch (const std::exception& e) {
        LOG_WARNING("Ignoring unreadable cache entry for " + symbol + ": " + e.what());
        return false;
    }

    LOG_DEBUG("Cache hit for " + symbol + " (" + std::to_string(series.size()) + " bars)");
    return !series.empty();
}

void HistoricalCache::store(const std::string& symbol, const std::string& interval,
                            const OHLCVSeries& series) {
    if (!enabled() || series.empty()) {
        return;
    }

    json rows = json::array();
    for (const auto& bar : series.bars()) {
        rows.push_back({bar.timestamp, bar.open, bar.high, bar.low, bar.close, bar.volume});
    }

    json entry;
    entry["symbol"] = symbol;
    entry["interval"] = interval;
    entry["saved_at"] = std::chrono::duration_cast<std::chrono::seconds>(
        clock_.wallTime().time_since_epoch()).count();
    entry["bars"] = rows;

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        LOG_WARNING("Cannot create cache directory " + directory_ + ": " + ec.message());
        return;
    }

    std::ofstream file(pathFor(symbol, interval), std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        LOG_WARNING("Cannot write cache entry for " + symbol);
        return;
    }
    file << entry.dump();
}

} // namespace data
} // namespace market_signals
