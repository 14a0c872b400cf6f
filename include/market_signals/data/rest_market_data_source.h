/**
 * REST market data source
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "market_signals/common/config.h"
#include "market_signals/data/market_data_source.h"

namespace market_signals {
namespace data {

// One row of the broker's instrument master (CSV from /instruments/{exchange})
struct Instrument {
    int64_t instrument_token = 0;
    std::string tradingsymbol;
    std::string name;             // Underlying for derivatives
    std::string expiry;           // YYYY-MM-DD, empty for cash instruments
    double strike = 0.0;
    std::string instrument_type;  // EQ, FUT, CE, PE
    std::string exchange;
};

/**
 * Broker REST client for candles, quotes and option chains.
 * Session tokens come from configuration; obtaining them is out of scope.
 *
 * Candles are addressed by numeric instrument token, so the cash exchange's
 * instrument master is downloaded once and cached. Option chains are built
 * from the derivatives exchange's master: contracts of the nearest expiries
 * are priced with one batched quote call that also carries the underlying,
 * and implied volatility is backed out of each last price.
 */
class RestMarketDataSource : public MarketDataSource {
public:
    explicit RestMarketDataSource(const common::DataSourceConfig& config);
    ~RestMarketDataSource() override;

    FetchOutcome fetchHistorical(const std::string& symbol, const DateRange& range) override;
    FetchOutcome fetchQuote(const std::string& symbol) override;
    FetchOutcome fetchOptionChain(const std::string& symbol) override;

    std::string getName() const override { return "rest"; }

    // Response decoding, exposed for tests. Each throws std::runtime_error on a
    // malformed payload.
    static OHLCVSeries parseHistorical(const std::string& symbol, const std::string& body);
    static Quote parseQuote(const std::string& symbol, const std::string& instrument,
                            const std::string& body);
    static std::vector<Instrument> parseInstruments(const std::string& csv);

    // Call and put contracts on underlying expiring on or after from_date,
    // limited to the max_expiries nearest expiries
    static std::vector<Instrument> selectOptions(const std::vector<Instrument>& instruments,
                                                 const std::string& underlying,
                                                 const std::string& from_date,
                                                 int max_expiries);

    // Build a chain from a quote response holding the options and the
    // underlying. Options missing from the response are skipped.
    static OptionChainSnapshot parseOptionQuotes(const std::string& symbol,
                                                 const std::string& underlying_key,
                                                 const std::vector<Instrument>& options,
                                                 const std::string& body,
                                                 int64_t now,
                                                 double risk_free_rate);

    // Black-Scholes implied volatility in percent, 0 when the price is outside
    // the no-arbitrage bounds or the inputs are unusable
    static double impliedVolatility(OptionType type, double spot, double strike, double years,
                                    double rate, double price);

    // Map a non-2xx HTTP response to an outcome
    static FetchOutcome classifyHttpFailure(long http_status, const std::string& body,
                                            const std::string& retry_after_header);

    // Parse "2024-01-05T09:15:00+0530", "2024-01-05" or epoch seconds/milliseconds
    static int64_t parseTimestamp(const std::string& text);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace data
} // namespace market_signals
