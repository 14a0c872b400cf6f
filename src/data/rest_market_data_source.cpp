/**
 * REST market data source implementation
 */

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "market_signals/common/logging.h"
#include "market_signals/data/rest_market_data_source.h"

using json = nlohmann::json;

namespace market_signals {
namespace data {

namespace {

// Callback function for CURL
size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// Captures the Retry-After header value
size_t HeaderCallback(char* buffer, size_t size, size_t nitems, std::string* retry_after) {
    std::string line(buffer, size * nitems);
    std::string lower = line;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const std::string key = "retry-after:";
    if (lower.compare(0, key.size(), key) == 0) {
        std::string value = line.substr(key.size());
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        *retry_after = value;
    }
    return size * nitems;
}

struct HttpResponse {
    CURLcode curl_code = CURLE_OK;
    long status = 0;
    std::string body;
    std::string retry_after;
};

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Kite caps a quote call at 500 instruments
constexpr size_t kQuoteBatchLimit = 500;

// Instrument masters change once a day
constexpr std::chrono::hours kInstrumentMaxAge{12};

// NSE derivatives expire at 15:30 IST
constexpr int64_t kExpiryCloseUtcSeconds = 10 * 3600;

constexpr double kSecondsPerYear = 365.0 * 24 * 3600;

using InstrumentListing = std::shared_ptr<const std::vector<Instrument>>;

std::string formatTime(int64_t epoch_seconds, const char* format) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    std::ostringstream out;
    out << std::put_time(&tm_buf, format);
    return out.str();
}

int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Split one CSV line, honouring double-quoted fields
std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(field);
            field.clear();
        } else if (c != '\r') {
            field += c;
        }
    }
    fields.push_back(field);
    return fields;
}

double normalCdf(double x) {
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

double blackScholes(OptionType type, double spot, double strike, double years, double rate,
                    double sigma) {
    double sqrt_t = std::sqrt(years);
    double d1 = (std::log(spot / strike) + (rate + 0.5 * sigma * sigma) * years) / (sigma * sqrt_t);
    double d2 = d1 - sigma * sqrt_t;
    double discounted_strike = strike * std::exp(-rate * years);
    if (type == OptionType::CALL) {
        return spot * normalCdf(d1) - discounted_strike * normalCdf(d2);
    }
    return discounted_strike * normalCdf(-d2) - spot * normalCdf(-d1);
}

// Extract the broker's error message from a JSON envelope, else the raw body
std::string errorMessage(const std::string& body) {
    json parsed = json::parse(body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("message") &&
        parsed["message"].is_string()) {
        return parsed["message"].get<std::string>();
    }
    return body.substr(0, 200);
}

double numberOr(const json& node, const char* key, double fallback) {
    if (node.contains(key) && node[key].is_number()) {
        return node[key].get<double>();
    }
    return fallback;
}

} // namespace

class RestMarketDataSource::Impl {
public:
    explicit Impl(const common::DataSourceConfig& config)
        : config_(config) {
        curl_global_init(CURL_GLOBAL_ALL);

        if (config_.api_key.empty() || config_.access_token.empty()) {
            LOG_WARNING("No API credentials configured for REST market data source");
        }
    }

    ~Impl() {
        curl_global_cleanup();
    }

    std::string instrument(const std::string& symbol) const {
        return config_.exchange + ":" + symbol;
    }

    std::string escape(const std::string& text) const {
        std::string result = text;
        CURL* curl = curl_easy_init();
        if (curl) {
            char* escaped = curl_easy_escape(curl, text.c_str(), static_cast<int>(text.size()));
            if (escaped) {
                result = escaped;
                curl_free(escaped);
            }
            curl_easy_cleanup(curl);
        }
        return result;
    }

    HttpResponse get(const std::string& url) {
        HttpResponse response;

        CURL* curl = curl_easy_init();
        if (!curl) {
            response.curl_code = CURLE_FAILED_INIT;
            return response;
        }

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "X-Kite-Version: 3");
        std::string auth = "Authorization: token " + config_.api_key + ":" + config_.access_token;
        headers = curl_slist_append(headers, auth.c_str());

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.retry_after);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        response.curl_code = curl_easy_perform(curl);
        if (response.curl_code == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        }

        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
        return response;
    }

    // Shared request path: transport errors, HTTP errors, error envelopes
    template <typename Decode>
    FetchOutcome request(const std::string& url, Decode decode) {
        HttpResponse response = get(url);

        if (response.curl_code != CURLE_OK) {
            return FetchOutcome::transientError(
                "CURL request failed: " + std::string(curl_easy_strerror(response.curl_code)));
        }

        if (response.status < 200 || response.status >= 300) {
            return classifyHttpFailure(response.status, response.body, response.retry_after);
        }

        json envelope = json::parse(response.body, nullptr, false);
        if (!envelope.is_discarded() && envelope.is_object() &&
            envelope.value("status", std::string("success")) == "error") {
            return classifyHttpFailure(400, response.body, response.retry_after);
        }

        FetchOutcome outcome;
        try {
            decode(response.body, outcome);
        } catch (const std::exception& e) {
            return FetchOutcome::permanentError(std::string("Malformed response: ") + e.what());
        }
        return outcome;
    }

    // Instrument master for an exchange, downloaded on first use and then
    // refreshed when stale. Concurrent callers wait for one download.
    FetchOutcome instruments(const std::string& exchange, InstrumentListing& out) {
        std::lock_guard<std::mutex> lock(instruments_mutex_);
        auto now = std::chrono::steady_clock::now();
        auto it = instruments_.find(exchange);
        if (it != instruments_.end() && now - it->second.fetched_at < kInstrumentMaxAge) {
            out = it->second.rows;
            return FetchOutcome{};
        }

        std::vector<Instrument> rows;
        FetchOutcome outcome = request(config_.base_url + "/instruments/" + escape(exchange),
                                       [&rows](const std::string& body, FetchOutcome&) {
                                           rows = parseInstruments(body);
                                       });
        if (!outcome.ok()) {
            return outcome;
        }
        if (rows.empty()) {
            return FetchOutcome::transientError("Empty instrument list for " + exchange);
        }

        LOG_INFO("Loaded " + std::to_string(rows.size()) + " instruments for " + exchange);
        out = std::make_shared<const std::vector<Instrument>>(std::move(rows));
        instruments_[exchange] = InstrumentList{out, now};
        return FetchOutcome{};
    }

    FetchOutcome resolveToken(const std::string& symbol, int64_t& token) {
        InstrumentListing listing;
        FetchOutcome outcome = instruments(config_.exchange, listing);
        if (!outcome.ok()) {
            return outcome;
        }
        for (const auto& row : *listing) {
            if (row.tradingsymbol == symbol) {
                token = row.instrument_token;
                return FetchOutcome{};
            }
        }
        return FetchOutcome::permanentError("Unknown instrument " + instrument(symbol));
    }

    const common::DataSourceConfig& config() const { return config_; }

private:
    struct InstrumentList {
        InstrumentListing rows;
        std::chrono::steady_clock::time_point fetched_at;
    };

    common::DataSourceConfig config_;
    std::mutex instruments_mutex_;
    std::map<std::string, InstrumentList> instruments_;
};

RestMarketDataSource::RestMarketDataSource(const common::DataSourceConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

RestMarketDataSource::~RestMarketDataSource() = default;

FetchOutcome RestMarketDataSource::fetchHistorical(const std::string& symbol, const DateRange& range) {
    int64_t token = 0;
    FetchOutcome resolved = impl_->resolveToken(symbol, token);
    if (!resolved.ok()) {
        return resolved;
    }

    const auto& cfg = impl_->config();
    std::string url = cfg.base_url + "/instruments/historical/" + std::to_string(token) + "/" +
                      cfg.interval +
                      "?from=" + impl_->escape(formatTime(range.from, "%Y-%m-%d %H:%M:%S")) +
                      "&to=" + impl_->escape(formatTime(range.to, "%Y-%m-%d %H:%M:%S"));

    FetchOutcome outcome = impl_->request(url, [&symbol](const std::string& body, FetchOutcome& out) {
        out.series = parseHistorical(symbol, body);
    });

    if (outcome.ok() && outcome.series.empty()) {
        return FetchOutcome::permanentError("No historical data for " + symbol);
    }
    return outcome;
}

FetchOutcome RestMarketDataSource::fetchQuote(const std::string& symbol) {
    const auto& cfg = impl_->config();
    std::string instrument = impl_->instrument(symbol);
    std::string url = cfg.base_url + "/quote?i=" + impl_->escape(instrument);

    return impl_->request(url, [&symbol, &instrument](const std::string& body, FetchOutcome& out) {
        out.quote = parseQuote(symbol, instrument, body);
    });
}

FetchOutcome RestMarketDataSource::fetchOptionChain(const std::string& symbol) {
    const auto& cfg = impl_->config();

    InstrumentListing listing;
    FetchOutcome listed = impl_->instruments(cfg.derivatives_exchange, listing);
    if (!listed.ok()) {
        return listed;
    }

    int64_t now = nowSeconds();
    std::vector<Instrument> options = selectOptions(*listing, symbol, formatTime(now, "%Y-%m-%d"),
                                                    cfg.option_expiries);
    if (options.empty()) {
        return FetchOutcome::permanentError("No listed options for " + symbol);
    }

    // The underlying rides in the first batch so every option can be priced against it
    std::string underlying = impl_->instrument(symbol);
    std::vector<std::string> keys{underlying};
    for (const auto& option : options) {
        keys.push_back(option.exchange + ":" + option.tradingsymbol);
    }

    json merged = json::object();
    for (size_t start = 0; start < keys.size(); start += kQuoteBatchLimit) {
        std::string url = cfg.base_url + "/quote?";
        size_t end = std::min(keys.size(), start + kQuoteBatchLimit);
        for (size_t i = start; i < end; ++i) {
            url += (i == start ? "i=" : "&i=") + impl_->escape(keys[i]);
        }

        FetchOutcome batch = impl_->request(url, [&merged](const std::string& body, FetchOutcome&) {
            json response = json::parse(body);
            for (const auto& item : response.at("data").items()) {
                merged[item.key()] = item.value();
            }
        });
        if (!batch.ok()) {
            return batch;
        }
    }

    FetchOutcome outcome;
    try {
        json envelope;
        envelope["data"] = std::move(merged);
        outcome.chain = parseOptionQuotes(symbol, underlying, options, envelope.dump(), now,
                                          cfg.risk_free_rate);
    } catch (const std::exception& e) {
        return FetchOutcome::permanentError(std::string("Malformed response: ") + e.what());
    }

    if (outcome.chain.contracts.empty()) {
        return FetchOutcome::permanentError("No option quotes for " + symbol);
    }
    LOG_DEBUG("Option chain for " + symbol + ": " + std::to_string(outcome.chain.contracts.size()) +
              " contracts over " + std::to_string(outcome.chain.expiryCount()) + " expiries");
    return outcome;
}

OHLCVSeries RestMarketDataSource::parseHistorical(const std::string& symbol, const std::string& body) {
    try {
        json response = json::parse(body);
        const json& candles = response.at("data").at("candles");

        std::vector<Bar> bars;
        bars.reserve(candles.size());
        for (const auto& candle : candles) {
            if (!candle.is_array() || candle.size() < 6) {
                throw std::runtime_error("candle must have 6 fields");
            }

            Bar bar;
            const json& ts = candle[0];
            bar.timestamp = ts.is_string() ? parseTimestamp(ts.get<std::string>())
                                           : parseTimestamp(std::to_string(ts.get<int64_t>()));
            bar.open = candle[1].get<double>();
            bar.high = candle[2].get<double>();
            bar.low = candle[3].get<double>();
            bar.close = candle[4].get<double>();
            bar.volume = candle[5].get<double>();
            bars.push_back(bar);
        }

        return OHLCVSeries::fromUnordered(symbol, std::move(bars));
    } catch (const json::exception& e) {
        throw std::runtime_error("historical payload: " + std::string(e.what()));
    }
}

Quote RestMarketDataSource::parseQuote(const std::string& symbol, const std::string& instrument,
                                       const std::string& body) {
    try {
        json response = json::parse(body);
        const json& node = response.at("data").at(instrument);

        Quote quote;
        quote.symbol = symbol;
        quote.last_price = node.at("last_price").get<double>();
        quote.volume = numberOr(node, "volume", 0.0);
        if (node.contains("ohlc") && node["ohlc"].is_object()) {
            quote.previous_close = numberOr(node["ohlc"], "close", 0.0);
        }
        if (node.contains("timestamp") && node["timestamp"].is_string()) {
            quote.timestamp = parseTimestamp(node["timestamp"].get<std::string>());
        }

        if (quote.last_price <= 0.0) {
            throw std::runtime_error("non-positive last price");
        }
        return quote;
    } catch (const json::exception& e) {
        throw std::runtime_error("quote payload: " + std::string(e.what()));
    }
}

std::vector<Instrument> RestMarketDataSource::parseInstruments(const std::string& csv) {
    std::istringstream in(csv);
    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error("instrument list: empty response");
    }

    std::map<std::string, size_t> columns;
    std::vector<std::string> header = splitCsvLine(line);
    for (size_t i = 0; i < header.size(); ++i) {
        columns[header[i]] = i;
    }
    for (const char* required : {"instrument_token", "tradingsymbol"}) {
        if (columns.count(required) == 0) {
            throw std::runtime_error(std::string("instrument list: missing column ") + required);
        }
    }

    auto field = [&columns](const std::vector<std::string>& row, const char* name) -> std::string {
        auto it = columns.find(name);
        return it != columns.end() && it->second < row.size() ? row[it->second] : std::string();
    };

    std::vector<Instrument> instruments;
    size_t line_number = 1;
    while (std::getline(in, line)) {
        ++line_number;
        if (line.empty() || line == "\r") {
            continue;
        }

        std::vector<std::string> row = splitCsvLine(line);
        if (row.size() < header.size()) {
            throw std::runtime_error("instrument list: short row at line " + std::to_string(line_number));
        }

        Instrument instrument;
        try {
            instrument.instrument_token = std::stoll(field(row, "instrument_token"));
            std::string strike = field(row, "strike");
            instrument.strike = strike.empty() ? 0.0 : std::stod(strike);
        } catch (const std::logic_error&) {
            throw std::runtime_error("instrument list: bad number at line " + std::to_string(line_number));
        }
        instrument.tradingsymbol = field(row, "tradingsymbol");
        instrument.name = field(row, "name");
        instrument.expiry = field(row, "expiry");
        instrument.instrument_type = field(row, "instrument_type");
        instrument.exchange = field(row, "exchange");
        instruments.push_back(std::move(instrument));
    }
    return instruments;
}

std::vector<Instrument> RestMarketDataSource::selectOptions(const std::vector<Instrument>& instruments,
                                                            const std::string& underlying,
                                                            const std::string& from_date,
                                                            int max_expiries) {
    std::vector<Instrument> candidates;
    std::set<std::string> expiries;
    for (const auto& instrument : instruments) {
        if (instrument.name != underlying || instrument.expiry.empty() ||
            (instrument.instrument_type != "CE" && instrument.instrument_type != "PE")) {
            continue;
        }
        // ISO dates order lexically
        if (instrument.expiry < from_date) {
            continue;
        }
        candidates.push_back(instrument);
        expiries.insert(instrument.expiry);
    }

    std::set<std::string> kept;
    for (const auto& expiry : expiries) {
        if (static_cast<int>(kept.size()) >= max_expiries) {
            break;
        }
        kept.insert(expiry);
    }

    std::vector<Instrument> selected;
    for (auto& candidate : candidates) {
        if (kept.count(candidate.expiry) > 0) {
            selected.push_back(std::move(candidate));
        }
    }
    std::sort(selected.begin(), selected.end(), [](const Instrument& a, const Instrument& b) {
        return std::tie(a.expiry, a.strike, a.instrument_type) <
               std::tie(b.expiry, b.strike, b.instrument_type);
    });
    return selected;
}

OptionChainSnapshot RestMarketDataSource::parseOptionQuotes(const std::string& symbol,
                                                            const std::string& underlying_key,
                                                            const std::vector<Instrument>& options,
                                                            const std::string& body,
                                                            int64_t now,
                                                            double risk_free_rate) {
    try {
        json response = json::parse(body);
        const json& data = response.at("data");

        double spot = 0.0;
        if (data.contains(underlying_key) && data[underlying_key].is_object()) {
            spot = numberOr(data[underlying_key], "last_price", 0.0);
        }
        if (!(spot > 0.0)) {
            LOG_WARNING("No underlying price for " + symbol + "; implied volatility unavailable");
        }

        OptionChainSnapshot chain;
        chain.symbol = symbol;
        chain.timestamp = now;

        for (const auto& option : options) {
            std::string key = option.exchange + ":" + option.tradingsymbol;
            if (!data.contains(key) || !data[key].is_object()) {
                continue;
            }
            const json& quote = data[key];

            OptionContract contract;
            contract.strike = option.strike;
            contract.expiry = option.expiry;
            contract.type = stringToOptionType(option.instrument_type);
            contract.open_interest = numberOr(quote, "oi", 0.0);
            contract.last_price = numberOr(quote, "last_price", 0.0);
            contract.volume = numberOr(quote, "volume", 0.0);

            if (spot > 0.0 && contract.last_price > 0.0) {
                int64_t expires_at = parseTimestamp(option.expiry) + kExpiryCloseUtcSeconds;
                double years = std::max<double>(expires_at - now, 3600.0) / kSecondsPerYear;
                contract.implied_volatility = impliedVolatility(contract.type, spot, contract.strike,
                                                                years, risk_free_rate,
                                                                contract.last_price);
            }
            chain.contracts.push_back(contract);
        }
        return chain;
    } catch (const json::exception& e) {
        throw std::runtime_error("option quote payload: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("option quote payload: " + std::string(e.what()));
    }
}

double RestMarketDataSource::impliedVolatility(OptionType type, double spot, double strike,
                                               double years, double rate, double price) {
    if (!(spot > 0.0) || !(strike > 0.0) || !(years > 0.0) || !(price > 0.0)) {
        return 0.0;
    }

    double discounted_strike = strike * std::exp(-rate * years);
    double lower = type == OptionType::CALL ? std::max(0.0, spot - discounted_strike)
                                            : std::max(0.0, discounted_strike - spot);
    double upper = type == OptionType::CALL ? spot : discounted_strike;
    if (price <= lower || price >= upper) {
        return 0.0;
    }

    // Price is increasing in sigma, so bisect
    double low_sigma = 1e-4;
    double high_sigma = 5.0;
    if (blackScholes(type, spot, strike, years, rate, high_sigma) < price) {
        return 0.0;
    }
    for (int i = 0; i < 100 && high_sigma - low_sigma > 1e-7; ++i) {
        double mid = 0.5 * (low_sigma + high_sigma);
        if (blackScholes(type, spot, strike, years, rate, mid) < price) {
            low_sigma = mid;
        } else {
            high_sigma = mid;
        }
    }
    return 0.5 * (low_sigma + high_sigma) * 100.0;
}

FetchOutcome RestMarketDataSource::classifyHttpFailure(long http_status, const std::string& body,
                                                       const std::string& retry_after_header) {
    std::string message = errorMessage(body);
    std::string lower = toLower(message);

    if (http_status == 429 ||
        lower.find("too many requests") != std::string::npos ||
        lower.find("rate limit") != std::string::npos) {
        std::chrono::milliseconds retry_after{0};
        if (!retry_after_header.empty() &&
            std::all_of(retry_after_header.begin(), retry_after_header.end(),
                        [](unsigned char c) { return std::isdigit(c); })) {
            retry_after = std::chrono::seconds(std::stol(retry_after_header));
        }
        return FetchOutcome::rateLimited(retry_after, "HTTP " + std::to_string(http_status) + ": " + message);
    }

    if (http_status >= 500) {
        return FetchOutcome::transientError("HTTP " + std::to_string(http_status) + ": " + message);
    }

    return FetchOutcome::permanentError("HTTP " + std::to_string(http_status) + ": " + message);
}

int64_t RestMarketDataSource::parseTimestamp(const std::string& text) {
    if (!text.empty() && std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        int64_t value = std::stoll(text);
        // Millisecond epochs are 13 digits for any date after 2001
        return value > 100000000000LL ? value / 1000 : value;
    }

    std::tm tm_buf{};
    std::istringstream in(text);
    in >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    size_t consumed = 19;
    if (in.fail()) {
        tm_buf = std::tm{};
        std::istringstream date_only(text);
        date_only >> std::get_time(&tm_buf, "%Y-%m-%d");
        if (date_only.fail()) {
            throw std::runtime_error("Unparseable timestamp: " + text);
        }
        consumed = 10;
    }

    int64_t epoch = static_cast<int64_t>(timegm(&tm_buf));

    // Optional zone suffix: Z, +HHMM, +HH:MM
    if (text.size() > consumed && (text[consumed] == '+' || text[consumed] == '-')) {
        std::string zone = text.substr(consumed + 1);
        zone.erase(std::remove(zone.begin(), zone.end(), ':'), zone.end());
        if (zone.size() >= 4 && std::all_of(zone.begin(), zone.begin() + 4,
                                            [](unsigned char c) { return std::isdigit(c); })) {
            int offset = std::stoi(zone.substr(0, 2)) * 3600 + std::stoi(zone.substr(2, 2)) * 60;
            epoch += (text[consumed] == '+') ? -offset : offset;
        }
    }
    return epoch;
}

} // namespace data
} // namespace market_signals
