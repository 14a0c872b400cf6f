/**
 * Configuration management for the signal engine
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace market_signals {
namespace common {

// Raised for any invalid or unreadable configuration; fatal at startup
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Logging configuration
struct LoggingConfig {
    std::string level = "INFO";
    std::string file = "logs/market_signals.log";
    bool console = true;
};

// Upstream broker REST endpoint
struct DataSourceConfig {
    std::string base_url = "https://api.kite.trade";
    std::string api_key;
    std::string access_token;
    std::string exchange = "NSE";
    std::string interval = "day";
    int history_days = 365;
    int timeout_ms = 15000;

    // Option chains are assembled from the derivatives instrument listing
    std::string derivatives_exchange = "NFO";
    int option_expiries = 2;
    double risk_free_rate = 0.065;  // Annual, used to back out implied volatility
};

// Per endpoint-class call budgets over one window
struct QuotaConfig {
    int window_ms = 1000;
    int min_retry_delay_ms = 60000;

    int historical_per_window = 3;
    int quote_per_window = 10;
    int option_chain_per_window = 10;
    int order_per_window = 10;
    int other_per_window = 10;
};

// Fetch scheduler
struct SchedulerConfig {
    int worker_pool_size = 4;
    int max_retries = 3;
    int backoff_floor_ms = 2000;
    int max_backoff_ms = 300000;
};

// Indicator pipeline parameters
struct IndicatorConfig {
    std::vector<std::string> enabled = {
        "trend", "momentum", "macd", "support_resistance", "adx", "volatility", "volume_change"};

    int rsi_period = 14;
    int macd_fast = 12;
    int macd_slow = 26;
    int macd_signal = 9;

    int trend_fast = 20;
    int trend_slow = 50;
    int trend_slope_bars = 5;

    int adx_period = 14;

    int sr_lookback = 60;
    int sr_window = 5;
    double sr_min_separation_pct = 0.5;
    double sr_fallback_pct = 2.0;

    int volatility_window = 30;
    int volume_window = 20;
};

// Option chain analysis
struct OptionsConfig {
    double min_open_interest = 100.0;
    double single_expiry_confidence = 0.75;
    double high_oi_multiple = 1.5;
};

// Signal aggregation policy
struct SignalConfig {
    // Ordered (indicator name, weight) pairs
    std::vector<std::pair<std::string, double>> weights = {
        {"trend", 0.4}, {"momentum", 0.3}, {"macd", 0.3}};

    double vote_deadband = 0.05;
    double risk_reward_threshold = 1.5;
    double target_band_multiple = 1.0;
    double min_stop_distance_pct = 1.0;
    double insufficient_data_penalty = 0.25;
    double degraded_penalty = 0.25;

    // ADX trend strength scales directional confidence
    double adx_weak_below = 20.0;
    double adx_strong_above = 40.0;
    double adx_weak_factor = 0.8;
    double adx_strong_factor = 1.2;

    // Profit probability = confidence x ADX factor x (1 - volatility_weight * annualized vol / 100)
    double profit_adx_weak_factor = 0.9;
    double profit_adx_strong_factor = 1.1;
    double profit_volatility_weight = 0.3;
};

// Position sizing
struct RiskConfig {
    double account_size = 100000.0;
    double risk_per_trade_pct = 2.0;
    double max_position_pct = 10.0;
    std::string sizing_method = "risk";  // risk, fixed, kelly
    double kelly_fraction = 0.5;
};

// Trading session used to decide whether live quotes are worth fetching
struct SessionConfig {
    int open_minute = 9 * 60 + 15;
    int close_minute = 15 * 60 + 30;
    int utc_offset_minutes = 330;
};

// Batch orchestration
struct BatchConfig {
    int deadline_ms = 600000;
    int compute_threads = 4;
    bool fetch_quotes = true;
    bool fetch_option_chains = true;
    std::string cache_dir;
    int cache_max_age_s = 43200;
    std::string output_file = "output/signals.json";
    int interval_s = 3600;
    std::vector<std::string> default_symbols;
    SessionConfig session;
};

// Configuration class
class Config {
public:
    // Built-in defaults
    Config();

    // Load and validate a YAML file
    explicit Config(const std::string& config_path);

    // Parse and validate inline YAML text
    static Config fromString(const std::string& yaml_text);

    const LoggingConfig& getLoggingConfig() const { return logging_config_; }
    const DataSourceConfig& getDataSourceConfig() const { return data_source_config_; }
    const QuotaConfig& getQuotaConfig() const { return quota_config_; }
    const SchedulerConfig& getSchedulerConfig() const { return scheduler_config_; }
    const IndicatorConfig& getIndicatorConfig() const { return indicator_config_; }
    const OptionsConfig& getOptionsConfig() const { return options_config_; }
    const SignalConfig& getSignalConfig() const { return signal_config_; }
    const RiskConfig& getRiskConfig() const { return risk_config_; }
    const BatchConfig& getBatchConfig() const { return batch_config_; }

    // Replace ${VAR} references with environment values
    static std::string expandEnvVars(const std::string& value);

    // Parse "HH:MM" into minutes after midnight
    static int parseClockTime(const std::string& value);

    // Checks applied after every load; throws ConfigError
    void validate() const;

private:
    LoggingConfig logging_config_;
    DataSourceConfig data_source_config_;
    QuotaConfig quota_config_;
    SchedulerConfig scheduler_config_;
    IndicatorConfig indicator_config_;
    OptionsConfig options_config_;
    SignalConfig signal_config_;
    RiskConfig risk_config_;
    BatchConfig batch_config_;

    void loadConfig(const YAML::Node& root);
};

} // namespace common
} // namespace market_signals
