/**
 * Configuration management implementation
 */

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <regex>
#include <set>

#include <yaml-cpp/yaml.h>
#include "market_signals/common/config.h"

namespace market_signals {
namespace common {

namespace {

const std::set<std::string>& knownIndicators() {
    static const std::set<std::string> names = {
        "trend", "momentum", "macd", "support_resistance", "adx", "volatility", "volume_change"};
    return names;
}

// Indicators whose score carries a direction and can take part in the vote
const std::set<std::string>& weightableIndicators() {
    static const std::set<std::string> names = {"trend", "momentum", "macd"};
    return names;
}

void requirePositive(int value, const std::string& name) {
    if (value <= 0) {
        throw ConfigError(name + " must be positive");
    }
}

// TA-Lib rejects averaging periods below two
void requirePeriod(int value, const std::string& name) {
    if (value < 2) {
        throw ConfigError(name + " must be at least 2");
    }
}

void requireFraction(double value, const std::string& name) {
    if (value < 0.0 || value >= 1.0) {
        throw ConfigError(name + " must be in [0, 1)");
    }
}

} // namespace

Config::Config() {
    validate();
}

Config::Config(const std::string& config_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Error loading config " + config_path + ": " + e.what());
    }

    loadConfig(root);
    std::cout << "Configuration loaded from " << config_path << std::endl;
}

Config Config::fromString(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Error parsing config: " + std::string(e.what()));
    }

    Config config;
    config.loadConfig(root);
    return config;
}

void Config::loadConfig(const YAML::Node& root) {
    try {
        if (root["logging"]) {
            auto log = root["logging"];
            logging_config_.level = log["level"].as<std::string>(logging_config_.level);
            logging_config_.file = log["file"].as<std::string>(logging_config_.file);
            logging_config_.console = log["console"].as<bool>(logging_config_.console);
        }

        if (root["data_source"]) {
            auto ds = root["data_source"];
            auto& cfg = data_source_config_;
            cfg.base_url = expandEnvVars(ds["base_url"].as<std::string>(cfg.base_url));
            cfg.api_key = expandEnvVars(ds["api_key"].as<std::string>(""));
            cfg.access_token = expandEnvVars(ds["access_token"].as<std::string>(""));
            cfg.exchange = ds["exchange"].as<std::string>(cfg.exchange);
            cfg.interval = ds["interval"].as<std::string>(cfg.interval);
            cfg.history_days = ds["history_days"].as<int>(cfg.history_days);
            cfg.timeout_ms = ds["timeout_ms"].as<int>(cfg.timeout_ms);
            cfg.derivatives_exchange = ds["derivatives_exchange"].as<std::string>(cfg.derivatives_exchange);
            cfg.option_expiries = ds["option_expiries"].as<int>(cfg.option_expiries);
            cfg.risk_free_rate = ds["risk_free_rate"].as<double>(cfg.risk_free_rate);
        }

        if (root["quota"]) {
            auto q = root["quota"];
            auto& cfg = quota_config_;
            cfg.window_ms = q["window_ms"].as<int>(cfg.window_ms);
            cfg.min_retry_delay_ms = q["min_retry_delay_ms"].as<int>(cfg.min_retry_delay_ms);

            if (q["limits"]) {
                auto limits = q["limits"];
                cfg.historical_per_window = limits["historical"].as<int>(cfg.historical_per_window);
                cfg.quote_per_window = limits["quote"].as<int>(cfg.quote_per_window);
                cfg.option_chain_per_window = limits["option_chain"].as<int>(cfg.option_chain_per_window);
                cfg.order_per_window = limits["order"].as<int>(cfg.order_per_window);
                cfg.other_per_window = limits["other"].as<int>(cfg.other_per_window);
            }
        }

        if (root["scheduler"]) {
            auto s = root["scheduler"];
            auto& cfg = scheduler_config_;
            cfg.worker_pool_size = s["worker_pool_size"].as<int>(cfg.worker_pool_size);
            cfg.max_retries = s["max_retries"].as<int>(cfg.max_retries);
            cfg.backoff_floor_ms = s["backoff_floor_ms"].as<int>(cfg.backoff_floor_ms);
            cfg.max_backoff_ms = s["max_backoff_ms"].as<int>(cfg.max_backoff_ms);
        }

        if (root["indicators"]) {
            auto ind = root["indicators"];
            auto& cfg = indicator_config_;
            if (ind["enabled"]) {
                cfg.enabled = ind["enabled"].as<std::vector<std::string>>();
            }
            cfg.rsi_period = ind["rsi_period"].as<int>(cfg.rsi_period);
            cfg.macd_fast = ind["macd_fast"].as<int>(cfg.macd_fast);
            cfg.macd_slow = ind["macd_slow"].as<int>(cfg.macd_slow);
            cfg.macd_signal = ind["macd_signal"].as<int>(cfg.macd_signal);
            cfg.trend_fast = ind["trend_fast"].as<int>(cfg.trend_fast);
            cfg.trend_slow = ind["trend_slow"].as<int>(cfg.trend_slow);
            cfg.trend_slope_bars = ind["trend_slope_bars"].as<int>(cfg.trend_slope_bars);
            cfg.adx_period = ind["adx_period"].as<int>(cfg.adx_period);
            cfg.sr_lookback = ind["sr_lookback"].as<int>(cfg.sr_lookback);
            cfg.sr_window = ind["sr_window"].as<int>(cfg.sr_window);
            cfg.sr_min_separation_pct = ind["sr_min_separation_pct"].as<double>(cfg.sr_min_separation_pct);
            cfg.sr_fallback_pct = ind["sr_fallback_pct"].as<double>(cfg.sr_fallback_pct);
            cfg.volatility_window = ind["volatility_window"].as<int>(cfg.volatility_window);
            cfg.volume_window = ind["volume_window"].as<int>(cfg.volume_window);
        }

        if (root["options"]) {
            auto opt = root["options"];
            auto& cfg = options_config_;
            cfg.min_open_interest = opt["min_open_interest"].as<double>(cfg.min_open_interest);
            cfg.single_expiry_confidence = opt["single_expiry_confidence"].as<double>(cfg.single_expiry_confidence);
            cfg.high_oi_multiple = opt["high_oi_multiple"].as<double>(cfg.high_oi_multiple);
        }

        if (root["signal"]) {
            auto sig = root["signal"];
            auto& cfg = signal_config_;
            if (sig["weights"]) {
                if (!sig["weights"].IsMap()) {
                    throw ConfigError("signal.weights must be a mapping of indicator to weight");
                }
                cfg.weights.clear();
                for (const auto& entry : sig["weights"]) {
                    cfg.weights.emplace_back(entry.first.as<std::string>(), entry.second.as<double>());
                }
            }
            cfg.vote_deadband = sig["vote_deadband"].as<double>(cfg.vote_deadband);
            cfg.risk_reward_threshold = sig["risk_reward_threshold"].as<double>(cfg.risk_reward_threshold);
            cfg.target_band_multiple = sig["target_band_multiple"].as<double>(cfg.target_band_multiple);
            cfg.min_stop_distance_pct = sig["min_stop_distance_pct"].as<double>(cfg.min_stop_distance_pct);
            cfg.insufficient_data_penalty = sig["insufficient_data_penalty"].as<double>(cfg.insufficient_data_penalty);
            cfg.degraded_penalty = sig["degraded_penalty"].as<double>(cfg.degraded_penalty);
            if (sig["adx"]) {
                auto adx = sig["adx"];
                cfg.adx_weak_below = adx["weak_below"].as<double>(cfg.adx_weak_below);
                cfg.adx_strong_above = adx["strong_above"].as<double>(cfg.adx_strong_above);
                cfg.adx_weak_factor = adx["weak_factor"].as<double>(cfg.adx_weak_factor);
                cfg.adx_strong_factor = adx["strong_factor"].as<double>(cfg.adx_strong_factor);
            }
            if (sig["profit_probability"]) {
                auto profit = sig["profit_probability"];
                cfg.profit_adx_weak_factor = profit["adx_weak_factor"].as<double>(cfg.profit_adx_weak_factor);
                cfg.profit_adx_strong_factor = profit["adx_strong_factor"].as<double>(cfg.profit_adx_strong_factor);
                cfg.profit_volatility_weight = profit["volatility_weight"].as<double>(cfg.profit_volatility_weight);
            }
        }

        if (root["risk"]) {
            auto risk = root["risk"];
            auto& cfg = risk_config_;
            cfg.account_size = risk["account_size"].as<double>(cfg.account_size);
            cfg.risk_per_trade_pct = risk["risk_per_trade_pct"].as<double>(cfg.risk_per_trade_pct);
            cfg.max_position_pct = risk["max_position_pct"].as<double>(cfg.max_position_pct);
            cfg.sizing_method = risk["sizing_method"].as<std::string>(cfg.sizing_method);
            cfg.kelly_fraction = risk["kelly_fraction"].as<double>(cfg.kelly_fraction);
        }

        if (root["batch"]) {
            auto batch = root["batch"];
            auto& cfg = batch_config_;
            cfg.deadline_ms = batch["deadline_ms"].as<int>(cfg.deadline_ms);
            cfg.compute_threads = batch["compute_threads"].as<int>(cfg.compute_threads);
            cfg.fetch_quotes = batch["fetch_quotes"].as<bool>(cfg.fetch_quotes);
            cfg.fetch_option_chains = batch["fetch_option_chains"].as<bool>(cfg.fetch_option_chains);
            cfg.cache_dir = batch["cache_dir"].as<std::string>(cfg.cache_dir);
            cfg.cache_max_age_s = batch["cache_max_age_s"].as<int>(cfg.cache_max_age_s);
            cfg.output_file = batch["output_file"].as<std::string>(cfg.output_file);
            cfg.interval_s = batch["interval_s"].as<int>(cfg.interval_s);
            if (batch["symbols"]) {
                cfg.default_symbols = batch["symbols"].as<std::vector<std::string>>();
            }

            if (batch["session"]) {
                auto session = batch["session"];
                if (session["open"]) {
                    cfg.session.open_minute = parseClockTime(session["open"].as<std::string>());
                }
                if (session["close"]) {
                    cfg.session.close_minute = parseClockTime(session["close"].as<std::string>());
                }
                cfg.session.utc_offset_minutes =
                    session["utc_offset_minutes"].as<int>(cfg.session.utc_offset_minutes);
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Error loading system config: " + std::string(e.what()));
    }

    validate();
}

void Config::validate() const {
    const auto& q = quota_config_;
    requirePositive(q.window_ms, "quota.window_ms");
    if (q.min_retry_delay_ms < 0) {
        throw ConfigError("quota.min_retry_delay_ms must not be negative");
    }
    requirePositive(q.historical_per_window, "quota.limits.historical");
    requirePositive(q.quote_per_window, "quota.limits.quote");
    requirePositive(q.option_chain_per_window, "quota.limits.option_chain");
    requirePositive(q.order_per_window, "quota.limits.order");
    requirePositive(q.other_per_window, "quota.limits.other");

    const auto& s = scheduler_config_;
    requirePositive(s.worker_pool_size, "scheduler.worker_pool_size");
    if (s.max_retries < 0) {
        throw ConfigError("scheduler.max_retries must not be negative");
    }
    requirePositive(s.backoff_floor_ms, "scheduler.backoff_floor_ms");
    if (s.max_backoff_ms < s.backoff_floor_ms) {
        throw ConfigError("scheduler.max_backoff_ms must be at least backoff_floor_ms");
    }

    const auto& ind = indicator_config_;
    for (const auto& name : ind.enabled) {
        if (knownIndicators().count(name) == 0) {
            throw ConfigError("Unknown indicator: " + name);
        }
    }
    requirePeriod(ind.rsi_period, "indicators.rsi_period");
    requirePeriod(ind.macd_fast, "indicators.macd_fast");
    requirePeriod(ind.macd_slow, "indicators.macd_slow");
    requirePositive(ind.macd_signal, "indicators.macd_signal");
    if (ind.macd_fast >= ind.macd_slow) {
        throw ConfigError("indicators.macd_fast must be shorter than macd_slow");
    }
    requirePeriod(ind.trend_fast, "indicators.trend_fast");
    requirePeriod(ind.trend_slow, "indicators.trend_slow");
    if (ind.trend_fast >= ind.trend_slow) {
        throw ConfigError("indicators.trend_fast must be shorter than trend_slow");
    }
    requirePositive(ind.trend_slope_bars, "indicators.trend_slope_bars");
    requirePeriod(ind.adx_period, "indicators.adx_period");
    requirePositive(ind.sr_window, "indicators.sr_window");
    if (ind.sr_lookback < 2 * ind.sr_window + 1) {
        throw ConfigError("indicators.sr_lookback must cover at least one full extrema window");
    }
    if (ind.sr_min_separation_pct < 0.0) {
        throw ConfigError("indicators.sr_min_separation_pct must not be negative");
    }
    if (ind.sr_fallback_pct <= 0.0) {
        throw ConfigError("indicators.sr_fallback_pct must be positive");
    }
    requirePeriod(ind.volatility_window, "indicators.volatility_window");
    requirePeriod(ind.volume_window, "indicators.volume_window");

    const auto& opt = options_config_;
    if (opt.min_open_interest < 0.0) {
        throw ConfigError("options.min_open_interest must not be negative");
    }
    if (opt.single_expiry_confidence < 0.0 || opt.single_expiry_confidence > 1.0) {
        throw ConfigError("options.single_expiry_confidence must be in [0, 1]");
    }
    if (opt.high_oi_multiple <= 0.0) {
        throw ConfigError("options.high_oi_multiple must be positive");
    }

    const auto& sig = signal_config_;
    if (sig.weights.empty()) {
        throw ConfigError("signal.weights must name at least one indicator");
    }
    double weight_sum = 0.0;
    std::set<std::string> seen;
    for (const auto& [name, weight] : sig.weights) {
        if (weightableIndicators().count(name) == 0) {
            throw ConfigError("signal.weights: " + name + " is not a directional indicator");
        }
        if (std::find(ind.enabled.begin(), ind.enabled.end(), name) == ind.enabled.end()) {
            throw ConfigError("signal.weights: indicator " + name + " is not enabled");
        }
        if (!seen.insert(name).second) {
            throw ConfigError("signal.weights: duplicate weight for " + name);
        }
        if (weight < 0.0) {
            throw ConfigError("signal.weights: weight for " + name + " must not be negative");
        }
        weight_sum += weight;
    }
    if (weight_sum <= 0.0) {
        throw ConfigError("signal.weights must sum to a positive value");
    }
    if (sig.vote_deadband < 0.0 || sig.vote_deadband >= 1.0) {
        throw ConfigError("signal.vote_deadband must be in [0, 1)");
    }
    if (sig.risk_reward_threshold <= 0.0) {
        throw ConfigError("signal.risk_reward_threshold must be positive");
    }
    if (sig.target_band_multiple <= 0.0) {
        throw ConfigError("signal.target_band_multiple must be positive");
    }
    if (sig.min_stop_distance_pct < 0.0) {
        throw ConfigError("signal.min_stop_distance_pct must not be negative");
    }
    requireFraction(sig.insufficient_data_penalty, "signal.insufficient_data_penalty");
    requireFraction(sig.degraded_penalty, "signal.degraded_penalty");
    if (sig.adx_weak_below < 0.0 || sig.adx_strong_above > 100.0 ||
        sig.adx_weak_below > sig.adx_strong_above) {
        throw ConfigError("signal.adx thresholds must satisfy 0 <= weak_below <= strong_above <= 100");
    }
    if (sig.adx_weak_factor <= 0.0 || sig.adx_strong_factor <= 0.0) {
        throw ConfigError("signal.adx factors must be positive");
    }
    if (sig.profit_adx_weak_factor <= 0.0 || sig.profit_adx_strong_factor <= 0.0) {
        throw ConfigError("signal.profit_probability ADX factors must be positive");
    }
    requireFraction(sig.profit_volatility_weight, "signal.profit_probability.volatility_weight");

    const auto& risk = risk_config_;
    if (risk.account_size <= 0.0) {
        throw ConfigError("risk.account_size must be positive");
    }
    if (risk.risk_per_trade_pct <= 0.0 || risk.risk_per_trade_pct > 100.0) {
        throw ConfigError("risk.risk_per_trade_pct must be in (0, 100]");
    }
    if (risk.max_position_pct <= 0.0 || risk.max_position_pct > 100.0) {
        throw ConfigError("risk.max_position_pct must be in (0, 100]");
    }
    if (risk.sizing_method != "risk" && risk.sizing_method != "fixed" && risk.sizing_method != "kelly") {
        throw ConfigError("risk.sizing_method must be one of risk, fixed, kelly");
    }
    if (risk.kelly_fraction <= 0.0 || risk.kelly_fraction > 1.0) {
        throw ConfigError("risk.kelly_fraction must be in (0, 1]");
    }

    const auto& batch = batch_config_;
    if (batch.deadline_ms < 0) {
        throw ConfigError("batch.deadline_ms must not be negative");
    }
    requirePositive(batch.compute_threads, "batch.compute_threads");
    requirePositive(batch.cache_max_age_s, "batch.cache_max_age_s");
    requirePositive(batch.interval_s, "batch.interval_s");
    if (batch.session.open_minute >= batch.session.close_minute) {
        throw ConfigError("batch.session.open must be before close");
    }
    if (data_source_config_.history_days <= 0) {
        throw ConfigError("data_source.history_days must be positive");
    }
    requirePositive(data_source_config_.timeout_ms, "data_source.timeout_ms");
    requirePositive(data_source_config_.option_expiries, "data_source.option_expiries");
    requireFraction(data_source_config_.risk_free_rate, "data_source.risk_free_rate");
}

std::string Config::expandEnvVars(const std::string& value) {
    if (value.find("${") == std::string::npos) {
        return value;
    }

    std::string result = value;
    std::regex env_var_pattern("\\$\\{([^}]+)\\}");

    std::smatch match;
    while (std::regex_search(result, match, env_var_pattern)) {
        std::string env_var_name = match[1].str();
        const char* env_var_value = std::getenv(env_var_name.c_str());

        std::string replacement = env_var_value ? env_var_value : "";
        result.replace(match.position(0), match.length(0), replacement);
    }

    return result;
}

int Config::parseClockTime(const std::string& value) {
    static const std::regex clock_pattern("^([01]?[0-9]|2[0-3]):([0-5][0-9])$");

    std::smatch match;
    if (!std::regex_match(value, match, clock_pattern)) {
        throw ConfigError("Invalid time of day '" + value + "', expected HH:MM");
    }
    return std::stoi(match[1].str()) * 60 + std::stoi(match[2].str());
}

} // namespace common
} // namespace market_signals
