#include <cstdlib>
#include <gtest/gtest.h>

#include "market_signals/common/config.h"

using market_signals::common::Config;
using market_signals::common::ConfigError;

TEST(ConfigTest, DefaultsAreValid) {
    Config config;

    EXPECT_EQ(config.getQuotaConfig().historical_per_window, 3);
    EXPECT_EQ(config.getSchedulerConfig().worker_pool_size, 4);
    EXPECT_EQ(config.getIndicatorConfig().enabled.size(), 7u);
    EXPECT_EQ(config.getSignalConfig().weights.size(), 3u);
    EXPECT_EQ(config.getRiskConfig().sizing_method, "risk");
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, OverridesFromYaml) {
    Config config = Config::fromString(R"(
quota:
  window_ms: 60000
  limits:
    historical: 5
scheduler:
  worker_pool_size: 2
  max_retries: 1
signal:
  weights:
    macd: 2.0
    trend: 1.0
  risk_reward_threshold: 2.0
risk:
  sizing_method: kelly
batch:
  deadline_ms: 0
  symbols: [INFY, TCS]
  session:
    open: "09:00"
    close: "15:00"
)");

    EXPECT_EQ(config.getQuotaConfig().window_ms, 60000);
    EXPECT_EQ(config.getQuotaConfig().historical_per_window, 5);
    // Untouched keys keep their defaults
    EXPECT_EQ(config.getQuotaConfig().quote_per_window, 10);
    EXPECT_EQ(config.getSchedulerConfig().worker_pool_size, 2);
    EXPECT_EQ(config.getSchedulerConfig().max_retries, 1);

    const auto& weights = config.getSignalConfig().weights;
    ASSERT_EQ(weights.size(), 2u);
    EXPECT_EQ(weights[0].first, "macd");
    EXPECT_EQ(weights[0].second, 2.0);
    EXPECT_EQ(weights[1].first, "trend");

    EXPECT_EQ(config.getSignalConfig().risk_reward_threshold, 2.0);
    EXPECT_EQ(config.getRiskConfig().sizing_method, "kelly");
    EXPECT_EQ(config.getBatchConfig().deadline_ms, 0);
    EXPECT_EQ(config.getBatchConfig().default_symbols, (std::vector<std::string>{"INFY", "TCS"}));
    EXPECT_EQ(config.getBatchConfig().session.open_minute, 540);
    EXPECT_EQ(config.getBatchConfig().session.close_minute, 900);
}

TEST(ConfigTest, RejectsInvalidWeights) {
    EXPECT_THROW(Config::fromString("signal:\n  weights:\n    trend: -1.0\n"), ConfigError);
    EXPECT_THROW(Config::fromString("signal:\n  weights:\n    trend: 0.0\n    macd: 0.0\n"), ConfigError);
    EXPECT_THROW(Config::fromString("signal:\n  weights:\n    adx: 1.0\n"), ConfigError);
    EXPECT_THROW(Config::fromString("signal:\n  weights: [trend, macd]\n"), ConfigError);
    EXPECT_THROW(Config::fromString("indicators:\n  enabled: [momentum, macd]\n"), ConfigError);
}

TEST(ConfigTest, OptionChainSourceSettings) {
    Config defaults;
    EXPECT_EQ(defaults.getDataSourceConfig().derivatives_exchange, "NFO");
    EXPECT_EQ(defaults.getDataSourceConfig().option_expiries, 2);

    Config config = Config::fromString(
        "data_source:\n  derivatives_exchange: BFO\n  option_expiries: 3\n  risk_free_rate: 0.07\n");
    EXPECT_EQ(config.getDataSourceConfig().derivatives_exchange, "BFO");
    EXPECT_EQ(config.getDataSourceConfig().option_expiries, 3);
    EXPECT_DOUBLE_EQ(config.getDataSourceConfig().risk_free_rate, 0.07);

    EXPECT_THROW(Config::fromString("data_source:\n  option_expiries: 0\n"), ConfigError);
    EXPECT_THROW(Config::fromString("data_source:\n  risk_free_rate: 1.5\n"), ConfigError);
}

TEST(ConfigTest, TrendStrengthSettings) {
    Config config = Config::fromString(
        "signal:\n  adx:\n    weak_below: 15\n    strong_factor: 1.5\n"
        "  profit_probability:\n    volatility_weight: 0.5\n");
    const auto& sig = config.getSignalConfig();
    EXPECT_EQ(sig.adx_weak_below, 15.0);
    EXPECT_EQ(sig.adx_strong_above, 40.0);
    EXPECT_EQ(sig.adx_strong_factor, 1.5);
    EXPECT_EQ(sig.profit_adx_strong_factor, 1.1);
    EXPECT_EQ(sig.profit_volatility_weight, 0.5);

    EXPECT_THROW(Config::fromString("signal:\n  adx:\n    weak_below: 50\n"), ConfigError);
    EXPECT_THROW(Config::fromString("signal:\n  adx:\n    weak_factor: 0\n"), ConfigError);
    EXPECT_THROW(Config::fromString("signal:\n  profit_probability:\n    volatility_weight: 1.5\n"), ConfigError);
}

TEST(ConfigTest, RejectsInvalidSchedulerAndQuota) {
    EXPECT_THROW(Config::fromString("scheduler:\n  worker_pool_size: 0\n"), ConfigError);
    EXPECT_THROW(Config::fromString("scheduler:\n  max_retries: -1\n"), ConfigError);
    EXPECT_THROW(Config::fromString("scheduler:\n  backoff_floor_ms: 5000\n  max_backoff_ms: 1000\n"), ConfigError);
    EXPECT_THROW(Config::fromString("quota:\n  window_ms: 0\n"), ConfigError);
    EXPECT_THROW(Config::fromString("quota:\n  limits:\n    quote: 0\n"), ConfigError);
}

TEST(ConfigTest, RejectsInvalidIndicatorParameters) {
    EXPECT_THROW(Config::fromString("indicators:\n  rsi_period: 1\n"), ConfigError);
    EXPECT_THROW(Config::fromString("indicators:\n  macd_fast: 26\n  macd_slow: 12\n"), ConfigError);
    EXPECT_THROW(Config::fromString("indicators:\n  trend_fast: 50\n"), ConfigError);
    EXPECT_THROW(Config::fromString("indicators:\n  sr_lookback: 5\n"), ConfigError);
    EXPECT_THROW(Config::fromString("indicators:\n  enabled: [trend, momentum, macd, ichimoku]\n"), ConfigError);
}

TEST(ConfigTest, RejectsInvalidRiskAndBatch) {
    EXPECT_THROW(Config::fromString("risk:\n  sizing_method: martingale\n"), ConfigError);
    EXPECT_THROW(Config::fromString("risk:\n  account_size: 0\n"), ConfigError);
    EXPECT_THROW(Config::fromString("batch:\n  deadline_ms: -1\n"), ConfigError);
    EXPECT_THROW(Config::fromString("batch:\n  session:\n    open: \"16:00\"\n"), ConfigError);
    EXPECT_THROW(Config::fromString("batch:\n  session:\n    open: \"9am\"\n"), ConfigError);
}

TEST(ConfigTest, RejectsMalformedYaml) {
    EXPECT_THROW(Config::fromString("quota: [unterminated"), ConfigError);
    EXPECT_THROW(Config("/nonexistent/market_signals.yaml"), ConfigError);
}

TEST(ConfigTest, ExpandsEnvironmentVariables) {
    setenv("MARKET_SIGNALS_TEST_TOKEN", "secret", 1);
    unsetenv("MARKET_SIGNALS_TEST_MISSING");

    EXPECT_EQ(Config::expandEnvVars("${MARKET_SIGNALS_TEST_TOKEN}"), "secret");
    EXPECT_EQ(Config::expandEnvVars("token ${MARKET_SIGNALS_TEST_TOKEN}:${MARKET_SIGNALS_TEST_MISSING}"),
              "token secret:");
    EXPECT_EQ(Config::expandEnvVars("plain"), "plain");

    Config config = Config::fromString("data_source:\n  access_token: ${MARKET_SIGNALS_TEST_TOKEN}\n");
    EXPECT_EQ(config.getDataSourceConfig().access_token, "secret");
}

TEST(ConfigTest, ParsesClockTimes) {
    EXPECT_EQ(Config::parseClockTime("09:15"), 555);
    EXPECT_EQ(Config::parseClockTime("9:15"), 555);
    EXPECT_EQ(Config::parseClockTime("23:59"), 1439);
    EXPECT_THROW(Config::parseClockTime("24:00"), ConfigError);
    EXPECT_THROW(Config::parseClockTime("12:60"), ConfigError);
}
