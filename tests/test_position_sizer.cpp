#include <gtest/gtest.h>

#include "market_signals/risk/position_sizer.h"

using namespace market_signals;
using risk::PositionSize;
using risk::PositionSizer;
using signals::Direction;

TEST(PositionSizerTest, RiskBasedSizing) {
    PositionSizer sizer{common::RiskConfig()};

    // 2% of 100k at 50 per share
    PositionSize size = sizer.calculate(Direction::BULLISH, 100.0, 50.0, 200.0, 0.8);

    EXPECT_EQ(size.method, "risk");
    EXPECT_EQ(size.shares, 40);
    EXPECT_DOUBLE_EQ(size.position_value, 4000.0);
    EXPECT_DOUBLE_EQ(size.risk_amount, 2000.0);
    EXPECT_DOUBLE_EQ(size.account_pct, 4.0);
    EXPECT_FALSE(size.capped);
}

TEST(PositionSizerTest, CapsAtMaxPositionPct) {
    PositionSizer sizer{common::RiskConfig()};

    PositionSize size = sizer.calculate(Direction::BEARISH, 100.0, 110.0, 80.0, 0.8);

    EXPECT_TRUE(size.capped);
    EXPECT_EQ(size.shares, 100);
    EXPECT_DOUBLE_EQ(size.account_pct, 10.0);
}

TEST(PositionSizerTest, StopAtEntryAssumesOnePercentRisk) {
    PositionSizer sizer{common::RiskConfig()};

    PositionSize size = sizer.calculate(Direction::BULLISH, 100.0, 100.0, 105.0, 0.5);

    EXPECT_TRUE(size.capped);
    EXPECT_EQ(size.shares, 100);
    EXPECT_DOUBLE_EQ(size.risk_amount, 100.0);
}

TEST(PositionSizerTest, FixedSizing) {
    common::RiskConfig config;
    config.sizing_method = "fixed";
    config.max_position_pct = 5.0;
    PositionSizer sizer(config);

    PositionSize size = sizer.calculate(Direction::BULLISH, 250.0, 240.0, 270.0, 0.1);

    EXPECT_EQ(size.method, "fixed");
    EXPECT_EQ(size.shares, 20);
    EXPECT_DOUBLE_EQ(size.position_value, 5000.0);
}

TEST(PositionSizerTest, KellySizing) {
    common::RiskConfig config;
    config.sizing_method = "kelly";
    config.max_position_pct = 50.0;
    PositionSizer sizer(config);

    // Odds 2:1 at 60%: f = 0.4, half Kelly 0.2
    PositionSize size = sizer.calculate(Direction::BULLISH, 100.0, 95.0, 110.0, 0.6);
    EXPECT_EQ(size.shares, 200);
    EXPECT_FALSE(size.capped);

    // Negative edge
    PositionSize none = sizer.calculate(Direction::BULLISH, 100.0, 95.0, 110.0, 0.3);
    EXPECT_EQ(none.shares, 0);

    // No reward
    PositionSize flat = sizer.calculate(Direction::BULLISH, 100.0, 95.0, 100.0, 0.9);
    EXPECT_EQ(flat.shares, 0);
}

TEST(PositionSizerTest, NeutralOrInvalidPriceSizesToZero) {
    PositionSizer sizer{common::RiskConfig()};

    EXPECT_EQ(sizer.calculate(Direction::NEUTRAL, 100.0, 95.0, 110.0, 0.9).shares, 0);
    EXPECT_EQ(sizer.calculate(Direction::BULLISH, 0.0, 0.0, 0.0, 0.9).shares, 0);
    EXPECT_EQ(sizer.calculate(Direction::BULLISH, -5.0, -6.0, 1.0, 0.9).shares, 0);
}
