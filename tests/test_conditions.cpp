#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "strategy/conditions.hpp"

using core::StrategyKind;
using namespace strategy;

namespace {

// Minden scalping feltételt teljesítő pillanatkép, 100-as áron.
ind::IndicatorSnapshot passing_scalping_snapshot(){
    ind::IndicatorSnapshot s;
    s.price = 100.0;
    s.rsi = 30.0;
    s.ema.ema8 = 101.0;
    s.ema.ema21 = 100.5;
    s.bollinger = {105.0, 110.0, 100.0};
    s.macd = {0.5, 0.4, 0.1};
    s.volume = 20.0;
    s.avg_volume = 10.0;
    s.cvd = -50.0;
    s.cvd_slope = 3.0;
    return s;
}

StrategyConfig all_optional_off(){
    StrategyConfig c;
    c.use_ma5 = c.use_ma8 = c.use_ma13 = c.use_ma20 = c.use_ma21 = c.use_ma34 = c.use_ma50 = false;
    c.macd_line_above_signal = false;
    c.use_bollinger_lower = c.use_bollinger_middle = c.use_bollinger_upper = false;
    c.cvd_slope_positive = false;
    return c;
}

} // namespace

TEST(Conditions, FixedOrderAndNames) {
    const auto ev = evaluate(StrategyKind::Scalping, passing_scalping_snapshot(), 100.0,
                             default_config(StrategyKind::Scalping));
    ASSERT_EQ(ev.conditions.size(), 6u);
    const std::vector<std::string> names{"rsi", "movingAverages", "bollingerBands", "macd", "volume", "cvd"};
    for (size_t i = 0; i < names.size(); ++i) EXPECT_EQ(ev.conditions.items[i].first, names[i]);
}

TEST(Conditions, ScalpingAllGreen) {
    const auto ev = evaluate(StrategyKind::Scalping, passing_scalping_snapshot(), 100.0,
                             default_config(StrategyKind::Scalping));
    EXPECT_TRUE(ev.all_met);
    EXPECT_EQ(ev.side, core::Side::Long);
    EXPECT_DOUBLE_EQ(ev.entry_price, 100.0);
    EXPECT_DOUBLE_EQ(ev.take_profit, 100.5);
    EXPECT_DOUBLE_EQ(ev.stop_loss, 99.75);
}

TEST(Conditions, DisabledOptionalsReduceToRsiAndVolume) {
    const auto cfg = all_optional_off();
    ind::IndicatorSnapshot s;   // üres: EMA, BB, MACD, CVD mind 0
    s.rsi = 20.0;
    s.volume = 16.0;
    s.avg_volume = 10.0;

    for (auto k : core::kAllStrategies) {
        auto ev = evaluate(k, s, 100.0, cfg);
        EXPECT_TRUE(ev.all_met) << core::to_string(k);

        auto high_rsi = s; high_rsi.rsi = 41.0;
        EXPECT_FALSE(evaluate(k, high_rsi, 100.0, cfg).all_met);

        auto low_vol = s; low_vol.volume = 15.0;   // 15 nem nagyobb, mint 10*1.5
        EXPECT_FALSE(evaluate(k, low_vol, 100.0, cfg).all_met);
    }
}

TEST(Conditions, RsiBoundsInclusive) {
    auto cfg = all_optional_off();
    cfg.rsi_min = 30.0; cfg.rsi_max = 40.0;
    ind::IndicatorSnapshot s;
    s.volume = 1.0;
    for (double r : {30.0, 35.0, 40.0}) {
        s.rsi = r;
        EXPECT_EQ(evaluate(StrategyKind::Intraday, s, 1.0, cfg).conditions.get(cond::kRsi), true) << r;
    }
    s.rsi = 40.01;
    EXPECT_EQ(evaluate(StrategyKind::Intraday, s, 1.0, cfg).conditions.get(cond::kRsi), false);
}

TEST(Conditions, VolumeIsStrictlyGreater) {
    auto cfg = all_optional_off();
    cfg.volume_multiplier = 2.0;
    ind::IndicatorSnapshot s;
    s.rsi = 10.0;
    s.avg_volume = 5.0;
    s.volume = 10.0;
    EXPECT_EQ(evaluate(StrategyKind::Pump, s, 1.0, cfg).conditions.get(cond::kVolume), false);
    s.volume = 10.5;
    EXPECT_EQ(evaluate(StrategyKind::Pump, s, 1.0, cfg).conditions.get(cond::kVolume), true);
}

TEST(Conditions, MovingAverageRulePerStrategy) {
    ind::IndicatorSnapshot s;
    s.ema.ema8 = 10.0;  s.ema.ema21 = 9.0;
    s.ema.ema20 = 10.0; s.ema.ema34 = 9.0;
    s.ema.ema5 = 10.0;  s.ema.ema13 = 9.0;

    EXPECT_TRUE(moving_average_condition(StrategyKind::Scalping, s, 5.0, default_config(StrategyKind::Scalping)));

    // intraday: az ár is az EMA34 fölött kell legyen
    const auto intraday = default_config(StrategyKind::Intraday);
    EXPECT_TRUE(moving_average_condition(StrategyKind::Intraday, s, 9.5, intraday));
    EXPECT_FALSE(moving_average_condition(StrategyKind::Intraday, s, 8.5, intraday));

    // pump: ár > EMA5 és EMA5 > EMA13
    const auto pump = default_config(StrategyKind::Pump);
    EXPECT_TRUE(moving_average_condition(StrategyKind::Pump, s, 10.5, pump));
    EXPECT_FALSE(moving_average_condition(StrategyKind::Pump, s, 9.5, pump));

    s.ema.ema8 = 8.0;
    EXPECT_FALSE(moving_average_condition(StrategyKind::Scalping, s, 5.0, default_config(StrategyKind::Scalping)));
}

TEST(Conditions, MovingAverageNeedsBothFlags) {
    ind::IndicatorSnapshot s;
    s.ema.ema8 = 1.0; s.ema.ema21 = 2.0;
    auto cfg = default_config(StrategyKind::Scalping);
    EXPECT_FALSE(moving_average_condition(StrategyKind::Scalping, s, 1.0, cfg));
    cfg.use_ma21 = false;
    EXPECT_TRUE(moving_average_condition(StrategyKind::Scalping, s, 1.0, cfg));
    // más stratégia kapcsolói nem számítanak
    cfg.use_ma21 = true; cfg.use_ma8 = false; cfg.use_ma5 = true; cfg.use_ma13 = true;
    EXPECT_TRUE(moving_average_condition(StrategyKind::Scalping, s, 1.0, cfg));
}

TEST(Conditions, BollingerToggles) {
    ind::IndicatorSnapshot s;
    s.bollinger = {100.0, 110.0, 90.0};

    auto cfg = all_optional_off();
    cfg.bollinger_multiplier = 1.0;
    cfg.use_bollinger_lower = true;
    EXPECT_EQ(evaluate(StrategyKind::Scalping, s, 90.0, cfg).conditions.get(cond::kBollinger), true);
    EXPECT_EQ(evaluate(StrategyKind::Scalping, s, 91.0, cfg).conditions.get(cond::kBollinger), false);

    cfg.use_bollinger_lower = false;
    cfg.use_bollinger_middle = true;
    EXPECT_EQ(evaluate(StrategyKind::Pump, s, 100.0, cfg).conditions.get(cond::kBollinger), true);
    EXPECT_EQ(evaluate(StrategyKind::Pump, s, 99.0, cfg).conditions.get(cond::kBollinger), false);

    cfg.use_bollinger_upper = true;
    EXPECT_EQ(evaluate(StrategyKind::Pump, s, 105.0, cfg).conditions.get(cond::kBollinger), false);
    EXPECT_EQ(evaluate(StrategyKind::Pump, s, 111.0, cfg).conditions.get(cond::kBollinger), true);
}

TEST(Conditions, MacdLineAboveZeroOnlyWithSignalCheck) {
    ind::IndicatorSnapshot s;
    s.macd = {-0.5, -1.0, 0.5};
    auto cfg = all_optional_off();
    cfg.macd_line_above_signal = true;
    EXPECT_EQ(evaluate(StrategyKind::Intraday, s, 1.0, cfg).conditions.get(cond::kMacd), true);

    cfg.macd_line_above_zero = true;
    EXPECT_EQ(evaluate(StrategyKind::Intraday, s, 1.0, cfg).conditions.get(cond::kMacd), false);

    // a nulla feletti feltétel önmagában nem kapcsol be semmit
    cfg.macd_line_above_signal = false;
    EXPECT_EQ(evaluate(StrategyKind::Intraday, s, 1.0, cfg).conditions.get(cond::kMacd), true);
}

TEST(Conditions, CvdSlopeAndLevel) {
    ind::IndicatorSnapshot s;
    s.cvd = -10.0;
    s.cvd_slope = 2.0;
    auto cfg = all_optional_off();
    cfg.cvd_slope_positive = true;
    EXPECT_EQ(evaluate(StrategyKind::Scalping, s, 1.0, cfg).conditions.get(cond::kCvd), true);

    cfg.cvd_above_zero = true;
    EXPECT_EQ(evaluate(StrategyKind::Scalping, s, 1.0, cfg).conditions.get(cond::kCvd), false);
    s.cvd = 10.0;
    EXPECT_EQ(evaluate(StrategyKind::Scalping, s, 1.0, cfg).conditions.get(cond::kCvd), true);

    s.cvd_slope = 0.0;
    EXPECT_EQ(evaluate(StrategyKind::Scalping, s, 1.0, cfg).conditions.get(cond::kCvd), false);
}

TEST(Conditions, TakeProfitStopLossFromPercent) {
    auto cfg = default_config(StrategyKind::Pump);
    const auto ev = evaluate(StrategyKind::Pump, ind::IndicatorSnapshot{}, 200.0, cfg);
    EXPECT_FALSE(ev.all_met);
    EXPECT_EQ(ev.side, core::Side::Wait);
    EXPECT_DOUBLE_EQ(ev.take_profit, 206.0);
    EXPECT_DOUBLE_EQ(ev.stop_loss, 198.0);
}

TEST(Conditions, DescribeFailuresListsOnlyFailed) {
    auto s = passing_scalping_snapshot();
    const auto cfg = default_config(StrategyKind::Scalping);
    auto ev = evaluate(StrategyKind::Scalping, s, 100.0, cfg);
    EXPECT_TRUE(describe_failures(ev, s, 100.0, cfg).empty());

    s.rsi = 55.0;
    s.volume = 12.0;
    ev = evaluate(StrategyKind::Scalping, s, 100.0, cfg);
    const auto why = describe_failures(ev, s, 100.0, cfg);
    ASSERT_EQ(why.size(), 2u);
    EXPECT_EQ(why[0], "RSI: 55.00 (need 0-40)");
    EXPECT_EQ(why[1], "Volume: 12.00 vs Avg*1.5=15.00");
}

TEST(ConditionVector, SetOverwritesInPlace) {
    ConditionVector v;
    v.set("a", true);
    v.set("b", false);
    v.set("a", false);
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v.items[0].first, "a");
    EXPECT_EQ(v.get("a"), false);
    EXPECT_FALSE(v.get("missing").has_value());
    EXPECT_FALSE(v.all());
    v.set("a", true); v.set("b", true);
    EXPECT_TRUE(v.all());
}
