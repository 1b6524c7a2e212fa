#include <gtest/gtest.h>
#include <cmath>
#include <deque>
#include <limits>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "engine/pipeline.hpp"
#include "strategy/config_store.hpp"

using core::StrategyKind;
using core::Tick;

namespace {

// Minden szimbólumra ugyanazt a beállítást adja.
class FixedConfig final : public strategy::IConfigProvider {
public:
    explicit FixedConfig(strategy::StrategyConfig c) : cfg_(c) {}
    strategy::StrategyConfig get_conditions(const std::string&, StrategyKind) override { return cfg_; }
private:
    strategy::StrategyConfig cfg_;
};

class CollectingSink final : public sink::ISignalSink {
public:
    void publish(const strategy::Signal& s) override {
        std::lock_guard<std::mutex> lk(mtx);
        signals.push_back(s);
    }
    std::size_t count() {
        std::lock_guard<std::mutex> lk(mtx);
        return signals.size();
    }
    std::mutex mtx;
    std::vector<strategy::Signal> signals;
};

// Kapcsolható hibával dobó beállítás forrás.
class FailingConfig final : public strategy::IConfigProvider {
public:
    explicit FailingConfig(strategy::StrategyConfig c) : cfg_(c) {}
    strategy::StrategyConfig get_conditions(const std::string&, StrategyKind) override {
        if (fail) throw std::runtime_error("config backend unavailable");
        return cfg_;
    }
    bool fail{false};
private:
    strategy::StrategyConfig cfg_;
};

// Csak az RSI (0-100) és a volumen > 0 számít: a jel a volumentől függ.
strategy::StrategyConfig volume_only_config(){
    strategy::StrategyConfig c;
    c.volume_multiplier = 0.0;
    c.rsi_min = 0.0; c.rsi_max = 100.0;
    c.use_ma8 = c.use_ma21 = false;
    c.macd_line_above_signal = false;
    c.use_bollinger_lower = false;
    c.cvd_slope_positive = false;
    return c;
}

engine::PipelineConfig scalping_only(){
    engine::PipelineConfig pc;
    pc.strategies = {StrategyKind::Scalping};
    pc.log_proximity = false;
    return pc;
}

} // namespace

TEST(Pipeline, RejectsInvalidTicks) {
    engine::SymbolRegistry reg;
    FixedConfig cfg(volume_only_config());
    CollectingSink out;
    engine::Pipeline p(reg, cfg, out);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    for (const Tick& t : {Tick{"", 1, 100.0, 1.0}, Tick{"BTCUSDT", 1, 0.0, 1.0},
                          Tick{"BTCUSDT", 1, -3.0, 1.0}, Tick{"BTCUSDT", 1, nan, 1.0},
                          Tick{"BTCUSDT", 1, 100.0, -1.0}, Tick{"BTCUSDT", 1, 100.0, inf}}) {
        EXPECT_FALSE(p.on_tick(t).accepted);
    }
    EXPECT_EQ(p.ticks_rejected(), 6u);
    EXPECT_EQ(p.ticks_processed(), 0u);
    EXPECT_EQ(reg.size(), 0u);
}

TEST(Pipeline, CvdAlignmentThroughTicks) {
    engine::SymbolRegistry reg;
    FixedConfig cfg(volume_only_config());
    CollectingSink out;
    engine::Pipeline p(reg, cfg, out, nullptr, scalping_only());

    const std::vector<double> prices{10, 10, 12, 11, 13};
    engine::TickResult last;
    for (size_t i = 0; i < prices.size(); ++i)
        last = p.on_tick({"BTCUSDT", static_cast<std::int64_t>(i) * 1000, prices[i], 100.0});

    auto* st = reg.find("BTCUSDT");
    ASSERT_NE(st, nullptr);
    EXPECT_EQ(st->cvd.values(), (std::deque<double>{0, 100, 0, 100}));
    EXPECT_DOUBLE_EQ(last.snapshot.cvd, 100.0);
    EXPECT_EQ(st->ticks, 5u);
}

TEST(Pipeline, SignalsOnlyOnRisingEdge) {
    engine::SymbolRegistry reg;
    FixedConfig cfg(volume_only_config());
    CollectingSink out;
    engine::Pipeline p(reg, cfg, out, nullptr, scalping_only());

    const std::vector<double> volumes{0, 5, 5, 5, 0, 5};
    std::vector<size_t> fired;
    for (size_t i = 0; i < volumes.size(); ++i) {
        auto r = p.on_tick({"ETHUSDT", 1000 + static_cast<std::int64_t>(i), 100.0, volumes[i]});
        ASSERT_TRUE(r.accepted);
        ASSERT_EQ(r.evaluations.size(), 1u);
        if (!r.signals.empty()) fired.push_back(i);
    }
    EXPECT_EQ(fired, (std::vector<size_t>{1, 5}));
    ASSERT_EQ(out.signals.size(), 2u);
    EXPECT_EQ(p.signals_emitted(), 2u);

    const auto& s = out.signals[0];
    EXPECT_EQ(s.id, "ETHUSDT-scalping-1001");
    EXPECT_EQ(s.side, core::Side::Long);
    EXPECT_DOUBLE_EQ(s.entry_price, 100.0);
    EXPECT_DOUBLE_EQ(s.take_profit, 100.5);
    EXPECT_EQ(s.conditions.size(), 6u);
    EXPECT_TRUE(s.conditions.all());
}

TEST(Pipeline, StrategiesHaveIndependentEdges) {
    engine::SymbolRegistry reg;
    FixedConfig cfg(volume_only_config());
    CollectingSink out;
    engine::PipelineConfig pc;
    pc.log_proximity = false;
    engine::Pipeline p(reg, cfg, out, nullptr, pc);

    p.on_tick({"BTCUSDT", 1, 100.0, 0.0});
    auto r = p.on_tick({"BTCUSDT", 2, 100.0, 5.0});
    ASSERT_EQ(r.signals.size(), 3u);
    EXPECT_EQ(r.signals[0].kind, StrategyKind::Scalping);
    EXPECT_EQ(r.signals[1].kind, StrategyKind::Intraday);
    EXPECT_EQ(r.signals[2].kind, StrategyKind::Pump);
    EXPECT_TRUE(p.on_tick({"BTCUSDT", 3, 100.0, 5.0}).signals.empty());
}

TEST(Pipeline, SymbolsAreIndependent) {
    engine::SymbolRegistry reg;
    FixedConfig cfg(volume_only_config());
    CollectingSink out;
    engine::Pipeline p(reg, cfg, out, nullptr, scalping_only());

    p.on_tick({"AAA", 1, 10.0, 0.0});
    p.on_tick({"BBB", 1, 10.0, 0.0});
    EXPECT_EQ(p.on_tick({"AAA", 2, 11.0, 5.0}).signals.size(), 1u);
    // BBB még nem adott jelet, az AAA állapota nem számít
    EXPECT_EQ(p.on_tick({"BBB", 2, 9.0, 5.0}).signals.size(), 1u);

    EXPECT_EQ(reg.find("AAA")->cvd.last(), 5.0);
    EXPECT_EQ(reg.find("BBB")->cvd.last(), -5.0);
    EXPECT_EQ(reg.size(), 2u);
}

TEST(Pipeline, HistoryCapacityBoundsSeries) {
    engine::SymbolRegistry reg(20, 10);
    FixedConfig cfg(volume_only_config());
    CollectingSink out;
    engine::Pipeline p(reg, cfg, out, nullptr, scalping_only());
    for (int i = 0; i < 50; ++i) p.on_tick({"XRPUSDT", i, 1.0 + i * 0.01, 1.0});
    auto* st = reg.find("XRPUSDT");
    ASSERT_NE(st, nullptr);
    EXPECT_EQ(st->history.size(), 20u);
    EXPECT_EQ(st->cvd.size(), 10u);
    EXPECT_DOUBLE_EQ(st->cvd.last(), 49.0);
}

TEST(Pipeline, ConcurrentSymbolsMatchSequentialRun) {
    const std::vector<std::string> symbols{"S0", "S1", "S2", "S3"};
    auto feed = [](engine::Pipeline& p, const std::string& sym, int salt){
        for (int i = 0; i < 300; ++i) {
            const double price = 100.0 + ((i * 7 + salt) % 11) - 5;
            const double vol = ((i + salt) % 4 == 0) ? 0.0 : 1.0 + (i % 3);
            p.on_tick({sym, i, price, vol});
        }
    };

    engine::SymbolRegistry seq_reg;
    FixedConfig seq_cfg(volume_only_config());
    CollectingSink seq_out;
    engine::Pipeline seq(seq_reg, seq_cfg, seq_out, nullptr, scalping_only());
    for (size_t k = 0; k < symbols.size(); ++k) feed(seq, symbols[k], static_cast<int>(k));

    engine::SymbolRegistry par_reg;
    FixedConfig par_cfg(volume_only_config());
    CollectingSink par_out;
    engine::Pipeline par(par_reg, par_cfg, par_out, nullptr, scalping_only());
    std::vector<std::thread> workers;
    for (size_t k = 0; k < symbols.size(); ++k)
        workers.emplace_back([&, k]{ feed(par, symbols[k], static_cast<int>(k)); });
    for (auto& w : workers) w.join();

    EXPECT_EQ(par.ticks_processed(), seq.ticks_processed());
    EXPECT_EQ(par_out.count(), seq_out.count());
    for (const auto& sym : symbols) {
        EXPECT_EQ(par_reg.find(sym)->cvd.values(), seq_reg.find(sym)->cvd.values()) << sym;
    }

    std::map<std::string, int> seq_per, par_per;
    for (const auto& s : seq_out.signals) ++seq_per[s.symbol];
    for (const auto& s : par_out.signals) ++par_per[s.symbol];
    EXPECT_EQ(par_per, seq_per);
}

TEST(Pipeline, RecordsIndicatorHistory) {
    engine::SymbolRegistry reg;
    FixedConfig cfg(volume_only_config());
    CollectingSink out;
    data::IndicatorHistory hist(std::chrono::seconds(60));
    engine::Pipeline p(reg, cfg, out, &hist, scalping_only());

    for (int i = 0; i < 5; ++i) p.on_tick({"BTCUSDT", 1'000'000 + i * 1000, 100.0 + i, 1.0});
    EXPECT_EQ(hist.size("BTCUSDT"), 5u);
    auto last = hist.latest("BTCUSDT");
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->timestamp_ms, 1'004'000);
    EXPECT_DOUBLE_EQ(last->values.price, 104.0);
}

TEST(Pipeline, UsesConfigStoreUpdates) {
    engine::SymbolRegistry reg;
    strategy::ConfigStore store;
    store.set_conditions("BTCUSDT", StrategyKind::Scalping, volume_only_config());
    CollectingSink out;
    engine::Pipeline p(reg, store, out, nullptr, scalping_only());

    p.on_tick({"BTCUSDT", 1, 100.0, 0.0});
    EXPECT_EQ(p.on_tick({"BTCUSDT", 2, 100.0, 5.0}).signals.size(), 1u);
    p.on_tick({"BTCUSDT", 3, 100.0, 0.0});

    // 10-es szorzóval az 5-ös volumen már nem elég
    ASSERT_TRUE(store.update_conditions("BTCUSDT", StrategyKind::Scalping,
                                        nlohmann::json{{"volumeMultiplier", 10.0}}));
    EXPECT_TRUE(p.on_tick({"BTCUSDT", 4, 100.0, 5.0}).signals.empty());
}

TEST(Pipeline, StrategyCvdLookbackOverridesSlopeWindow) {
    engine::SymbolRegistry reg;
    auto c = volume_only_config();
    c.cvd_slope_positive = true;
    c.cvd_lookback_candles = 2;
    FixedConfig cfg(c);
    CollectingSink out;
    engine::Pipeline p(reg, cfg, out, nullptr, scalping_only());

    // CVD: [0, 1, 2]: 5-ös ablakhoz kevés, 2-eshez elég
    p.on_tick({"BTCUSDT", 1, 10.0, 1.0});
    p.on_tick({"BTCUSDT", 2, 10.0, 1.0});
    p.on_tick({"BTCUSDT", 3, 11.0, 1.0});
    auto r = p.on_tick({"BTCUSDT", 4, 12.0, 1.0});
    EXPECT_DOUBLE_EQ(r.snapshot.cvd_slope, 0.0);
    ASSERT_EQ(r.signals.size(), 1u);
    EXPECT_DOUBLE_EQ(r.signals[0].indicators.cvd_slope, 1.0);
}

TEST(Pipeline, ConfigFailureLeavesSymbolStateUntouched) {
    engine::SymbolRegistry reg;
    FailingConfig cfg(volume_only_config());
    CollectingSink out;
    engine::Pipeline p(reg, cfg, out, nullptr, scalping_only());

    p.on_tick({"BTCUSDT", 1, 10.0, 1.0});
    p.on_tick({"BTCUSDT", 2, 11.0, 1.0});
    auto* st = reg.find("BTCUSDT");
    ASSERT_NE(st, nullptr);

    cfg.fail = true;
    EXPECT_THROW(p.on_tick({"BTCUSDT", 3, 12.0, 1.0}), std::runtime_error);
    EXPECT_THROW(p.on_tick({"ETHUSDT", 3, 12.0, 1.0}), std::runtime_error);
    EXPECT_EQ(st->history.size(), 2u);
    EXPECT_EQ(st->cvd.size(), 1u);
    EXPECT_EQ(st->ticks, 2u);
    EXPECT_EQ(p.ticks_processed(), 2u);
    EXPECT_EQ(reg.find("ETHUSDT"), nullptr);

    // a következő tick ott folytatja, ahol az utolsó teljes tick hagyta
    cfg.fail = false;
    p.on_tick({"BTCUSDT", 4, 12.0, 1.0});
    EXPECT_EQ(st->history.size(), 3u);
    EXPECT_EQ(st->cvd.values(), (std::deque<double>{1.0, 2.0}));
}

TEST(Pipeline, NonUtf8SymbolWithAutosavedConfigStore) {
    const auto path = (std::filesystem::temp_directory_path() / "edgescan_test_pipeline_autosave.json").string();
    std::filesystem::remove(path);
    engine::SymbolRegistry reg;
    strategy::ConfigStore store(path);
    CollectingSink out;
    engine::Pipeline p(reg, store, out, nullptr, scalping_only());

    const std::string sym = "BAD\xff";
    for (int i = 0; i < 3; ++i) {
        engine::TickResult r;
        ASSERT_NO_THROW(r = p.on_tick({sym, i, 10.0 + i, 1.0}));
        EXPECT_TRUE(r.accepted);
    }
    auto* st = reg.find(sym);
    ASSERT_NE(st, nullptr);
    EXPECT_EQ(st->ticks, 3u);
    EXPECT_EQ(st->history.size(), 3u);
    EXPECT_EQ(st->cvd.size(), 2u);
    EXPECT_EQ(p.ticks_processed(), 3u);
    std::filesystem::remove(path);
}
