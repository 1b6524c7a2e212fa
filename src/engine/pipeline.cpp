#include "engine/pipeline.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "indicators/engine.hpp"

namespace engine {

namespace {
std::string upper_kind(core::StrategyKind k){
    std::string s = core::to_string(k);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    return s;
}

bool valid_tick(const core::Tick& t){
    return !t.symbol.empty() && std::isfinite(t.price) && std::isfinite(t.volume) &&
           t.price > 0.0 && t.volume >= 0.0;
}
}

Pipeline::Pipeline(SymbolRegistry& registry, strategy::IConfigProvider& config, sink::ISignalSink& sink,
                   data::IndicatorHistory* history, PipelineConfig cfg)
    : registry_(registry), config_(config), sink_(sink), history_(history), cfg_(std::move(cfg)) {}

TickResult Pipeline::on_tick(const core::Tick& tick){
    TickResult res;
    if (!valid_tick(tick)) {
        spdlog::warn("rejected tick for '{}': price={} volume={}", tick.symbol, tick.price, tick.volume);
        ++rejected_;
        return res;
    }

    // a beállítások a szimbólum állapotának módosítása előtt: ha itt hiba van, a tick el sem kezdődött
    std::vector<strategy::StrategyConfig> configs;
    configs.reserve(cfg_.strategies.size());
    for (auto kind : cfg_.strategies) configs.push_back(config_.get_conditions(tick.symbol, kind));

    auto& st = registry_.get_or_create(tick.symbol);
    {
        std::lock_guard<std::mutex> lk(st.mtx);
        ++st.ticks;

        st.history.push(tick.price, tick.volume);
        const auto& prices  = st.history.prices();
        const auto& volumes = st.history.volumes();

        res.snapshot = ind::compute_indicators(prices, volumes, tick.price);
        res.snapshot.cvd       = st.cvd.update(prices, volumes);
        res.snapshot.cvd_slope = st.cvd.slope(cfg_.cvd_slope_lookback);
        res.snapshot.cvd_trend = st.cvd.trend(cfg_.cvd_trend_lookback);

        for (std::size_t n = 0; n < cfg_.strategies.size(); ++n) {
            const auto kind = cfg_.strategies[n];
            const auto& cfg = configs[n];

            // saját CVD lookback esetén a meredekség a stratégia ablakán számolódik
            ind::IndicatorSnapshot snap = res.snapshot;
            const auto lookback = static_cast<std::size_t>(std::max(0, cfg.cvd_lookback_candles));
            if (lookback != cfg_.cvd_slope_lookback) snap.cvd_slope = st.cvd.slope(lookback);

            auto ev = strategy::evaluate(kind, snap, tick.price, cfg);

            if (cfg_.log_proximity && spdlog::should_log(spdlog::level::debug)) {
                if (ev.all_met) {
                    spdlog::debug("{} {} all conditions met", tick.symbol, core::to_string(kind));
                } else {
                    const auto why = strategy::describe_failures(ev, snap, tick.price, cfg);
                    spdlog::debug("{} {} conditions not met: {}", tick.symbol, core::to_string(kind),
                                  fmt::format("{}", fmt::join(why, ", ")));
                }
            }

            if (st.edge(kind).update(ev.all_met)) {
                spdlog::info("{}: All green - Symbol: {}", upper_kind(kind), tick.symbol);
                res.signals.push_back(strategy::make_signal(tick.symbol, tick.timestamp_ms, ev, snap));
            }
            res.evaluations.push_back(std::move(ev));
        }

        if (history_) history_->add_snapshot(tick.symbol, tick.timestamp_ms, res.snapshot);
    }

    for (const auto& s : res.signals) {
        sink_.publish(s);
        ++signals_;
    }
    ++ticks_;
    res.accepted = true;
    return res;
}

} // namespace engine
