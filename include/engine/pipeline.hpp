#pragma once
#include <atomic>
#include <cstdint>
#include <vector>
#include "core/types.hpp"
#include "data/indicator_history.hpp"
#include "engine/symbol_registry.hpp"
#include "indicators/snapshot.hpp"
#include "sink/signal_sink.hpp"
#include "strategy/conditions.hpp"
#include "strategy/config_provider.hpp"
#include "strategy/signal.hpp"

namespace engine {

struct PipelineConfig {
    std::size_t cvd_slope_lookback{5};
    std::size_t cvd_trend_lookback{10};
    std::vector<core::StrategyKind> strategies{core::StrategyKind::Scalping,
                                               core::StrategyKind::Intraday,
                                               core::StrategyKind::Pump};
    bool log_proximity{true};
};

struct TickResult {
    bool accepted{false};
    ind::IndicatorSnapshot snapshot;
    std::vector<strategy::Evaluation> evaluations;
    std::vector<strategy::Signal> signals;
};

// tick -> indikátorok + CVD -> snapshot -> stratégiánkénti kiértékelés -> él detektor -> sink.
// Egy szimbólum tickjei szigorúan sorban futnak (a szimbólum zárja alatt), különböző
// szimbólumok párhuzamosan is hívhatják.
class Pipeline {
public:
    Pipeline(SymbolRegistry& registry, strategy::IConfigProvider& config, sink::ISignalSink& sink,
             data::IndicatorHistory* history = nullptr, PipelineConfig cfg = {});

    TickResult on_tick(const core::Tick& tick);

    std::uint64_t ticks_processed() const { return ticks_.load(); }
    std::uint64_t ticks_rejected() const { return rejected_.load(); }
    std::uint64_t signals_emitted() const { return signals_.load(); }
    const PipelineConfig& config() const { return cfg_; }

private:
    SymbolRegistry& registry_;
    strategy::IConfigProvider& config_;
    sink::ISignalSink& sink_;
    data::IndicatorHistory* history_;
    PipelineConfig cfg_;

    std::atomic<std::uint64_t> ticks_{0};
    std::atomic<std::uint64_t> rejected_{0};
    std::atomic<std::uint64_t> signals_{0};
};

} // namespace engine
