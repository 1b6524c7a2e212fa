#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <memory>

#include <spdlog/spdlog.h>

#include "core/types.hpp"
#include "core/settings.hpp"
#include "data/tick_csv.hpp"
#include "data/indicator_history.hpp"
#include "engine/pipeline.hpp"
#include "engine/symbol_registry.hpp"
#include "sink/file_sinks.hpp"
#include "sink/signal_sink.hpp"
#include "strategy/config_store.hpp"

static void usage(){
    std::cout << "Usage: edgescan_replay <ticks.csv> [--settings f.json] [--conditions f.json]\n"
                 "                       [--signals out.jsonl] [--csv out.csv] [--log-level lvl]\n"
                 "  ticks.csv: symbol,timestamp_ms,price,volume (first row is a header)\n";
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }

    std::string ticks_path = argv[1];
    std::string settings_path, conditions_path, signals_path, csv_path, log_level;
    for (int i = 2; i < argc; ++i) {
        const std::string a = argv[i];
        auto next = [&]() -> std::string { return (i + 1 < argc) ? argv[++i] : std::string{}; };
        if      (a == "--settings")   settings_path = next();
        else if (a == "--conditions") conditions_path = next();
        else if (a == "--signals")    signals_path = next();
        else if (a == "--csv")        csv_path = next();
        else if (a == "--log-level")  log_level = next();
        else { std::cerr << "unknown option " << a << "\n"; usage(); return 1; }
    }

    core::Settings settings;
    if (!settings_path.empty() && !core::load_settings(settings_path, settings)) return 2;
    if (!conditions_path.empty()) settings.conditions_path = conditions_path;
    if (!signals_path.empty())    settings.signals_jsonl_path = signals_path;
    if (!csv_path.empty())        settings.signals_csv_path = csv_path;
    if (!log_level.empty())       settings.log_level = log_level;
    spdlog::set_level(spdlog::level::from_str(settings.log_level));

    std::vector<core::Tick> ticks;
    if (!data::load_ticks_csv(ticks_path, ticks)) {
        std::cerr << "Failed to load ticks: " << ticks_path << "\n";
        return 2;
    }

    strategy::ConfigStore conditions;
    if (!settings.conditions_path.empty() && !conditions.load_file(settings.conditions_path))
        spdlog::info("replaying with default strategy conditions");

    // sinkek
    sink::FanoutSignalSink sinks;
    sinks.add(std::make_unique<sink::LogSignalSink>());
    if (!settings.signals_jsonl_path.empty())
        sinks.add(std::make_unique<sink::JsonlSignalSink>(settings.signals_jsonl_path));
    if (!settings.signals_csv_path.empty())
        sinks.add(std::make_unique<sink::CsvSignalSink>(settings.signals_csv_path));

    std::map<std::string, int> per_strategy;
    sinks.add(std::make_unique<sink::CallbackSignalSink>([&](const strategy::Signal& s){
        ++per_strategy[core::to_string(s.kind)];
    }));

    engine::SymbolRegistry registry(settings.history_length, settings.cvd_max_length);
    data::IndicatorHistory history(std::chrono::seconds(settings.history_horizon_seconds));

    engine::PipelineConfig pcfg;
    pcfg.cvd_slope_lookback = settings.cvd_slope_lookback;
    pcfg.cvd_trend_lookback = settings.cvd_trend_lookback;
    engine::Pipeline pipeline(registry, conditions, sinks, &history, pcfg);

    for (const auto& t : ticks) pipeline.on_tick(t);

    std::cout << "Ticks: " << pipeline.ticks_processed()
              << " | Rejected: " << pipeline.ticks_rejected()
              << " | Symbols: " << registry.size()
              << " | Signals: " << pipeline.signals_emitted() << "\n";
    for (auto k : core::kAllStrategies)
        std::cout << "  " << core::to_string(k) << ": " << per_strategy[core::to_string(k)] << "\n";

    for (const auto& sym : registry.symbols()) {
        const auto last = history.latest(sym);
        if (!last) continue;
        const auto tr = history.trend(sym, ind::IndicatorField::Price, 30.0, last->timestamp_ms);
        std::cout << "  " << sym << " price " << last->values.price
                  << " | RSI " << last->values.rsi
                  << " | CVD " << last->values.cvd << " (" << core::to_string(last->values.cvd_trend) << ")"
                  << " | 30s trend " << data::to_string(tr.trend) << " " << tr.change_percent << "%\n";
    }
    return 0;
}
