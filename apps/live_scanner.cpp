#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <ixwebsocket/IXNetSystem.h>
#include <spdlog/spdlog.h>

#include "core/settings.hpp"
#include "data/binance_stream.hpp"
#include "data/indicator_history.hpp"
#include "engine/pipeline.hpp"
#include "engine/symbol_registry.hpp"
#include "sink/file_sinks.hpp"
#include "sink/signal_sink.hpp"
#include "strategy/config_store.hpp"

namespace {
std::atomic<bool> g_stop{false};
void on_signal(int) { g_stop.store(true); }
}

int main(int argc, char** argv) {
    core::Settings settings;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--settings" && i + 1 < argc) {
            if (!core::load_settings(argv[++i], settings)) return 2;
        } else {
            std::cout << "Usage: edgescan_live [--settings f.json]\n";
            return 1;
        }
    }
    spdlog::set_level(spdlog::level::from_str(settings.log_level));

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    ix::initNetSystem();

    // feltételek: betöltés, majd minden módosítás visszaírva ugyanoda
    strategy::ConfigStore conditions(settings.conditions_path);
    if (!settings.conditions_path.empty() && !conditions.load_file(settings.conditions_path))
        spdlog::info("starting with default strategy conditions");

    sink::FanoutSignalSink sinks;
    sinks.add(std::make_unique<sink::LogSignalSink>());
    if (!settings.signals_jsonl_path.empty())
        sinks.add(std::make_unique<sink::JsonlSignalSink>(settings.signals_jsonl_path));
    if (!settings.signals_csv_path.empty())
        sinks.add(std::make_unique<sink::CsvSignalSink>(settings.signals_csv_path));

    engine::SymbolRegistry registry(settings.history_length, settings.cvd_max_length);
    data::IndicatorHistory history(std::chrono::seconds(settings.history_horizon_seconds));
    history.start_cleanup(std::chrono::milliseconds(settings.history_cleanup_ms));

    engine::PipelineConfig pcfg;
    pcfg.cvd_slope_lookback = settings.cvd_slope_lookback;
    pcfg.cvd_trend_lookback = settings.cvd_trend_lookback;
    engine::Pipeline pipeline(registry, conditions, sinks, &history, pcfg);

    data::StreamConfig scfg;
    scfg.symbols = settings.symbols;
    scfg.base_url = settings.stream_url;
    scfg.channel = settings.stream_channel;
    scfg.max_reconnect_attempts = settings.max_reconnect_attempts;
    scfg.gap_warn = std::chrono::seconds(settings.gap_warn_seconds);

    data::BinanceTickStream stream(scfg);
    stream.set_on_tick([&](const core::Tick& t){
        try {
            pipeline.on_tick(t);
        } catch (const std::exception& e) {
            spdlog::error("tick for {} failed: {}", t.symbol, e.what());
        }
    });
    if (!stream.start()) return 3;
    spdlog::info("edgescan live: {} symbols", settings.symbols.size());

    auto last_report = std::chrono::steady_clock::now();
    while (!g_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        const auto now = std::chrono::steady_clock::now();
        if (now - last_report < std::chrono::seconds(60)) continue;
        last_report = now;
        for (const auto& sym : registry.symbols()) {
            const auto st = history.stats(sym, ind::IndicatorField::Price, 60.0);
            spdlog::info("{} 60s price min {:.6f} max {:.6f} avg {:.6f} vol {:.6f} | delay {} ms",
                         sym, st.min, st.max, st.avg, st.volatility, stream.delay_ms(sym));
        }
    }

    spdlog::info("shutting down: {} ticks, {} signals", pipeline.ticks_processed(), pipeline.signals_emitted());
    stream.stop();
    history.stop();
    ix::uninitNetSystem();
    return 0;
}
