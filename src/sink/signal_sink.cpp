#include "sink/signal_sink.hpp"
#include <spdlog/spdlog.h>

namespace sink {

void FanoutSignalSink::add(std::unique_ptr<ISignalSink> s){
    if (s) sinks_.push_back(std::move(s));
}

void FanoutSignalSink::publish(const strategy::Signal& s){
    for (auto& k : sinks_) {
        try {
            k->publish(s);
        } catch (const std::exception& e) {
            spdlog::error("signal sink failed for {}: {}", s.id, e.what());
        }
    }
}

void CallbackSignalSink::publish(const strategy::Signal& s){
    std::lock_guard<std::mutex> lk(mtx_);
    if (cb_) cb_(s);
}

void LogSignalSink::publish(const strategy::Signal& s){
    spdlog::info("{} {} {} @ {:.6f} TP {:.6f} SL {:.6f} (RSI {:.2f}, CVD {:.2f} {}, slope {:.2f})",
                 core::to_string(s.side), s.symbol, core::to_string(s.kind),
                 s.entry_price, s.take_profit, s.stop_loss,
                 s.indicators.rsi, s.indicators.cvd, core::to_string(s.indicators.cvd_trend),
                 s.indicators.cvd_slope);
}

} // namespace sink
