#include "sink/file_sinks.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace sink {

JsonlSignalSink::JsonlSignalSink(std::string path) : path_(std::move(path)) {
    out_.open(path_, std::ios::app);
    if (!out_.good()) spdlog::error("cannot open signal store {}", path_);
}

void JsonlSignalSink::publish(const strategy::Signal& s){
    const nlohmann::json j = s;
    std::lock_guard<std::mutex> lk(mtx_);
    if (!out_.good()) {
        spdlog::warn("signal {} not stored, {} is not writable", s.id, path_);
        return;
    }
    out_ << j.dump() << '\n';
    out_.flush();
}

std::string csv_escape(const std::string& f){
    if (f.find_first_of(",\"\n") == std::string::npos) return f;
    std::string out = "\"";
    for (char c : f) { if (c == '"') out.push_back('"'); out.push_back(c); }
    out.push_back('"');
    return out;
}

const std::vector<std::string>& CsvSignalSink::header(){
    static const std::vector<std::string> h{
        "id", "symbol", "strategy", "signal", "timestamp",
        "entryPrice", "takeProfit", "stopLoss",
        "rsi", "macdLine", "macdSignal",
        "ma5", "ma8", "ma13", "ma20", "ma21", "ma34", "ma50",
        "bollingerUpper", "bollingerLower", "bollingerMiddle",
        "currentPrice", "volume", "avgVolume", "volumeSpike",
        "cvd", "cvdTrend", "cvdSlope"
    };
    return h;
}

std::vector<std::string> CsvSignalSink::row(const strategy::Signal& s){
    const auto& i = s.indicators;
    auto num = [](double v){ return fmt::format("{}", v); };
    return {
        s.id, s.symbol, core::to_string(s.kind), core::to_string(s.side), std::to_string(s.timestamp_ms),
        num(s.entry_price), num(s.take_profit), num(s.stop_loss),
        num(i.rsi), num(i.macd.line), num(i.macd.signal),
        num(i.ema.ema5), num(i.ema.ema8), num(i.ema.ema13), num(i.ema.ema20),
        num(i.ema.ema21), num(i.ema.ema34), num(i.ema.ema50),
        num(i.bollinger.upper), num(i.bollinger.lower), num(i.bollinger.mid),
        num(i.price), num(i.volume), num(i.avg_volume), i.volume_spike ? "true" : "false",
        num(i.cvd), core::to_string(i.cvd_trend), num(i.cvd_slope)
    };
}

namespace {
std::string join(const std::vector<std::string>& v){
    std::string out;
    for (std::size_t n=0; n<v.size(); ++n) {
        if (n) out.push_back(',');
        out += csv_escape(v[n]);
    }
    return out;
}
}

CsvSignalSink::CsvSignalSink(std::string path) : path_(std::move(path)) {
    std::error_code ec;
    const bool fresh = !std::filesystem::exists(path_, ec) || std::filesystem::file_size(path_, ec) == 0;
    out_.open(path_, std::ios::app);
    if (!out_.good()) {
        spdlog::error("cannot open signal export {}", path_);
        return;
    }
    if (fresh) out_ << join(header()) << '\n';
}

void CsvSignalSink::publish(const strategy::Signal& s){
    const auto line = join(row(s));
    std::lock_guard<std::mutex> lk(mtx_);
    if (!out_.good()) {
        spdlog::warn("signal {} not exported, {} is not writable", s.id, path_);
        return;
    }
    out_ << line << '\n';
    out_.flush();
}

} // namespace sink
