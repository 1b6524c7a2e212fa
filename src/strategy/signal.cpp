#include "strategy/signal.hpp"

using json = nlohmann::json;

namespace ind {

void to_json(json& j, const IndicatorSnapshot& s){
    j = json{
        {"rsi", s.rsi},
        {"macd", {{"line", s.macd.line}, {"signal", s.macd.signal}, {"macd", s.macd.macd}}},
        {"ma5", s.ema.ema5}, {"ma8", s.ema.ema8}, {"ma13", s.ema.ema13}, {"ma20", s.ema.ema20},
        {"ma21", s.ema.ema21}, {"ma34", s.ema.ema34}, {"ma50", s.ema.ema50},
        {"bollingerUpper", s.bollinger.upper},
        {"bollingerMiddle", s.bollinger.mid},
        {"bollingerLower", s.bollinger.lower},
        {"volume", s.volume},
        {"avgVolume", s.avg_volume},
        {"volumeSpike", s.volume_spike},
        {"price", s.price},
        {"cvd", s.cvd},
        {"cvdTrend", core::to_string(s.cvd_trend)},
        {"cvdSlope", s.cvd_slope},
    };
}

} // namespace ind

namespace strategy {

std::string make_signal_id(const std::string& symbol, core::StrategyKind kind, std::int64_t ts_ms){
    return symbol + "-" + core::to_string(kind) + "-" + std::to_string(ts_ms);
}

Signal make_signal(const std::string& symbol, std::int64_t ts_ms,
                   const Evaluation& ev, const ind::IndicatorSnapshot& snap){
    Signal s;
    s.id = make_signal_id(symbol, ev.kind, ts_ms);
    s.symbol = symbol;
    s.kind = ev.kind;
    s.side = ev.side;
    s.timestamp_ms = ts_ms;
    s.entry_price = ev.entry_price;
    s.take_profit = ev.take_profit;
    s.stop_loss = ev.stop_loss;
    s.indicators = snap;
    s.conditions = ev.conditions;
    return s;
}

void to_json(json& j, const ConditionVector& c){
    j = json::object();
    for (const auto& [name, ok] : c.items) j[name] = ok;
}

void to_json(json& j, const Signal& s){
    j = json{
        {"id", s.id},
        {"symbol", s.symbol},
        {"strategy", core::to_string(s.kind)},
        {"signal", core::to_string(s.side)},
        {"timestamp", s.timestamp_ms},
        {"entryPrice", s.entry_price},
        {"takeProfit", s.take_profit},
        {"stopLoss", s.stop_loss},
        {"indicators", s.indicators},
        {"conditions", s.conditions},
    };
}

} // namespace strategy
