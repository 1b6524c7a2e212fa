#include "strategy/config.hpp"
#include <tuple>

using json = nlohmann::json;

namespace strategy {

StrategyConfig default_config(core::StrategyKind kind){
    StrategyConfig c;  // scalping alapértékek
    switch (kind) {
        case core::StrategyKind::Scalping:
            break;
        case core::StrategyKind::Intraday:
            c.volume_multiplier = 1.2;
            c.rsi_min = 35.0; c.rsi_max = 65.0;
            c.use_ma8 = false; c.use_ma21 = false;
            c.use_ma20 = true; c.use_ma34 = true;
            c.bollinger_multiplier = 1.01;
            c.cvd_above_zero = true;
            c.cvd_lookback_candles = 10;
            c.take_profit_percent = 2.0;
            c.stop_loss_percent = 1.0;
            break;
        case core::StrategyKind::Pump:
            c.volume_multiplier = 2.0;
            c.rsi_min = 50.0; c.rsi_max = 85.0;
            c.use_ma8 = false; c.use_ma21 = false;
            c.use_ma5 = true; c.use_ma13 = true;
            c.macd_line_above_zero = true;
            c.bollinger_multiplier = 1.0;
            c.use_bollinger_lower = false;
            c.use_bollinger_middle = true;
            c.cvd_above_zero = true;
            c.take_profit_percent = 3.0;
            c.stop_loss_percent = 1.0;
            break;
    }
    return c;
}

namespace {
template <typename T>
void overlay(const json& j, const char* key, T& field){
    auto it = j.find(key);
    if (it != j.end()) field = it->get<T>();
}
}

StrategyConfig merge_config(const StrategyConfig& base, const json& j){
    StrategyConfig c = base;
    if (!j.is_object()) return c;
    overlay(j, "volumeMultiplier",    c.volume_multiplier);
    overlay(j, "rsiMin",              c.rsi_min);
    overlay(j, "rsiMax",              c.rsi_max);
    overlay(j, "useMA5",              c.use_ma5);
    overlay(j, "useMA8",              c.use_ma8);
    overlay(j, "useMA13",             c.use_ma13);
    overlay(j, "useMA20",             c.use_ma20);
    overlay(j, "useMA21",             c.use_ma21);
    overlay(j, "useMA34",             c.use_ma34);
    overlay(j, "useMA50",             c.use_ma50);
    overlay(j, "macdLineAboveSignal", c.macd_line_above_signal);
    overlay(j, "macdLineAboveZero",   c.macd_line_above_zero);
    overlay(j, "bollingerMultiplier", c.bollinger_multiplier);
    overlay(j, "useBollingerUpper",   c.use_bollinger_upper);
    overlay(j, "useBollingerLower",   c.use_bollinger_lower);
    overlay(j, "useBollingerMiddle",  c.use_bollinger_middle);
    overlay(j, "cvdAboveZero",        c.cvd_above_zero);
    overlay(j, "cvdSlopePositive",    c.cvd_slope_positive);
    overlay(j, "cvdLookbackCandles",  c.cvd_lookback_candles);
    overlay(j, "takeProfitPercent",   c.take_profit_percent);
    overlay(j, "stopLossPercent",     c.stop_loss_percent);
    return c;
}

void to_json(json& j, const StrategyConfig& c){
    j = json{
        {"volumeMultiplier",    c.volume_multiplier},
        {"rsiMin",              c.rsi_min},
        {"rsiMax",              c.rsi_max},
        {"useMA5",              c.use_ma5},
        {"useMA8",              c.use_ma8},
        {"useMA13",             c.use_ma13},
        {"useMA20",             c.use_ma20},
        {"useMA21",             c.use_ma21},
        {"useMA34",             c.use_ma34},
        {"useMA50",             c.use_ma50},
        {"macdLineAboveSignal", c.macd_line_above_signal},
        {"macdLineAboveZero",   c.macd_line_above_zero},
        {"bollingerMultiplier", c.bollinger_multiplier},
        {"useBollingerUpper",   c.use_bollinger_upper},
        {"useBollingerLower",   c.use_bollinger_lower},
        {"useBollingerMiddle",  c.use_bollinger_middle},
        {"cvdAboveZero",        c.cvd_above_zero},
        {"cvdSlopePositive",    c.cvd_slope_positive},
        {"cvdLookbackCandles",  c.cvd_lookback_candles},
        {"takeProfitPercent",   c.take_profit_percent},
        {"stopLossPercent",     c.stop_loss_percent},
    };
}

namespace {
auto tie_fields(const StrategyConfig& c){
    return std::tie(c.volume_multiplier, c.rsi_min, c.rsi_max,
                    c.use_ma5, c.use_ma8, c.use_ma13, c.use_ma20, c.use_ma21, c.use_ma34, c.use_ma50,
                    c.macd_line_above_signal, c.macd_line_above_zero,
                    c.bollinger_multiplier, c.use_bollinger_upper, c.use_bollinger_lower, c.use_bollinger_middle,
                    c.cvd_above_zero, c.cvd_slope_positive, c.cvd_lookback_candles,
                    c.take_profit_percent, c.stop_loss_percent);
}
}

bool operator==(const StrategyConfig& a, const StrategyConfig& b){
    return tie_fields(a) == tie_fields(b);
}

} // namespace strategy
