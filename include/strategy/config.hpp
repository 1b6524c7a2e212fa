#pragma once
#include <nlohmann/json.hpp>
#include "core/types.hpp"

namespace strategy {

// Egy (szimbólum, stratégia) pár feltétel-beállításai.
// A kikapcsolt feltételek mindig teljesülnek; az RSI és a volumen mindig számít.
struct StrategyConfig {
    // Volumen
    double volume_multiplier{1.5};

    // RSI sáv
    double rsi_min{0.0};
    double rsi_max{40.0};

    // EMA kapcsolók
    bool use_ma5{false};
    bool use_ma8{true};
    bool use_ma13{false};
    bool use_ma20{false};
    bool use_ma21{true};
    bool use_ma34{false};
    bool use_ma50{false};

    // MACD
    bool macd_line_above_signal{true};
    bool macd_line_above_zero{false};

    // Bollinger
    double bollinger_multiplier{1.01};
    bool use_bollinger_upper{false};
    bool use_bollinger_lower{true};
    bool use_bollinger_middle{false};

    // CVD
    bool cvd_above_zero{false};
    bool cvd_slope_positive{true};
    int cvd_lookback_candles{5};

    // TP / SL százalékban
    double take_profit_percent{0.5};
    double stop_loss_percent{0.25};
};

// Beépített alapértékek stratégiánként
StrategyConfig default_config(core::StrategyKind kind);

// A `patch` jelen lévő kulcsait ráteszi a `base`-re; a hiányzók változatlanok maradnak.
// Rossz típusú értéknél nlohmann::json::exception.
StrategyConfig merge_config(const StrategyConfig& base, const nlohmann::json& patch);

// Alapértékekből + JSON-ból épít, a beolvasáskor egyszer.
inline StrategyConfig config_from_json(core::StrategyKind kind, const nlohmann::json& j) {
    return merge_config(default_config(kind), j);
}

void to_json(nlohmann::json& j, const StrategyConfig& c);

bool operator==(const StrategyConfig& a, const StrategyConfig& b);
inline bool operator!=(const StrategyConfig& a, const StrategyConfig& b) { return !(a == b); }

} // namespace strategy
