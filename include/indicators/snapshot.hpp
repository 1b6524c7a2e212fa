#pragma once
#include <string>
#include <optional>
#include "core/types.hpp"
#include "indicators/macd.hpp"
#include "indicators/sma_ema.hpp"
#include "indicators/bollinger.hpp"

namespace ind {

// Egy szimbólum indikátorai egy adott tick után. Értéktípus, minden tick újat kap.
struct IndicatorSnapshot {
    double rsi{50.0};
    Macd macd{};
    EmaSet ema{};
    BB bollinger{};
    double volume{0.0};
    double avg_volume{0.0};
    bool volume_spike{false};
    double price{0.0};
    double cvd{0.0};
    core::CvdTrend cvd_trend{core::CvdTrend::Neutral};
    double cvd_slope{0.0};
};

// Numerikus mezők a history / trend lekérdezésekhez
enum class IndicatorField {
    Rsi, MacdLine, MacdSignal, MacdHistogram,
    Ema5, Ema8, Ema13, Ema20, Ema21, Ema34, Ema50,
    BollingerUpper, BollingerMiddle, BollingerLower,
    Volume, AvgVolume, Price, Cvd, CvdSlope
};

double field_value(const IndicatorSnapshot& s, IndicatorField f);
const char* to_string(IndicatorField f);
std::optional<IndicatorField> parse_indicator_field(const std::string& name);

} // namespace ind
