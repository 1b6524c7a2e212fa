#include "indicators/snapshot.hpp"
#include <array>
#include <utility>

namespace ind {

namespace {
using FieldName = std::pair<IndicatorField, const char*>;
constexpr std::array<FieldName, 19> kFieldNames{{
    {IndicatorField::Rsi,             "rsi"},
    {IndicatorField::MacdLine,        "macdLine"},
    {IndicatorField::MacdSignal,      "macdSignal"},
    {IndicatorField::MacdHistogram,   "macd"},
    {IndicatorField::Ema5,            "ma5"},
    {IndicatorField::Ema8,            "ma8"},
    {IndicatorField::Ema13,           "ma13"},
    {IndicatorField::Ema20,           "ma20"},
    {IndicatorField::Ema21,           "ma21"},
    {IndicatorField::Ema34,           "ma34"},
    {IndicatorField::Ema50,           "ma50"},
    {IndicatorField::BollingerUpper,  "bollingerUpper"},
    {IndicatorField::BollingerMiddle, "bollingerMiddle"},
    {IndicatorField::BollingerLower,  "bollingerLower"},
    {IndicatorField::Volume,          "volume"},
    {IndicatorField::AvgVolume,       "avgVolume"},
    {IndicatorField::Price,           "price"},
    {IndicatorField::Cvd,             "cvd"},
    {IndicatorField::CvdSlope,        "cvdSlope"},
}};
}

double field_value(const IndicatorSnapshot& s, IndicatorField f){
    switch (f) {
        case IndicatorField::Rsi:             return s.rsi;
        case IndicatorField::MacdLine:        return s.macd.line;
        case IndicatorField::MacdSignal:      return s.macd.signal;
        case IndicatorField::MacdHistogram:   return s.macd.macd;
        case IndicatorField::Ema5:            return s.ema.ema5;
        case IndicatorField::Ema8:            return s.ema.ema8;
        case IndicatorField::Ema13:           return s.ema.ema13;
        case IndicatorField::Ema20:           return s.ema.ema20;
        case IndicatorField::Ema21:           return s.ema.ema21;
        case IndicatorField::Ema34:           return s.ema.ema34;
        case IndicatorField::Ema50:           return s.ema.ema50;
        case IndicatorField::BollingerUpper:  return s.bollinger.upper;
        case IndicatorField::BollingerMiddle: return s.bollinger.mid;
        case IndicatorField::BollingerLower:  return s.bollinger.lower;
        case IndicatorField::Volume:          return s.volume;
        case IndicatorField::AvgVolume:       return s.avg_volume;
        case IndicatorField::Price:           return s.price;
        case IndicatorField::Cvd:             return s.cvd;
        case IndicatorField::CvdSlope:        return s.cvd_slope;
    }
    return 0.0;
}

const char* to_string(IndicatorField f){
    for (const auto& [field, name] : kFieldNames) if (field == f) return name;
    return "unknown";
}

std::optional<IndicatorField> parse_indicator_field(const std::string& name){
    for (const auto& [field, n] : kFieldNames) if (name == n) return field;
    return std::nullopt;
}

} // namespace ind
