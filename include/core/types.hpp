#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <algorithm>

namespace core {

// Bejövő piaci tick (szimbólum, idő, ár, mennyiség)
struct Tick {
    std::string symbol;
    std::int64_t timestamp_ms{};
    double price{};
    double volume{};
};

// Stratégia típus
enum class StrategyKind { Scalping, Intraday, Pump };

inline constexpr StrategyKind kAllStrategies[] = {
    StrategyKind::Scalping, StrategyKind::Intraday, StrategyKind::Pump
};

inline const char* to_string(StrategyKind k) {
    switch (k) {
        case StrategyKind::Scalping: return "scalping";
        case StrategyKind::Intraday: return "intraday";
        default:                     return "pump";
    }
}

inline std::optional<StrategyKind> parse_strategy_kind(const std::string& s) {
    if (s == "scalping") return StrategyKind::Scalping;
    if (s == "intraday") return StrategyKind::Intraday;
    if (s == "pump")     return StrategyKind::Pump;
    return std::nullopt;
}

inline std::size_t index_of(StrategyKind k) { return static_cast<std::size_t>(k); }

// Jel iránya
enum class Side { Long, Wait };

inline const char* to_string(Side s) {
    return s == Side::Long ? "LONG" : "WAIT";
}

// CVD trend irány
enum class CvdTrend { Bullish, Bearish, Neutral };

inline const char* to_string(CvdTrend t) {
    switch (t) {
        case CvdTrend::Bullish: return "bullish";
        case CvdTrend::Bearish: return "bearish";
        default:                return "neutral";
    }
}

inline CvdTrend parse_cvd_trend(const std::string& s) {
    if (s == "bullish") return CvdTrend::Bullish;
    if (s == "bearish") return CvdTrend::Bearish;
    return CvdTrend::Neutral;
}

} // namespace core
