#pragma once
#include <string>
#include <utility>
#include <vector>
#include <optional>
#include "core/types.hpp"
#include "indicators/snapshot.hpp"
#include "strategy/config.hpp"

namespace strategy {

namespace cond {
inline constexpr const char* kRsi            = "rsi";
inline constexpr const char* kMovingAverages = "movingAverages";
inline constexpr const char* kBollinger      = "bollingerBands";
inline constexpr const char* kMacd           = "macd";
inline constexpr const char* kVolume         = "volume";
inline constexpr const char* kCvd            = "cvd";
}

// Név -> bool, rögzített sorrendben. Minden kiértékelés újat épít.
struct ConditionVector {
    std::vector<std::pair<std::string, bool>> items;

    void set(const std::string& name, bool v);
    std::optional<bool> get(const std::string& name) const;
    bool all() const;
    std::size_t size() const { return items.size(); }
};

struct Evaluation {
    core::StrategyKind kind{core::StrategyKind::Scalping};
    ConditionVector conditions;
    bool all_met{false};
    core::Side side{core::Side::Wait};
    double entry_price{0.0};
    double take_profit{0.0};
    double stop_loss{0.0};
};

// Egy stratégia feltételeinek kiértékelése. A kikapcsolt feltételek igazak;
// a döntés az összes feltétel ÉS kapcsolata.
Evaluation evaluate(core::StrategyKind kind, const ind::IndicatorSnapshot& s,
                    double price, const StrategyConfig& cfg);

// A stratégiához tartozó EMA pár feltétele (scalping: 8/21, intraday: 20/34, pump: 5/13).
bool moving_average_condition(core::StrategyKind kind, const ind::IndicatorSnapshot& s,
                              double price, const StrategyConfig& cfg);

// Olvasható lista a nem teljesült feltételekről, az összehasonlított értékekkel.
std::vector<std::string> describe_failures(const Evaluation& ev, const ind::IndicatorSnapshot& s,
                                           double price, const StrategyConfig& cfg);

} // namespace strategy
