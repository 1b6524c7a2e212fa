#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/types.hpp"
#include "indicators/snapshot.hpp"
#include "strategy/conditions.hpp"

namespace ind {
void to_json(nlohmann::json& j, const IndicatorSnapshot& s);
} // namespace ind

namespace strategy {

// Egy élre kiváltott jel; létrehozás után nem módosul, a sink kapja meg.
struct Signal {
    std::string id;
    std::string symbol;
    core::StrategyKind kind{core::StrategyKind::Scalping};
    core::Side side{core::Side::Long};
    std::int64_t timestamp_ms{0};
    double entry_price{0.0};
    double take_profit{0.0};
    double stop_loss{0.0};
    ind::IndicatorSnapshot indicators;
    ConditionVector conditions;
};

// <symbol>-<strategy>-<timestamp_ms>
std::string make_signal_id(const std::string& symbol, core::StrategyKind kind, std::int64_t ts_ms);

Signal make_signal(const std::string& symbol, std::int64_t ts_ms,
                   const Evaluation& ev, const ind::IndicatorSnapshot& snap);

void to_json(nlohmann::json& j, const ConditionVector& c);
void to_json(nlohmann::json& j, const Signal& s);

} // namespace strategy
