#pragma once
#include <string>
#include "core/types.hpp"
#include "strategy/config.hpp"

namespace strategy {

// Konfiguráció olvasó interfész a pipeline felé.
// Hiányzó beállítás soha nem hiba: ilyenkor a beépített alapérték jön vissza.
class IConfigProvider {
public:
    virtual ~IConfigProvider() = default;
    virtual StrategyConfig get_conditions(const std::string& symbol, core::StrategyKind kind) = 0;
};

} // namespace strategy
