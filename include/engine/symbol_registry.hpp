#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/types.hpp"
#include "data/price_history.hpp"
#include "indicators/cvd.hpp"
#include "strategy/edge_detector.hpp"

namespace engine {

// Egy szimbólum teljes változó állapota. Csak a saját mutex-ével fogva írható;
// különböző szimbólumok között nincs közös zár.
struct SymbolState {
    SymbolState(std::string sym, std::size_t history_cap, std::size_t cvd_cap)
        : symbol(std::move(sym)), history(history_cap), cvd(cvd_cap) {}

    const std::string symbol;
    std::mutex mtx;
    data::PriceHistory history;
    ind::CvdSeries cvd;
    std::array<strategy::EdgeDetector, 3> edges{};  // core::index_of(kind) szerint
    std::uint64_t ticks{0};

    strategy::EdgeDetector& edge(core::StrategyKind k) { return edges[core::index_of(k)]; }
};

class SymbolRegistry {
public:
    explicit SymbolRegistry(std::size_t history_cap = 200, std::size_t cvd_cap = 100)
        : history_cap_(history_cap), cvd_cap_(cvd_cap) {}

    // Az állapot élettartama a registry-é; a visszaadott referencia addig érvényes.
    SymbolState& get_or_create(const std::string& symbol);
    SymbolState* find(const std::string& symbol);

    std::vector<std::string> symbols() const;
    std::size_t size() const;

    std::size_t history_capacity() const { return history_cap_; }
    std::size_t cvd_capacity() const { return cvd_cap_; }

private:
    std::size_t history_cap_;
    std::size_t cvd_cap_;
    mutable std::shared_mutex mtx_;
    std::unordered_map<std::string, std::unique_ptr<SymbolState>> states_;
};

} // namespace engine
