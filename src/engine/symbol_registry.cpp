#include "engine/symbol_registry.hpp"
#include <spdlog/spdlog.h>

namespace engine {

SymbolState& SymbolRegistry::get_or_create(const std::string& symbol){
    {
        std::shared_lock<std::shared_mutex> rl(mtx_);
        auto it = states_.find(symbol);
        if (it != states_.end()) return *it->second;
    }
    std::unique_lock<std::shared_mutex> wl(mtx_);
    auto& slot = states_[symbol];
    if (!slot) {
        slot = std::make_unique<SymbolState>(symbol, history_cap_, cvd_cap_);
        spdlog::debug("tracking new symbol {}", symbol);
    }
    return *slot;
}

SymbolState* SymbolRegistry::find(const std::string& symbol){
    std::shared_lock<std::shared_mutex> rl(mtx_);
    auto it = states_.find(symbol);
    return it == states_.end() ? nullptr : it->second.get();
}

std::vector<std::string> SymbolRegistry::symbols() const {
    std::shared_lock<std::shared_mutex> rl(mtx_);
    std::vector<std::string> out;
    out.reserve(states_.size());
    for (const auto& [sym, _] : states_) out.push_back(sym);
    return out;
}

std::size_t SymbolRegistry::size() const {
    std::shared_lock<std::shared_mutex> rl(mtx_);
    return states_.size();
}

} // namespace engine
