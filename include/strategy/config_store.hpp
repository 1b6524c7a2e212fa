#pragma once
#include <array>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "strategy/config_provider.hpp"

namespace strategy {

// Szimbólumonkénti, stratégiánkénti beállítások tárolója.
// Első hozzáféréskor a szimbólum mindhárom stratégiája alapértéket kap.
// Ha van autosave útvonal, minden módosítás után fájlba írja az állapotot.
class ConfigStore final : public IConfigProvider {
public:
    using SymbolConfigs = std::array<StrategyConfig, 3>;  // core::index_of(kind) szerint

    ConfigStore() = default;
    explicit ConfigStore(std::string autosave_path);

    StrategyConfig get_conditions(const std::string& symbol, core::StrategyKind kind) override;

    // Részleges felülírás JSON-ból; rossz típusú mezőnél false és nem változik semmi.
    bool update_conditions(const std::string& symbol, core::StrategyKind kind, const nlohmann::json& patch);
    void set_conditions(const std::string& symbol, core::StrategyKind kind, const StrategyConfig& cfg);
    void reset_conditions(const std::string& symbol, core::StrategyKind kind);

    SymbolConfigs all_for_symbol(const std::string& symbol);
    std::vector<std::string> symbols() const;

    std::string export_json() const;
    bool import_json(const std::string& text);

    bool load_file(const std::string& path);
    bool save_file(const std::string& path) const;

private:
    SymbolConfigs& ensure_symbol(const std::string& symbol);
    nlohmann::json to_json_locked() const;
    void persist_locked() const;

    mutable std::mutex mtx_;
    std::map<std::string, SymbolConfigs> conditions_;
    std::string autosave_path_;
};

} // namespace strategy
