#include "strategy/config_store.hpp"
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace strategy {

namespace {
ConfigStore::SymbolConfigs defaults_for_symbol(){
    ConfigStore::SymbolConfigs out;
    for (auto k : core::kAllStrategies) out[core::index_of(k)] = default_config(k);
    return out;
}

// Érvénytelen UTF-8 szimbólumnál csere karakter, nem kivétel.
std::string dump_text(const json& j, int indent = -1){
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

bool write_text(const std::string& path, const std::string& text){
    std::ofstream f(path, std::ios::trunc);
    if (!f.good()) {
        spdlog::error("cannot open {} for writing", path);
        return false;
    }
    f << text;
    return f.good();
}
}

ConfigStore::ConfigStore(std::string autosave_path) : autosave_path_(std::move(autosave_path)) {}

ConfigStore::SymbolConfigs& ConfigStore::ensure_symbol(const std::string& symbol){
    auto it = conditions_.find(symbol);
    if (it != conditions_.end()) return it->second;
    auto& cfgs = conditions_.emplace(symbol, defaults_for_symbol()).first->second;
    persist_locked();
    return cfgs;
}

StrategyConfig ConfigStore::get_conditions(const std::string& symbol, core::StrategyKind kind){
    std::lock_guard<std::mutex> lk(mtx_);
    return ensure_symbol(symbol)[core::index_of(kind)];
}

bool ConfigStore::update_conditions(const std::string& symbol, core::StrategyKind kind, const json& patch){
    std::lock_guard<std::mutex> lk(mtx_);
    auto& slot = ensure_symbol(symbol)[core::index_of(kind)];
    try {
        slot = merge_config(slot, patch);
    } catch (const json::exception& e) {
        spdlog::warn("rejected {} {} conditions update: {}", symbol, core::to_string(kind), e.what());
        return false;
    }
    persist_locked();
    spdlog::info("updated {} conditions for {}: {}", core::to_string(kind), symbol, dump_text(patch));
    return true;
}

void ConfigStore::set_conditions(const std::string& symbol, core::StrategyKind kind, const StrategyConfig& cfg){
    std::lock_guard<std::mutex> lk(mtx_);
    ensure_symbol(symbol)[core::index_of(kind)] = cfg;
    persist_locked();
}

void ConfigStore::reset_conditions(const std::string& symbol, core::StrategyKind kind){
    std::lock_guard<std::mutex> lk(mtx_);
    ensure_symbol(symbol)[core::index_of(kind)] = default_config(kind);
    persist_locked();
    spdlog::info("reset {} conditions for {} to defaults", core::to_string(kind), symbol);
}

ConfigStore::SymbolConfigs ConfigStore::all_for_symbol(const std::string& symbol){
    std::lock_guard<std::mutex> lk(mtx_);
    return ensure_symbol(symbol);
}

std::vector<std::string> ConfigStore::symbols() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<std::string> out;
    out.reserve(conditions_.size());
    for (const auto& [sym, _] : conditions_) out.push_back(sym);
    return out;
}

json ConfigStore::to_json_locked() const {
    json root = json::object();
    for (const auto& [sym, cfgs] : conditions_) {
        json per = json::object();
        for (auto k : core::kAllStrategies) per[core::to_string(k)] = cfgs[core::index_of(k)];
        root[sym] = per;
    }
    return root;
}

std::string ConfigStore::export_json() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return dump_text(to_json_locked(), 2);
}

bool ConfigStore::import_json(const std::string& text){
    std::map<std::string, SymbolConfigs> parsed;
    try {
        const auto root = json::parse(text);
        if (!root.is_object()) {
            spdlog::error("conditions import: top level is not an object");
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it.value().is_object()) {
                spdlog::error("conditions import: entry for {} is not an object", it.key());
                return false;
            }
            auto cfgs = defaults_for_symbol();
            for (auto st = it.value().begin(); st != it.value().end(); ++st) {
                auto kind = core::parse_strategy_kind(st.key());
                if (!kind) {
                    spdlog::warn("conditions import: unknown strategy '{}' for {}", st.key(), it.key());
                    continue;
                }
                cfgs[core::index_of(*kind)] = config_from_json(*kind, st.value());
            }
            parsed.emplace(it.key(), cfgs);
        }
    } catch (const json::exception& e) {
        spdlog::error("failed to import conditions: {}", e.what());
        return false;
    }

    std::lock_guard<std::mutex> lk(mtx_);
    conditions_ = std::move(parsed);
    persist_locked();
    spdlog::info("imported strategy conditions for {} symbols", conditions_.size());
    return true;
}

bool ConfigStore::load_file(const std::string& path){
    std::ifstream f(path);
    if (!f.good()) {
        spdlog::warn("conditions file {} not found, using defaults", path);
        return false;
    }
    std::stringstream ss; ss << f.rdbuf();
    return import_json(ss.str());
}

bool ConfigStore::save_file(const std::string& path) const {
    std::string text;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        text = dump_text(to_json_locked(), 2);
    }
    return write_text(path, text);
}

void ConfigStore::persist_locked() const {
    if (autosave_path_.empty()) return;
    if (!write_text(autosave_path_, dump_text(to_json_locked(), 2)))
        spdlog::error("failed to save strategy conditions to {}", autosave_path_);
}

} // namespace strategy
