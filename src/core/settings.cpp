#include "core/settings.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace core {

namespace {
// Kapacitás / ablak méret: 1 alatti érték esetén marad az alapérték.
void read_count(const json& j, const char* key, std::size_t& field){
    const long long v = j.value(key, static_cast<long long>(field));
    if (v < 1) {
        spdlog::warn("settings: {}={} is not positive, keeping {}", key, v, field);
        return;
    }
    field = static_cast<std::size_t>(v);
}
}

Settings settings_from_json(const json& j){
    Settings s;
    if (!j.is_object()) return s;
    s.symbols                 = j.value("symbols", s.symbols);
    s.stream_url              = j.value("streamUrl", s.stream_url);
    s.stream_channel          = j.value("streamChannel", s.stream_channel);
    s.max_reconnect_attempts  = j.value("maxReconnectAttempts", s.max_reconnect_attempts);
    s.gap_warn_seconds        = j.value("gapWarnSeconds", s.gap_warn_seconds);
    read_count(j, "historyLength",    s.history_length);
    read_count(j, "cvdMaxLength",     s.cvd_max_length);
    read_count(j, "cvdSlopeLookback", s.cvd_slope_lookback);
    read_count(j, "cvdTrendLookback", s.cvd_trend_lookback);
    s.history_horizon_seconds = j.value("historyHorizonSeconds", s.history_horizon_seconds);
    s.history_cleanup_ms      = j.value("historyCleanupMs", s.history_cleanup_ms);
    s.conditions_path         = j.value("conditionsPath", s.conditions_path);
    s.signals_jsonl_path      = j.value("signalsJsonlPath", s.signals_jsonl_path);
    s.signals_csv_path        = j.value("signalsCsvPath", s.signals_csv_path);
    s.log_level               = j.value("logLevel", s.log_level);
    return s;
}

void to_json(json& j, const Settings& s){
    j = json{
        {"symbols", s.symbols},
        {"streamUrl", s.stream_url},
        {"streamChannel", s.stream_channel},
        {"maxReconnectAttempts", s.max_reconnect_attempts},
        {"gapWarnSeconds", s.gap_warn_seconds},
        {"historyLength", s.history_length},
        {"cvdMaxLength", s.cvd_max_length},
        {"cvdSlopeLookback", s.cvd_slope_lookback},
        {"cvdTrendLookback", s.cvd_trend_lookback},
        {"historyHorizonSeconds", s.history_horizon_seconds},
        {"historyCleanupMs", s.history_cleanup_ms},
        {"conditionsPath", s.conditions_path},
        {"signalsJsonlPath", s.signals_jsonl_path},
        {"signalsCsvPath", s.signals_csv_path},
        {"logLevel", s.log_level},
    };
}

bool load_settings(const std::string& path, Settings& out){
    std::ifstream f(path);
    if (!f.good()) {
        spdlog::error("cannot open settings file {}", path);
        return false;
    }
    try {
        out = settings_from_json(json::parse(f));
    } catch (const json::exception& e) {
        spdlog::error("settings file {} invalid: {}", path, e.what());
        return false;
    }
    return true;
}

} // namespace core
