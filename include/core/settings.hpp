#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace core {

// Alkalmazás beállítások; minden kulcs opcionális a JSON fájlban.
struct Settings {
    std::vector<std::string> symbols{"BTCUSDT", "ETHUSDT", "XRPUSDT", "SOLUSDT", "DOGEUSDT"};
    std::string stream_url{"wss://fstream.binance.com/stream"};
    std::string stream_channel{"kline_1m"};
    int max_reconnect_attempts{5};
    int gap_warn_seconds{60};

    std::size_t history_length{200};
    std::size_t cvd_max_length{100};
    std::size_t cvd_slope_lookback{5};
    std::size_t cvd_trend_lookback{10};

    int history_horizon_seconds{60};
    int history_cleanup_ms{10000};

    std::string conditions_path;
    std::string signals_jsonl_path;
    std::string signals_csv_path;
    std::string log_level{"info"};
};

Settings settings_from_json(const nlohmann::json& j);
void to_json(nlohmann::json& j, const Settings& s);

// false, ha a fájl nem olvasható vagy hibás; ilyenkor `out` változatlan.
bool load_settings(const std::string& path, Settings& out);

} // namespace core
