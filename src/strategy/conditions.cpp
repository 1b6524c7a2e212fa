#include "strategy/conditions.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace strategy {

void ConditionVector::set(const std::string& name, bool v){
    for (auto& [n, b] : items) if (n == name) { b = v; return; }
    items.emplace_back(name, v);
}

std::optional<bool> ConditionVector::get(const std::string& name) const {
    for (const auto& [n, b] : items) if (n == name) return b;
    return std::nullopt;
}

bool ConditionVector::all() const {
    return std::all_of(items.begin(), items.end(), [](const auto& p){ return p.second; });
}

bool moving_average_condition(core::StrategyKind kind, const ind::IndicatorSnapshot& s,
                              double price, const StrategyConfig& cfg){
    const auto& e = s.ema;
    switch (kind) {
        case core::StrategyKind::Scalping:
            if (!(cfg.use_ma8 && cfg.use_ma21)) return true;
            return e.ema8 > e.ema21;
        case core::StrategyKind::Intraday:
            if (!(cfg.use_ma20 && cfg.use_ma34)) return true;
            return price > e.ema34 && e.ema20 > e.ema34;
        case core::StrategyKind::Pump:
            if (!(cfg.use_ma5 && cfg.use_ma13)) return true;
            return price > e.ema5 && e.ema5 > e.ema13;
    }
    return true;
}

namespace {

bool bollinger_condition(const ind::IndicatorSnapshot& s, double price, const StrategyConfig& cfg){
    const double m = cfg.bollinger_multiplier;
    bool ok = true;
    if (cfg.use_bollinger_lower)  ok = ok && price <= s.bollinger.lower * m;
    if (cfg.use_bollinger_middle) ok = ok && price >= s.bollinger.mid * m;
    if (cfg.use_bollinger_upper)  ok = ok && price >= s.bollinger.upper * m;
    return ok;
}

bool macd_condition(const ind::IndicatorSnapshot& s, const StrategyConfig& cfg){
    if (!cfg.macd_line_above_signal) return true;
    bool ok = s.macd.line > s.macd.signal;
    if (cfg.macd_line_above_zero) ok = ok && s.macd.line > 0.0;
    return ok;
}

bool cvd_condition(const ind::IndicatorSnapshot& s, const StrategyConfig& cfg){
    if (!cfg.cvd_slope_positive) return true;
    bool ok = s.cvd_slope > 0.0;
    if (cfg.cvd_above_zero) ok = ok && s.cvd > 0.0;
    return ok;
}

} // namespace

Evaluation evaluate(core::StrategyKind kind, const ind::IndicatorSnapshot& s,
                    double price, const StrategyConfig& cfg){
    Evaluation ev;
    ev.kind = kind;
    ev.entry_price = price;
    ev.take_profit = price * (1.0 + cfg.take_profit_percent / 100.0);
    ev.stop_loss   = price * (1.0 - cfg.stop_loss_percent / 100.0);

    ev.conditions.set(cond::kRsi, s.rsi >= cfg.rsi_min && s.rsi <= cfg.rsi_max);
    ev.conditions.set(cond::kMovingAverages, moving_average_condition(kind, s, price, cfg));
    ev.conditions.set(cond::kBollinger, bollinger_condition(s, price, cfg));
    ev.conditions.set(cond::kMacd, macd_condition(s, cfg));
    ev.conditions.set(cond::kVolume, s.volume > s.avg_volume * cfg.volume_multiplier);
    ev.conditions.set(cond::kCvd, cvd_condition(s, cfg));

    ev.all_met = ev.conditions.all();
    ev.side = ev.all_met ? core::Side::Long : core::Side::Wait;
    return ev;
}

std::vector<std::string> describe_failures(const Evaluation& ev, const ind::IndicatorSnapshot& s,
                                           double price, const StrategyConfig& cfg){
    std::vector<std::string> out;
    auto failed = [&](const char* name){ return ev.conditions.get(name) == std::optional<bool>(false); };

    if (failed(cond::kRsi))
        out.push_back(fmt::format("RSI: {:.2f} (need {:g}-{:g})", s.rsi, cfg.rsi_min, cfg.rsi_max));

    if (failed(cond::kMovingAverages)) {
        const auto& e = s.ema;
        switch (ev.kind) {
            case core::StrategyKind::Scalping:
                out.push_back(fmt::format("MA: EMA8={:.4f} vs EMA21={:.4f} (need EMA8 > EMA21)", e.ema8, e.ema21));
                break;
            case core::StrategyKind::Intraday:
                out.push_back(fmt::format("MA: Price={:.4f} vs EMA34={:.4f}, EMA20={:.4f} vs EMA34={:.4f}",
                                          price, e.ema34, e.ema20, e.ema34));
                break;
            case core::StrategyKind::Pump:
                out.push_back(fmt::format("MA: Price={:.4f} vs EMA5={:.4f}, EMA5={:.4f} vs EMA13={:.4f}",
                                          price, e.ema5, e.ema5, e.ema13));
                break;
        }
    }

    if (failed(cond::kBollinger)) {
        const double m = cfg.bollinger_multiplier;
        if (cfg.use_bollinger_lower)
            out.push_back(fmt::format("BB: Price={:.4f} vs BBLower*{:g}={:.4f}", price, m, s.bollinger.lower*m));
        if (cfg.use_bollinger_middle)
            out.push_back(fmt::format("BB: Price={:.4f} vs BBMiddle*{:g}={:.4f}", price, m, s.bollinger.mid*m));
        if (cfg.use_bollinger_upper)
            out.push_back(fmt::format("BB: Price={:.4f} vs BBUpper*{:g}={:.4f}", price, m, s.bollinger.upper*m));
    }

    if (failed(cond::kMacd))
        out.push_back(fmt::format("MACD: Line={:.6f} vs Signal={:.6f}", s.macd.line, s.macd.signal));

    if (failed(cond::kVolume))
        out.push_back(fmt::format("Volume: {:.2f} vs Avg*{:g}={:.2f}", s.volume, cfg.volume_multiplier,
                                  s.avg_volume * cfg.volume_multiplier));

    if (failed(cond::kCvd)) {
        if (cfg.cvd_above_zero)
            out.push_back(fmt::format("CVD Slope: {:.2f} (need > 0), CVD: {:.2f} (need > 0)", s.cvd_slope, s.cvd));
        else
            out.push_back(fmt::format("CVD Slope: {:.2f} (need > 0)", s.cvd_slope));
    }
    return out;
}

} // namespace strategy
