#include "indicators/engine.hpp"
#include "indicators/rsi.hpp"
#include "indicators/volume.hpp"
#include <stdexcept>
#include <string>

namespace ind {

IndicatorSnapshot compute_indicators(const std::deque<double>& prices,
                                     const std::deque<double>& volumes,
                                     double current_price){
    if (prices.size() != volumes.size())
        throw std::invalid_argument("compute_indicators: " + std::to_string(prices.size()) +
                                    " prices vs " + std::to_string(volumes.size()) + " volumes");

    IndicatorSnapshot s;
    s.rsi = compute_rsi(prices, 14);
    s.macd = compute_macd(prices);
    s.ema = compute_ema_set(prices);
    s.bollinger = compute_bb(prices, 20, 2.0);

    const auto vs = compute_volume_spike(volumes, 20, 2.0);
    s.avg_volume = vs.avg_volume;
    s.volume_spike = vs.spike;
    s.volume = volumes.empty()? 0.0 : volumes.back();
    s.price = current_price;
    return s;
}

} // namespace ind
