#include "indicators/macd.hpp"
#include "indicators/sma_ema.hpp"

namespace ind {

namespace {
constexpr std::size_t kFast = 12;
constexpr std::size_t kSlow = 26;
constexpr double kSignalRatio = 0.8;
}

Macd compute_macd(const std::deque<double>& c){
    if (c.size() < kSlow) return {};
    const double line = compute_ema(c, kFast) - compute_ema(c, kSlow);
    const double signal = line * kSignalRatio;
    return {line, signal, line - signal};
}

} // namespace ind
