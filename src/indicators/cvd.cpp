#include "indicators/cvd.hpp"
#include <algorithm>
#include <cmath>

namespace ind {

namespace {
constexpr double kTrendThreshold = 0.1;

inline double signed_volume(double prev_price, double price, double volume){
    if (price > prev_price) return volume;   // vételi nyomás
    if (price < prev_price) return -volume;  // eladási nyomás
    return 0.0;
}
}

std::deque<double> compute_cvd(const std::deque<double>& prices, const std::deque<double>& volumes){
    std::deque<double> out;
    const std::size_t n = std::min(prices.size(), volumes.size());
    double running = 0.0;
    for (std::size_t i=1; i<n; ++i){
        running += signed_volume(prices[i-1], prices[i], volumes[i]);
        out.push_back(running);
    }
    return out;
}

double compute_cvd_slope(const std::deque<double>& cvd, std::size_t lookback){
    if (cvd.size() < lookback + 1) return 0.0;
    const std::size_t n = lookback + 1;
    if (n < 2) return 0.0;

    double sx=0.0, sy=0.0, sxy=0.0, sx2=0.0;
    const std::size_t off = cvd.size() - n;
    for (std::size_t i=0; i<n; ++i){
        const double x = static_cast<double>(i);
        const double y = cvd[off + i];
        sx += x; sy += y; sxy += x*y; sx2 += x*x;
    }
    const double dn = static_cast<double>(n);
    const double den = dn*sx2 - sx*sx;
    if (den == 0.0) return 0.0;
    return (dn*sxy - sx*sy) / den;
}

core::CvdTrend compute_cvd_trend(const std::deque<double>& cvd, std::size_t lookback){
    if (lookback == 0 || cvd.size() < lookback) return core::CvdTrend::Neutral;
    const double first = cvd[cvd.size() - lookback];
    const double last  = cvd.back();
    const double base  = first != 0.0 ? std::abs(first) : 1.0;
    const double strength = (last - first) / base;
    if (strength >  kTrendThreshold) return core::CvdTrend::Bullish;
    if (strength < -kTrendThreshold) return core::CvdTrend::Bearish;
    return core::CvdTrend::Neutral;
}

double CvdSeries::update(const std::deque<double>& prices, const std::deque<double>& volumes){
    if (prices.size() < 2 || volumes.size() < 2) return 0.0;

    if (values_.empty()) {
        values_ = compute_cvd(prices, volumes);
    } else {
        const double prev = prices[prices.size()-2];
        const double cur  = prices.back();
        values_.push_back(values_.back() + signed_volume(prev, cur, volumes.back()));
    }
    trim();
    return last();
}

double CvdSeries::slope(std::size_t lookback) const {
    return compute_cvd_slope(values_, lookback);
}

core::CvdTrend CvdSeries::trend(std::size_t lookback) const {
    return compute_cvd_trend(values_, lookback);
}

void CvdSeries::trim(){
    while (values_.size() > max_len_) values_.pop_front();
}

} // namespace ind
