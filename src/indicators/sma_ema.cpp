#include "indicators/sma_ema.hpp"

namespace ind {
double compute_sma(const std::deque<double>& v, std::size_t p){
    if (p == 0 || v.size()<p) return v.empty()?0.0:v.back();
    double s=0; for (std::size_t i=v.size()-p;i<v.size();++i) s+=v[i];
    return s/static_cast<double>(p);
}
double compute_ema(const std::deque<double>& v, std::size_t p){
    if (v.empty()) return 0.0;
    const double k = 2.0/(p+1.0);
    double e = v[0];
    for (std::size_t i=1;i<v.size();++i) e = (v[i]-e)*k + e;
    return e;
}
EmaSet compute_ema_set(const std::deque<double>& v){
    EmaSet s;
    s.ema5  = compute_ema(v, 5);
    s.ema8  = compute_ema(v, 8);
    s.ema13 = compute_ema(v, 13);
    s.ema20 = compute_ema(v, 20);
    s.ema21 = compute_ema(v, 21);
    s.ema34 = compute_ema(v, 34);
    s.ema50 = compute_ema(v, 50);
    return s;
}
} // namespace ind
