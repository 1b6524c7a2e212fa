#include "indicators/rsi.hpp"

namespace ind {
double compute_rsi(const std::deque<double>& c, std::size_t p){
    if (p == 0 || c.size() <= p) return 50.0;
    double g=0.0, l=0.0;
    for (std::size_t i=c.size()-p; i<c.size(); ++i){
        const double d = c[i]-c[i-1];
        if (d>0) g+=d; else l-=d;
    }
    const double avg_gain = g / static_cast<double>(p);
    const double avg_loss = l / static_cast<double>(p);
    if (avg_loss == 0.0) return 100.0;
    const double rs = avg_gain / avg_loss;
    return 100.0 - (100.0/(1.0+rs));
}
} // namespace ind
