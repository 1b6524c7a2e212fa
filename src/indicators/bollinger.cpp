#include "indicators/bollinger.hpp"
#include <algorithm>
#include <cmath>

namespace ind {
BB compute_bb(const std::deque<double>& v, std::size_t p, double k){
    if (p == 0 || v.size()<p) {
        const double last = v.empty()? 0.0 : v.back();
        return {last, last, last};
    }
    double mid=0.0;
    for (std::size_t i=v.size()-p;i<v.size();++i) mid += v[i];
    mid/=static_cast<double>(p);
    double var=0.0;
    for (std::size_t i=v.size()-p;i<v.size();++i){ const double d=v[i]-mid; var+=d*d; }
    const double sd = std::sqrt(std::max(0.0, var/static_cast<double>(p)));
    return {mid, mid + k*sd, mid - k*sd};
}
} // namespace ind
