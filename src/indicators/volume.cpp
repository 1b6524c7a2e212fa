#include "indicators/volume.hpp"

namespace ind {
VolumeSpike compute_volume_spike(const std::deque<double>& v, std::size_t p, double ratio){
    if (p == 0 || v.size() < p) return {v.empty()? 0.0 : v.back(), false};
    double s=0.0;
    for (std::size_t i=v.size()-p;i<v.size();++i) s+=v[i];
    const double avg = s/static_cast<double>(p);
    return {avg, v.back() > avg*ratio};
}
} // namespace ind
