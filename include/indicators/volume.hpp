#pragma once
#include <deque>
#include <cstddef>

namespace ind {

struct VolumeSpike {
    double avg_volume{0.0};
    bool spike{false};
};

// spike = utolsó mennyiség > 2.0 * átlag; kevés adatnál az átlag az utolsó érték.
VolumeSpike compute_volume_spike(const std::deque<double>& volumes, std::size_t p = 20,
                                 double spike_ratio = 2.0);

} // namespace ind
