#pragma once
#include <deque>
#include "indicators/snapshot.hpp"

namespace ind {

// Állapotmentes újraszámolás az ár/mennyiség előzményből.
// A CVD mezőket nem tölti ki, azok a szimbólum CvdSeries-éből jönnek.
// Eltérő hosszú sorozatokra std::invalid_argument.
IndicatorSnapshot compute_indicators(const std::deque<double>& prices,
                                     const std::deque<double>& volumes,
                                     double current_price);

} // namespace ind
