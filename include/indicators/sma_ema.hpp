#pragma once
#include <deque>
#include <cstddef>

namespace ind {

double compute_sma(const std::deque<double>& v, std::size_t p);
double compute_ema(const std::deque<double>& v, std::size_t p);

// A stratégiák által használt EMA család (5, 8, 13, 20, 21, 34, 50)
struct EmaSet {
    double ema5{}, ema8{}, ema13{}, ema20{}, ema21{}, ema34{}, ema50{};
};
EmaSet compute_ema_set(const std::deque<double>& v);

} // namespace ind
