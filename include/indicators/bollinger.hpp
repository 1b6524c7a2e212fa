#pragma once
#include <deque>
#include <cstddef>

namespace ind {

struct BB { double mid{}, upper{}, lower{}; };

// Kevés adatnál mindhárom sáv az utolsó árra esik össze.
BB compute_bb(const std::deque<double>& v, std::size_t p=20, double k=2.0);

} // namespace ind
