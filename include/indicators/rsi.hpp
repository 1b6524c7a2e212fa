#pragma once
#include <deque>
#include <cstddef>

namespace ind {

// RSI az utolsó `period` változásból; kevés adatnál semleges 50,
// nulla átlagos veszteségnél 100.
double compute_rsi(const std::deque<double>& closes, std::size_t period = 14);

} // namespace ind
