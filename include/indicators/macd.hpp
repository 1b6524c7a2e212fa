#pragma once
#include <deque>

namespace ind {

struct Macd {
    double line{0.0};    // EMA12 - EMA26
    double signal{0.0};  // fix 0.8 * line, nem valódi 9-es EMA
    double macd{0.0};    // hisztogram: line - signal
};

// 26 minta alatt csupa nulla.
Macd compute_macd(const std::deque<double>& closes);

} // namespace ind
