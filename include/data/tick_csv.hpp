#pragma once
#include <string>
#include <vector>
#include "core/types.hpp"

namespace data {

// symbol,timestamp_ms,price,volume sorok; az első sor fejléc.
// A hibás sorokat kihagyja (warn), false ha a fájl nem nyitható vagy üres.
bool load_ticks_csv(const std::string& path, std::vector<core::Tick>& out);

// Egy sor feldolgozása; false hibás sornál.
bool parse_tick_line(const std::string& line, core::Tick& out);

} // namespace data
