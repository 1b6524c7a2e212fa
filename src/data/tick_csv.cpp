#include "data/tick_csv.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace data {

bool parse_tick_line(const std::string& line, core::Tick& t){
    std::stringstream ss(line);
    std::string x;
    try {
        if (!std::getline(ss,x,',') || x.empty()) return false; t.symbol = x;
        if (!std::getline(ss,x,',')) return false; t.timestamp_ms = std::stoll(x);
        if (!std::getline(ss,x,',')) return false; t.price = std::stod(x);
        if (!std::getline(ss,x,',')) return false; t.volume = std::stod(x);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

bool load_ticks_csv(const std::string& path, std::vector<core::Tick>& out){
    std::ifstream f(path);
    if (!f.good()) {
        spdlog::error("cannot open tick file {}", path);
        return false;
    }
    std::string line;
    std::getline(f, line);  // fejléc
    std::size_t lineno = 1, skipped = 0;
    while (std::getline(f, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        core::Tick t;
        if (!parse_tick_line(line, t)) {
            spdlog::warn("{}:{}: malformed tick row skipped", path, lineno);
            ++skipped;
            continue;
        }
        out.push_back(std::move(t));
    }
    if (skipped) spdlog::warn("{}: {} malformed rows skipped", path, skipped);
    return !out.empty();
}

} // namespace data
