#include "data/indicator_history.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <spdlog/spdlog.h>

namespace data {

const char* to_string(Direction d){
    switch (d) {
        case Direction::Up:   return "up";
        case Direction::Down: return "down";
        default:              return "neutral";
    }
}

namespace {
constexpr double kTrendPercent = 0.1;

inline std::int64_t cutoff(std::int64_t now_ms, double seconds_ago){
    return now_ms - static_cast<std::int64_t>(seconds_ago * 1000.0);
}
}

IndicatorHistory::IndicatorHistory(std::chrono::milliseconds horizon) : horizon_(horizon) {}

IndicatorHistory::~IndicatorHistory(){
    stop();
}

void IndicatorHistory::add_snapshot(const std::string& symbol, std::int64_t ts_ms, const ind::IndicatorSnapshot& s){
    std::lock_guard<std::mutex> lk(mtx_);
    auto& q = history_[symbol];
    q.push_back({ts_ms, s});
    purge_locked(q, ts_ms);
}

std::vector<TimedSnapshot> IndicatorHistory::history(const std::string& symbol) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = history_.find(symbol);
    if (it == history_.end()) return {};
    return {it->second.begin(), it->second.end()};
}

std::vector<TimedSnapshot> IndicatorHistory::range(const std::string& symbol, double seconds_ago,
                                                   std::int64_t now_ms) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<TimedSnapshot> out;
    auto it = history_.find(symbol);
    if (it == history_.end()) return out;
    const auto from = cutoff(now_ms, seconds_ago);
    for (const auto& s : it->second) if (s.timestamp_ms >= from) out.push_back(s);
    return out;
}

std::optional<TimedSnapshot> IndicatorHistory::latest(const std::string& symbol) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = history_.find(symbol);
    if (it == history_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
}

std::optional<TimedSnapshot> IndicatorHistory::closest_to(const std::string& symbol, double seconds_ago,
                                                          std::int64_t now_ms) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = history_.find(symbol);
    if (it == history_.end()) return std::nullopt;
    const auto target = cutoff(now_ms, seconds_ago);
    std::optional<TimedSnapshot> best;
    std::int64_t best_diff = std::numeric_limits<std::int64_t>::max();
    for (const auto& s : it->second) {
        const auto diff = std::llabs(s.timestamp_ms - target);
        if (diff < best_diff) { best_diff = diff; best = s; }
    }
    return best;
}

std::vector<double> IndicatorHistory::values_in_range(const std::string& symbol, ind::IndicatorField f,
                                                      double seconds_back, std::int64_t now_ms) const {
    std::vector<double> v;
    for (const auto& s : range(symbol, seconds_back, now_ms)) v.push_back(ind::field_value(s.values, f));
    return v;
}

IndicatorTrend IndicatorHistory::trend(const std::string& symbol, ind::IndicatorField f, double seconds_back,
                                       std::int64_t now_ms) const {
    const auto v = values_in_range(symbol, f, seconds_back, now_ms);
    if (v.size() < 2) return {};

    IndicatorTrend t;
    t.change = v.back() - v.front();
    t.change_percent = v.front() != 0.0 ? (t.change / std::abs(v.front())) * 100.0 : 0.0;
    if (std::abs(t.change_percent) > kTrendPercent)
        t.trend = t.change > 0 ? Direction::Up : Direction::Down;
    return t;
}

bool IndicatorHistory::is_stable(const std::string& symbol, ind::IndicatorField f, double seconds_back,
                                 double threshold_percent, std::int64_t now_ms) const {
    const auto v = values_in_range(symbol, f, seconds_back, now_ms);
    if (v.size() < 3) return false;
    double avg = 0.0;
    for (double x : v) avg += x;
    avg /= static_cast<double>(v.size());
    if (avg == 0.0)
        return std::all_of(v.begin(), v.end(), [](double x){ return x == 0.0; });
    return std::all_of(v.begin(), v.end(), [&](double x){
        return std::abs((x - avg) / avg) * 100.0 <= threshold_percent;
    });
}

IndicatorStats IndicatorHistory::stats(const std::string& symbol, ind::IndicatorField f, double seconds_back,
                                       std::int64_t now_ms) const {
    const auto v = values_in_range(symbol, f, seconds_back, now_ms);
    if (v.empty()) return {};

    IndicatorStats st;
    st.min = *std::min_element(v.begin(), v.end());
    st.max = *std::max_element(v.begin(), v.end());
    double sum = 0.0;
    for (double x : v) sum += x;
    st.avg = sum / static_cast<double>(v.size());
    st.current = v.back();
    double sq = 0.0;
    for (double x : v) sq += (x - st.avg) * (x - st.avg);
    st.volatility = std::sqrt(sq / static_cast<double>(v.size()));
    return st;
}

void IndicatorHistory::purge_locked(std::deque<TimedSnapshot>& q, std::int64_t now_ms){
    const auto from = now_ms - horizon_.count();
    while (!q.empty() && q.front().timestamp_ms < from) q.pop_front();
}

void IndicatorHistory::purge(std::int64_t now_ms){
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto it = history_.begin(); it != history_.end(); ) {
        purge_locked(it->second, now_ms);
        if (it->second.empty()) it = history_.erase(it);
        else ++it;
    }
}

void IndicatorHistory::clear(){
    std::lock_guard<std::mutex> lk(mtx_);
    history_.clear();
}

std::size_t IndicatorHistory::size(const std::string& symbol) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = history_.find(symbol);
    return it == history_.end() ? 0 : it->second.size();
}

void IndicatorHistory::start_cleanup(std::chrono::milliseconds interval){
    if (running_.exchange(true)) return;
    cleanup_thread_ = std::thread(&IndicatorHistory::cleanup_loop, this, interval);
}

void IndicatorHistory::stop(){
    {
        std::lock_guard<std::mutex> lk(cv_mtx_);
        if (!running_.exchange(false)) return;
    }
    cv_.notify_all();
    if (cleanup_thread_.joinable()) cleanup_thread_.join();
}

void IndicatorHistory::cleanup_loop(std::chrono::milliseconds interval){
    spdlog::debug("indicator history cleanup every {} ms", interval.count());
    while (running_.load()) {
        std::unique_lock<std::mutex> lk(cv_mtx_);
        cv_.wait_for(lk, interval, [this]{ return !running_.load(); });
        if (!running_.load()) break;
        lk.unlock();
        purge();
    }
}

} // namespace data
