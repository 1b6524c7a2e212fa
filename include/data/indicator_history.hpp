#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "core/clock.hpp"
#include "indicators/snapshot.hpp"

namespace data {

struct TimedSnapshot {
    std::int64_t timestamp_ms{0};
    ind::IndicatorSnapshot values;
};

enum class Direction { Up, Down, Neutral };
const char* to_string(Direction d);

struct IndicatorTrend {
    Direction trend{Direction::Neutral};
    double change{0.0};
    double change_percent{0.0};
};

struct IndicatorStats {
    double min{0.0};
    double max{0.0};
    double avg{0.0};
    double current{0.0};
    double volatility{0.0};  // szórás
};

// Időbélyeges snapshotok szimbólumonként, `horizon` ideig megtartva.
// Csak olvasó lekérdezések diagnosztikához / UI-hoz.
class IndicatorHistory {
public:
    explicit IndicatorHistory(std::chrono::milliseconds horizon = std::chrono::seconds(60));
    ~IndicatorHistory();

    IndicatorHistory(const IndicatorHistory&) = delete;
    IndicatorHistory& operator=(const IndicatorHistory&) = delete;

    // A snapshot saját ideje számít "most"-nak a régi elemek kidobásánál.
    void add_snapshot(const std::string& symbol, std::int64_t ts_ms, const ind::IndicatorSnapshot& s);

    std::vector<TimedSnapshot> history(const std::string& symbol) const;
    std::vector<TimedSnapshot> range(const std::string& symbol, double seconds_ago,
                                     std::int64_t now_ms = core::wall_clock_ms()) const;
    std::optional<TimedSnapshot> latest(const std::string& symbol) const;
    std::optional<TimedSnapshot> closest_to(const std::string& symbol, double seconds_ago,
                                            std::int64_t now_ms = core::wall_clock_ms()) const;

    IndicatorTrend trend(const std::string& symbol, ind::IndicatorField f, double seconds_back = 30.0,
                         std::int64_t now_ms = core::wall_clock_ms()) const;
    bool is_stable(const std::string& symbol, ind::IndicatorField f, double seconds_back = 15.0,
                   double threshold_percent = 1.0, std::int64_t now_ms = core::wall_clock_ms()) const;
    IndicatorStats stats(const std::string& symbol, ind::IndicatorField f, double seconds_back = 60.0,
                         std::int64_t now_ms = core::wall_clock_ms()) const;

    void purge(std::int64_t now_ms = core::wall_clock_ms());
    void clear();
    std::size_t size(const std::string& symbol) const;

    // Háttérszál, ami `interval` időnként purge()-öt hív a falióra szerint.
    void start_cleanup(std::chrono::milliseconds interval = std::chrono::seconds(10));
    void stop();

private:
    std::vector<double> values_in_range(const std::string& symbol, ind::IndicatorField f,
                                        double seconds_back, std::int64_t now_ms) const;
    void purge_locked(std::deque<TimedSnapshot>& q, std::int64_t now_ms);
    void cleanup_loop(std::chrono::milliseconds interval);

    std::chrono::milliseconds horizon_;
    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::deque<TimedSnapshot>> history_;

    std::thread cleanup_thread_;
    std::atomic<bool> running_{false};
    std::mutex cv_mtx_;
    std::condition_variable cv_;
};

} // namespace data
