#pragma once
#include <string>
#include <vector>
#include <functional>
#include <memory>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <unordered_map>
#include <optional>
#include <chrono>
#include <ixwebsocket/IXWebSocket.h>
#include "core/types.hpp"

namespace data {

struct StreamConfig {
    std::vector<std::string> symbols{"BTCUSDT", "ETHUSDT", "XRPUSDT", "SOLUSDT", "DOGEUSDT"};
    std::string base_url{"wss://fstream.binance.com/stream"};
    std::string channel{"kline_1m"};                  // vagy "ticker"
    int max_reconnect_attempts{5};
    std::chrono::milliseconds gap_warn{std::chrono::seconds(60)};
    std::chrono::milliseconds gap_check_interval{std::chrono::seconds(30)};
};

// wss://.../stream?streams=btcusdt@kline_1m/ethusdt@kline_1m
std::string build_stream_url(const StreamConfig& cfg);

// Egy kombinált stream frame ({stream, data}) -> Tick.
// Ticker: c = ár, v = mennyiség; kline: k.c / k.v. Az idő E, kline esetén k.T.
// `delay_ms` a beérkezés és a tőzsdei idő különbsége.
std::optional<core::Tick> parse_stream_frame(const std::string& text, std::int64_t receive_ms,
                                             std::int64_t* delay_ms = nullptr);

// Binance futures kombinált stream kliens. Csak tickeket ad tovább, a feldolgozást
// a hívó végzi. Kapcsolat bontásnál exponenciális várakozással (2^n s) újracsatlakozik.
class BinanceTickStream {
public:
    using TickCB = std::function<void(const core::Tick&)>;

    explicit BinanceTickStream(StreamConfig cfg);
    ~BinanceTickStream();

    void set_on_tick(TickCB cb);

    bool start();
    void stop();

    std::int64_t delay_ms(const std::string& symbol) const;
    bool connected() const { return connected_.load(); }

private:
    void connect();
    void on_message(const ix::WebSocketMessagePtr& msg);
    void request_reconnect();
    void monitor_loop();
    void check_gaps(std::int64_t now_ms);

    StreamConfig cfg_;
    std::unique_ptr<ix::WebSocket> ws_;
    std::thread monitor_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};

    mutable std::mutex mtx_;
    TickCB on_tick_;
    std::unordered_map<std::string, std::int64_t> delay_;
    std::unordered_map<std::string, std::int64_t> last_data_;

    std::mutex cv_mtx_;
    std::condition_variable cv_;
    bool reconnect_requested_{false};
    int reconnect_attempts_{0};
};

} // namespace data
