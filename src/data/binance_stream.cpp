#include "data/binance_stream.hpp"
#include "core/clock.hpp"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace data {

namespace {
double to_d(const json& j, const char* k){
    if (!j.contains(k)) return 0.0;
    if (j[k].is_string()) return std::stod(j[k].get_ref<const std::string&>());
    if (j[k].is_number()) return j[k].get<double>();
    return 0.0;
}

std::string lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string upper(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    return s;
}
}

std::string build_stream_url(const StreamConfig& cfg){
    std::string url = cfg.base_url + "?streams=";
    for (std::size_t i=0; i<cfg.symbols.size(); ++i) {
        if (i) url.push_back('/');
        url += lower(cfg.symbols[i]) + "@" + cfg.channel;
    }
    return url;
}

std::optional<core::Tick> parse_stream_frame(const std::string& text, std::int64_t receive_ms,
                                             std::int64_t* delay_ms){
    const auto j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("stream") || !j.contains("data")) return std::nullopt;
    if (!j["stream"].is_string() || !j["data"].is_object()) return std::nullopt;

    const auto stream = j["stream"].get<std::string>();
    const auto at = stream.find('@');
    if (at == std::string::npos) return std::nullopt;
    const auto& d = j["data"];

    core::Tick t;
    t.symbol = upper(stream.substr(0, at));
    std::int64_t exch_ms = receive_ms;
    try {
        if (d.contains("k") && d["k"].is_object()) {
            const auto& k = d["k"];
            t.price  = to_d(k, "c");
            t.volume = to_d(k, "v");
            if (k.contains("T")) exch_ms = k["T"].get<std::int64_t>();
        } else {
            t.price  = to_d(d, "c");
            t.volume = to_d(d, "v");
        }
        if (d.contains("E")) exch_ms = d["E"].get<std::int64_t>();
    } catch (const std::exception& e) {
        spdlog::warn("stream frame for {} unreadable: {}", t.symbol, e.what());
        return std::nullopt;
    }
    if (t.price <= 0.0) return std::nullopt;

    t.timestamp_ms = exch_ms;
    if (delay_ms) *delay_ms = receive_ms - exch_ms;
    return t;
}

BinanceTickStream::BinanceTickStream(StreamConfig cfg) : cfg_(std::move(cfg)) {}

BinanceTickStream::~BinanceTickStream(){
    stop();
}

void BinanceTickStream::set_on_tick(TickCB cb){
    std::lock_guard<std::mutex> lk(mtx_);
    on_tick_ = std::move(cb);
}

std::int64_t BinanceTickStream::delay_ms(const std::string& symbol) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = delay_.find(symbol);
    return it == delay_.end() ? 0 : it->second;
}

void BinanceTickStream::on_message(const ix::WebSocketMessagePtr& msg){
    if (msg->type == ix::WebSocketMessageType::Message) {
        const auto now = core::wall_clock_ms();
        std::int64_t delay = 0;
        auto tick = parse_stream_frame(msg->str, now, &delay);
        if (!tick) {
            spdlog::warn("unparseable stream frame ({} bytes)", msg->str.size());
            return;
        }
        TickCB cb;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            delay_[tick->symbol] = delay;
            last_data_[tick->symbol] = now;
            cb = on_tick_;
        }
        if (cb) cb(*tick);
    } else if (msg->type == ix::WebSocketMessageType::Open) {
        spdlog::info("market stream connected: {}", msg->openInfo.uri);
        connected_.store(true);
        std::lock_guard<std::mutex> lk(cv_mtx_);
        reconnect_attempts_ = 0;
    } else if (msg->type == ix::WebSocketMessageType::Close) {
        spdlog::warn("market stream closed code={} reason={}", msg->closeInfo.code, msg->closeInfo.reason);
        connected_.store(false);
        request_reconnect();
    } else if (msg->type == ix::WebSocketMessageType::Error) {
        spdlog::error("market stream error: {}", msg->errorInfo.reason);
        connected_.store(false);
        request_reconnect();
    }
}

void BinanceTickStream::connect(){
    ws_ = std::make_unique<ix::WebSocket>();
    ws_->setUrl(build_stream_url(cfg_));
    ws_->disableAutomaticReconnection();
    ws_->disablePerMessageDeflate();
    ws_->setOnMessageCallback([this](const ix::WebSocketMessagePtr& msg){ on_message(msg); });
    ws_->start();
}

void BinanceTickStream::request_reconnect(){
    if (!running_.load()) return;
    {
        std::lock_guard<std::mutex> lk(cv_mtx_);
        reconnect_requested_ = true;
    }
    cv_.notify_all();
}

bool BinanceTickStream::start(){
    if (running_.exchange(true)) return true;
    if (cfg_.symbols.empty()) {
        spdlog::error("market stream: no symbols configured");
        running_.store(false);
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const auto now = core::wall_clock_ms();
        for (const auto& s : cfg_.symbols) last_data_[upper(s)] = now;
    }
    connect();
    monitor_thread_ = std::thread(&BinanceTickStream::monitor_loop, this);
    return true;
}

void BinanceTickStream::stop(){
    {
        std::lock_guard<std::mutex> lk(cv_mtx_);
        if (!running_.exchange(false)) return;
    }
    cv_.notify_all();
    if (monitor_thread_.joinable()) monitor_thread_.join();
    if (ws_) { ws_->stop(); ws_.reset(); }
    connected_.store(false);
}

void BinanceTickStream::check_gaps(std::int64_t now_ms){
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& [sym, last] : last_data_) {
        const auto gap = now_ms - last;
        if (gap > cfg_.gap_warn.count())
            spdlog::warn("no data received for {} in {}s - possible subscription gap", sym, gap / 1000);
    }
}

// Az újracsatlakozás és a gap figyelés ezen a szálon fut, nem az ix callbackben.
void BinanceTickStream::monitor_loop(){
    while (running_.load()) {
        std::unique_lock<std::mutex> lk(cv_mtx_);
        cv_.wait_for(lk, cfg_.gap_check_interval, [this]{ return !running_.load() || reconnect_requested_; });
        if (!running_.load()) break;

        if (!reconnect_requested_) {
            lk.unlock();
            check_gaps(core::wall_clock_ms());
            continue;
        }

        reconnect_requested_ = false;
        if (reconnect_attempts_ >= cfg_.max_reconnect_attempts) {
            spdlog::error("max reconnection attempts ({}) reached, market stream stays down",
                          cfg_.max_reconnect_attempts);
            continue;
        }
        ++reconnect_attempts_;
        const auto delay = std::chrono::seconds(1LL << reconnect_attempts_);
        spdlog::info("reconnecting in {}s... attempt {}/{}", delay.count(), reconnect_attempts_,
                     cfg_.max_reconnect_attempts);
        if (cv_.wait_for(lk, delay, [this]{ return !running_.load(); })) break;
        lk.unlock();

        ws_->stop();
        {
            std::lock_guard<std::mutex> g(cv_mtx_);
            reconnect_requested_ = false;  // a stop() saját Close eseménye
        }
        ws_->start();
    }
}

} // namespace data
