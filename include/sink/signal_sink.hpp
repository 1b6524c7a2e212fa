#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include "strategy/signal.hpp"

namespace sink {

// Jel fogadó interfész (tárolás, export, UI). A pipeline egyszer adja át a jelet,
// nem próbálkozik újra; a hibákat az implementáció naplózza.
class ISignalSink {
public:
    virtual ~ISignalSink() = default;
    virtual void publish(const strategy::Signal& s) = 0;
};

// Több sink felé továbbít, sorrendben.
class FanoutSignalSink final : public ISignalSink {
public:
    void add(std::unique_ptr<ISignalSink> s);
    std::size_t size() const { return sinks_.size(); }
    void publish(const strategy::Signal& s) override;
private:
    std::vector<std::unique_ptr<ISignalSink>> sinks_;
};

class CallbackSignalSink final : public ISignalSink {
public:
    using Callback = std::function<void(const strategy::Signal&)>;
    explicit CallbackSignalSink(Callback cb) : cb_(std::move(cb)) {}
    void publish(const strategy::Signal& s) override;
private:
    std::mutex mtx_;
    Callback cb_;
};

// Naplóba írja a jeleket (spdlog info).
class LogSignalSink final : public ISignalSink {
public:
    void publish(const strategy::Signal& s) override;
};

} // namespace sink
