#pragma once
#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include "sink/signal_sink.hpp"

namespace sink {

// Helyi jel-tár: soronként egy JSON objektum, hozzáfűzéssel.
class JsonlSignalSink final : public ISignalSink {
public:
    explicit JsonlSignalSink(std::string path);
    void publish(const strategy::Signal& s) override;
    const std::string& path() const { return path_; }
private:
    std::mutex mtx_;
    std::string path_;
    std::ofstream out_;
};

// Táblázat export sorformátum (fejléc + egy sor jelenként).
class CsvSignalSink final : public ISignalSink {
public:
    explicit CsvSignalSink(std::string path);
    void publish(const strategy::Signal& s) override;

    static const std::vector<std::string>& header();
    static std::vector<std::string> row(const strategy::Signal& s);
private:
    std::mutex mtx_;
    std::string path_;
    std::ofstream out_;
};

// Egy CSV mező idézőjelezése, ha kell.
std::string csv_escape(const std::string& field);

} // namespace sink
