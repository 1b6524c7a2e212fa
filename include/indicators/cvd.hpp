#pragma once
#include <deque>
#include <cstddef>
#include "core/types.hpp"

namespace ind {

// Kumulatív volumen delta sorozat egy szimbólumhoz.
// value[i] = value[i-1] +volume[i] ha az ár nőtt, -volume[i] ha csökkent, különben változatlan.
// Az első frissítés a teljes elérhető előzményt visszatölti (n minta -> n-1 pont),
// utána minden frissítés pontosan egy pontot fűz a végére.
class CvdSeries {
public:
    explicit CvdSeries(std::size_t max_len = 100) : max_len_(max_len) {}

    // Visszaadja a legutóbbi CVD értéket; 2 minta alatt 0 és nem tárol semmit.
    double update(const std::deque<double>& prices, const std::deque<double>& volumes);

    double slope(std::size_t lookback = 5) const;
    core::CvdTrend trend(std::size_t lookback = 10) const;

    double last() const { return values_.empty()? 0.0 : values_.back(); }
    const std::deque<double>& values() const { return values_; }
    std::size_t size() const { return values_.size(); }
    std::size_t max_len() const { return max_len_; }
    void reset() { values_.clear(); }

private:
    void trim();

    std::deque<double> values_;
    std::size_t max_len_;
};

// Teljes visszatöltés a megadott előzményből (hossz: min(árak, mennyiségek) - 1).
std::deque<double> compute_cvd(const std::deque<double>& prices, const std::deque<double>& volumes);

// Legkisebb négyzetes meredekség az utolsó lookback+1 ponton (x = index).
double compute_cvd_slope(const std::deque<double>& cvd, std::size_t lookback = 5);

// Az utolsó `lookback` pont első és utolsó értékének relatív változása, +-10% küszöbbel.
core::CvdTrend compute_cvd_trend(const std::deque<double>& cvd, std::size_t lookback = 10);

} // namespace ind
