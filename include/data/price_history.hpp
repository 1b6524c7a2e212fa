#pragma once
#include <deque>
#include <cstddef>

namespace data {

// Egy szimbólum ár/mennyiség előzménye, fix kapacitással (FIFO kidobás).
class PriceHistory {
public:
    explicit PriceHistory(std::size_t capacity = 200) : capacity_(capacity) {}

    void push(double price, double volume) {
        prices_.push_back(price);
        volumes_.push_back(volume);
        while (prices_.size() > capacity_) { prices_.pop_front(); volumes_.pop_front(); }
    }

    const std::deque<double>& prices() const { return prices_; }
    const std::deque<double>& volumes() const { return volumes_; }
    std::size_t size() const { return prices_.size(); }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return prices_.empty(); }
    void clear() { prices_.clear(); volumes_.clear(); }

private:
    std::deque<double> prices_;
    std::deque<double> volumes_;
    std::size_t capacity_;
};

} // namespace data
