#pragma once
#include <cstddef>
#include <vector>
#include "crossover/utils/ring_buffer.hpp"

namespace crossover::core {

// Most recent prices of one instrument at one resolution.
class PriceWindow {
public:
    explicit PriceWindow(size_t capacity);

    void push(double price);

    // Replaces the contents with `capacity()` copies of `price`.
    void fill(double price);

    // Mean of the newest `count` prices; count must be in [1, size()].
    double mean_of_last(size_t count) const;

    // Oldest first.
    std::vector<double> snapshot() const;

    bool empty() const { return prices_.empty(); }
    bool full() const { return prices_.full(); }
    size_t size() const { return prices_.size(); }
    size_t capacity() const { return prices_.capacity(); }

private:
    utils::RingBuffer<double> prices_;
};

} // namespace crossover::core
