// src/crossover/strategy/moving_average_tracker.cpp
#include "crossover/strategy/moving_average_tracker.hpp"
#include <stdexcept>
#include <string>

namespace crossover {
namespace strategy {

MovingAverageTracker::MovingAverageTracker(size_t short_period, size_t long_period)
    : short_period_(short_period), long_period_(long_period) {
    if (short_period_ == 0) {
        throw std::invalid_argument("short_period must be positive");
    }
    if (short_period_ > long_period_) {
        throw std::invalid_argument("short_period (" + std::to_string(short_period_) +
                                    ") exceeds long_period (" + std::to_string(long_period_) + ")");
    }
}

core::CrossoverReading MovingAverageTracker::observe(core::PriceWindow& window, double price) const {
    window.push(price);
    return evaluate(window);
}

core::CrossoverReading MovingAverageTracker::evaluate(const core::PriceWindow& window) const {
    core::CrossoverReading reading;
    if (window.size() < long_period_) {
        return reading;
    }

    reading.short_ma = window.mean_of_last(short_period_);
    reading.long_ma = window.mean_of_last(long_period_);

    if (reading.short_ma > reading.long_ma) {
        reading.signal = core::SignalType::BUY;
    } else if (reading.short_ma < reading.long_ma) {
        reading.signal = core::SignalType::SELL;
    } else {
        reading.signal = core::SignalType::HOLD;
    }
    return reading;
}

} // namespace strategy
} // namespace crossover
