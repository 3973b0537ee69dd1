// include/crossover/strategy/moving_average_tracker.hpp
#pragma once
#include <cstddef>
#include "crossover/core/price_window.hpp"
#include "crossover/core/signal.hpp"

namespace crossover {
namespace strategy {

/**
 * @class MovingAverageTracker
 * @brief Short/long simple moving average crossover over a PriceWindow
 *
 * Holds only the two periods; all state lives in the window passed in, so a
 * single tracker serves every instrument and resolution.
 */
class MovingAverageTracker {
public:
    /**
     * @param short_period Number of newest prices in the fast average
     * @param long_period Number of prices in the slow average, also the window capacity
     * @throws std::invalid_argument if short_period is 0 or exceeds long_period
     */
    MovingAverageTracker(size_t short_period, size_t long_period);

    /**
     * @brief Push a price into the window and evaluate the crossover
     * @return PENDING with zero averages until the window holds long_period prices
     */
    core::CrossoverReading observe(core::PriceWindow& window, double price) const;

    // Evaluates the window as it stands.
    core::CrossoverReading evaluate(const core::PriceWindow& window) const;

    size_t short_period() const { return short_period_; }
    size_t long_period() const { return long_period_; }

private:
    size_t short_period_;
    size_t long_period_;
};

} // namespace strategy
} // namespace crossover
