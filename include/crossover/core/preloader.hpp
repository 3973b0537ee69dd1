// include/crossover/core/preloader.hpp
#pragma once
#include <chrono>
#include <vector>
#include "crossover/core/clock.hpp"
#include "crossover/core/instrument_state.hpp"
#include "crossover/feed/quote_fetcher.hpp"
#include "crossover/utils/cancellation_token.hpp"

namespace crossover {
namespace core {

/**
 * @class Preloader
 * @brief Warms the price windows before live polling starts
 *
 * One un-retried fetch per instrument and resolution (high frequency first).
 * A successful fetch fills the window with copies of the price so averages
 * exist immediately; a failed one leaves the window empty to fill from live
 * ticks. Every call is followed by `delay` to spread the startup burst.
 */
class Preloader {
public:
    Preloader(feed::QuoteFetcher& fetcher, Clock& clock, std::chrono::milliseconds delay);

    // Returns the number of windows filled.
    size_t preload(std::vector<InstrumentState>& table,
                   Resolution high_freq_resolution,
                   Resolution low_freq_resolution,
                   const utils::CancellationToken& token);

private:
    bool preload_window(InstrumentState& state, PriceWindow& window, Resolution resolution);

    feed::QuoteFetcher& fetcher_;
    Clock& clock_;
    std::chrono::milliseconds delay_;
};

} // namespace core
} // namespace crossover
