#pragma once
#include <optional>
#include "crossover/core/market_data.hpp"
#include "crossover/core/price_window.hpp"
#include "crossover/core/session_policy.hpp"
#include "crossover/core/signal.hpp"

namespace crossover::core {

// Everything the engine remembers about one instrument.
struct InstrumentState {
    Instrument instrument;
    PriceWindow high_freq_window;
    PriceWindow low_freq_window;
    std::optional<SignalType> last_signal;  // empty until the first real signal

    InstrumentState(Instrument inst, size_t window_capacity);

    // LOW_FREQUENCY uses the low-frequency window, every other phase the
    // high-frequency one.
    PriceWindow& window_for(SessionPhase phase);
    const PriceWindow& window_for(SessionPhase phase) const;
};

} // namespace crossover::core
