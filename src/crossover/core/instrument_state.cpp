#include <crossover/core/instrument_state.hpp>

namespace crossover::core {

InstrumentState::InstrumentState(Instrument inst, size_t window_capacity)
    : instrument(std::move(inst)),
      high_freq_window(window_capacity),
      low_freq_window(window_capacity) {}

PriceWindow& InstrumentState::window_for(SessionPhase phase) {
    return phase == SessionPhase::LOW_FREQUENCY ? low_freq_window : high_freq_window;
}

const PriceWindow& InstrumentState::window_for(SessionPhase phase) const {
    return phase == SessionPhase::LOW_FREQUENCY ? low_freq_window : high_freq_window;
}

} // namespace crossover::core
