// include/crossover/core/engine.hpp
#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "crossover/core/clock.hpp"
#include "crossover/core/instrument_state.hpp"
#include "crossover/core/market_data.hpp"
#include "crossover/core/preloader.hpp"
#include "crossover/core/session_policy.hpp"
#include "crossover/core/signal.hpp"
#include "crossover/feed/quote_fetcher.hpp"
#include "crossover/feed/quote_source.hpp"
#include "crossover/io/signal_log.hpp"
#include "crossover/strategy/moving_average_tracker.hpp"
#include "crossover/utils/cancellation_token.hpp"

namespace crossover {
namespace core {

// Engine configuration structure
struct EngineConfiguration {
    // Polled in this order every tick
    std::vector<Instrument> instruments;

    // Moving averages
    size_t short_period = 5;
    size_t long_period = 15;

    // Fetching
    feed::RetryPolicy retry;
    std::chrono::milliseconds instrument_delay{1000};
    std::chrono::milliseconds preload_delay{1500};
};

enum class EngineState {
    BOOTSTRAPPING,
    WAITING_FOR_OPEN,
    POLLING_HIGH_FREQUENCY,
    POLLING_LOW_FREQUENCY,
    STOPPED
};

const char* to_string(EngineState state);

struct EngineStats {
    size_t ticks = 0;
    size_t quotes = 0;
    size_t fetch_failures = 0;
    size_t signals_emitted = 0;
    size_t log_failures = 0;
};

/**
 * @class Engine
 * @brief Session-driven polling loop turning quotes into logged signal changes
 *
 * Single-threaded. Every iteration asks the SessionPolicy for the phase,
 * sweeps all instruments when the market is open, and sleeps through the
 * Clock until the next tick. Reaching the CLOSED phase or cancelling the
 * token stops the loop.
 */
class Engine {
private:
    EngineConfiguration config_;
    SessionPolicy policy_;

    // Collaborators
    feed::QuoteSourcePtr source_;
    io::SignalLogPtr signal_log_;
    std::shared_ptr<Clock> clock_;

    strategy::MovingAverageTracker tracker_;
    feed::QuoteFetcher fetcher_;
    Preloader preloader_;

    std::vector<InstrumentState> table_;
    EngineState state_ = EngineState::BOOTSTRAPPING;
    std::optional<SessionPhase> last_phase_;
    EngineStats stats_;

    void enter(EngineState state);
    bool emit(InstrumentState& state, const SignalRecord& record);

public:
    Engine(EngineConfiguration config,
           SessionPolicy policy,
           feed::QuoteSourcePtr source,
           io::SignalLogPtr signal_log,
           std::shared_ptr<Clock> clock);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Preload, then loop until CLOSED or cancellation.
    void run(const utils::CancellationToken& token);

    // Warm every window from the quote source.
    size_t preload(const utils::CancellationToken& token);

    // One loop iteration: wait, sweep-and-wait, or stop. Returns the new state.
    EngineState step(const utils::CancellationToken& token);

    // Fetch and evaluate every instrument once at the phase's resolution.
    // Returns the number of signal records emitted.
    size_t run_tick(SessionPhase phase, const utils::CancellationToken& token);

    // Feed one sample into the window; returns the record if the signal changed.
    std::optional<SignalRecord> process_quote(InstrumentState& state, PriceWindow& window,
                                              const PriceSample& sample);

    EngineState state() const { return state_; }
    const EngineStats& stats() const { return stats_; }

    // Throws std::out_of_range for an unknown symbol.
    InstrumentState& instrument(const std::string& symbol);
    const InstrumentState& instrument(const std::string& symbol) const;
};

} // namespace core
} // namespace crossover
