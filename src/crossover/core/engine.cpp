#include <crossover/core/engine.hpp>
#include <crossover/utils/logger.hpp>
#include <algorithm>
#include <exception>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace crossover::core {

namespace {

template<typename T>
T& require(const std::shared_ptr<T>& ptr, const char* what) {
    if (!ptr) {
        throw std::invalid_argument(std::string("engine needs a ") + what);
    }
    return *ptr;
}

} // namespace

const char* to_string(EngineState state) {
    switch (state) {
        case EngineState::BOOTSTRAPPING:
            return "BOOTSTRAPPING";
        case EngineState::WAITING_FOR_OPEN:
            return "WAITING_FOR_OPEN";
        case EngineState::POLLING_HIGH_FREQUENCY:
            return "POLLING_HIGH_FREQUENCY";
        case EngineState::POLLING_LOW_FREQUENCY:
            return "POLLING_LOW_FREQUENCY";
        case EngineState::STOPPED:
            return "STOPPED";
    }
    return "?";
}

Engine::Engine(EngineConfiguration config,
               SessionPolicy policy,
               feed::QuoteSourcePtr source,
               io::SignalLogPtr signal_log,
               std::shared_ptr<Clock> clock)
    : config_(std::move(config)),
      policy_(std::move(policy)),
      source_(std::move(source)),
      signal_log_(std::move(signal_log)),
      clock_(std::move(clock)),
      tracker_(config_.short_period, config_.long_period),
      fetcher_(require(source_, "quote source"), require(clock_, "clock"), config_.retry),
      preloader_(fetcher_, *clock_, config_.preload_delay) {
    require(signal_log_, "signal log");
    if (config_.instruments.empty()) {
        throw std::invalid_argument("engine needs at least one instrument");
    }

    table_.reserve(config_.instruments.size());
    for (const auto& instrument : config_.instruments) {
        auto duplicate = std::find_if(table_.begin(), table_.end(), [&](const InstrumentState& s) {
            return s.instrument.symbol == instrument.symbol;
        });
        if (duplicate != table_.end()) {
            throw std::invalid_argument("instrument listed twice: " + instrument.symbol);
        }
        table_.emplace_back(instrument, config_.long_period);
    }
}

void Engine::enter(EngineState state) {
    if (state_ != state) {
        utils::Logger::debug() << "Engine " << to_string(state_) << " -> " << to_string(state)
                               << utils::Logger::endl;
        state_ = state;
    }
}

InstrumentState& Engine::instrument(const std::string& symbol) {
    for (auto& state : table_) {
        if (state.instrument.symbol == symbol) {
            return state;
        }
    }
    throw std::out_of_range("unknown instrument: " + symbol);
}

const InstrumentState& Engine::instrument(const std::string& symbol) const {
    return const_cast<Engine*>(this)->instrument(symbol);
}

size_t Engine::preload(const utils::CancellationToken& token) {
    enter(EngineState::BOOTSTRAPPING);
    return preloader_.preload(table_,
                              policy_.schedule().high_freq_resolution,
                              policy_.schedule().low_freq_resolution,
                              token);
}

void Engine::run(const utils::CancellationToken& token) {
    preload(token);

    utils::Logger::info() << "Monitoring " << table_.size() << " instruments from "
                          << policy_.zone().format(policy_.market_open(clock_->now()), "%H:%M") << " to "
                          << policy_.zone().format(policy_.market_close(clock_->now()), "%H:%M") << " "
                          << policy_.zone().name() << utils::Logger::endl;

    while (step(token) != EngineState::STOPPED) {
    }

    utils::Logger::info() << "Engine stopped after " << stats_.ticks << " ticks, "
                          << stats_.signals_emitted << " signal changes" << utils::Logger::endl;
}

EngineState Engine::step(const utils::CancellationToken& token) {
    if (token.is_cancelled()) {
        utils::Logger::info() << "Monitoring cancelled." << utils::Logger::endl;
        enter(EngineState::STOPPED);
        return state_;
    }

    auto now = clock_->now();
    auto phase = policy_.phase(now);

    if (!last_phase_ || *last_phase_ != phase) {
        utils::Logger::info() << "Session phase " << to_string(phase) << " at "
                              << policy_.zone().format(now) << utils::Logger::endl;
        last_phase_ = phase;
    }

    switch (phase) {
        case SessionPhase::CLOSED:
            utils::Logger::info() << "Market closed. Monitoring ended." << utils::Logger::endl;
            enter(EngineState::STOPPED);
            return state_;

        case SessionPhase::BEFORE_OPEN: {
            enter(EngineState::WAITING_FOR_OPEN);
            auto wait = policy_.next_tick(now, phase);
            utils::Logger::info() << "Waiting for market open ("
                                  << std::chrono::duration_cast<std::chrono::seconds>(wait).count()
                                  << " seconds)..." << utils::Logger::endl;
            if (!clock_->sleep_for(wait, token)) {
                enter(EngineState::STOPPED);
            }
            return state_;
        }

        case SessionPhase::HIGH_FREQUENCY:
        case SessionPhase::LOW_FREQUENCY:
            enter(phase == SessionPhase::HIGH_FREQUENCY ? EngineState::POLLING_HIGH_FREQUENCY
                                                        : EngineState::POLLING_LOW_FREQUENCY);
            break;
    }

    run_tick(phase, token);

    auto wait = policy_.next_tick(clock_->now(), phase);
    utils::Logger::debug() << "Next tick in " << wait.count() << "ms" << utils::Logger::endl;
    if (token.is_cancelled() || !clock_->sleep_for(wait, token)) {
        enter(EngineState::STOPPED);
    }
    return state_;
}

size_t Engine::run_tick(SessionPhase phase, const utils::CancellationToken& token) {
    auto resolution = policy_.resolution_for(phase);
    size_t emitted = 0;
    ++stats_.ticks;

    for (size_t i = 0; i < table_.size(); ++i) {
        if (token.is_cancelled()) {
            break;
        }

        auto& state = table_[i];
        auto result = fetcher_.fetch(state.instrument, resolution, token);

        if (result.ok()) {
            ++stats_.quotes;
            PriceSample sample(state.instrument.symbol, clock_->now(), result.price);
            if (process_quote(state, state.window_for(phase), sample)) {
                ++emitted;
            }
        } else {
            ++stats_.fetch_failures;
            utils::Logger::debug() << state.instrument.symbol << ": tick skipped ("
                                   << feed::to_string(result.status) << ")" << utils::Logger::endl;
        }

        // Stagger requests to stay under the upstream rate limit
        if (i + 1 < table_.size() && !clock_->sleep_for(config_.instrument_delay, token)) {
            break;
        }
    }

    return emitted;
}

std::optional<SignalRecord> Engine::process_quote(InstrumentState& state, PriceWindow& window,
                                                  const PriceSample& sample) {
    auto reading = tracker_.observe(window, sample.price);

    if (reading.is_pending()) {
        utils::Logger::debug() << state.instrument.symbol << ": collecting history ("
                               << window.size() << "/" << tracker_.long_period() << ")"
                               << utils::Logger::endl;
        return std::nullopt;
    }
    if (state.last_signal && *state.last_signal == reading.signal) {
        return std::nullopt;
    }

    SignalRecord record(sample.timestamp, sample.symbol, sample.price, reading);
    emit(state, record);
    return record;
}

bool Engine::emit(InstrumentState& state, const SignalRecord& record) {
    std::ostringstream line;
    line << policy_.zone().format(record.timestamp) << " | " << record.symbol
         << std::fixed << std::setprecision(2)
         << " | " << record.price
         << " | Short MA: " << record.short_ma
         << " | Long MA: " << record.long_ma
         << " | " << to_string(record.signal);
    utils::Logger::info() << line.str() << utils::Logger::endl;

    // The change counts as emitted even if persisting fails, so it is not
    // re-announced on every following tick.
    state.last_signal = record.signal;
    ++stats_.signals_emitted;

    try {
        signal_log_->append(record);
    } catch (const std::exception& e) {
        ++stats_.log_failures;
        utils::Logger::error() << "Failed to persist " << record.symbol << " signal: " << e.what()
                               << utils::Logger::endl;
        return false;
    }
    return true;
}

} // namespace crossover::core
