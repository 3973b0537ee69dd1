// tests/integration/engine_integration_test.cpp
#include <gtest/gtest.h>
#include "crossover/core/clock.hpp"
#include "crossover/core/engine.hpp"
#include "crossover/core/session_policy.hpp"
#include "crossover/utils/cancellation_token.hpp"
#include "crossover/utils/time_zone.hpp"
#include "support/test_doubles.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using crossover::core::EngineState;
using crossover::core::Resolution;
using crossover::core::SessionPhase;
using crossover::core::SignalType;
using crossover::feed::FetchResult;
using crossover::testing::trading_day;
using namespace std::chrono_literals;

// Engine wired to scripted quotes, an in-memory log and virtual time
class EngineIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = std::make_shared<crossover::testing::ScriptedQuoteSource>();
        log_ = std::make_shared<crossover::testing::MemorySignalLog>();
        clock_ = std::make_shared<crossover::core::SimulatedClock>(trading_day(9, 29));
    }

    std::unique_ptr<crossover::core::Engine> make_engine(const std::vector<std::string>& symbols) {
        crossover::core::EngineConfiguration config;
        for (const auto& s : symbols) {
            config.instruments.emplace_back(s, "NASDAQ");
        }
        config.retry = crossover::feed::RetryPolicy{3, 5000ms};

        crossover::core::SessionPolicy policy(crossover::core::SessionSchedule{},
                                              crossover::utils::TimeZone::utc());
        return std::make_unique<crossover::core::Engine>(config, policy, source_, log_, clock_);
    }

    // Quote stamped with the current virtual time
    crossover::core::PriceSample sample(const std::string& symbol, double price) const {
        return crossover::core::PriceSample(symbol, clock_->now(), price);
    }

    std::shared_ptr<crossover::testing::ScriptedQuoteSource> source_;
    std::shared_ptr<crossover::testing::MemorySignalLog> log_;
    std::shared_ptr<crossover::core::SimulatedClock> clock_;
    crossover::utils::CancellationToken token_;
};

// 1..15 on a cold window: fourteen pending ticks, then exactly one BUY record
TEST_F(EngineIntegrationTest, AscendingPricesProduceSingleBuy) {
    auto engine = make_engine({"TSLA"});
    clock_->set(trading_day(9, 30));

    std::vector<double> prices;
    for (int i = 1; i <= 15; ++i) {
        prices.push_back(static_cast<double>(i));
    }
    source_->script_prices("TSLA", prices);

    for (int i = 1; i <= 14; ++i) {
        EXPECT_EQ(engine->run_tick(SessionPhase::HIGH_FREQUENCY, token_), 0u);
    }
    EXPECT_TRUE(log_->records.empty());
    EXPECT_FALSE(engine->instrument("TSLA").last_signal.has_value());

    EXPECT_EQ(engine->run_tick(SessionPhase::HIGH_FREQUENCY, token_), 1u);

    ASSERT_EQ(log_->records.size(), 1u);
    const auto& record = log_->records[0];
    EXPECT_EQ(record.symbol, "TSLA");
    EXPECT_EQ(record.signal, SignalType::BUY);
    EXPECT_EQ(record.price, 15.0);
    EXPECT_EQ(record.short_ma, 13.0);
    EXPECT_EQ(record.long_ma, 8.0);
    EXPECT_EQ(record.timestamp, clock_->now());
    EXPECT_EQ(engine->instrument("TSLA").last_signal, SignalType::BUY);
}

// Only transitions are written
TEST_F(EngineIntegrationTest, RepeatedSignalIsNotRelogged) {
    auto engine = make_engine({"MSFT"});
    source_->set_fallback("MSFT", FetchResult::success(100.0));

    for (int i = 0; i < 30; ++i) {
        engine->run_tick(SessionPhase::HIGH_FREQUENCY, token_);
    }

    ASSERT_EQ(log_->records.size(), 1u);
    EXPECT_EQ(log_->records[0].signal, SignalType::HOLD);
    EXPECT_EQ(engine->stats().signals_emitted, 1u);
}

TEST_F(EngineIntegrationTest, TransitionsAreLoggedInOrder) {
    auto engine = make_engine({"NVDA"});
    auto& state = engine->instrument("NVDA");
    auto& window = state.high_freq_window;
    window.fill(100.0);

    EXPECT_TRUE(engine->process_quote(state, window, sample("NVDA", 100.0)).has_value());   // HOLD
    EXPECT_TRUE(engine->process_quote(state, window, sample("NVDA", 110.0)).has_value());   // BUY
    EXPECT_FALSE(engine->process_quote(state, window, sample("NVDA", 111.0)).has_value());  // still BUY
    EXPECT_TRUE(engine->process_quote(state, window, sample("NVDA", 50.0)).has_value());    // SELL

    ASSERT_EQ(log_->records.size(), 3u);
    EXPECT_EQ(log_->records[0].signal, SignalType::HOLD);
    EXPECT_EQ(log_->records[1].signal, SignalType::BUY);
    EXPECT_EQ(log_->records[2].signal, SignalType::SELL);
}

// A failing instrument neither aborts the tick nor touches its window
TEST_F(EngineIntegrationTest, FailureIsContainedToOneInstrument) {
    auto engine = make_engine({"TSLA", "MSFT", "NVDA"});
    source_->set_fallback("TSLA", FetchResult::success(250.0));
    source_->set_fallback("MSFT", FetchResult::unavailable("HTTP 500"));
    source_->throw_for("NVDA");

    engine->run_tick(SessionPhase::HIGH_FREQUENCY, token_);

    EXPECT_EQ(engine->instrument("TSLA").high_freq_window.size(), 1u);
    EXPECT_EQ(engine->instrument("MSFT").high_freq_window.size(), 0u);
    EXPECT_EQ(engine->instrument("NVDA").high_freq_window.size(), 0u);
    EXPECT_EQ(engine->stats().quotes, 1u);
    EXPECT_EQ(engine->stats().fetch_failures, 2u);

    // Fixed order, one call each, staggered between instruments
    ASSERT_EQ(source_->calls().size(), 3u);
    EXPECT_EQ(source_->calls()[0].symbol, "TSLA");
    EXPECT_EQ(source_->calls()[1].symbol, "MSFT");
    EXPECT_EQ(source_->calls()[2].symbol, "NVDA");
    EXPECT_EQ(clock_->sleeps(), (std::vector<std::chrono::milliseconds>{1000ms, 1000ms}));
}

// Always throttled: exactly retry_count calls, then the instrument is skipped
TEST_F(EngineIntegrationTest, RateLimitedInstrumentIsSkipped) {
    auto engine = make_engine({"PLTR", "TSLA"});
    source_->set_fallback("PLTR", FetchResult::rate_limited());
    source_->set_fallback("TSLA", FetchResult::success(250.0));

    engine->run_tick(SessionPhase::LOW_FREQUENCY, token_);

    EXPECT_EQ(source_->calls_for("PLTR"), 3u);
    EXPECT_EQ(source_->calls_for("TSLA"), 1u);
    EXPECT_TRUE(engine->instrument("PLTR").low_freq_window.empty());
    EXPECT_EQ(engine->instrument("TSLA").low_freq_window.size(), 1u);
    EXPECT_EQ(source_->calls().back().resolution, Resolution::MIN_15);
}

TEST_F(EngineIntegrationTest, PreloadFillsWindows) {
    auto engine = make_engine({"TSLA", "MSFT"});
    source_->script("TSLA", {FetchResult::success(250.0), FetchResult::success(251.0)});
    source_->script("MSFT", {FetchResult::rate_limited(), FetchResult::unavailable("timeout")});

    EXPECT_EQ(engine->preload(token_), 2u);

    const auto& tsla = engine->instrument("TSLA");
    EXPECT_TRUE(tsla.high_freq_window.full());
    EXPECT_TRUE(tsla.low_freq_window.full());
    EXPECT_EQ(tsla.high_freq_window.snapshot().front(), 250.0);
    EXPECT_EQ(tsla.low_freq_window.snapshot().back(), 251.0);

    const auto& msft = engine->instrument("MSFT");
    EXPECT_TRUE(msft.high_freq_window.empty());
    EXPECT_TRUE(msft.low_freq_window.empty());

    // No retries during preload, high frequency first, 1.5s after every call
    ASSERT_EQ(source_->calls().size(), 4u);
    EXPECT_EQ(source_->calls()[0].resolution, Resolution::MIN_1);
    EXPECT_EQ(source_->calls()[1].resolution, Resolution::MIN_15);
    EXPECT_EQ(clock_->sleeps().size(), 4u);
    EXPECT_EQ(clock_->total_slept(), 6000ms);
    EXPECT_EQ(engine->state(), EngineState::BOOTSTRAPPING);
}

// Pending readings never overwrite the last real signal
TEST_F(EngineIntegrationTest, PendingWindowKeepsLastSignal) {
    auto engine = make_engine({"TSLA"});
    auto& state = engine->instrument("TSLA");
    state.high_freq_window.fill(100.0);
    engine->process_quote(state, state.high_freq_window, sample("TSLA", 120.0));
    ASSERT_EQ(state.last_signal, SignalType::BUY);

    // Low-frequency window starts cold
    source_->set_fallback("TSLA", FetchResult::success(130.0));
    for (int i = 0; i < 14; ++i) {
        engine->run_tick(SessionPhase::LOW_FREQUENCY, token_);
        EXPECT_EQ(state.last_signal, SignalType::BUY);
    }
    EXPECT_EQ(log_->records.size(), 1u);

    // Full window of flat prices: genuine HOLD is a change
    engine->run_tick(SessionPhase::LOW_FREQUENCY, token_);
    ASSERT_EQ(log_->records.size(), 2u);
    EXPECT_EQ(log_->records[1].signal, SignalType::HOLD);
}

TEST_F(EngineIntegrationTest, LogFailureDoesNotStopTheLoop) {
    auto engine = make_engine({"TSLA", "MSFT"});
    source_->set_fallback("TSLA", FetchResult::success(10.0));
    source_->set_fallback("MSFT", FetchResult::success(20.0));
    engine->preload(token_);
    log_->set_failing(true);

    engine->run_tick(SessionPhase::HIGH_FREQUENCY, token_);

    EXPECT_EQ(engine->stats().signals_emitted, 2u);
    EXPECT_EQ(engine->stats().log_failures, 2u);
    EXPECT_EQ(engine->instrument("MSFT").last_signal, SignalType::HOLD);

    // Not re-announced once the sink recovers
    log_->set_failing(false);
    engine->run_tick(SessionPhase::HIGH_FREQUENCY, token_);
    EXPECT_TRUE(log_->records.empty());
}

TEST_F(EngineIntegrationTest, StepStateMachine) {
    auto engine = make_engine({"TSLA"});
    source_->set_fallback("TSLA", FetchResult::success(100.0));

    clock_->set(trading_day(8, 0));
    EXPECT_EQ(engine->step(token_), EngineState::WAITING_FOR_OPEN);
    EXPECT_EQ(clock_->now(), trading_day(9, 30));

    EXPECT_EQ(engine->step(token_), EngineState::POLLING_HIGH_FREQUENCY);
    EXPECT_EQ(clock_->now(), trading_day(9, 31));

    clock_->set(trading_day(10, 0));
    EXPECT_EQ(engine->step(token_), EngineState::POLLING_LOW_FREQUENCY);
    EXPECT_EQ(clock_->now(), trading_day(10, 10));

    clock_->set(trading_day(16, 0, 1));
    EXPECT_EQ(engine->step(token_), EngineState::STOPPED);
    EXPECT_EQ(source_->calls().size(), 2u);
}

// Whole trading day in virtual time
TEST_F(EngineIntegrationTest, FullSessionRun) {
    auto engine = make_engine({"TSLA"});
    source_->set_fallback("TSLA", FetchResult::success(100.0));

    engine->run(token_);

    EXPECT_EQ(engine->state(), EngineState::STOPPED);
    // 09:30..09:59 every minute, then 10:00..16:00 every ten minutes
    EXPECT_EQ(engine->stats().ticks, 30u + 37u);
    // Preloaded flat history: one HOLD for the whole day
    ASSERT_EQ(log_->records.size(), 1u);
    EXPECT_EQ(log_->records[0].signal, SignalType::HOLD);
    EXPECT_EQ(log_->records[0].timestamp, trading_day(9, 30));
    EXPECT_EQ(clock_->now(), trading_day(16, 10));
}

TEST_F(EngineIntegrationTest, CancellationStopsRun) {
    auto engine = make_engine({"TSLA"});
    source_->set_fallback("TSLA", FetchResult::success(100.0));
    clock_->on_sleep([this](crossover::core::Timestamp now) {
        if (now >= trading_day(11, 0)) {
            token_.cancel();
        }
    });

    engine->run(token_);

    EXPECT_EQ(engine->state(), EngineState::STOPPED);
    EXPECT_EQ(clock_->now(), trading_day(11, 0));
    EXPECT_LT(engine->stats().ticks, 67u);
}

TEST_F(EngineIntegrationTest, RunAfterCloseStopsImmediately) {
    auto engine = make_engine({"TSLA"});
    source_->set_fallback("TSLA", FetchResult::success(100.0));
    clock_->set(trading_day(17, 0));

    engine->run(token_);

    EXPECT_EQ(engine->state(), EngineState::STOPPED);
    EXPECT_EQ(engine->stats().ticks, 0u);
    EXPECT_TRUE(log_->records.empty());
}

TEST_F(EngineIntegrationTest, RejectsBadConfiguration) {
    crossover::core::SessionPolicy policy(crossover::core::SessionSchedule{},
                                          crossover::utils::TimeZone::utc());
    crossover::core::EngineConfiguration empty;
    EXPECT_THROW((crossover::core::Engine(empty, policy, source_, log_, clock_)), std::invalid_argument);

    crossover::core::EngineConfiguration duplicate;
    duplicate.instruments = {{"TSLA", "NASDAQ"}, {"TSLA", "NASDAQ"}};
    EXPECT_THROW((crossover::core::Engine(duplicate, policy, source_, log_, clock_)), std::invalid_argument);

    crossover::core::EngineConfiguration ok;
    ok.instruments = {{"TSLA", "NASDAQ"}};
    EXPECT_THROW((crossover::core::Engine(ok, policy, nullptr, log_, clock_)), std::invalid_argument);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
