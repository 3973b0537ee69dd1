// include/crossover/core/clock.hpp
#pragma once
#include <chrono>
#include <functional>
#include <vector>
#include "crossover/core/market_data.hpp"
#include "crossover/utils/cancellation_token.hpp"

namespace crossover {
namespace core {

// Source of "now" and of blocking waits for the polling loop.
class Clock {
public:
    virtual ~Clock() = default;

    virtual Timestamp now() const = 0;

    // Waits for `duration`. Returns false if `token` was cancelled before or
    // during the wait.
    virtual bool sleep_for(std::chrono::milliseconds duration,
                           const utils::CancellationToken& token) = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override;
    bool sleep_for(std::chrono::milliseconds duration,
                   const utils::CancellationToken& token) override;
};

// Virtual time: sleep_for advances now() instantly and records the request.
class SimulatedClock : public Clock {
public:
    using SleepHook = std::function<void(Timestamp)>;

    explicit SimulatedClock(Timestamp start);

    Timestamp now() const override { return now_; }
    bool sleep_for(std::chrono::milliseconds duration,
                   const utils::CancellationToken& token) override;

    void set(Timestamp instant) { now_ = instant; }

    // Called with the new time after every sleep.
    void on_sleep(SleepHook hook) { hook_ = std::move(hook); }

    const std::vector<std::chrono::milliseconds>& sleeps() const { return sleeps_; }
    std::chrono::milliseconds total_slept() const;

private:
    Timestamp now_;
    SleepHook hook_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

} // namespace core
} // namespace crossover
