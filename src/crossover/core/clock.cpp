#include <crossover/core/clock.hpp>

namespace crossover::core {

Timestamp SystemClock::now() const {
    return std::chrono::system_clock::now();
}

bool SystemClock::sleep_for(std::chrono::milliseconds duration,
                            const utils::CancellationToken& token) {
    if (duration.count() <= 0) {
        return !token.is_cancelled();
    }
    return !token.wait_for(duration);
}

SimulatedClock::SimulatedClock(Timestamp start)
    : now_(start) {}

bool SimulatedClock::sleep_for(std::chrono::milliseconds duration,
                               const utils::CancellationToken& token) {
    if (token.is_cancelled()) {
        return false;
    }

    sleeps_.push_back(duration);
    if (duration.count() > 0) {
        now_ += duration;
    }

    if (hook_) {
        hook_(now_);
    }
    return !token.is_cancelled();
}

std::chrono::milliseconds SimulatedClock::total_slept() const {
    std::chrono::milliseconds total(0);
    for (const auto& d : sleeps_) {
        total += d;
    }
    return total;
}

} // namespace crossover::core
