// include/crossover/core/session_policy.hpp
#pragma once
#include <chrono>
#include <string>
#include "crossover/core/market_data.hpp"
#include "crossover/utils/time_zone.hpp"

namespace crossover {
namespace core {

enum class SessionPhase {
    BEFORE_OPEN,
    HIGH_FREQUENCY,
    LOW_FREQUENCY,
    CLOSED
};

const char* to_string(SessionPhase phase);

// "HH:MM" or "HH:MM:SS" to an offset from local midnight.
// Throws std::invalid_argument on malformed or out-of-range input.
std::chrono::seconds parse_time_of_day(const std::string& text);

// Trading day layout, all times of day in the market's local zone.
struct SessionSchedule {
    std::chrono::seconds market_open = std::chrono::hours(9) + std::chrono::minutes(30);
    std::chrono::seconds market_close = std::chrono::hours(16);

    // Polling runs every high_freq_interval for the first high_freq_duration
    // after the open, then on the low_freq_grid wall-clock marks.
    std::chrono::minutes high_freq_duration{30};
    std::chrono::seconds high_freq_interval{60};
    std::chrono::minutes low_freq_grid{10};

    std::chrono::seconds low_freq_floor{5};
    std::chrono::seconds wait_floor{30};

    Resolution high_freq_resolution = Resolution::MIN_1;
    Resolution low_freq_resolution = Resolution::MIN_15;

    // Throws std::invalid_argument describing the first inconsistency.
    void validate() const;
};

/**
 * @class SessionPolicy
 * @brief Stateless mapping from an instant to the polling phase and cadence
 *
 * Phase boundaries: [open, open + high_freq_duration) is HIGH_FREQUENCY,
 * [open + high_freq_duration, close] is LOW_FREQUENCY, after close is CLOSED.
 */
class SessionPolicy {
public:
    SessionPolicy(SessionSchedule schedule, utils::TimeZone zone);

    SessionPhase phase(Timestamp now) const;

    /**
     * @brief How long to sleep before the next iteration
     *
     * BEFORE_OPEN: max(wait_floor, time until open)
     * HIGH_FREQUENCY: high_freq_interval
     * LOW_FREQUENCY: max(low_freq_floor, time until next_boundary)
     * CLOSED: zero
     */
    std::chrono::milliseconds next_tick(Timestamp now, SessionPhase phase) const;

    // First multiple of low_freq_grid on the local wall clock strictly after now.
    Timestamp next_boundary(Timestamp now) const;

    Resolution resolution_for(SessionPhase phase) const;

    // Open of the trading day `now` falls on.
    Timestamp market_open(Timestamp now) const;
    Timestamp market_close(Timestamp now) const;

    const SessionSchedule& schedule() const { return schedule_; }
    const utils::TimeZone& zone() const { return zone_; }

private:
    SessionSchedule schedule_;
    utils::TimeZone zone_;
};

} // namespace core
} // namespace crossover
