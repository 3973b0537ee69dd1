// src/crossover/core/session_policy.cpp
#include "crossover/core/session_policy.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace crossover {
namespace core {

namespace {

constexpr std::chrono::hours kDay(24);

} // namespace

const char* to_string(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::BEFORE_OPEN:
            return "BEFORE_OPEN";
        case SessionPhase::HIGH_FREQUENCY:
            return "HIGH_FREQUENCY";
        case SessionPhase::LOW_FREQUENCY:
            return "LOW_FREQUENCY";
        case SessionPhase::CLOSED:
            return "CLOSED";
    }
    return "?";
}

std::chrono::seconds parse_time_of_day(const std::string& text) {
    int hours = -1;
    int minutes = -1;
    int seconds = 0;
    char sep1 = 0;
    char sep2 = ':';
    char trailing = 0;

    std::istringstream iss(text);
    if (!(iss >> hours >> sep1 >> minutes) || sep1 != ':') {
        throw std::invalid_argument("invalid time of day '" + text + "', expected HH:MM");
    }
    if (iss >> sep2) {
        if (sep2 != ':' || !(iss >> seconds)) {
            throw std::invalid_argument("invalid time of day '" + text + "', expected HH:MM:SS");
        }
    }
    if (iss >> trailing) {
        throw std::invalid_argument("trailing characters in time of day '" + text + "'");
    }
    if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59 || seconds < 0 || seconds > 59) {
        throw std::invalid_argument("time of day out of range: " + text);
    }

    return std::chrono::hours(hours) + std::chrono::minutes(minutes) + std::chrono::seconds(seconds);
}

void SessionSchedule::validate() const {
    if (market_open < std::chrono::seconds(0) || market_close >= kDay) {
        throw std::invalid_argument("market open/close must lie within one day");
    }
    if (market_close <= market_open) {
        throw std::invalid_argument("market_close must be after market_open");
    }
    if (high_freq_duration < std::chrono::minutes(0)) {
        throw std::invalid_argument("high_freq_duration must not be negative");
    }
    if (high_freq_interval <= std::chrono::seconds(0)) {
        throw std::invalid_argument("high_freq_interval must be positive");
    }
    if (low_freq_grid <= std::chrono::minutes(0)) {
        throw std::invalid_argument("low_freq_grid must be positive");
    }
    if (low_freq_floor < std::chrono::seconds(0) || wait_floor < std::chrono::seconds(0)) {
        throw std::invalid_argument("sleep floors must not be negative");
    }
}

SessionPolicy::SessionPolicy(SessionSchedule schedule, utils::TimeZone zone)
    : schedule_(schedule), zone_(std::move(zone)) {
    schedule_.validate();
}

SessionPhase SessionPolicy::phase(Timestamp now) const {
    auto tod = zone_.time_of_day(now);
    auto high_freq_end = schedule_.market_open + schedule_.high_freq_duration;

    if (tod < schedule_.market_open) {
        return SessionPhase::BEFORE_OPEN;
    }
    if (tod < high_freq_end) {
        return SessionPhase::HIGH_FREQUENCY;
    }
    if (tod <= schedule_.market_close) {
        return SessionPhase::LOW_FREQUENCY;
    }
    return SessionPhase::CLOSED;
}

std::chrono::milliseconds SessionPolicy::next_tick(Timestamp now, SessionPhase phase) const {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    switch (phase) {
        case SessionPhase::BEFORE_OPEN: {
            auto until_open = duration_cast<milliseconds>(market_open(now) - now);
            return std::max<milliseconds>(schedule_.wait_floor, until_open);
        }
        case SessionPhase::HIGH_FREQUENCY:
            return schedule_.high_freq_interval;
        case SessionPhase::LOW_FREQUENCY: {
            auto until_boundary = duration_cast<milliseconds>(next_boundary(now) - now);
            return std::max<milliseconds>(schedule_.low_freq_floor, until_boundary);
        }
        case SessionPhase::CLOSED:
            break;
    }
    return milliseconds(0);
}

Timestamp SessionPolicy::next_boundary(Timestamp now) const {
    auto tod = zone_.time_of_day(now);
    auto grid = std::chrono::duration_cast<std::chrono::milliseconds>(schedule_.low_freq_grid);

    // Strictly after now, even when now sits exactly on a mark.
    auto next = (tod / grid + 1) * grid;
    return now + (next - tod);
}

Resolution SessionPolicy::resolution_for(SessionPhase phase) const {
    return phase == SessionPhase::LOW_FREQUENCY ? schedule_.low_freq_resolution
                                                : schedule_.high_freq_resolution;
}

Timestamp SessionPolicy::market_open(Timestamp now) const {
    return zone_.at_time_of_day(now, schedule_.market_open);
}

Timestamp SessionPolicy::market_close(Timestamp now) const {
    return zone_.at_time_of_day(now, schedule_.market_close);
}

} // namespace core
} // namespace crossover
