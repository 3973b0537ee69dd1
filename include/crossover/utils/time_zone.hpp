#pragma once
#include <chrono>
#include <string>
#include <date/tz.h>

namespace crossover::utils {

/**
 * @class TimeZone
 * @brief Maps UTC instants to the wall clock of the market's time zone
 *
 * Either a fixed offset ("UTC", "UTC-05:00") or an IANA zone name looked up
 * in the tz database ("America/New_York"). Named zones follow daylight
 * saving transitions.
 */
class TimeZone {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    static TimeZone utc();
    static TimeZone fixed(std::chrono::minutes offset);
    static TimeZone named(const std::string& iana_name);

    // Accepts "UTC", "UTC+HH:MM", "UTC-HH:MM" or an IANA name.
    // Throws std::invalid_argument if the zone cannot be resolved.
    static TimeZone parse(const std::string& text);

    const std::string& name() const { return name_; }

    std::chrono::seconds utc_offset(TimePoint instant) const;

    // Wall-clock time elapsed since local midnight.
    std::chrono::milliseconds time_of_day(TimePoint instant) const;

    // The instant at which the local date of `reference` reaches `tod`.
    // A wall time skipped by a DST jump resolves to the transition instant.
    TimePoint at_time_of_day(TimePoint reference, std::chrono::milliseconds tod) const;

    std::string format(TimePoint instant, const char* pattern = "%Y-%m-%d %H:%M:%S") const;

private:
    TimeZone(std::string name, const date::time_zone* zone, std::chrono::minutes offset);

    std::string name_;
    const date::time_zone* zone_;  // null for fixed offsets
    std::chrono::minutes offset_;
};

} // namespace crossover::utils
