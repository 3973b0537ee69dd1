#include <crossover/utils/time_zone.hpp>
#include <date/date.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace crossover::utils {

namespace {

date::local_time<std::chrono::milliseconds> shift_to_local(TimeZone::TimePoint instant,
                                                           std::chrono::seconds offset) {
    auto utc = date::floor<std::chrono::milliseconds>(instant);
    return date::local_time<std::chrono::milliseconds>{utc.time_since_epoch() + offset};
}

} // namespace

TimeZone::TimeZone(std::string name, const date::time_zone* zone, std::chrono::minutes offset)
    : name_(std::move(name)), zone_(zone), offset_(offset) {}

TimeZone TimeZone::utc() {
    return TimeZone("UTC", nullptr, std::chrono::minutes(0));
}

TimeZone TimeZone::fixed(std::chrono::minutes offset) {
    auto total = offset.count();
    auto magnitude = total < 0 ? -total : total;

    std::ostringstream name;
    name << "UTC" << (total < 0 ? '-' : '+')
         << std::setfill('0') << std::setw(2) << magnitude / 60 << ':'
         << std::setw(2) << magnitude % 60;
    return TimeZone(name.str(), nullptr, offset);
}

TimeZone TimeZone::named(const std::string& iana_name) {
    if (iana_name.empty()) {
        throw std::invalid_argument("empty time zone name");
    }
    try {
        return TimeZone(iana_name, date::locate_zone(iana_name), std::chrono::minutes(0));
    } catch (const std::runtime_error& e) {
        throw std::invalid_argument("unknown time zone '" + iana_name + "': " + e.what());
    }
}

TimeZone TimeZone::parse(const std::string& text) {
    if (text == "UTC" || text == "GMT" || text == "Z") {
        return utc();
    }

    if (text.size() > 3 && text.compare(0, 3, "UTC") == 0) {
        char sign = text[3];
        int hours = 0;
        int minutes = 0;
        char colon = ':';
        std::istringstream iss(text.substr(4));
        if ((sign != '+' && sign != '-') || !(iss >> hours)) {
            throw std::invalid_argument("invalid UTC offset: " + text);
        }
        if (iss >> colon) {
            if (colon != ':' || !(iss >> minutes)) {
                throw std::invalid_argument("invalid UTC offset: " + text);
            }
        }
        if (hours < 0 || hours > 14 || minutes < 0 || minutes > 59) {
            throw std::invalid_argument("UTC offset out of range: " + text);
        }
        int total = hours * 60 + minutes;
        return fixed(std::chrono::minutes(sign == '-' ? -total : total));
    }

    return named(text);
}

std::chrono::seconds TimeZone::utc_offset(TimePoint instant) const {
    if (zone_ == nullptr) {
        return offset_;
    }
    return zone_->get_info(date::floor<std::chrono::seconds>(instant)).offset;
}

std::chrono::milliseconds TimeZone::time_of_day(TimePoint instant) const {
    auto local = shift_to_local(instant, utc_offset(instant));
    return local - date::floor<date::days>(local);
}

TimeZone::TimePoint TimeZone::at_time_of_day(TimePoint reference, std::chrono::milliseconds tod) const {
    auto local_midnight = date::floor<date::days>(shift_to_local(reference, utc_offset(reference)));
    auto target = local_midnight + tod;

    if (zone_ == nullptr) {
        return TimePoint(target.time_since_epoch() - offset_);
    }
    return zone_->to_sys(target, date::choose::earliest);
}

std::string TimeZone::format(TimePoint instant, const char* pattern) const {
    auto local = date::floor<std::chrono::seconds>(shift_to_local(instant, utc_offset(instant)));
    return date::format(pattern, local);
}

} // namespace crossover::utils
