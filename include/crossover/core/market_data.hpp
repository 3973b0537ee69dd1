#pragma once
#include <string>
#include <chrono>
#include <ostream>

namespace crossover::core {

using Timestamp = std::chrono::system_clock::time_point;

// Bar interval a quote is sampled at.
enum class Resolution {
    MIN_1,
    MIN_5,
    MIN_15,
    MIN_30,
    HOUR_1,
    HOUR_2,
    HOUR_4,
    DAY_1,
    WEEK_1,
    MONTH_1
};

// "1m", "5m", "15m", "30m", "1h", "2h", "4h", "1d", "1W", "1M"
const char* to_string(Resolution resolution);

// Throws std::invalid_argument for unknown text.
Resolution parse_resolution(const std::string& text);

std::ostream& operator<<(std::ostream& os, Resolution resolution);

struct Instrument {
    std::string symbol;
    std::string exchange;
    std::string screener;

    Instrument() = default;
    Instrument(std::string sym, std::string exch, std::string scr = "america");
};

struct PriceSample {
    std::string symbol;
    Timestamp timestamp;
    double price;

    PriceSample();
    PriceSample(const std::string& sym, Timestamp ts, double p);
};

} // namespace crossover::core
