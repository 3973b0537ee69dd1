#include <crossover/core/market_data.hpp>
#include <stdexcept>

namespace crossover::core {

namespace {

struct ResolutionName {
    Resolution resolution;
    const char* text;
};

constexpr ResolutionName kResolutionNames[] = {
    {Resolution::MIN_1, "1m"},
    {Resolution::MIN_5, "5m"},
    {Resolution::MIN_15, "15m"},
    {Resolution::MIN_30, "30m"},
    {Resolution::HOUR_1, "1h"},
    {Resolution::HOUR_2, "2h"},
    {Resolution::HOUR_4, "4h"},
    {Resolution::DAY_1, "1d"},
    {Resolution::WEEK_1, "1W"},
    {Resolution::MONTH_1, "1M"},
};

} // namespace

const char* to_string(Resolution resolution) {
    for (const auto& entry : kResolutionNames) {
        if (entry.resolution == resolution) {
            return entry.text;
        }
    }
    return "?";
}

Resolution parse_resolution(const std::string& text) {
    for (const auto& entry : kResolutionNames) {
        if (text == entry.text) {
            return entry.resolution;
        }
    }
    throw std::invalid_argument("unknown resolution: " + text);
}

std::ostream& operator<<(std::ostream& os, Resolution resolution) {
    return os << to_string(resolution);
}

Instrument::Instrument(std::string sym, std::string exch, std::string scr)
    : symbol(std::move(sym)), exchange(std::move(exch)), screener(std::move(scr)) {}

PriceSample::PriceSample()
    : price(0.0) {}

PriceSample::PriceSample(const std::string& sym, Timestamp ts, double p)
    : symbol(sym), timestamp(ts), price(p) {}

} // namespace crossover::core
