#include "crossover/core/signal.hpp"

namespace crossover::core {

const char* to_string(SignalType type) {
    switch (type) {
        case SignalType::BUY:
            return "BUY";
        case SignalType::SELL:
            return "SELL";
        case SignalType::HOLD:
            return "HOLD";
        case SignalType::PENDING:
            return "PENDING";
    }
    return "?";
}

std::ostream& operator<<(std::ostream& os, SignalType type) {
    return os << to_string(type);
}

SignalRecord::SignalRecord(Timestamp ts, const std::string& sym, double p, const CrossoverReading& reading)
    : timestamp(ts), symbol(sym), price(p),
      short_ma(reading.short_ma), long_ma(reading.long_ma), signal(reading.signal) {}

} // namespace crossover::core
