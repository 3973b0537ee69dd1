#pragma once
#include <string>
#include <ostream>
#include "crossover/core/market_data.hpp"

namespace crossover::core {

enum class SignalType {
    BUY,
    SELL,
    HOLD,
    PENDING  // window not full yet; never persisted
};

// "BUY", "SELL", "HOLD", "PENDING"
const char* to_string(SignalType type);
std::ostream& operator<<(std::ostream& os, SignalType type);

// Output of one moving-average observation.
struct CrossoverReading {
    SignalType signal = SignalType::PENDING;
    double short_ma = 0.0;
    double long_ma = 0.0;

    bool is_pending() const { return signal == SignalType::PENDING; }
};

// One row of the signal log, written only when an instrument's signal changes.
struct SignalRecord {
    Timestamp timestamp;
    std::string symbol;
    double price = 0.0;
    double short_ma = 0.0;
    double long_ma = 0.0;
    SignalType signal = SignalType::HOLD;

    SignalRecord() = default;
    SignalRecord(Timestamp ts, const std::string& sym, double p, const CrossoverReading& reading);
};

} // namespace crossover::core
