// include/crossover/io/signal_log.hpp
#pragma once
#include <fstream>
#include <memory>
#include <string>
#include "crossover/core/signal.hpp"
#include "crossover/utils/time_zone.hpp"

namespace crossover {
namespace io {

// Append-only sink for signal changes.
class SignalLog {
public:
    virtual ~SignalLog() = default;

    // Throws std::runtime_error if the record could not be stored.
    virtual void append(const core::SignalRecord& record) = 0;
};

using SignalLogPtr = std::shared_ptr<SignalLog>;

/**
 * @class CsvSignalLog
 * @brief Signal log file with header Timestamp,Ticker,Price,Short_MA,Long_MA,Signal
 *
 * The header is written when the file is missing or empty. Timestamps are
 * rendered in the market's zone, prices and averages with two decimals.
 */
class CsvSignalLog : public SignalLog {
public:
    static constexpr const char* HEADER = "Timestamp,Ticker,Price,Short_MA,Long_MA,Signal";

    // Throws std::runtime_error if the file cannot be opened for appending.
    CsvSignalLog(std::string path, utils::TimeZone zone);

    void append(const core::SignalRecord& record) override;

    // One CSV line without the trailing newline.
    std::string format_row(const core::SignalRecord& record) const;

private:
    std::string path_;
    utils::TimeZone zone_;
    std::ofstream out_;
};

} // namespace io
} // namespace crossover
