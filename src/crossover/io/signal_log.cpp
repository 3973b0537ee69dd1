// src/crossover/io/signal_log.cpp
#include "crossover/io/signal_log.hpp"
#include "crossover/utils/logger.hpp"
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace crossover {
namespace io {

namespace {

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

} // namespace

CsvSignalLog::CsvSignalLog(std::string path, utils::TimeZone zone)
    : path_(std::move(path)), zone_(std::move(zone)) {
    std::error_code ec;
    bool needs_header = !std::filesystem::exists(path_, ec) || std::filesystem::file_size(path_, ec) == 0;

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        throw std::runtime_error("cannot open signal log " + path_);
    }

    if (needs_header) {
        out_ << HEADER << '\n';
        out_.flush();
        utils::Logger::info() << "Created signal log " << path_ << utils::Logger::endl;
    }
}

std::string CsvSignalLog::format_row(const core::SignalRecord& record) const {
    std::ostringstream row;
    row << zone_.format(record.timestamp) << ','
        << csv_field(record.symbol) << ','
        << std::fixed << std::setprecision(2)
        << record.price << ','
        << record.short_ma << ','
        << record.long_ma << ','
        << core::to_string(record.signal);
    return row.str();
}

void CsvSignalLog::append(const core::SignalRecord& record) {
    if (record.signal == core::SignalType::PENDING) {
        throw std::invalid_argument("PENDING is not a loggable signal");
    }

    out_ << format_row(record) << '\n';
    out_.flush();
    if (!out_) {
        out_.clear();
        throw std::runtime_error("failed to write signal log " + path_);
    }
}

} // namespace io
} // namespace crossover
