// include/crossover/core/settings.hpp
#pragma once
#include <chrono>
#include <string>
#include "crossover/core/engine.hpp"
#include "crossover/core/session_policy.hpp"
#include "crossover/utils/config.hpp"
#include "crossover/utils/logger.hpp"
#include "crossover/utils/time_zone.hpp"

namespace crossover {
namespace core {

// Typed, validated view of crossover.conf.
struct MonitorSettings {
    EngineConfiguration engine;
    SessionSchedule schedule;
    std::string timezone = "America/New_York";

    std::string log_file = "tradingview_signals.csv";
    std::string quote_endpoint = "tcp://127.0.0.1:5556";
    std::chrono::milliseconds request_timeout{5000};
    utils::LogLevel log_level = utils::LogLevel::INFO;

    // Missing keys keep their defaults. Throws std::invalid_argument for
    // values that do not parse or are inconsistent.
    static MonitorSettings from_config(const utils::Config& config);

    SessionPolicy make_policy() const;
};

} // namespace core
} // namespace crossover
