// src/crossover/core/settings.cpp
#include "crossover/core/settings.hpp"
#include <sstream>
#include <stdexcept>

namespace crossover {
namespace core {

namespace {

// Config::get<T> falls back to the default on garbage; a typo in a numeric
// key should fail loudly instead.
long long get_integer(const utils::Config& config, const std::string& key, long long default_value,
                      long long min_value) {
    if (!config.contains(key)) {
        return default_value;
    }

    std::string raw = config.get(key, std::string());
    std::istringstream iss(raw);
    long long value = 0;
    char trailing = 0;
    if (!(iss >> value) || (iss >> trailing)) {
        throw std::invalid_argument("config key '" + key + "' expects an integer, got '" + raw + "'");
    }
    if (value < min_value) {
        throw std::invalid_argument("config key '" + key + "' must be at least " +
                                    std::to_string(min_value) + ", got " + raw);
    }
    return value;
}

} // namespace

MonitorSettings MonitorSettings::from_config(const utils::Config& config) {
    MonitorSettings settings;

    auto tickers = config.get_list("tickers", {"TSLA", "MSFT", "NVDA", "PLTR"});
    if (tickers.empty()) {
        throw std::invalid_argument("config key 'tickers' lists no instruments");
    }
    std::string exchange = config.get("exchange", "NASDAQ");
    std::string screener = config.get("screener", "america");
    for (const auto& ticker : tickers) {
        settings.engine.instruments.emplace_back(ticker, exchange, screener);
    }

    settings.engine.short_period = static_cast<size_t>(get_integer(config, "short_period", 5, 1));
    settings.engine.long_period = static_cast<size_t>(get_integer(config, "long_period", 15, 1));
    if (settings.engine.short_period > settings.engine.long_period) {
        throw std::invalid_argument("short_period must not exceed long_period");
    }

    settings.engine.retry.max_attempts = static_cast<int>(get_integer(config, "retry_count", 3, 1));
    settings.engine.retry.delay = std::chrono::seconds(get_integer(config, "retry_delay_seconds", 5, 0));
    settings.engine.instrument_delay = std::chrono::milliseconds(get_integer(config, "instrument_delay_ms", 1000, 0));
    settings.engine.preload_delay = std::chrono::milliseconds(get_integer(config, "preload_delay_ms", 1500, 0));

    auto& schedule = settings.schedule;
    schedule.market_open = parse_time_of_day(config.get("market_open", "09:30"));
    schedule.market_close = parse_time_of_day(config.get("market_close", "16:00"));
    schedule.high_freq_interval = std::chrono::seconds(get_integer(config, "high_freq_interval_seconds", 60, 1));
    schedule.high_freq_duration = std::chrono::minutes(get_integer(config, "high_freq_duration_minutes", 30, 0));
    schedule.low_freq_grid = std::chrono::minutes(get_integer(config, "low_freq_grid_minutes", 10, 1));
    schedule.low_freq_floor = std::chrono::seconds(get_integer(config, "low_freq_floor_seconds", 5, 0));
    schedule.wait_floor = std::chrono::seconds(get_integer(config, "wait_floor_seconds", 30, 0));
    schedule.high_freq_resolution = parse_resolution(config.get("high_freq_resolution", "1m"));
    schedule.low_freq_resolution = parse_resolution(config.get("low_freq_resolution", "15m"));
    schedule.validate();

    settings.timezone = config.get("timezone", settings.timezone);
    settings.log_file = config.get("log_file", settings.log_file);
    settings.quote_endpoint = config.get("quote_endpoint", settings.quote_endpoint);
    settings.request_timeout = std::chrono::milliseconds(get_integer(config, "request_timeout_ms", 5000, 1));
    settings.log_level = utils::parse_log_level(config.get("log_level", "info"));

    if (settings.log_file.empty()) {
        throw std::invalid_argument("config key 'log_file' is empty");
    }

    return settings;
}

SessionPolicy MonitorSettings::make_policy() const {
    return SessionPolicy(schedule, utils::TimeZone::parse(timezone));
}

} // namespace core
} // namespace crossover
