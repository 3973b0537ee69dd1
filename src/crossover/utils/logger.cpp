#include <crossover/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace crossover::utils {

std::mutex Logger::console_mutex_;
LogLevel Logger::current_level_ = LogLevel::INFO;

LogLevel parse_log_level(const std::string& text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::LOG_ERROR;

    throw std::invalid_argument("unknown log level: " + text);
}

Logger::Logger(LogLevel level) : level_(level) {}

Logger& Logger::reset(Logger& instance) {
    instance.stream_.str("");
    instance.stream_.clear();
    return instance;
}

Logger& Logger::debug() {
    static thread_local Logger instance(LogLevel::DEBUG);
    return reset(instance);
}

Logger& Logger::info() {
    static thread_local Logger instance(LogLevel::INFO);
    return reset(instance);
}

Logger& Logger::warn() {
    static thread_local Logger instance(LogLevel::WARN);
    return reset(instance);
}

Logger& Logger::error() {
    static thread_local Logger instance(LogLevel::LOG_ERROR);
    return reset(instance);
}

Logger& Logger::operator<<(const EndlType&) {
    if (!enabled()) {
        return *this;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ).count() % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::stringstream time_str;
    time_str << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    time_str << '.' << std::setfill('0') << std::setw(3) << ms;

    std::lock_guard<std::mutex> lock(console_mutex_);

    std::cout << "[" << time_str.str() << "] ";

    switch (level_) {
        case LogLevel::DEBUG:
            std::cout << "[DEBUG] ";
            break;
        case LogLevel::INFO:
            std::cout << "[INFO] ";
            break;
        case LogLevel::WARN:
            std::cout << "[WARN] ";
            break;
        case LogLevel::LOG_ERROR:
            std::cout << "[ERROR] ";
            break;
    }

    std::cout << stream_.str() << std::endl;
    stream_.str("");

    return *this;
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
}

} // namespace crossover::utils
