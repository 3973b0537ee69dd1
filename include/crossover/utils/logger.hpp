#pragma once
#include <string>
#include <sstream>
#include <mutex>

namespace crossover::utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    LOG_ERROR  // ERROR collides with a Windows macro
};

// Parses "debug", "info", "warn"/"warning" or "error" (case-insensitive).
// Throws std::invalid_argument for anything else.
LogLevel parse_log_level(const std::string& text);

class Logger {
public:
    struct EndlType {};
    inline static constexpr EndlType endl{};

    static Logger& debug();
    static Logger& info();
    static Logger& warn();
    static Logger& error();

    template<typename T>
    Logger& operator<<(const T& value) {
        if (enabled()) {
            stream_ << value;
        }
        return *this;
    }

    Logger& operator<<(const EndlType&);

    static void set_level(LogLevel level);

private:
    explicit Logger(LogLevel level);

    bool enabled() const { return level_ >= current_level_; }
    static Logger& reset(Logger& instance);

    LogLevel level_;
    std::stringstream stream_;

    static std::mutex console_mutex_;
    static LogLevel current_level_;
};

} // namespace crossover::utils
