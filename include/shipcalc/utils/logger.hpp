#pragma once
#include <string>
#include <sstream>
#include <ostream>
#include <mutex>

namespace shipcalc::utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    LOG_ERROR  // ERROR collides with a Windows macro
};

// Maps "DEBUG", "INFO", "WARN", "ERROR" (any case) to a level; anything else is INFO.
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
        stream_ << value;
        return *this;
    }

    Logger& operator<<(const EndlType&);

    static void set_level(LogLevel level);
    static LogLevel level();

    // Redirects output; nullptr restores std::cout.
    static void set_sink(std::ostream* sink);

private:
    explicit Logger(LogLevel level);

    static Logger& builder(LogLevel level);

    LogLevel level_;
    std::stringstream stream_;

    static std::mutex console_mutex_;
    static LogLevel current_level_;
    static std::ostream* sink_;
};

} // namespace shipcalc::utils
