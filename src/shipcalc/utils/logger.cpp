#include <shipcalc/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace shipcalc::utils {

std::mutex Logger::console_mutex_;
LogLevel Logger::current_level_ = LogLevel::INFO;
std::ostream* Logger::sink_ = nullptr;

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:
            return "[DEBUG] ";
        case LogLevel::INFO:
            return "[INFO] ";
        case LogLevel::WARN:
            return "[WARN] ";
        case LogLevel::LOG_ERROR:
            return "[ERROR] ";
    }
    return "";
}

} // namespace

LogLevel parse_log_level(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::LOG_ERROR;
    return LogLevel::INFO;
}

Logger::Logger(LogLevel level) : level_(level) {}

Logger& Logger::builder(LogLevel level) {
    // One builder per level per thread, so interleaved messages never share a buffer
    static thread_local Logger debug_instance(LogLevel::DEBUG);
    static thread_local Logger info_instance(LogLevel::INFO);
    static thread_local Logger warn_instance(LogLevel::WARN);
    static thread_local Logger error_instance(LogLevel::LOG_ERROR);

    Logger* instance = &info_instance;
    switch (level) {
        case LogLevel::DEBUG: instance = &debug_instance; break;
        case LogLevel::INFO: instance = &info_instance; break;
        case LogLevel::WARN: instance = &warn_instance; break;
        case LogLevel::LOG_ERROR: instance = &error_instance; break;
    }
    instance->stream_.str("");
    instance->stream_.clear();
    return *instance;
}

Logger& Logger::debug() { return builder(LogLevel::DEBUG); }
Logger& Logger::info() { return builder(LogLevel::INFO); }
Logger& Logger::warn() { return builder(LogLevel::WARN); }
Logger& Logger::error() { return builder(LogLevel::LOG_ERROR); }

Logger& Logger::operator<<(const EndlType&) {
    std::lock_guard<std::mutex> lock(console_mutex_);
    if (level_ < current_level_) {
        return *this;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ).count() % 1000;

    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &time);
#else
    localtime_r(&time, &local_tm);
#endif

    std::ostream& out = sink_ ? *sink_ : std::cout;
    out << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms << std::setfill(' ') << "] "
        << level_tag(level_) << stream_.str() << std::endl;

    return *this;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(console_mutex_);
    current_level_ = level;
}

LogLevel Logger::level() {
    std::lock_guard<std::mutex> lock(console_mutex_);
    return current_level_;
}

void Logger::set_sink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(console_mutex_);
    sink_ = sink;
}

} // namespace shipcalc::utils
