#pragma once
#include <stdexcept>
#include <string>

namespace shipcalc::core {

// The registration table is unusable: empty, or a name registered twice.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

class StrategyNotFoundError : public std::runtime_error {
public:
    explicit StrategyNotFoundError(const std::string& name)
        : std::runtime_error("strategy not found: " + name), requested_name_(name) {}

    const std::string& requested_name() const { return requested_name_; }

private:
    std::string requested_name_;
};

} // namespace shipcalc::core
