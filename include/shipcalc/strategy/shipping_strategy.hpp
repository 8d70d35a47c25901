// include/shipcalc/strategy/shipping_strategy.hpp
#pragma once
#include <memory>
#include <string>
#include "shipcalc/core/order.hpp"

namespace shipcalc {
namespace strategy {

class ShippingStrategy {
protected:
    std::string name_;

public:
    explicit ShippingStrategy(std::string name) : name_(std::move(name)) {}
    virtual ~ShippingStrategy() = default;

    // Shipping cost in the currency of order.cost
    virtual double calculate(const core::Order& order) const = 0;

    // Registry key and display name
    const std::string& name() const { return name_; }
};

using StrategyPtr = std::shared_ptr<ShippingStrategy>;

} // namespace strategy
} // namespace shipcalc
