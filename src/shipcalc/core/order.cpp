#include <shipcalc/core/order.hpp>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace shipcalc::core {

namespace {

double checked_cost(double cost) {
    if (!std::isfinite(cost) || cost < 0.0) {
        throw std::invalid_argument("order cost must be a finite, non-negative number");
    }
    return cost;
}

} // namespace

Address::Address(std::string country_name)
    : country(std::move(country_name)) {}

Order::Order(double order_cost, Address dest)
    : cost(checked_cost(order_cost)), destination(std::move(dest)) {}

Order::Order(double order_cost, Address dest, Address orig)
    : cost(checked_cost(order_cost)), destination(std::move(dest)), origin(std::move(orig)) {}

} // namespace shipcalc::core
