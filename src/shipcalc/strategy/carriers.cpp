// src/shipcalc/strategy/carriers.cpp
#include "shipcalc/strategy/carriers.hpp"
#include <stdexcept>
#include <utility>

namespace shipcalc {
namespace strategy {

double UpsStrategy::calculate(const core::Order& order) const {
    return order.cost * SHIPPING_COST_RATIO;
}

double FedExStrategy::calculate(const core::Order& order) const {
    const std::string& country = order.destination.country;
    if (country == "Russia" || country == "USA") {
        return order.cost / RUSSIA_AND_USA_DIVISOR;
    }
    return order.cost / OTHER_COUNTRIES_DIVISOR;
}

EmsStrategy::EmsStrategy(utils::RandomSourcePtr random)
    : ShippingStrategy("EMS"), random_(std::move(random)) {
    if (!random_) {
        throw std::invalid_argument("EMS strategy requires a random source");
    }
}

double EmsStrategy::calculate(const core::Order& order) const {
    return random_->next_unit() * order.cost;
}

} // namespace strategy
} // namespace shipcalc
