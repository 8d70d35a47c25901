// include/shipcalc/strategy/carriers.hpp
#pragma once
#include "shipcalc/strategy/shipping_strategy.hpp"
#include "shipcalc/utils/random_source.hpp"

namespace shipcalc {
namespace strategy {

/**
 * @class UpsStrategy
 * @brief Flat share of the order cost
 */
class UpsStrategy : public ShippingStrategy {
public:
    static constexpr double SHIPPING_COST_RATIO = 0.3;

    UpsStrategy() : ShippingStrategy("UPS") {}

    double calculate(const core::Order& order) const override;
};

/**
 * @class FedExStrategy
 * @brief Divides the order cost; Russia and USA get the larger divisor
 *
 * Country names are compared exactly, so "russia" or "US" pay the standard rate.
 */
class FedExStrategy : public ShippingStrategy {
public:
    static constexpr double RUSSIA_AND_USA_DIVISOR = 7.0;
    static constexpr double OTHER_COUNTRIES_DIVISOR = 5.0;

    FedExStrategy() : ShippingStrategy("FedEx") {}

    double calculate(const core::Order& order) const override;
};

/**
 * @class EmsStrategy
 * @brief Random share of the order cost, redrawn on every call
 */
class EmsStrategy : public ShippingStrategy {
public:
    /**
     * @brief Constructor
     * @param random Source of the [0, 1) share; must not be null
     */
    explicit EmsStrategy(utils::RandomSourcePtr random);

    double calculate(const core::Order& order) const override;

private:
    utils::RandomSourcePtr random_;
};

} // namespace strategy
} // namespace shipcalc
