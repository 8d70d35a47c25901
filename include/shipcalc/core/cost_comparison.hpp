#pragma once

#include <optional>
#include <string>
#include <vector>
#include <shipcalc/core/order.hpp>
#include <shipcalc/strategy/shipping_strategy.hpp>

namespace shipcalc::core {

struct CostQuote {
    std::string carrier;
    double cost;
};

/**
 * @brief Price one order with every strategy given
 * @param strategies Strategies to run, in display order
 * @param order The order being shipped
 * @return One quote per strategy, same order as the input
 */
std::vector<CostQuote> compare_costs(const std::vector<strategy::StrategyPtr>& strategies,
                                     const Order& order);

/**
 * @brief Lowest quote; the earliest one wins a tie
 */
std::optional<CostQuote> cheapest(const std::vector<CostQuote>& quotes);

// "Shipping cost from {carrier} is: {cost}", cost with up to 15 significant digits.
std::string format_quote(const CostQuote& quote);

} // namespace shipcalc::core
