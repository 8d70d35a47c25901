#include <shipcalc/core/cost_comparison.hpp>
#include <shipcalc/utils/logger.hpp>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace shipcalc::core {

std::vector<CostQuote> compare_costs(const std::vector<strategy::StrategyPtr>& strategies,
                                     const Order& order) {
    std::vector<CostQuote> quotes;
    quotes.reserve(strategies.size());

    for (const auto& strategy : strategies) {
        if (!strategy) {
            throw std::invalid_argument("compare_costs received a null strategy");
        }
        quotes.push_back(CostQuote{strategy->name(), strategy->calculate(order)});
        utils::Logger::debug() << "Quoted " << quotes.back().carrier << ": "
                               << quotes.back().cost << utils::Logger::endl;
    }

    return quotes;
}

std::optional<CostQuote> cheapest(const std::vector<CostQuote>& quotes) {
    if (quotes.empty()) {
        return std::nullopt;
    }

    const CostQuote* best = &quotes.front();
    for (const auto& quote : quotes) {
        if (quote.cost < best->cost) {
            best = &quote;
        }
    }
    return *best;
}

std::string format_quote(const CostQuote& quote) {
    std::ostringstream oss;
    oss << "Shipping cost from " << quote.carrier << " is: "
        << std::setprecision(15) << quote.cost;
    return oss.str();
}

} // namespace shipcalc::core
