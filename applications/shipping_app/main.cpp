// applications/shipping_app/main.cpp
#include "shipcalc/core/cost_comparison.hpp"
#include "shipcalc/core/order.hpp"
#include "shipcalc/strategy/strategy_registry.hpp"
#include "shipcalc/utils/config.hpp"
#include "shipcalc/utils/logger.hpp"
#include "shipcalc/utils/random_source.hpp"
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

// Digits only; a sign, a fraction or an out-of-range value is rejected
std::optional<std::uint64_t> parse_seed(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        auto config = shipcalc::utils::Config::instance();
        std::string config_file = argc > 1 ? argv[1] : "shipcalc.conf";
        if (!config->load_from_file(config_file)) {
            shipcalc::utils::Logger::warn() << "Failed to load configuration file "
                                            << config_file << ". Using defaults."
                                            << shipcalc::utils::Logger::endl;
        }

        shipcalc::utils::Logger::set_level(
            shipcalc::utils::parse_log_level(config->get("log_level", "INFO")));

        shipcalc::utils::RandomSourcePtr ems_random = shipcalc::utils::default_random_source();
        if (config->has("ems_seed")) {
            std::string seed_text = config->get("ems_seed", "");
            if (auto seed = parse_seed(seed_text)) {
                ems_random = std::make_shared<shipcalc::utils::MersenneRandomSource>(*seed);
            } else {
                shipcalc::utils::Logger::warn() << "ems_seed '" << seed_text
                                                << "' is not an unsigned integer; EMS stays unseeded"
                                                << shipcalc::utils::Logger::endl;
            }
        }

        shipcalc::core::Order order(
            config->get("order_cost", 1000.0),
            shipcalc::core::Address(config->get("destination_country", "Russia")));

        shipcalc::strategy::StrategyRegistry registry(ems_random);

        // Selected carrier first, then the full comparison
        std::string strategy_name = config->get("strategy", "FedEx");
        auto selected = registry.get(strategy_name);
        std::cout << shipcalc::core::format_quote({selected->name(), selected->calculate(order)})
                  << std::endl;

        auto quotes = shipcalc::core::compare_costs(registry.list_all(), order);
        for (const auto& quote : quotes) {
            std::cout << shipcalc::core::format_quote(quote) << std::endl;
        }

        if (auto best = shipcalc::core::cheapest(quotes)) {
            std::cout << "Cheapest carrier: " << best->carrier << std::endl;
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
