#include <shipcalc/strategy/strategy_registry.hpp>
#include <shipcalc/strategy/carriers.hpp>
#include <shipcalc/core/errors.hpp>
#include <shipcalc/utils/logger.hpp>
#include <utility>

namespace shipcalc::strategy {

std::vector<StrategyRegistry::Registration>
StrategyRegistry::builtin_registrations(utils::RandomSourcePtr ems_random) {
    std::vector<Registration> registrations;
    registrations.push_back(make_registration<UpsStrategy>());
    registrations.push_back(make_registration<FedExStrategy>());
    registrations.push_back(make_registration<EmsStrategy>(std::move(ems_random)));
    return registrations;
}

StrategyRegistry::StrategyRegistry()
    : StrategyRegistry(utils::default_random_source()) {}

StrategyRegistry::StrategyRegistry(utils::RandomSourcePtr ems_random)
    : StrategyRegistry(builtin_registrations(std::move(ems_random))) {}

StrategyRegistry::StrategyRegistry(std::vector<Registration> registrations) {
    registrations_.reserve(registrations.size());

    for (auto& registration : registrations) {
        if (!registration.create) {
            throw core::ConfigurationError("strategy registration without a creator: "
                                           + registration.name);
        }
        if (index_.count(registration.name) != 0) {
            throw core::ConfigurationError("duplicate strategy registration: "
                                           + registration.name);
        }

        // The key must be the name the created strategy reports
        StrategyPtr sample = registration.create();
        if (!sample) {
            throw core::ConfigurationError("strategy creator returned null: "
                                           + registration.name);
        }
        if (sample->name() != registration.name) {
            throw core::ConfigurationError("strategy registered as '" + registration.name
                                           + "' reports name '" + sample->name() + "'");
        }

        index_.emplace(registration.name, registrations_.size());
        utils::Logger::debug() << "Registered strategy: " << registration.name
                               << utils::Logger::endl;
        registrations_.push_back(std::move(registration));
    }

    if (registrations_.empty()) {
        utils::Logger::warn() << "Strategy registry initialized with no strategies"
                              << utils::Logger::endl;
    } else {
        utils::Logger::info() << "Strategy registry ready with " << registrations_.size()
                              << " strategies" << utils::Logger::endl;
    }
}

StrategyPtr StrategyRegistry::get(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        utils::Logger::warn() << "Strategy '" << name << "' not found" << utils::Logger::endl;
        throw core::StrategyNotFoundError(name);
    }
    return registrations_[it->second].create();
}

std::vector<StrategyPtr> StrategyRegistry::list_all() const {
    if (registrations_.empty()) {
        utils::Logger::error() << "No strategies registered" << utils::Logger::endl;
        throw core::ConfigurationError("no strategies registered");
    }

    std::vector<StrategyPtr> strategies;
    strategies.reserve(registrations_.size());
    for (const auto& registration : registrations_) {
        strategies.push_back(registration.create());
    }
    return strategies;
}

bool StrategyRegistry::contains(const std::string& name) const {
    return index_.find(name) != index_.end();
}

std::vector<std::string> StrategyRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(registrations_.size());
    for (const auto& registration : registrations_) {
        result.push_back(registration.name);
    }
    return result;
}

} // namespace shipcalc::strategy
