#pragma once
#include <shipcalc/strategy/shipping_strategy.hpp>
#include <shipcalc/utils/random_source.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace shipcalc::strategy {

// Name -> creator table, fixed at construction. Every lookup builds a new instance.
class StrategyRegistry {
public:
    using StrategyCreator = std::function<StrategyPtr()>;

    struct Registration {
        std::string name;
        StrategyCreator create;
    };

    // Registration keyed by the name the strategy reports for itself
    template<typename T, typename... Args>
    static Registration make_registration(Args... args) {
        StrategyCreator creator = [args...]() -> StrategyPtr {
            return std::make_shared<T>(args...);
        };
        std::string name = creator()->name();
        return Registration{std::move(name), std::move(creator)};
    }

    // UPS, FedEx and EMS in that order
    static std::vector<Registration> builtin_registrations(utils::RandomSourcePtr ems_random);

    StrategyRegistry();
    explicit StrategyRegistry(utils::RandomSourcePtr ems_random);
    explicit StrategyRegistry(std::vector<Registration> registrations);

    // Throws core::StrategyNotFoundError for an unknown name
    StrategyPtr get(const std::string& name) const;

    // Throws core::ConfigurationError when nothing is registered
    std::vector<StrategyPtr> list_all() const;

    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;
    std::size_t size() const { return registrations_.size(); }

private:
    std::vector<Registration> registrations_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace shipcalc::strategy
