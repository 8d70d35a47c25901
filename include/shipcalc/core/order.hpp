#pragma once

#include <optional>
#include <string>

namespace shipcalc::core {

struct Address {
    std::string contact_name;
    std::string city;
    std::string region;
    std::string country;
    std::string postal_code;

    Address() = default;
    explicit Address(std::string country_name);
};

// Shipment being costed. Cost is validated on construction.
struct Order {
    double cost;
    Address destination;
    std::optional<Address> origin;

    Order(double order_cost, Address dest);
    Order(double order_cost, Address dest, Address orig);
};

} // namespace shipcalc::core
