// src/shipcalc/utils/random_source.cpp
#include "shipcalc/utils/random_source.hpp"

namespace shipcalc {
namespace utils {

MersenneRandomSource::MersenneRandomSource()
    : engine_(std::random_device{}()) {}

MersenneRandomSource::MersenneRandomSource(std::uint64_t seed)
    : engine_(seed) {}

double MersenneRandomSource::next_unit() {
    std::lock_guard<std::mutex> lock(mutex_);
    double value = distribution_(engine_);
    // Some standard libraries can round up to the upper bound
    while (value >= 1.0) {
        value = distribution_(engine_);
    }
    return value;
}

RandomSourcePtr default_random_source() {
    static RandomSourcePtr source = std::make_shared<MersenneRandomSource>();
    return source;
}

} // namespace utils
} // namespace shipcalc
