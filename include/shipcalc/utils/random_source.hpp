// include/shipcalc/utils/random_source.hpp
#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>

namespace shipcalc {
namespace utils {

/**
 * @class RandomSource
 * @brief Supplier of uniform values in [0, 1)
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Draw the next value
     * @return A value in the half-open range [0, 1)
     */
    virtual double next_unit() = 0;
};

using RandomSourcePtr = std::shared_ptr<RandomSource>;

/**
 * @class MersenneRandomSource
 * @brief mt19937_64 backed source, safe to share between threads
 *
 * A seeded instance replays the same sequence, which is what tests rely on.
 */
class MersenneRandomSource : public RandomSource {
public:
    /**
     * @brief Seed from std::random_device
     */
    MersenneRandomSource();

    /**
     * @brief Seed explicitly for a reproducible sequence
     * @param seed Engine seed
     */
    explicit MersenneRandomSource(std::uint64_t seed);

    double next_unit() override;

private:
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> distribution_{0.0, 1.0};
    std::mutex mutex_;
};

// Process-wide source seeded from std::random_device.
RandomSourcePtr default_random_source();

} // namespace utils
} // namespace shipcalc
