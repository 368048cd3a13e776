#pragma once

/// @file random_source.hpp
/// @brief Injectable die source for every roll the core makes.

#include <cstdint>
#include <random>

namespace tcc::rules {

/// Produces uniformly distributed die faces.
///
/// Everything that rolls takes a RandomSource& so tests can script
/// exact faces and replays can reuse a seed.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// A face in [1, sides]. @p sides is always >= 1.
    virtual int32_t roll(int32_t sides) = 0;
};

/// Deterministic source backed by std::mt19937_64.
class SeededRandomSource final : public RandomSource {
public:
    /// Seeded from std::random_device.
    SeededRandomSource();

    explicit SeededRandomSource(uint64_t seed);

    int32_t roll(int32_t sides) override;

    void reseed(uint64_t seed) { engine_.seed(seed); }

private:
    std::mt19937_64 engine_;
};

} // namespace tcc::rules
