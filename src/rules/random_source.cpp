/// @file random_source.cpp
/// @brief Mersenne Twister random source.

#include "tcc/rules/random_source.hpp"

namespace tcc::rules {

SeededRandomSource::SeededRandomSource()
    : engine_(std::random_device{}()) {}

SeededRandomSource::SeededRandomSource(uint64_t seed)
    : engine_(seed) {}

int32_t SeededRandomSource::roll(int32_t sides) {
    if (sides <= 1) {
        return 1;
    }
    std::uniform_int_distribution<int32_t> dist(1, sides);
    return dist(engine_);
}

} // namespace tcc::rules
