#include "RandomSource.hpp"

#include <memory>
#include <random>

namespace PK {

auto makeRandomSource() -> RandomSource {
    std::random_device rd;
    return makeRandomSource((static_cast<std::uint64_t>(rd()) << 32U) | rd());
}

auto makeRandomSource(std::uint64_t seed) -> RandomSource {
    auto gen = std::make_shared<std::mt19937_64>(seed);
    return [gen]() -> std::uint64_t {
        std::uniform_int_distribution<std::uint32_t> dist;
        return dist(*gen);
    };
}

} // namespace PK
