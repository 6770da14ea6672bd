#pragma once
#include <cstdint>
#include <functional>

namespace PK {

// Source of integers used to name temporary directories.
using RandomSource = std::function<std::uint64_t()>;

auto makeRandomSource() -> RandomSource;
auto makeRandomSource(std::uint64_t seed) -> RandomSource;

} // namespace PK
