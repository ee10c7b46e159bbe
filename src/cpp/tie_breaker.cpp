#include "tie_breaker.h"

namespace {

constexpr std::uint64_t kRowMultiplier = 0x9E3779B185EBCA87ULL;
constexpr std::uint64_t kColMultiplier = 0xC2B2AE3D27D4EB4FULL;

std::uint64_t widen(int v) {
    return static_cast<std::uint64_t>(static_cast<std::int64_t>(v));
}

}  // namespace

std::uint64_t splitmix64(std::uint64_t x) {
    std::uint64_t z = x + 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

TieBreaker::TieBreaker(std::uint64_t seed)
    : seed_(seed) {}

std::uint64_t TieBreaker::key(const GridCoord& c) const {
    std::uint64_t value = seed_;
    value ^= widen(c.row) * kRowMultiplier;
    value ^= widen(c.col) * kColMultiplier;
    return splitmix64(value);
}
