#pragma once

#include <cstdint>

#include "grid_graph.h"

std::uint64_t splitmix64(std::uint64_t x);

// Seeded total order over coordinates. Every equal-cost choice in the
// optimizer is resolved by comparing these keys.
class TieBreaker {
public:
    explicit TieBreaker(std::uint64_t seed);

    std::uint64_t key(const GridCoord& c) const;

private:
    std::uint64_t seed_;
};
