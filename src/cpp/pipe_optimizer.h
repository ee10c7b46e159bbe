#pragma once

#include <cstdint>
#include <vector>

#include "grid_graph.h"
#include "pipe_solution.h"

struct OptimizerConfig {
    double junction_penalty = 1.25;
    std::uint64_t seed = 0xD15EA5E5ULL;
};

struct GridSettings {
    int rows = 20;
    int cols = 30;
    OptimizerConfig optimizer;
};

// Throws std::invalid_argument for a negative or non-finite penalty.
void validate_config(const OptimizerConfig& config);

// Consumers may repeat and may include the source; both are dropped before
// routing. Returns an empty solution when no consumer remains. Throws
// std::invalid_argument if the source or a consumer lies outside the grid.
PipeSolution optimize_pipes(
    const GridGraph& grid,
    const GridCoord& source,
    const std::vector<GridCoord>& consumers,
    const OptimizerConfig& config);

PipeSolution optimize_pipes(
    const GridSettings& settings,
    const GridCoord& source,
    const std::vector<GridCoord>& consumers);
