#pragma once

#include <cstdint>
#include <vector>

#include "grid_graph.h"
#include "pipe_network.h"
#include "tie_breaker.h"

// Label-setting search from a detached terminal to the closest cell of the
// network. A step over an existing network edge is free; a new edge costs
// 1 plus junction_penalty for each endpoint it would lift from degree 2 to 3.
class AttachmentRouter {
public:
    AttachmentRouter(const GridGraph& grid, const TieBreaker& tie, double junction_penalty);

    // Path from start to a network cell, start first. A start that is
    // already on the network yields {start}.
    std::vector<GridCoord> route(const PipeNetwork& network, const GridCoord& start);

    // True if the last route() returned the L-shaped fallback.
    bool used_fallback() const;

    GridCoord nearest_node(const PipeNetwork& network, const GridCoord& start) const;
    std::vector<GridCoord> fallback_path(const GridCoord& start, const GridCoord& target) const;

private:
    void reset(int start_id);
    int select_next() const;
    bool better_label(int lhs, int rhs) const;
    double step_cost(const PipeNetwork& network, int from, int to) const;
    void relax(const PipeNetwork& network, int from, int to);

    const GridGraph& grid_;
    TieBreaker tie_;
    double junction_penalty_;
    std::vector<std::uint64_t> keys_;

    std::vector<double> cost_;
    std::vector<int> steps_;
    std::vector<int> pred_;
    std::vector<char> visited_;
    bool used_fallback_;
};
