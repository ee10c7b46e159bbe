#pragma once

#include <vector>

#include "grid_graph.h"
#include "tie_breaker.h"

struct TerminalEdge {
    int u;  // already in the tree when the edge was chosen
    int v;
    int weight;
};

// Dense Prim over the complete terminal graph, rooted at index 0.
std::vector<TerminalEdge> build_terminal_mst(
    const std::vector<GridCoord>& terminals,
    const TieBreaker& tie);

// Breadth-first visit order of the tree from index 0, source excluded.
std::vector<int> build_connection_order(
    const std::vector<GridCoord>& terminals,
    const std::vector<TerminalEdge>& mst,
    const TieBreaker& tie);
