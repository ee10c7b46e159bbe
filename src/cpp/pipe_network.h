#pragma once

#include <vector>

#include "grid_graph.h"

// Network grown during one optimization call. Per-cell arrays are indexed by
// GridGraph::id; an edge is stored on its smaller endpoint as a right or down
// link.
class PipeNetwork {
public:
    PipeNetwork(const GridGraph& grid, const GridCoord& source);

    bool has_node(int id) const;
    bool has_node(const GridCoord& c) const;
    bool has_edge(const GridEdge& e) const;
    int degree(int id) const;
    int degree(const GridCoord& c) const;

    // Cell ids currently in the network, ascending.
    std::vector<int> node_ids() const;
    // Edges in insertion order.
    const std::vector<GridEdge>& edges() const;

    // Returns the number of edges that were not already present.
    int add_path(const std::vector<GridCoord>& path);

private:
    // Id of the smaller endpoint, or -1 when e is not a grid edge. Sets
    // *horizontal to pick right_ over down_.
    int edge_slot(const GridEdge& e, bool* horizontal) const;

    const GridGraph* grid_;
    std::vector<char> nodes_;
    std::vector<int> degree_;
    std::vector<char> right_;
    std::vector<char> down_;
    std::vector<GridEdge> edges_;
};
