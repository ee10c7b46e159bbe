#pragma once

#include <map>
#include <set>
#include <vector>

#include "grid_graph.h"

using DirectionSet = std::set<Direction>;
using ConnectionMap = std::map<GridCoord, DirectionSet>;

struct PipeMetrics {
    int total_length = 0;
    int junction_count = 0;
};

bool operator==(const PipeMetrics& a, const PipeMetrics& b);

enum class CellKind {
    Empty,
    Source,
    Consumer,
    Pipe,
};

const char* cell_kind_name(CellKind kind);

struct CellView {
    GridCoord coord;
    CellKind kind;
    DirectionSet connections;
    bool is_junction;
};

struct PipeSolution {
    std::set<GridEdge> edges;
    std::set<GridCoord> pipe_cells;
    std::set<GridCoord> junctions;
    ConnectionMap connections;
    PipeMetrics metrics;

    bool empty() const;

    // BFS from source over the solution edges.
    bool is_fully_connected(const GridCoord& source, const std::set<GridCoord>& consumers) const;

    CellView cell_at(const GridCoord& c, const GridCoord& source, const std::set<GridCoord>& consumers) const;
};

bool operator==(const PipeSolution& a, const PipeSolution& b);
bool operator!=(const PipeSolution& a, const PipeSolution& b);

ConnectionMap build_connection_map(const std::set<GridEdge>& edges);

PipeSolution build_solution(
    const std::vector<GridEdge>& edges,
    const GridCoord& source,
    const std::set<GridCoord>& consumers);
