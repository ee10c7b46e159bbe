#include "pipe_solution.h"

#include <queue>

bool operator==(const PipeMetrics& a, const PipeMetrics& b) {
    return a.total_length == b.total_length && a.junction_count == b.junction_count;
}

const char* cell_kind_name(CellKind kind) {
    switch (kind) {
        case CellKind::Source:
            return "source";
        case CellKind::Consumer:
            return "consumer";
        case CellKind::Pipe:
            return "pipe";
        default:
            return "empty";
    }
}

bool PipeSolution::empty() const {
    return edges.empty();
}

bool PipeSolution::is_fully_connected(const GridCoord& source, const std::set<GridCoord>& consumers) const {
    if (consumers.empty()) {
        return true;
    }

    std::map<GridCoord, std::vector<GridCoord>> adjacency;
    for (const auto& e : edges) {
        adjacency[e.a].push_back(e.b);
        adjacency[e.b].push_back(e.a);
    }

    std::set<GridCoord> visited{source};
    std::queue<GridCoord> q;
    q.push(source);
    while (!q.empty()) {
        GridCoord cur = q.front();
        q.pop();
        auto it = adjacency.find(cur);
        if (it == adjacency.end()) {
            continue;
        }
        for (const auto& next : it->second) {
            if (visited.insert(next).second) {
                q.push(next);
            }
        }
    }

    for (const auto& c : consumers) {
        if (!visited.count(c)) {
            return false;
        }
    }
    return true;
}

CellView PipeSolution::cell_at(const GridCoord& c, const GridCoord& source, const std::set<GridCoord>& consumers) const {
    CellView view{c, CellKind::Empty, {}, junctions.count(c) > 0};
    auto it = connections.find(c);
    if (it != connections.end()) {
        view.connections = it->second;
    }
    if (c == source) {
        view.kind = CellKind::Source;
    } else if (consumers.count(c)) {
        view.kind = CellKind::Consumer;
    } else if (it != connections.end()) {
        view.kind = CellKind::Pipe;
    }
    return view;
}

bool operator==(const PipeSolution& a, const PipeSolution& b) {
    return a.edges == b.edges && a.pipe_cells == b.pipe_cells && a.junctions == b.junctions &&
           a.connections == b.connections && a.metrics == b.metrics;
}

bool operator!=(const PipeSolution& a, const PipeSolution& b) {
    return !(a == b);
}

ConnectionMap build_connection_map(const std::set<GridEdge>& edges) {
    ConnectionMap map;
    for (const auto& e : edges) {
        Direction d;
        if (e.a.row == e.b.row) {
            d = e.a.col < e.b.col ? Direction::Right : Direction::Left;
        } else {
            d = e.a.row < e.b.row ? Direction::Down : Direction::Up;
        }
        map[e.a].insert(d);
        map[e.b].insert(opposite(d));
    }
    return map;
}

PipeSolution build_solution(
    const std::vector<GridEdge>& edges,
    const GridCoord& source,
    const std::set<GridCoord>& consumers) {
    PipeSolution solution;
    solution.edges.insert(edges.begin(), edges.end());
    solution.connections = build_connection_map(solution.edges);
    for (const auto& entry : solution.connections) {
        if (entry.second.size() > 2) {
            solution.junctions.insert(entry.first);
        }
        if (entry.first != source && !consumers.count(entry.first)) {
            solution.pipe_cells.insert(entry.first);
        }
    }
    solution.metrics.total_length = static_cast<int>(solution.edges.size());
    solution.metrics.junction_count = static_cast<int>(solution.junctions.size());
    return solution;
}
