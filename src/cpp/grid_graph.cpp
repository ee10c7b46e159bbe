#include "grid_graph.h"

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

int GridCoord::manhattan(const GridCoord& other) const {
    return std::abs(row - other.row) + std::abs(col - other.col);
}

bool operator==(const GridCoord& a, const GridCoord& b) {
    return a.row == b.row && a.col == b.col;
}

bool operator!=(const GridCoord& a, const GridCoord& b) {
    return !(a == b);
}

bool operator<(const GridCoord& a, const GridCoord& b) {
    if (a.row != b.row) {
        return a.row < b.row;
    }
    return a.col < b.col;
}

bool operator<=(const GridCoord& a, const GridCoord& b) {
    return !(b < a);
}

int row_offset(Direction d) {
    switch (d) {
        case Direction::Up:
            return -1;
        case Direction::Down:
            return 1;
        default:
            return 0;
    }
}

int col_offset(Direction d) {
    switch (d) {
        case Direction::Left:
            return -1;
        case Direction::Right:
            return 1;
        default:
            return 0;
    }
}

Direction opposite(Direction d) {
    switch (d) {
        case Direction::Up:
            return Direction::Down;
        case Direction::Down:
            return Direction::Up;
        case Direction::Left:
            return Direction::Right;
        case Direction::Right:
            return Direction::Left;
    }
    return d;
}

const char* direction_name(Direction d) {
    switch (d) {
        case Direction::Up:
            return "up";
        case Direction::Down:
            return "down";
        case Direction::Left:
            return "left";
        case Direction::Right:
            return "right";
    }
    return "unknown";
}

GridEdge::GridEdge(GridCoord first, GridCoord second)
    : a(first <= second ? first : second),
      b(first <= second ? second : first) {}

bool operator==(const GridEdge& x, const GridEdge& y) {
    return x.a == y.a && x.b == y.b;
}

bool operator!=(const GridEdge& x, const GridEdge& y) {
    return !(x == y);
}

bool operator<(const GridEdge& x, const GridEdge& y) {
    if (x.a != y.a) {
        return x.a < y.a;
    }
    return x.b < y.b;
}

GridGraph::GridGraph(int rows, int cols)
    : rows_(rows), cols_(cols) {
    if (rows_ <= 0 || cols_ <= 0) {
        throw std::invalid_argument(
            "Grid dimensions must be positive, got " + std::to_string(rows) + "x" + std::to_string(cols));
    }
    if (rows_ > std::numeric_limits<int>::max() / cols_) {
        throw std::invalid_argument(
            "Grid dimensions are too large, got " + std::to_string(rows) + "x" + std::to_string(cols));
    }
}

int GridGraph::rows() const {
    return rows_;
}

int GridGraph::cols() const {
    return cols_;
}

int GridGraph::cell_count() const {
    return rows_ * cols_;
}

bool GridGraph::in_bounds(const GridCoord& c) const {
    return c.row >= 0 && c.col >= 0 && c.row < rows_ && c.col < cols_;
}

int GridGraph::id(const GridCoord& c) const {
    if (!in_bounds(c)) {
        return -1;
    }
    return c.row * cols_ + c.col;
}

GridCoord GridGraph::coord(int id) const {
    if (id < 0 || id >= cell_count()) {
        return {-1, -1};
    }
    return {id / cols_, id % cols_};
}

bool GridGraph::step(const GridCoord& from, Direction d, GridCoord* out) const {
    GridCoord next{from.row + row_offset(d), from.col + col_offset(d)};
    if (!in_bounds(next)) {
        return false;
    }
    *out = next;
    return true;
}

std::vector<int> GridGraph::neighbors(int node_id) const {
    std::vector<int> result;
    if (node_id < 0 || node_id >= cell_count()) {
        return result;
    }
    GridCoord here = coord(node_id);
    for (Direction d : kAllDirections) {
        GridCoord next{};
        if (step(here, d, &next)) {
            result.push_back(id(next));
        }
    }
    return result;
}
