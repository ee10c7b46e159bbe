#pragma once

#include <array>
#include <vector>

struct GridCoord {
    int row;
    int col;

    int manhattan(const GridCoord& other) const;
};

bool operator==(const GridCoord& a, const GridCoord& b);
bool operator!=(const GridCoord& a, const GridCoord& b);
bool operator<(const GridCoord& a, const GridCoord& b);
bool operator<=(const GridCoord& a, const GridCoord& b);

enum class Direction {
    Up,
    Down,
    Left,
    Right,
};

constexpr std::array<Direction, 4> kAllDirections = {
    Direction::Up, Direction::Down, Direction::Left, Direction::Right};

int row_offset(Direction d);
int col_offset(Direction d);
Direction opposite(Direction d);
const char* direction_name(Direction d);

// Unordered pair of adjacent cells, smaller endpoint first.
struct GridEdge {
    GridCoord a;
    GridCoord b;

    GridEdge(GridCoord first, GridCoord second);
};

bool operator==(const GridEdge& x, const GridEdge& y);
bool operator!=(const GridEdge& x, const GridEdge& y);
bool operator<(const GridEdge& x, const GridEdge& y);

class GridGraph {
public:
    GridGraph(int rows, int cols);

    int rows() const;
    int cols() const;
    int cell_count() const;

    bool in_bounds(const GridCoord& c) const;

    int id(const GridCoord& c) const;
    GridCoord coord(int id) const;

    bool step(const GridCoord& from, Direction d, GridCoord* out) const;
    std::vector<int> neighbors(int node_id) const;

private:
    int rows_;
    int cols_;
};
