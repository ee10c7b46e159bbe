#include "pipe_network.h"

#include <stdexcept>
#include <string>

namespace {

std::string describe(const GridCoord& c) {
    return "(" + std::to_string(c.row) + ", " + std::to_string(c.col) + ")";
}

}  // namespace

PipeNetwork::PipeNetwork(const GridGraph& grid, const GridCoord& source)
    : grid_(&grid),
      nodes_(grid.cell_count(), 0),
      degree_(grid.cell_count(), 0),
      right_(grid.cell_count(), 0),
      down_(grid.cell_count(), 0) {
    int sid = grid.id(source);
    if (sid < 0) {
        throw std::invalid_argument("Source " + describe(source) + " is outside the grid");
    }
    nodes_[sid] = 1;
}

bool PipeNetwork::has_node(int id) const {
    return id >= 0 && id < static_cast<int>(nodes_.size()) && nodes_[id] != 0;
}

bool PipeNetwork::has_node(const GridCoord& c) const {
    return has_node(grid_->id(c));
}

bool PipeNetwork::has_edge(const GridEdge& e) const {
    bool horizontal = false;
    int slot = edge_slot(e, &horizontal);
    if (slot < 0) {
        return false;
    }
    return (horizontal ? right_[slot] : down_[slot]) != 0;
}

int PipeNetwork::degree(int id) const {
    if (id < 0 || id >= static_cast<int>(degree_.size())) {
        return 0;
    }
    return degree_[id];
}

int PipeNetwork::degree(const GridCoord& c) const {
    return degree(grid_->id(c));
}

std::vector<int> PipeNetwork::node_ids() const {
    std::vector<int> ids;
    for (int i = 0; i < static_cast<int>(nodes_.size()); ++i) {
        if (nodes_[i]) {
            ids.push_back(i);
        }
    }
    return ids;
}

const std::vector<GridEdge>& PipeNetwork::edges() const {
    return edges_;
}

int PipeNetwork::add_path(const std::vector<GridCoord>& path) {
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (!grid_->in_bounds(path[i])) {
            throw std::invalid_argument("Path cell " + describe(path[i]) + " is outside the grid");
        }
        if (i > 0 && path[i - 1].manhattan(path[i]) != 1) {
            throw std::invalid_argument(
                "Path step " + describe(path[i - 1]) + " -> " + describe(path[i]) + " is not a grid edge");
        }
    }
    for (const auto& c : path) {
        nodes_[grid_->id(c)] = 1;
    }

    int added = 0;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        GridEdge e(path[i], path[i + 1]);
        bool horizontal = false;
        int slot = edge_slot(e, &horizontal);
        std::vector<char>& links = horizontal ? right_ : down_;
        if (links[slot]) {
            continue;
        }
        links[slot] = 1;
        ++degree_[grid_->id(e.a)];
        ++degree_[grid_->id(e.b)];
        edges_.push_back(e);
        ++added;
    }
    return added;
}

int PipeNetwork::edge_slot(const GridEdge& e, bool* horizontal) const {
    if (e.a.manhattan(e.b) != 1) {
        return -1;
    }
    int aid = grid_->id(e.a);
    if (aid < 0 || grid_->id(e.b) < 0) {
        return -1;
    }
    *horizontal = e.a.row == e.b.row;
    return aid;
}
