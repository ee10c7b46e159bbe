#include "attachment_router.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "log.h"

namespace {

constexpr double kCostEpsilon = 1e-9;
constexpr double kInfinity = std::numeric_limits<double>::infinity();

bool cost_less(double lhs, double rhs) {
    return lhs + kCostEpsilon < rhs;
}

bool cost_equal(double lhs, double rhs) {
    return std::abs(lhs - rhs) <= kCostEpsilon;
}

}  // namespace

AttachmentRouter::AttachmentRouter(const GridGraph& grid, const TieBreaker& tie, double junction_penalty)
    : grid_(grid),
      tie_(tie),
      junction_penalty_(junction_penalty),
      keys_(grid.cell_count()),
      cost_(grid.cell_count(), kInfinity),
      steps_(grid.cell_count(), std::numeric_limits<int>::max()),
      pred_(grid.cell_count(), -1),
      visited_(grid.cell_count(), 0),
      used_fallback_(false) {
    for (int id = 0; id < grid_.cell_count(); ++id) {
        keys_[id] = tie_.key(grid_.coord(id));
    }
}

bool AttachmentRouter::used_fallback() const {
    return used_fallback_;
}

void AttachmentRouter::reset(int start_id) {
    std::fill(cost_.begin(), cost_.end(), kInfinity);
    std::fill(steps_.begin(), steps_.end(), std::numeric_limits<int>::max());
    std::fill(pred_.begin(), pred_.end(), -1);
    std::fill(visited_.begin(), visited_.end(), 0);
    cost_[start_id] = 0.0;
    steps_[start_id] = 0;
}

bool AttachmentRouter::better_label(int lhs, int rhs) const {
    if (cost_less(cost_[lhs], cost_[rhs])) {
        return true;
    }
    if (!cost_equal(cost_[lhs], cost_[rhs])) {
        return false;
    }
    if (steps_[lhs] != steps_[rhs]) {
        return steps_[lhs] < steps_[rhs];
    }
    return keys_[lhs] < keys_[rhs];
}

int AttachmentRouter::select_next() const {
    int best = -1;
    for (int id = 0; id < grid_.cell_count(); ++id) {
        if (visited_[id] || std::isinf(cost_[id])) {
            continue;
        }
        if (best < 0 || better_label(id, best)) {
            best = id;
        }
    }
    return best;
}

double AttachmentRouter::step_cost(const PipeNetwork& network, int from, int to) const {
    int lifted = (network.degree(from) == 2 ? 1 : 0) + (network.degree(to) == 2 ? 1 : 0);
    return 1.0 + junction_penalty_ * lifted;
}

void AttachmentRouter::relax(const PipeNetwork& network, int from, int to) {
    bool reused = network.has_edge(GridEdge(grid_.coord(from), grid_.coord(to)));
    double candidate_cost = cost_[from] + (reused ? 0.0 : step_cost(network, from, to));
    int candidate_steps = steps_[from] + (reused ? 0 : 1);

    bool replace = false;
    if (cost_less(candidate_cost, cost_[to])) {
        replace = true;
    } else if (cost_equal(candidate_cost, cost_[to])) {
        if (candidate_steps < steps_[to]) {
            replace = true;
        } else if (candidate_steps == steps_[to]) {
            // Ties prefer the relaxing cell over the recorded predecessor.
            replace = pred_[to] < 0 || keys_[from] < keys_[pred_[to]];
        }
    }
    if (replace) {
        cost_[to] = candidate_cost;
        steps_[to] = candidate_steps;
        pred_[to] = from;
    }
}

std::vector<GridCoord> AttachmentRouter::route(const PipeNetwork& network, const GridCoord& start) {
    used_fallback_ = false;
    int start_id = grid_.id(start);
    if (start_id < 0) {
        throw std::invalid_argument(
            "Route start (" + std::to_string(start.row) + ", " + std::to_string(start.col) + ") is outside the grid");
    }
    if (network.has_node(start_id)) {
        return {start};
    }

    reset(start_id);
    int target_id = -1;
    for (int round = 0; round < grid_.cell_count(); ++round) {
        int cur = select_next();
        if (cur < 0) {
            break;
        }
        visited_[cur] = 1;
        if (cur != start_id && network.has_node(cur)) {
            target_id = cur;
            break;
        }
        for (int nb : grid_.neighbors(cur)) {
            if (visited_[nb]) {
                continue;
            }
            relax(network, cur, nb);
        }
    }

    if (target_id >= 0) {
        std::vector<GridCoord> path;
        for (int cursor = target_id; cursor >= 0; cursor = pred_[cursor]) {
            path.push_back(grid_.coord(cursor));
            if (cursor == start_id) {
                break;
            }
        }
        if (!path.empty() && path.back() == start) {
            std::reverse(path.begin(), path.end());
            return path;
        }
    }

    used_fallback_ = true;
    GridCoord target = nearest_node(network, start);
    log_warn("no labelled path from ({}, {}); using L-shaped route to ({}, {})",
             start.row, start.col, target.row, target.col);
    return fallback_path(start, target);
}

GridCoord AttachmentRouter::nearest_node(const PipeNetwork& network, const GridCoord& start) const {
    int best = -1;
    int best_distance = 0;
    for (int id : network.node_ids()) {
        int distance = start.manhattan(grid_.coord(id));
        if (best < 0 || distance < best_distance ||
            (distance == best_distance && keys_[id] < keys_[best])) {
            best = id;
            best_distance = distance;
        }
    }
    if (best < 0) {
        return start;
    }
    return grid_.coord(best);
}

std::vector<GridCoord> AttachmentRouter::fallback_path(const GridCoord& start, const GridCoord& target) const {
    std::vector<GridCoord> path{start};
    GridCoord cur = start;

    auto walk_cols = [&]() {
        while (cur.col != target.col) {
            cur.col += cur.col < target.col ? 1 : -1;
            path.push_back(cur);
        }
    };
    auto walk_rows = [&]() {
        while (cur.row != target.row) {
            cur.row += cur.row < target.row ? 1 : -1;
            path.push_back(cur);
        }
    };

    bool horizontal_first = ((tie_.key(start) ^ tie_.key(target)) & 1ULL) == 0;
    if (horizontal_first) {
        walk_cols();
        walk_rows();
    } else {
        walk_rows();
        walk_cols();
    }
    return path;
}
