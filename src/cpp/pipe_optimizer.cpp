#include "pipe_optimizer.h"

#include "attachment_router.h"
#include "log.h"
#include "pipe_network.h"
#include "terminal_tree.h"
#include "tie_breaker.h"

#include <cmath>
#include <set>
#include <stdexcept>
#include <string>

namespace {

std::string describe(const GridCoord& c) {
    return "(" + std::to_string(c.row) + ", " + std::to_string(c.col) + ")";
}

std::set<GridCoord> normalize_consumers(
    const GridGraph& grid,
    const GridCoord& source,
    const std::vector<GridCoord>& consumers) {
    std::set<GridCoord> out;
    for (const auto& c : consumers) {
        if (!grid.in_bounds(c)) {
            throw std::invalid_argument("Consumer " + describe(c) + " is outside the grid");
        }
        if (c == source) {
            continue;
        }
        out.insert(c);
    }
    return out;
}

}  // namespace

void validate_config(const OptimizerConfig& config) {
    if (!std::isfinite(config.junction_penalty) || config.junction_penalty < 0.0) {
        throw std::invalid_argument(
            "Junction penalty must be finite and non-negative, got " + std::to_string(config.junction_penalty));
    }
}

PipeSolution optimize_pipes(
    const GridGraph& grid,
    const GridCoord& source,
    const std::vector<GridCoord>& consumers,
    const OptimizerConfig& config) {
    validate_config(config);
    if (!grid.in_bounds(source)) {
        throw std::invalid_argument("Source " + describe(source) + " is outside the grid");
    }

    std::set<GridCoord> normalized = normalize_consumers(grid, source, consumers);
    if (normalized.empty()) {
        log_debug("no consumers besides the source; returning empty network");
        return PipeSolution{};
    }

    std::vector<GridCoord> terminals;
    terminals.reserve(normalized.size() + 1);
    terminals.push_back(source);
    terminals.insert(terminals.end(), normalized.begin(), normalized.end());

    TieBreaker tie(config.seed);
    std::vector<TerminalEdge> mst = build_terminal_mst(terminals, tie);
    std::vector<int> order = build_connection_order(terminals, mst, tie);

    PipeNetwork network(grid, source);
    AttachmentRouter router(grid, tie, config.junction_penalty);
    int fallbacks = 0;
    for (int index : order) {
        const GridCoord& terminal = terminals[index];
        if (network.has_node(terminal)) {
            continue;
        }
        std::vector<GridCoord> path = router.route(network, terminal);
        if (router.used_fallback()) {
            ++fallbacks;
        }
        int added = network.add_path(path);
        log_debug("attached terminal {} at {} with {} new edges", index, describe(terminal), added);
    }

    PipeSolution solution = build_solution(network.edges(), source, normalized);
    log_info("{}x{} grid, {} consumers: length {}, {} junctions, {} fallback routes",
             grid.rows(), grid.cols(), normalized.size(),
             solution.metrics.total_length, solution.metrics.junction_count, fallbacks);
    return solution;
}

PipeSolution optimize_pipes(
    const GridSettings& settings,
    const GridCoord& source,
    const std::vector<GridCoord>& consumers) {
    GridGraph grid(settings.rows, settings.cols);
    return optimize_pipes(grid, source, consumers, settings.optimizer);
}
