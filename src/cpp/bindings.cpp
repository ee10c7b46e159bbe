#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "log.h"
#include "pipe_optimizer.h"

namespace py = pybind11;

namespace {

using Cell = std::pair<int, int>;

GridCoord to_coord(const Cell& c) {
    return {c.first, c.second};
}

Cell to_cell(const GridCoord& c) {
    return {c.row, c.col};
}

std::vector<GridCoord> to_coords(const std::vector<Cell>& cells) {
    std::vector<GridCoord> out;
    out.reserve(cells.size());
    for (const auto& c : cells) {
        out.push_back(to_coord(c));
    }
    return out;
}

std::set<GridCoord> to_coord_set(const std::vector<Cell>& cells, const GridCoord& source) {
    std::set<GridCoord> out;
    for (const auto& c : cells) {
        GridCoord coord = to_coord(c);
        if (coord != source) {
            out.insert(coord);
        }
    }
    return out;
}

std::vector<Cell> to_cells(const std::set<GridCoord>& coords) {
    std::vector<Cell> out;
    out.reserve(coords.size());
    for (const auto& c : coords) {
        out.push_back(to_cell(c));
    }
    return out;
}

std::vector<std::string> direction_names(const DirectionSet& dirs) {
    std::vector<std::string> out;
    for (Direction d : dirs) {
        out.emplace_back(direction_name(d));
    }
    return out;
}

PipeSolution solution_from_edges(const std::vector<std::pair<Cell, Cell>>& edges,
                                 const GridCoord& source,
                                 const std::set<GridCoord>& consumers) {
    std::vector<GridEdge> grid_edges;
    grid_edges.reserve(edges.size());
    for (const auto& e : edges) {
        grid_edges.emplace_back(to_coord(e.first), to_coord(e.second));
    }
    return build_solution(grid_edges, source, consumers);
}

}  // namespace

PYBIND11_MODULE(pipe_optimizer_cpp, m) {
    m.doc() = "Junction-aware rectilinear pipe network optimizer";

    m.def("optimize", [](int rows,
                         int columns,
                         const Cell& source,
                         const std::vector<Cell>& consumers,
                         double junction_penalty,
                         std::uint64_t seed) {
        GridGraph grid(rows, columns);
        OptimizerConfig config;
        config.junction_penalty = junction_penalty;
        config.seed = seed;
        std::vector<GridCoord> consumer_coords = to_coords(consumers);
        PipeSolution solution;
        {
            py::gil_scoped_release release;
            solution = optimize_pipes(grid, to_coord(source), consumer_coords, config);
        }

        std::vector<std::pair<Cell, Cell>> edges;
        for (const auto& e : solution.edges) {
            edges.emplace_back(to_cell(e.a), to_cell(e.b));
        }
        py::dict connections;
        for (const auto& entry : solution.connections) {
            connections[py::cast(to_cell(entry.first))] = direction_names(entry.second);
        }

        py::dict out;
        out["edges"] = edges;
        out["pipe_cells"] = to_cells(solution.pipe_cells);
        out["junctions"] = to_cells(solution.junctions);
        out["connections"] = connections;
        out["total_length"] = solution.metrics.total_length;
        out["junction_count"] = solution.metrics.junction_count;
        return out;
    }, py::arg("rows"), py::arg("columns"), py::arg("source"), py::arg("consumers"),
       py::arg("junction_penalty") = OptimizerConfig{}.junction_penalty,
       py::arg("seed") = OptimizerConfig{}.seed);

    m.def("is_fully_connected", [](const std::vector<std::pair<Cell, Cell>>& edges,
                                   const Cell& source,
                                   const std::vector<Cell>& consumers) {
        GridCoord src = to_coord(source);
        std::set<GridCoord> consumer_set = to_coord_set(consumers, src);
        return solution_from_edges(edges, src, consumer_set).is_fully_connected(src, consumer_set);
    }, py::arg("edges"), py::arg("source"), py::arg("consumers"));

    m.def("cell_at", [](int rows,
                        int columns,
                        const Cell& source,
                        const std::vector<Cell>& consumers,
                        const std::vector<std::pair<Cell, Cell>>& edges,
                        int row,
                        int column) {
        GridGraph grid(rows, columns);
        GridCoord cell{row, column};
        if (!grid.in_bounds(cell)) {
            throw py::value_error("Cell is outside the grid");
        }
        GridCoord src = to_coord(source);
        std::set<GridCoord> consumer_set = to_coord_set(consumers, src);
        CellView view = solution_from_edges(edges, src, consumer_set).cell_at(cell, src, consumer_set);

        py::dict out;
        out["kind"] = cell_kind_name(view.kind);
        out["connections"] = direction_names(view.connections);
        out["is_junction"] = view.is_junction;
        return out;
    }, py::arg("rows"), py::arg("columns"), py::arg("source"), py::arg("consumers"), py::arg("edges"),
       py::arg("row"), py::arg("column"));

    m.def("set_log_level", [](const std::string& name) {
        set_log_level(parse_log_level(name));
    }, py::arg("name"));
}
