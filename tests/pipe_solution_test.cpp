#include <gtest/gtest.h>

#include <set>
#include <vector>

#include "pipe_solution.h"

namespace {

// Plus shape centred on (2,2) with arms of length one.
std::vector<GridEdge> plus_edges() {
    return {
        GridEdge({2, 2}, {1, 2}),
        GridEdge({2, 2}, {3, 2}),
        GridEdge({2, 2}, {2, 1}),
        GridEdge({2, 2}, {2, 3}),
    };
}

}  // namespace

TEST(PipeSolution, DefaultIsEmpty) {
    PipeSolution solution;
    EXPECT_TRUE(solution.empty());
    EXPECT_EQ(solution.metrics.total_length, 0);
    EXPECT_EQ(solution.metrics.junction_count, 0);
    EXPECT_TRUE(solution.is_fully_connected({0, 0}, {}));
    EXPECT_FALSE(solution.is_fully_connected({0, 0}, {{0, 1}}));
}

TEST(PipeSolution, ConnectionMapDirections) {
    std::set<GridEdge> edges{GridEdge({1, 1}, {1, 2}), GridEdge({1, 1}, {2, 1})};
    ConnectionMap map = build_connection_map(edges);
    ASSERT_EQ(map.size(), 3u);
    EXPECT_EQ(map.at({1, 1}), (DirectionSet{Direction::Right, Direction::Down}));
    EXPECT_EQ(map.at({1, 2}), (DirectionSet{Direction::Left}));
    EXPECT_EQ(map.at({2, 1}), (DirectionSet{Direction::Up}));
}

TEST(PipeSolution, JunctionsAndPipeCells) {
    GridCoord source{1, 2};
    std::set<GridCoord> consumers{{3, 2}, {2, 1}, {2, 3}};
    PipeSolution solution = build_solution(plus_edges(), source, consumers);

    EXPECT_EQ(solution.metrics.total_length, 4);
    EXPECT_EQ(solution.metrics.junction_count, 1);
    EXPECT_EQ(solution.junctions, (std::set<GridCoord>{{2, 2}}));
    EXPECT_EQ(solution.pipe_cells, (std::set<GridCoord>{{2, 2}}));
    EXPECT_EQ(solution.connections.at({2, 2}).size(), 4u);
    EXPECT_TRUE(solution.is_fully_connected(source, consumers));
}

TEST(PipeSolution, DuplicateEdgesCollapse) {
    std::vector<GridEdge> edges{GridEdge({0, 0}, {0, 1}), GridEdge({0, 1}, {0, 0})};
    PipeSolution solution = build_solution(edges, {0, 0}, {{0, 1}});
    EXPECT_EQ(solution.metrics.total_length, 1);
    EXPECT_TRUE(solution.pipe_cells.empty());
}

TEST(PipeSolution, DetectsDisconnectedConsumer) {
    std::vector<GridEdge> edges{GridEdge({0, 0}, {0, 1}), GridEdge({3, 3}, {3, 4})};
    std::set<GridCoord> consumers{{0, 1}, {3, 4}};
    PipeSolution solution = build_solution(edges, {0, 0}, consumers);
    EXPECT_FALSE(solution.is_fully_connected({0, 0}, consumers));
    EXPECT_TRUE(solution.is_fully_connected({0, 0}, {{0, 1}}));
}

TEST(PipeSolution, CellLookup) {
    GridCoord source{1, 2};
    std::set<GridCoord> consumers{{3, 2}, {2, 1}, {2, 3}};
    PipeSolution solution = build_solution(plus_edges(), source, consumers);

    CellView centre = solution.cell_at({2, 2}, source, consumers);
    EXPECT_EQ(centre.kind, CellKind::Pipe);
    EXPECT_TRUE(centre.is_junction);
    EXPECT_EQ(centre.connections.size(), 4u);

    CellView src = solution.cell_at(source, source, consumers);
    EXPECT_EQ(src.kind, CellKind::Source);
    EXPECT_EQ(src.connections, (DirectionSet{Direction::Down}));
    EXPECT_FALSE(src.is_junction);

    CellView consumer = solution.cell_at({2, 1}, source, consumers);
    EXPECT_EQ(consumer.kind, CellKind::Consumer);
    EXPECT_EQ(consumer.connections, (DirectionSet{Direction::Right}));

    CellView blank = solution.cell_at({0, 0}, source, consumers);
    EXPECT_EQ(blank.kind, CellKind::Empty);
    EXPECT_TRUE(blank.connections.empty());
    EXPECT_FALSE(blank.is_junction);
    EXPECT_STREQ(cell_kind_name(blank.kind), "empty");
}

TEST(PipeSolution, Equality) {
    PipeSolution a = build_solution(plus_edges(), {1, 2}, {{3, 2}});
    PipeSolution b = build_solution(plus_edges(), {1, 2}, {{3, 2}});
    EXPECT_TRUE(a == b);
    PipeSolution c = build_solution({GridEdge({0, 0}, {0, 1})}, {0, 0}, {{0, 1}});
    EXPECT_TRUE(a != c);
}
