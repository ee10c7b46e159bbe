#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "attachment_router.h"

namespace {

std::vector<GridCoord> row_segment(int row, int from_col, int to_col) {
    std::vector<GridCoord> out;
    for (int c = from_col; c <= to_col; ++c) {
        out.push_back({row, c});
    }
    return out;
}

void expect_contiguous(const GridGraph& grid, const std::vector<GridCoord>& path) {
    for (std::size_t i = 0; i < path.size(); ++i) {
        EXPECT_TRUE(grid.in_bounds(path[i]));
        if (i > 0) {
            EXPECT_EQ(path[i - 1].manhattan(path[i]), 1);
        }
    }
}

}  // namespace

TEST(AttachmentRouter, StartOnNetworkIsTrivial) {
    GridGraph grid(5, 5);
    TieBreaker tie(3);
    PipeNetwork network(grid, {2, 2});
    AttachmentRouter router(grid, tie, 1.25);
    std::vector<GridCoord> path = router.route(network, {2, 2});
    EXPECT_EQ(path, (std::vector<GridCoord>{{2, 2}}));
    EXPECT_FALSE(router.used_fallback());
}

TEST(AttachmentRouter, StraightLineToLoneSource) {
    GridGraph grid(10, 10);
    TieBreaker tie(0xD15EA5E5ULL);
    PipeNetwork network(grid, {2, 2});
    AttachmentRouter router(grid, tie, 1.25);
    std::vector<GridCoord> path = router.route(network, {2, 5});
    EXPECT_EQ(path, (std::vector<GridCoord>{{2, 5}, {2, 4}, {2, 3}, {2, 2}}));
    EXPECT_FALSE(router.used_fallback());
}

TEST(AttachmentRouter, StopsAtNearestNetworkCell) {
    GridGraph grid(8, 8);
    TieBreaker tie(11);
    PipeNetwork network(grid, {0, 0});
    network.add_path(row_segment(0, 0, 5));
    AttachmentRouter router(grid, tie, 1.25);
    std::vector<GridCoord> path = router.route(network, {3, 5});
    EXPECT_EQ(path, (std::vector<GridCoord>{{3, 5}, {2, 5}, {1, 5}, {0, 5}}));
}

TEST(AttachmentRouter, ZeroPenaltyBranchesMidSegment) {
    GridGraph grid(6, 8);
    TieBreaker tie(5);
    PipeNetwork network(grid, {2, 0});
    network.add_path(row_segment(2, 0, 6));
    AttachmentRouter router(grid, tie, 0.0);
    std::vector<GridCoord> path = router.route(network, {0, 3});
    EXPECT_EQ(path, (std::vector<GridCoord>{{0, 3}, {1, 3}, {2, 3}}));
}

TEST(AttachmentRouter, LargePenaltyAttachesAtSegmentEnd) {
    GridGraph grid(6, 8);
    TieBreaker tie(5);
    PipeNetwork network(grid, {2, 0});
    network.add_path(row_segment(2, 0, 6));
    AttachmentRouter router(grid, tie, 10.0);
    std::vector<GridCoord> path = router.route(network, {0, 3});

    ASSERT_FALSE(path.empty());
    EXPECT_EQ(path.front(), (GridCoord{0, 3}));
    GridCoord end = path.back();
    EXPECT_TRUE(end == (GridCoord{2, 0}) || end == (GridCoord{2, 6}));
    EXPECT_EQ(path.size(), 6u);
    expect_contiguous(grid, path);
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        EXPECT_FALSE(network.has_node(path[i]));
    }
}

TEST(AttachmentRouter, NearestNodeUsesManhattanThenKey) {
    GridGraph grid(9, 9);
    TieBreaker tie(77);
    PipeNetwork network(grid, {4, 0});
    network.add_path({{4, 0}, {4, 1}});
    AttachmentRouter router(grid, tie, 1.0);
    EXPECT_EQ(router.nearest_node(network, {4, 6}), (GridCoord{4, 1}));

    PipeNetwork symmetric(grid, {0, 4});
    symmetric.add_path({{0, 4}, {0, 5}, {0, 6}});
    symmetric.add_path({{8, 4}, {8, 5}, {8, 6}});
    GridCoord expected = tie.key({0, 5}) < tie.key({8, 5}) ? GridCoord{0, 5} : GridCoord{8, 5};
    EXPECT_EQ(router.nearest_node(symmetric, {4, 5}), expected);
}

TEST(AttachmentRouter, FallbackIsLShapedAndSeeded) {
    GridGraph grid(6, 6);
    TieBreaker tie(0xD15EA5E5ULL);
    AttachmentRouter router(grid, tie, 1.25);
    GridCoord start{0, 0};
    GridCoord target{2, 3};
    std::vector<GridCoord> path = router.fallback_path(start, target);

    ASSERT_EQ(path.size(), 6u);
    EXPECT_EQ(path.front(), start);
    EXPECT_EQ(path.back(), target);
    expect_contiguous(grid, path);

    bool horizontal_first = ((tie.key(start) ^ tie.key(target)) & 1ULL) == 0;
    if (horizontal_first) {
        EXPECT_EQ(path[3], (GridCoord{0, 3}));
    } else {
        EXPECT_EQ(path[2], (GridCoord{2, 0}));
    }
}

TEST(AttachmentRouter, FallbackToSelfIsSingleCell) {
    GridGraph grid(3, 3);
    TieBreaker tie(1);
    AttachmentRouter router(grid, tie, 0.0);
    EXPECT_EQ(router.fallback_path({1, 1}, {1, 1}), (std::vector<GridCoord>{{1, 1}}));
}

TEST(AttachmentRouter, RejectsStartOutsideGrid) {
    GridGraph grid(3, 3);
    TieBreaker tie(1);
    PipeNetwork network(grid, {0, 0});
    AttachmentRouter router(grid, tie, 0.0);
    EXPECT_THROW(router.route(network, {5, 5}), std::invalid_argument);
}
