#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include "tcc/grid/pathfinder.hpp"

using namespace tcc::grid;
using tcc::foundation::CombatantId;

namespace {

bool pathContains(const PathfindingResult& result, GridPos pos) {
    return std::find(result.path.begin(), result.path.end(), pos) != result.path.end();
}

// Consecutive path cells are neighbours.
bool isContiguous(const std::vector<GridPos>& path) {
    for (std::size_t i = 1; i < path.size(); ++i) {
        if (chebyshevSquares(path[i - 1], path[i]) != 1) {
            return false;
        }
    }
    return true;
}


// Exhaustive relaxation over (cell, diagonal parity) states until nothing
// improves. Slow but independent of the A* implementation.
int32_t cheapestCost(const CombatGrid& grid, GridPos from, GridPos to, DiagonalPolicy policy) {
    constexpr int32_t kNone = std::numeric_limits<int32_t>::max();
    const int32_t w = grid.width();
    const int32_t h = grid.height();
    auto index = [w](GridPos p, int parity) {
        return static_cast<std::size_t>((p.y * w + p.x) * 2 + parity);
    };

    std::vector<int32_t> best(static_cast<std::size_t>(w * h * 2), kNone);
    best[index(from, 0)] = 0;

    bool changed = true;
    while (changed) {
        changed = false;
        for (int32_t y = 0; y < h; ++y) {
            for (int32_t x = 0; x < w; ++x) {
                for (int parity = 0; parity < 2; ++parity) {
                    const int32_t g = best[index({x, y}, parity)];
                    if (g == kNone) {
                        continue;
                    }
                    for (int32_t dy = -1; dy <= 1; ++dy) {
                        for (int32_t dx = -1; dx <= 1; ++dx) {
                            const GridPos next{x + dx, y + dy};
                            if ((dx == 0 && dy == 0) || !grid.isPassable(next)) {
                                continue;
                            }
                            int32_t cost = grid.cell(next)->movementCost();
                            int nextParity = parity;
                            if (dx != 0 && dy != 0 && policy == DiagonalPolicy::Alternating) {
                                cost *= parity == 0 ? 1 : 2;
                                nextParity = parity ^ 1;
                            }
                            int32_t& slot = best[index(next, nextParity)];
                            if (g + cost < slot) {
                                slot = g + cost;
                                changed = true;
                            }
                        }
                    }
                }
            }
        }
    }
    return std::min(best[index(to, 0)], best[index(to, 1)]);
}

// Re-prices a returned path step by step.
int32_t pricePath(const CombatGrid& grid, const std::vector<GridPos>& path,
                  DiagonalPolicy policy) {
    int32_t total = 0;
    int parity = 0;
    for (std::size_t i = 1; i < path.size(); ++i) {
        int32_t cost = grid.cell(path[i])->movementCost();
        const bool diagonal = path[i].x != path[i - 1].x && path[i].y != path[i - 1].y;
        if (diagonal && policy == DiagonalPolicy::Alternating) {
            cost *= parity == 0 ? 1 : 2;
            parity ^= 1;
        }
        total += cost;
    }
    return total;
}

} // namespace

class PathfinderTest : public ::testing::Test {
protected:
    CombatGrid grid_{8, 8};
};

// ---------------------------------------------------------------------------
// findPath
// ---------------------------------------------------------------------------

TEST_F(PathfinderTest, OpenGridDiagonalUnderChebyshev) {
    auto result = Pathfinder::findPath(grid_, {0, 0}, {7, 7}, 100, DiagonalPolicy::Chebyshev);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.totalCost, 35);
    ASSERT_EQ(result.path.size(), 8u);
    EXPECT_EQ(result.path.front(), (GridPos{0, 0}));
    EXPECT_EQ(result.path.back(), (GridPos{7, 7}));
    EXPECT_TRUE(isContiguous(result.path));
    EXPECT_EQ(result.reason, "Path found: 35ft");
}

TEST_F(PathfinderTest, SameCellIsTrivialSuccess) {
    auto result = Pathfinder::findPath(grid_, {3, 3}, {3, 3}, 0);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.totalCost, 0);
    ASSERT_EQ(result.path.size(), 1u);
    EXPECT_EQ(result.path[0], (GridPos{3, 3}));
}

TEST_F(PathfinderTest, OccupiedDestinationReportsOccupant) {
    grid_.setOccupant({5, 5}, CombatantId(9));
    auto result = Pathfinder::findPath(grid_, {0, 0}, {5, 5}, 100);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.blockedBy, CombatantId(9));
    EXPECT_EQ(result.reason, "Destination is occupied");
    EXPECT_TRUE(result.path.empty());
}

TEST_F(PathfinderTest, ImpassableDestination) {
    grid_.setTerrain({2, 2}, TerrainKind::Impassable);
    auto result = Pathfinder::findPath(grid_, {0, 0}, {2, 2}, 100);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.reason, "Destination is impassable");
}

TEST_F(PathfinderTest, InvalidEndpoints) {
    EXPECT_EQ(Pathfinder::findPath(grid_, {-1, 0}, {2, 2}, 100).reason,
              "Invalid start position");
    EXPECT_EQ(Pathfinder::findPath(grid_, {0, 0}, {8, 0}, 100).reason,
              "Invalid end position");
}

TEST_F(PathfinderTest, BudgetTooSmall) {
    auto result = Pathfinder::findPath(grid_, {0, 0}, {7, 0}, 30);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.reason, "No path found");

    EXPECT_TRUE(Pathfinder::findPath(grid_, {0, 0}, {7, 0}, 35).success);
}

TEST_F(PathfinderTest, FullWallBlocks) {
    for (int32_t y = 0; y < 8; ++y) {
        grid_.setTerrain({3, y}, TerrainKind::Impassable);
    }
    auto result = Pathfinder::findPath(grid_, {0, 0}, {6, 0}, 1000);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.reason, "No path found");
}

TEST_F(PathfinderTest, RoutesThroughGapInWall) {
    for (int32_t y = 0; y < 7; ++y) {
        grid_.setTerrain({3, y}, TerrainKind::Impassable);
    }
    auto result = Pathfinder::findPath(grid_, {0, 0}, {6, 0}, 1000);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(pathContains(result, {3, 7}));
    EXPECT_TRUE(isContiguous(result.path));
    for (const auto& p : result.path) {
        EXPECT_NE(grid_.cell(p)->terrain, TerrainKind::Impassable);
    }
}

TEST_F(PathfinderTest, OccupiedCellsAreNeverEntered) {
    grid_.setOccupant({1, 1}, CombatantId(2));
    auto result = Pathfinder::findPath(grid_, {0, 0}, {2, 2}, 100);
    ASSERT_TRUE(result.success);
    EXPECT_FALSE(pathContains(result, {1, 1}));
    EXPECT_EQ(result.totalCost, 15);
}

TEST(PathfinderCostTest, DifficultTerrainCostsDouble) {
    CombatGrid grid(3, 1);
    grid.setTerrain({1, 0}, TerrainKind::Difficult);
    auto result = Pathfinder::findPath(grid, {0, 0}, {2, 0}, 100);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.totalCost, 15);
    EXPECT_EQ(result.path.size(), 3u);
}

TEST(PathfinderCostTest, DetourAroundDifficultTerrainWhenCheaper) {
    CombatGrid grid(5, 3);
    grid.setTerrain({2, 1}, TerrainKind::Difficult);
    auto result = Pathfinder::findPath(grid, {0, 1}, {4, 1}, 100);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.totalCost, 20);
    EXPECT_FALSE(std::find(result.path.begin(), result.path.end(), GridPos{2, 1}) !=
                 result.path.end());
}

TEST(PathfinderCostTest, AlternatingDiagonals) {
    CombatGrid grid(8, 8, DiagonalPolicy::Alternating);
    EXPECT_EQ(Pathfinder::findPath(grid, {0, 0}, {1, 1}, 100).totalCost, 5);
    EXPECT_EQ(Pathfinder::findPath(grid, {0, 0}, {2, 2}, 100).totalCost, 15);
    EXPECT_EQ(Pathfinder::findPath(grid, {0, 0}, {3, 3}, 100).totalCost, 20);
    EXPECT_EQ(Pathfinder::findPath(grid, {0, 0}, {4, 2}, 100).totalCost, 25);

    // The grid's own policy can be overridden per call.
    EXPECT_EQ(Pathfinder::findPath(grid, {0, 0}, {3, 3}, 100, DiagonalPolicy::Chebyshev)
                  .totalCost,
              15);
}

TEST(PathfinderCostTest, DistanceMatchesOpenGridCost) {
    EXPECT_EQ(Pathfinder::distance({0, 0}, {7, 7}, DiagonalPolicy::Chebyshev), 35);
    EXPECT_EQ(Pathfinder::distance({0, 0}, {3, 3}, DiagonalPolicy::Alternating), 20);
    EXPECT_EQ(Pathfinder::distance({2, 2}, {2, 6}, DiagonalPolicy::Alternating), 20);
}

TEST_F(PathfinderTest, SearchIsDeterministic) {
    grid_.setTerrain({3, 3}, TerrainKind::Impassable);
    grid_.setTerrain({4, 2}, TerrainKind::Difficult);
    auto a = Pathfinder::findPath(grid_, {0, 0}, {7, 5}, 200);
    auto b = Pathfinder::findPath(grid_, {0, 0}, {7, 5}, 200);
    ASSERT_TRUE(a.success);
    EXPECT_EQ(a.path, b.path);
    EXPECT_EQ(a.totalCost, b.totalCost);
}

// ---------------------------------------------------------------------------
// reachableCells
// ---------------------------------------------------------------------------

TEST(ReachableCellsTest, OneStepRing) {
    CombatGrid grid(3, 3);
    auto cells = Pathfinder::reachableCells(grid, {1, 1}, 5);
    ASSERT_EQ(cells.size(), 8u);
    EXPECT_EQ(cells.front().pos, (GridPos{0, 0}));
    EXPECT_EQ(cells.back().pos, (GridPos{2, 2}));
    for (const auto& c : cells) {
        EXPECT_EQ(c.cost, 5);
    }
}

TEST(ReachableCellsTest, AlternatingSecondDiagonalIsExpensive) {
    CombatGrid grid(3, 3, DiagonalPolicy::Alternating);
    auto cells = Pathfinder::reachableCells(grid, {0, 0}, 10);
    EXPECT_EQ(cells.size(), 7u);
    for (const auto& c : cells) {
        EXPECT_NE(c.pos, (GridPos{2, 2}));
        if (c.pos == GridPos{1, 1}) {
            EXPECT_EQ(c.cost, 5);
        }
    }
}

TEST(ReachableCellsTest, ExcludesBlockedCellsAndOrigin) {
    CombatGrid grid(3, 3);
    grid.setTerrain({0, 0}, TerrainKind::Impassable);
    grid.setOccupant({2, 2}, CombatantId(4));
    auto cells = Pathfinder::reachableCells(grid, {1, 1}, 5);
    EXPECT_EQ(cells.size(), 6u);
    EXPECT_TRUE(Pathfinder::reachableCells(grid, {1, 1}, 0).empty());
}

TEST(ReachableCellsTest, ReportsCheapestCost) {
    CombatGrid grid(5, 1);
    grid.setTerrain({2, 0}, TerrainKind::Difficult);
    auto cells = Pathfinder::reachableCells(grid, {0, 0}, 30);
    ASSERT_EQ(cells.size(), 4u);
    EXPECT_EQ(cells[0], (ReachableCell{{1, 0}, 5}));
    EXPECT_EQ(cells[1], (ReachableCell{{2, 0}, 15}));
    EXPECT_EQ(cells[2], (ReachableCell{{3, 0}, 20}));
    EXPECT_EQ(cells[3], (ReachableCell{{4, 0}, 25}));
}

// ---------------------------------------------------------------------------
// threatenedSquares / lineOfSight / cover
// ---------------------------------------------------------------------------

TEST_F(PathfinderTest, ThreatenedSquaresExcludeOwnCell) {
    grid_.setOccupant({0, 0}, CombatantId(1));
    grid_.setOccupant({4, 4}, CombatantId(2));

    EXPECT_EQ(Pathfinder::threatenedSquares(grid_, CombatantId(1)).size(), 3u);
    EXPECT_EQ(Pathfinder::threatenedSquares(grid_, CombatantId(2)).size(), 8u);
    EXPECT_EQ(Pathfinder::threatenedSquares(grid_, CombatantId(2), 10).size(), 24u);
    EXPECT_EQ(Pathfinder::threatenedSquares(grid_, CombatantId(2), 0).size(), 8u);
    EXPECT_TRUE(Pathfinder::threatenedSquares(grid_, CombatantId(3)).empty());
}

TEST_F(PathfinderTest, LineOfSightBlockedByImpassable) {
    grid_.setTerrain({2, 0}, TerrainKind::Impassable);
    auto los = Pathfinder::lineOfSight(grid_, {0, 0}, {4, 0});
    EXPECT_FALSE(los.clear);
    EXPECT_EQ(los.cells.size(), 5u);
    EXPECT_EQ(Pathfinder::cover(grid_, {0, 0}, {4, 0}), kTotalCover);
}

TEST_F(PathfinderTest, LineOfSightIgnoresOrigin) {
    grid_.setTerrain({0, 0}, TerrainKind::Impassable);
    EXPECT_TRUE(Pathfinder::lineOfSight(grid_, {0, 0}, {3, 0}).clear);
}

TEST_F(PathfinderTest, DiagonalLineOfSight) {
    auto los = Pathfinder::lineOfSight(grid_, {0, 0}, {3, 3});
    EXPECT_TRUE(los.clear);
    ASSERT_EQ(los.cells.size(), 4u);
    EXPECT_EQ(los.cells[2], (GridPos{2, 2}));
}

TEST_F(PathfinderTest, CoverIsHighestInterveningValue) {
    EXPECT_EQ(Pathfinder::cover(grid_, {0, 0}, {4, 0}), kNoCover);

    grid_.setCover({1, 0}, kHalfCover);
    grid_.setCover({3, 0}, kThreeQuartersCover);
    grid_.setCover({4, 0}, kThreeQuartersCover);
    EXPECT_EQ(Pathfinder::cover(grid_, {0, 0}, {4, 0}), kThreeQuartersCover);

    grid_.setCover({3, 0}, kNoCover);
    EXPECT_EQ(Pathfinder::cover(grid_, {0, 0}, {4, 0}), kHalfCover);
}

// ---------------------------------------------------------------------------
// Optimality on random layouts
// ---------------------------------------------------------------------------

class PathfinderRandomLayoutTest : public ::testing::TestWithParam<DiagonalPolicy> {};

TEST_P(PathfinderRandomLayoutTest, MatchesExhaustiveSearchCost) {
    const DiagonalPolicy policy = GetParam();
    std::mt19937 rng(20240611u);
    std::uniform_int_distribution<int> terrainRoll(0, 99);
    std::uniform_int_distribution<int32_t> coord(0, 9);

    int solved = 0;
    for (int layout = 0; layout < 60; ++layout) {
        CombatGrid grid(10, 10, policy);
        for (int32_t y = 0; y < 10; ++y) {
            for (int32_t x = 0; x < 10; ++x) {
                const int roll = terrainRoll(rng);
                if (roll < 25) {
                    grid.setTerrain({x, y}, TerrainKind::Impassable);
                } else if (roll < 45) {
                    grid.setTerrain({x, y}, TerrainKind::Difficult);
                } else if (roll < 55) {
                    grid.setTerrain({x, y}, TerrainKind::Water);
                }
            }
        }
        const GridPos from{coord(rng), coord(rng)};
        GridPos to{coord(rng), coord(rng)};
        if (to == from) {
            to = {9 - from.x, 9 - from.y};
        }
        if (to == from) {
            continue;
        }
        grid.setTerrain(from, TerrainKind::Open);
        grid.setTerrain(to, TerrainKind::Open);

        const int32_t expected = cheapestCost(grid, from, to, policy);
        auto result = Pathfinder::findPath(grid, from, to, 10000, policy);

        SCOPED_TRACE("layout " + std::to_string(layout));
        if (expected == std::numeric_limits<int32_t>::max()) {
            EXPECT_FALSE(result.success);
            continue;
        }
        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.totalCost, expected);
        EXPECT_EQ(pricePath(grid, result.path, policy), expected);
        EXPECT_TRUE(isContiguous(result.path));
        EXPECT_EQ(result.path.front(), from);
        EXPECT_EQ(result.path.back(), to);
        ++solved;
    }
    EXPECT_GT(solved, 0);
}

INSTANTIATE_TEST_SUITE_P(BothPolicies, PathfinderRandomLayoutTest,
                         ::testing::Values(DiagonalPolicy::Chebyshev,
                                           DiagonalPolicy::Alternating));
