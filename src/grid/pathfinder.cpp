/// @file pathfinder.cpp
/// @brief A* / Dijkstra search and Bresenham line of sight.

#include "tcc/grid/pathfinder.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <limits>
#include <queue>
#include <string>
#include <tuple>

#include "tcc/foundation/game_logger.hpp"

namespace tcc::grid {

using foundation::LogCategory;

namespace {

constexpr int32_t kUnvisited = std::numeric_limits<int32_t>::max();

// Search state: a cell plus the parity of diagonal steps taken so far.
// Under the Chebyshev policy parity stays 0 and the state space collapses
// to plain cells.
struct SearchState {
    GridPos pos;
    uint8_t parity = 0;
};

struct OpenEntry {
    int32_t f = 0;
    int32_t h = 0;
    int32_t g = 0;
    GridPos pos;
    uint8_t parity = 0;

    // Min-heap ordering: lowest f, then h, then row-major position, then parity.
    bool operator>(const OpenEntry& o) const {
        return std::tie(f, h, pos.y, pos.x, parity) >
               std::tie(o.f, o.h, o.pos.y, o.pos.x, o.parity);
    }
};

using OpenSet = std::priority_queue<OpenEntry, std::vector<OpenEntry>, std::greater<>>;

std::size_t stateIndex(const CombatGrid& grid, GridPos pos, uint8_t parity) {
    return (static_cast<std::size_t>(pos.y) * static_cast<std::size_t>(grid.width()) +
            static_cast<std::size_t>(pos.x)) * 2 + parity;
}

bool isDiagonalStep(GridPos a, GridPos b) {
    return a.x != b.x && a.y != b.y;
}

// Cost of entering @p target and the diagonal parity afterwards.
std::pair<int32_t, uint8_t> stepCost(const GridCell& target, bool diagonal,
                                     uint8_t parity, DiagonalPolicy policy) {
    const int32_t base = target.movementCost();
    if (!diagonal || policy == DiagonalPolicy::Chebyshev) {
        return {base, parity};
    }
    return {parity == 0 ? base : 2 * base, static_cast<uint8_t>(parity ^ 1)};
}

// Lower bound on the remaining cost assuming open terrain. With odd
// parity the next diagonal is the expensive one.
int32_t heuristic(GridPos from, GridPos to, uint8_t parity, DiagonalPolicy policy) {
    const int32_t dx = std::abs(to.x - from.x);
    const int32_t dy = std::abs(to.y - from.y);
    const int32_t longer = std::max(dx, dy);
    const int32_t shorter = std::min(dx, dy);
    if (policy == DiagonalPolicy::Chebyshev) {
        return longer * kFeetPerSquare;
    }
    const int32_t doubled = parity == 0 ? shorter / 2 : (shorter + 1) / 2;
    return (longer + doubled) * kFeetPerSquare;
}

PathfindingResult failure(std::string reason) {
    PathfindingResult result;
    result.reason = std::move(reason);
    return result;
}

} // namespace

PathfindingResult Pathfinder::findPath(const CombatGrid& grid, GridPos from, GridPos to,
                                       int32_t maxMovement, DiagonalPolicy policy) {
    if (!grid.isValidPosition(from)) {
        return failure("Invalid start position");
    }
    if (!grid.isValidPosition(to)) {
        return failure("Invalid end position");
    }

    if (from == to) {
        PathfindingResult result;
        result.success = true;
        result.path.push_back(from);
        result.reason = "Already at destination";
        return result;
    }

    const GridCell* goal = grid.cell(to);
    if (goal->occupant.has_value()) {
        auto result = failure("Destination is occupied");
        result.blockedBy = goal->occupant;
        return result;
    }
    if (goal->terrain == TerrainKind::Impassable) {
        return failure("Destination is impassable");
    }

    const std::size_t stateCount =
        static_cast<std::size_t>(grid.width()) * static_cast<std::size_t>(grid.height()) * 2;
    std::vector<int32_t> bestCost(stateCount, kUnvisited);
    std::vector<bool> closed(stateCount, false);
    std::vector<SearchState> parent(stateCount);
    std::vector<bool> hasParent(stateCount, false);

    OpenSet open;
    const int32_t h0 = heuristic(from, to, 0, policy);
    bestCost[stateIndex(grid, from, 0)] = 0;
    open.push(OpenEntry{h0, h0, 0, from, 0});

    while (!open.empty()) {
        const OpenEntry current = open.top();
        open.pop();

        const std::size_t currentIdx = stateIndex(grid, current.pos, current.parity);
        if (closed[currentIdx] || current.g != bestCost[currentIdx]) {
            continue;
        }
        closed[currentIdx] = true;

        if (current.pos == to) {
            PathfindingResult result;
            result.success = true;
            result.totalCost = current.g;

            SearchState walk{current.pos, current.parity};
            result.path.push_back(walk.pos);
            std::size_t walkIdx = currentIdx;
            while (hasParent[walkIdx]) {
                walk = parent[walkIdx];
                walkIdx = stateIndex(grid, walk.pos, walk.parity);
                result.path.push_back(walk.pos);
            }
            std::reverse(result.path.begin(), result.path.end());
            result.reason = "Path found: " + std::to_string(result.totalCost) + "ft";
            return result;
        }

        for (const GridPos& next : grid.adjacentCells(current.pos)) {
            const GridCell* nextCell = grid.cell(next);
            if (!nextCell->isPassable()) {
                continue;
            }

            const auto [cost, nextParity] =
                stepCost(*nextCell, isDiagonalStep(current.pos, next), current.parity, policy);
            const int32_t g = current.g + cost;
            if (g > maxMovement) {
                continue;
            }

            const std::size_t nextIdx = stateIndex(grid, next, nextParity);
            if (closed[nextIdx] || g >= bestCost[nextIdx]) {
                continue;
            }
            bestCost[nextIdx] = g;
            parent[nextIdx] = SearchState{current.pos, current.parity};
            hasParent[nextIdx] = true;

            const int32_t h = heuristic(next, to, nextParity, policy);
            open.push(OpenEntry{g + h, h, g, next, nextParity});
        }
    }

    TCC_LOG_DEBUG(LogCategory::Grid,
                  "no path from (" + std::to_string(from.x) + "," + std::to_string(from.y) +
                      ") to (" + std::to_string(to.x) + "," + std::to_string(to.y) +
                      ") within " + std::to_string(maxMovement) + "ft");
    return failure("No path found");
}

PathfindingResult Pathfinder::findPath(const CombatGrid& grid, GridPos from, GridPos to,
                                       int32_t maxMovement) {
    return findPath(grid, from, to, maxMovement, grid.diagonalPolicy());
}

std::vector<ReachableCell> Pathfinder::reachableCells(const CombatGrid& grid, GridPos origin,
                                                      int32_t budget, DiagonalPolicy policy) {
    std::vector<ReachableCell> result;
    if (!grid.isValidPosition(origin) || budget <= 0) {
        return result;
    }

    const std::size_t cellCount =
        static_cast<std::size_t>(grid.width()) * static_cast<std::size_t>(grid.height());
    std::vector<int32_t> bestState(cellCount * 2, kUnvisited);
    std::vector<int32_t> bestCell(cellCount, kUnvisited);

    // Same entry layout as A* with h fixed at 0.
    OpenSet open;
    bestState[stateIndex(grid, origin, 0)] = 0;
    open.push(OpenEntry{0, 0, 0, origin, 0});

    while (!open.empty()) {
        const OpenEntry current = open.top();
        open.pop();

        if (current.g != bestState[stateIndex(grid, current.pos, current.parity)]) {
            continue;
        }

        for (const GridPos& next : grid.adjacentCells(current.pos)) {
            const GridCell* nextCell = grid.cell(next);
            if (!nextCell->isPassable()) {
                continue;
            }
            const auto [cost, nextParity] =
                stepCost(*nextCell, isDiagonalStep(current.pos, next), current.parity, policy);
            const int32_t g = current.g + cost;
            if (g > budget) {
                continue;
            }
            const std::size_t nextIdx = stateIndex(grid, next, nextParity);
            if (g >= bestState[nextIdx]) {
                continue;
            }
            bestState[nextIdx] = g;

            const std::size_t cellIdx = nextIdx / 2;
            bestCell[cellIdx] = std::min(bestCell[cellIdx], g);
            open.push(OpenEntry{g, 0, g, next, nextParity});
        }
    }

    for (int32_t y = 0; y < grid.height(); ++y) {
        for (int32_t x = 0; x < grid.width(); ++x) {
            GridPos p{x, y};
            if (p == origin) {
                continue;
            }
            const int32_t cost = bestCell[stateIndex(grid, p, 0) / 2];
            if (cost != kUnvisited) {
                result.push_back(ReachableCell{p, cost});
            }
        }
    }
    return result;
}

std::vector<ReachableCell> Pathfinder::reachableCells(const CombatGrid& grid, GridPos origin,
                                                      int32_t budget) {
    return reachableCells(grid, origin, budget, grid.diagonalPolicy());
}

std::vector<GridPos> Pathfinder::threatenedSquares(const CombatGrid& grid,
                                                   CombatantId combatant,
                                                   int32_t reachFeet) {
    std::vector<GridPos> result;
    auto pos = grid.findCombatant(combatant);
    if (!pos) {
        return result;
    }
    const int32_t reachSquares = std::max<int32_t>(1, reachFeet / kFeetPerSquare);
    for (const GridPos& p : grid.cellsInRadius(*pos, reachSquares * kFeetPerSquare)) {
        if (p != *pos) {
            result.push_back(p);
        }
    }
    return result;
}

LineOfSight Pathfinder::lineOfSight(const CombatGrid& grid, GridPos from, GridPos to) {
    LineOfSight los;

    const int32_t dx = std::abs(to.x - from.x);
    const int32_t dy = std::abs(to.y - from.y);
    const int32_t sx = from.x < to.x ? 1 : -1;
    const int32_t sy = from.y < to.y ? 1 : -1;
    int32_t err = dx - dy;

    GridPos p = from;
    while (true) {
        los.cells.push_back(p);
        if (p != from) {
            const GridCell* c = grid.cell(p);
            if (c != nullptr && c->terrain == TerrainKind::Impassable) {
                los.clear = false;
            }
        }
        if (p == to) {
            break;
        }
        const int32_t e2 = 2 * err;
        if (e2 > -dy) {
            err -= dy;
            p.x += sx;
        }
        if (e2 < dx) {
            err += dx;
            p.y += sy;
        }
    }
    return los;
}

int32_t Pathfinder::cover(const CombatGrid& grid, GridPos attacker, GridPos target) {
    const LineOfSight los = lineOfSight(grid, attacker, target);
    if (!los.clear) {
        return kTotalCover;
    }
    int32_t best = kNoCover;
    for (const GridPos& p : los.cells) {
        if (p == attacker || p == target) {
            continue;
        }
        if (const GridCell* c = grid.cell(p)) {
            best = std::max(best, c->cover);
        }
    }
    return best;
}

int32_t Pathfinder::distance(GridPos a, GridPos b, DiagonalPolicy policy) noexcept {
    return heuristic(a, b, 0, policy);
}

} // namespace tcc::grid
