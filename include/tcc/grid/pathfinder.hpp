#pragma once

/// @file pathfinder.hpp
/// @brief Movement search and geometric queries over a CombatGrid.
///
/// All functions are pure with respect to the grid: they read it and
/// return value records. A failed search is an ordinary result with
/// success == false and a reason, never an error.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tcc/grid/combat_grid.hpp"
#include "tcc/grid/grid_types.hpp"

namespace tcc::grid {

/// Outcome of a findPath() call.
struct PathfindingResult {
    bool success = false;
    std::vector<GridPos> path;             ///< Includes both endpoints
    int32_t totalCost = 0;                 ///< Feet
    std::optional<CombatantId> blockedBy;  ///< Set when the destination is occupied
    std::string reason;
};

/// A cell reachable within a movement budget and its cheapest cost.
struct ReachableCell {
    GridPos pos;
    int32_t cost = 0;

    bool operator==(const ReachableCell&) const = default;
};

struct LineOfSight {
    bool clear = true;
    std::vector<GridPos> cells;  ///< Traced cells, origin and target included
};

/// Static pathfinding and line-of-sight utilities.
class Pathfinder {
public:
    Pathfinder() = delete;

    /// A* search from @p from to @p to.
    ///
    /// Checks, in order: both endpoints in bounds, from == to (trivial
    /// success, cost 0), destination occupied (fail with blockedBy, no
    /// search), destination impassable. Occupied and impassable cells are
    /// never expanded and nodes costing more than @p maxMovement are never
    /// opened, so exhausting the budget reports "No path found".
    ///
    /// Open-set ties break on (f, h, y, x, diagonal parity), which makes
    /// the returned path a function of grid state alone.
    [[nodiscard]] static PathfindingResult findPath(const CombatGrid& grid,
                                                    GridPos from, GridPos to,
                                                    int32_t maxMovement,
                                                    DiagonalPolicy policy);

    /// findPath() using the grid's own diagonal policy.
    [[nodiscard]] static PathfindingResult findPath(const CombatGrid& grid,
                                                    GridPos from, GridPos to,
                                                    int32_t maxMovement);

    /// Cost-bounded Dijkstra flood fill.
    ///
    /// Returns each valid destination (not the origin, not occupied, not
    /// impassable) reachable within @p budget, sorted row-major.
    [[nodiscard]] static std::vector<ReachableCell> reachableCells(const CombatGrid& grid,
                                                                   GridPos origin,
                                                                   int32_t budget,
                                                                   DiagonalPolicy policy);

    [[nodiscard]] static std::vector<ReachableCell> reachableCells(const CombatGrid& grid,
                                                                   GridPos origin,
                                                                   int32_t budget);

    /// Cells within @p reachFeet of @p combatant, excluding its own cell.
    /// Empty when the combatant is not on the grid.
    [[nodiscard]] static std::vector<GridPos> threatenedSquares(const CombatGrid& grid,
                                                                CombatantId combatant,
                                                                int32_t reachFeet = kFeetPerSquare);

    /// Bresenham trace between cell centres. Any impassable cell other
    /// than the origin blocks.
    [[nodiscard]] static LineOfSight lineOfSight(const CombatGrid& grid, GridPos from, GridPos to);

    /// 0 when clear, kTotalCover when blocked, otherwise the highest cover
    /// value among intervening cells (endpoints excluded).
    [[nodiscard]] static int32_t cover(const CombatGrid& grid, GridPos attacker, GridPos target);

    /// Open-terrain distance in feet under @p policy.
    [[nodiscard]] static int32_t distance(GridPos a, GridPos b, DiagonalPolicy policy) noexcept;
};

} // namespace tcc::grid
