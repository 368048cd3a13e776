#pragma once

/// @file combat_grid.hpp
/// @brief Fixed-size battle grid owning every cell of one encounter.

#include <cstdint>
#include <optional>
#include <vector>

#include "tcc/grid/grid_types.hpp"

namespace tcc::grid {

/// Dense width x height grid of GridCells.
///
/// Every coordinate access is bounds-checked: reads outside the grid
/// return nullptr / std::nullopt and setters return false. Nothing here
/// is an error, since probing off the edge is routine for callers.
///
/// Thread safety: None. A grid belongs to exactly one CombatSession.
class CombatGrid {
public:
    /// Non-positive dimensions are clamped to 1.
    explicit CombatGrid(int32_t width = kDefaultGridWidth,
                        int32_t height = kDefaultGridHeight,
                        DiagonalPolicy policy = DiagonalPolicy::Chebyshev);

    // ── Accessors ──────────────────────────────────────────────────────

    [[nodiscard]] int32_t width() const noexcept { return width_; }
    [[nodiscard]] int32_t height() const noexcept { return height_; }
    [[nodiscard]] DiagonalPolicy diagonalPolicy() const noexcept { return policy_; }
    void setDiagonalPolicy(DiagonalPolicy policy) noexcept { policy_ = policy; }

    [[nodiscard]] bool isValidPosition(GridPos pos) const noexcept {
        return pos.x >= 0 && pos.y >= 0 && pos.x < width_ && pos.y < height_;
    }

    /// nullptr when out of bounds.
    [[nodiscard]] const GridCell* cell(GridPos pos) const noexcept;
    [[nodiscard]] const GridCell* cell(int32_t x, int32_t y) const noexcept {
        return cell(GridPos{x, y});
    }

    /// False for out-of-bounds, impassable and occupied cells.
    [[nodiscard]] bool isPassable(GridPos pos) const noexcept;

    [[nodiscard]] std::optional<CombatantId> occupant(GridPos pos) const noexcept;

    /// Position of @p id, scanning row-major.
    [[nodiscard]] std::optional<GridPos> findCombatant(CombatantId id) const noexcept;

    // ── Mutation ───────────────────────────────────────────────────────

    bool setTerrain(GridPos pos, TerrainKind terrain);

    /// Pass std::nullopt to vacate the cell.
    bool setOccupant(GridPos pos, std::optional<CombatantId> id);

    bool setElevation(GridPos pos, int32_t elevation);

    /// Accepts only kNoCover, kHalfCover and kThreeQuartersCover.
    bool setCover(GridPos pos, int32_t cover);

    /// Negative depths are stored as 0.
    bool setPitDepth(GridPos pos, int32_t depthFeet);

    bool setHazard(GridPos pos, Hazard hazard);
    bool clearHazard(GridPos pos);

    // ── Neighbourhood ──────────────────────────────────────────────────

    /// In-bounds neighbours: orthogonal first (E, W, S, N), then diagonals.
    [[nodiscard]] std::vector<GridPos> adjacentCells(GridPos pos,
                                                     bool includeDiagonals = true) const;

    /// In-bounds cells within @p radiusFeet (Chebyshev), including @p center.
    [[nodiscard]] std::vector<GridPos> cellsInRadius(GridPos center,
                                                     int32_t radiusFeet) const;

private:
    [[nodiscard]] std::size_t indexOf(GridPos pos) const noexcept {
        return static_cast<std::size_t>(pos.y) * static_cast<std::size_t>(width_) +
               static_cast<std::size_t>(pos.x);
    }

    GridCell* mutableCell(GridPos pos) noexcept;

    int32_t width_;
    int32_t height_;
    DiagonalPolicy policy_;
    std::vector<GridCell> cells_;
};

} // namespace tcc::grid
