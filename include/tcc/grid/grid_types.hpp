#pragma once

/// @file grid_types.hpp
/// @brief Value types shared by the battle grid and its queries.
///
/// Distances and movement costs are in feet; one square is 5 ft.

#include <compare>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include "tcc/foundation/types.hpp"

namespace tcc::grid {

using foundation::CombatantId;

inline constexpr int32_t kFeetPerSquare = 5;
inline constexpr int32_t kDefaultGridWidth = 8;
inline constexpr int32_t kDefaultGridHeight = 8;

/// Entry cost reported for impassable cells.
inline constexpr int32_t kImpassableCost = std::numeric_limits<int32_t>::max();

/// Cover value reported when line of sight is blocked outright.
inline constexpr int32_t kTotalCover = 100;

/// Declared cover values a cell may carry (+2 half, +5 three-quarters).
inline constexpr int32_t kNoCover = 0;
inline constexpr int32_t kHalfCover = 2;
inline constexpr int32_t kThreeQuartersCover = 5;

/// Ground kind of a single cell.
enum class TerrainKind : uint8_t {
    Open,
    Difficult,
    Impassable,
    Water,
    Pit
};

/// How diagonal steps are priced.
enum class DiagonalPolicy : uint8_t {
    Chebyshev,   ///< Every diagonal costs the same as an orthogonal step
    Alternating  ///< Diagonals alternate normal and double cost (5-10-5)
};

/// Cost in feet of entering a cell of the given terrain.
constexpr int32_t terrainCost(TerrainKind terrain) noexcept {
    switch (terrain) {
        case TerrainKind::Open:       return kFeetPerSquare;
        case TerrainKind::Difficult:  return 2 * kFeetPerSquare;
        case TerrainKind::Impassable: return kImpassableCost;
        case TerrainKind::Water:      return 2 * kFeetPerSquare;
        case TerrainKind::Pit:        return kFeetPerSquare;
    }
    return kImpassableCost;
}

constexpr std::string_view terrainName(TerrainKind terrain) noexcept {
    switch (terrain) {
        case TerrainKind::Open:       return "open";
        case TerrainKind::Difficult:  return "difficult";
        case TerrainKind::Impassable: return "impassable";
        case TerrainKind::Water:      return "water";
        case TerrainKind::Pit:        return "pit";
    }
    return "unknown";
}

/// Parse "chebyshev" / "alternating" (as written in configuration).
[[nodiscard]] std::optional<DiagonalPolicy> parseDiagonalPolicy(std::string_view text);

[[nodiscard]] std::string_view diagonalPolicyName(DiagonalPolicy policy) noexcept;

/// Integer cell coordinate. Ordered row-major (y first, then x).
struct GridPos {
    int32_t x = 0;
    int32_t y = 0;

    constexpr bool operator==(const GridPos&) const = default;

    constexpr std::strong_ordering operator<=>(const GridPos& other) const {
        if (auto cmp = y <=> other.y; cmp != 0) {
            return cmp;
        }
        return x <=> other.x;
    }
};

/// Chebyshev distance in squares.
constexpr int32_t chebyshevSquares(GridPos a, GridPos b) noexcept {
    int32_t dx = a.x > b.x ? a.x - b.x : b.x - a.x;
    int32_t dy = a.y > b.y ? a.y - b.y : b.y - a.y;
    return dx > dy ? dx : dy;
}

/// Damage dealt on entering a hazardous cell (fire, acid, spikes).
struct Hazard {
    std::string damageNotation;  ///< e.g. "2d6"
    std::string damageType;      ///< e.g. "fire"
};

/// A single square of the battle grid.
struct GridCell {
    GridPos pos;
    TerrainKind terrain = TerrainKind::Open;
    std::optional<CombatantId> occupant;  ///< Weak reference, never owned
    int32_t cover = kNoCover;
    int32_t elevation = 0;                ///< In 5 ft steps, 0 = ground
    int32_t pitDepth = 0;                 ///< Feet; only meaningful for pits
    std::optional<Hazard> hazard;

    [[nodiscard]] bool isPassable() const noexcept {
        return terrain != TerrainKind::Impassable && !occupant.has_value();
    }

    [[nodiscard]] int32_t movementCost() const noexcept { return terrainCost(terrain); }
};

} // namespace tcc::grid

template <>
struct std::hash<tcc::grid::GridPos> {
    std::size_t operator()(const tcc::grid::GridPos& p) const noexcept {
        auto h1 = std::hash<int32_t>{}(p.x);
        auto h2 = std::hash<int32_t>{}(p.y);
        return h1 ^ (h2 * 2654435761u);
    }
};
