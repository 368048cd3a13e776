/// @file combat_grid.cpp
/// @brief CombatGrid implementation.

#include "tcc/grid/combat_grid.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "tcc/foundation/game_logger.hpp"

namespace tcc::grid {

using foundation::LogCategory;

std::optional<DiagonalPolicy> parseDiagonalPolicy(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "chebyshev") {
        return DiagonalPolicy::Chebyshev;
    }
    if (lowered == "alternating") {
        return DiagonalPolicy::Alternating;
    }
    return std::nullopt;
}

std::string_view diagonalPolicyName(DiagonalPolicy policy) noexcept {
    switch (policy) {
        case DiagonalPolicy::Chebyshev:   return "chebyshev";
        case DiagonalPolicy::Alternating: return "alternating";
    }
    return "unknown";
}

CombatGrid::CombatGrid(int32_t width, int32_t height, DiagonalPolicy policy)
    : width_(std::max<int32_t>(1, width)),
      height_(std::max<int32_t>(1, height)),
      policy_(policy) {
    if (width < 1 || height < 1) {
        TCC_LOG_WARN(LogCategory::Grid,
                     "grid dimensions " + std::to_string(width) + "x" +
                         std::to_string(height) + " clamped to " +
                         std::to_string(width_) + "x" + std::to_string(height_));
    }
    cells_.resize(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_));
    for (int32_t y = 0; y < height_; ++y) {
        for (int32_t x = 0; x < width_; ++x) {
            cells_[indexOf({x, y})].pos = GridPos{x, y};
        }
    }
}

const GridCell* CombatGrid::cell(GridPos pos) const noexcept {
    if (!isValidPosition(pos)) {
        return nullptr;
    }
    return &cells_[indexOf(pos)];
}

GridCell* CombatGrid::mutableCell(GridPos pos) noexcept {
    if (!isValidPosition(pos)) {
        return nullptr;
    }
    return &cells_[indexOf(pos)];
}

bool CombatGrid::isPassable(GridPos pos) const noexcept {
    const auto* c = cell(pos);
    return c != nullptr && c->isPassable();
}

std::optional<CombatantId> CombatGrid::occupant(GridPos pos) const noexcept {
    const auto* c = cell(pos);
    if (c == nullptr) {
        return std::nullopt;
    }
    return c->occupant;
}

std::optional<GridPos> CombatGrid::findCombatant(CombatantId id) const noexcept {
    for (const auto& c : cells_) {
        if (c.occupant == id) {
            return c.pos;
        }
    }
    return std::nullopt;
}

bool CombatGrid::setTerrain(GridPos pos, TerrainKind terrain) {
    auto* c = mutableCell(pos);
    if (c == nullptr) {
        return false;
    }
    c->terrain = terrain;
    return true;
}

bool CombatGrid::setOccupant(GridPos pos, std::optional<CombatantId> id) {
    auto* c = mutableCell(pos);
    if (c == nullptr) {
        return false;
    }
    c->occupant = id;
    return true;
}

bool CombatGrid::setElevation(GridPos pos, int32_t elevation) {
    auto* c = mutableCell(pos);
    if (c == nullptr) {
        return false;
    }
    c->elevation = elevation;
    return true;
}

bool CombatGrid::setCover(GridPos pos, int32_t cover) {
    if (cover != kNoCover && cover != kHalfCover && cover != kThreeQuartersCover) {
        return false;
    }
    auto* c = mutableCell(pos);
    if (c == nullptr) {
        return false;
    }
    c->cover = cover;
    return true;
}

bool CombatGrid::setPitDepth(GridPos pos, int32_t depthFeet) {
    auto* c = mutableCell(pos);
    if (c == nullptr) {
        return false;
    }
    c->pitDepth = std::max<int32_t>(0, depthFeet);
    return true;
}

bool CombatGrid::setHazard(GridPos pos, Hazard hazard) {
    auto* c = mutableCell(pos);
    if (c == nullptr) {
        return false;
    }
    c->hazard = std::move(hazard);
    return true;
}

bool CombatGrid::clearHazard(GridPos pos) {
    auto* c = mutableCell(pos);
    if (c == nullptr) {
        return false;
    }
    c->hazard.reset();
    return true;
}

std::vector<GridPos> CombatGrid::adjacentCells(GridPos pos, bool includeDiagonals) const {
    static constexpr GridPos kOrthogonal[] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};
    static constexpr GridPos kDiagonal[] = {{1, 1}, {1, -1}, {-1, 1}, {-1, -1}};

    std::vector<GridPos> result;
    result.reserve(8);
    for (const auto& d : kOrthogonal) {
        GridPos n{pos.x + d.x, pos.y + d.y};
        if (isValidPosition(n)) {
            result.push_back(n);
        }
    }
    if (includeDiagonals) {
        for (const auto& d : kDiagonal) {
            GridPos n{pos.x + d.x, pos.y + d.y};
            if (isValidPosition(n)) {
                result.push_back(n);
            }
        }
    }
    return result;
}

std::vector<GridPos> CombatGrid::cellsInRadius(GridPos center, int32_t radiusFeet) const {
    std::vector<GridPos> result;
    if (radiusFeet < 0) {
        return result;
    }
    const int32_t r = radiusFeet / kFeetPerSquare;
    for (int32_t y = center.y - r; y <= center.y + r; ++y) {
        for (int32_t x = center.x - r; x <= center.x + r; ++x) {
            GridPos p{x, y};
            if (isValidPosition(p)) {
                result.push_back(p);
            }
        }
    }
    return result;
}

} // namespace tcc::grid
