/// @file tactical_queries.cpp
/// @brief TacticalQueries implementation.

#include "tcc/grid/tactical_queries.hpp"

#include <algorithm>

#include "tcc/grid/pathfinder.hpp"

namespace tcc::grid {

namespace {

// Polearm Master always works at 10 ft.
constexpr int32_t kPolearmReachSquares = 2;

constexpr int32_t kRunningStartFeet = 10;

JumpResult jumpFailure(std::string description) {
    JumpResult result;
    result.description = std::move(description);
    return result;
}

} // namespace

std::vector<CombatantId> TacticalQueries::opportunityAttackTriggers(
    const CombatGrid& grid, GridPos from, GridPos to,
    const std::vector<ThreatProfile>& enemies, const MoverState& mover) {
    std::vector<CombatantId> result;

    for (const auto& enemy : enemies) {
        auto enemyPos = grid.findCombatant(enemy.id);
        if (!enemyPos) {
            continue;
        }
        if (mover.disengaged && !enemy.sentinel) {
            continue;
        }
        if (mover.mobile &&
            std::find(mover.attackedThisTurn.begin(), mover.attackedThisTurn.end(),
                      enemy.id) != mover.attackedThisTurn.end()) {
            continue;
        }

        const int32_t reach = std::max<int32_t>(1, enemy.reachFeet / kFeetPerSquare);
        if (chebyshevSquares(from, *enemyPos) <= reach &&
            chebyshevSquares(to, *enemyPos) > reach) {
            result.push_back(enemy.id);
        }
    }
    return result;
}

std::vector<CombatantId> TacticalQueries::polearmMasterTriggers(
    const CombatGrid& grid, GridPos from, GridPos to,
    const std::vector<ThreatProfile>& enemies) {
    std::vector<CombatantId> result;

    for (const auto& enemy : enemies) {
        if (!enemy.polearmMaster) {
            continue;
        }
        auto enemyPos = grid.findCombatant(enemy.id);
        if (!enemyPos) {
            continue;
        }
        if (chebyshevSquares(from, *enemyPos) > kPolearmReachSquares &&
            chebyshevSquares(to, *enemyPos) <= kPolearmReachSquares) {
            result.push_back(enemy.id);
        }
    }
    return result;
}

ElevationModifier TacticalQueries::elevationAttackModifier(const CombatGrid& grid,
                                                           GridPos attacker,
                                                           GridPos target) {
    const GridCell* a = grid.cell(attacker);
    const GridCell* t = grid.cell(target);
    if (a == nullptr || t == nullptr) {
        return {};
    }
    const int32_t diff = a->elevation - t->elevation;
    if (diff >= 1) {
        return {2, "High ground (+2 attack, " + std::to_string(diff * kFeetPerSquare) +
                       "ft above)"};
    }
    return {};
}

int32_t TacticalQueries::elevationRangeBonus(const CombatGrid& grid, GridPos attacker,
                                             GridPos target) {
    const GridCell* a = grid.cell(attacker);
    const GridCell* t = grid.cell(target);
    if (a == nullptr || t == nullptr) {
        return 0;
    }
    const int32_t diff = a->elevation - t->elevation;
    return diff > 0 ? (diff / 2) * kFeetPerSquare : 0;
}

RangeCheck TacticalQueries::isInRange(const CombatGrid& grid, GridPos attacker,
                                      GridPos target, int32_t normalRangeFeet,
                                      int32_t longRangeFeet) {
    RangeCheck check;
    check.distanceFeet = Pathfinder::distance(attacker, target, grid.diagonalPolicy());

    const int32_t bonus = elevationRangeBonus(grid, attacker, target);
    const int32_t normal = normalRangeFeet + bonus;
    const int32_t longer =
        (longRangeFeet > 0 ? longRangeFeet : normalRangeFeet * 4) + bonus;

    check.inRange = check.distanceFeet <= std::max(normal, longer);
    check.longRange = check.inRange && check.distanceFeet > normal;
    return check;
}

std::optional<HazardEffect> TacticalQueries::hazardOnEnter(const CombatGrid& grid,
                                                           GridPos pos) {
    const GridCell* c = grid.cell(pos);
    if (c == nullptr) {
        return std::nullopt;
    }
    if (c->hazard && !c->hazard->damageNotation.empty()) {
        return HazardEffect{c->hazard->damageNotation, c->hazard->damageType,
                            "Entered hazardous terrain (" + c->hazard->damageType + ")"};
    }
    if (c->terrain == TerrainKind::Pit) {
        const int32_t depth = c->pitDepth > 0 ? c->pitDepth : kDefaultPitDepth;
        const int32_t dice = std::clamp<int32_t>(depth / 10, 1, kMaxFallDice);
        return HazardEffect{std::to_string(dice) + "d6", "bludgeoning",
                            "Fell " + std::to_string(depth) + "ft into a pit"};
    }
    return std::nullopt;
}

int32_t TacticalQueries::longJumpDistance(int32_t strengthScore, bool runningStart) {
    const int32_t full = std::max<int32_t>(0, strengthScore);
    return runningStart ? full : full / 2;
}

int32_t TacticalQueries::highJumpHeight(int32_t strengthModifier, bool runningStart) {
    const int32_t full = std::max<int32_t>(0, 3 + strengthModifier);
    return runningStart ? full : full / 2;
}

JumpResult TacticalQueries::attemptJump(const CombatGrid& grid, const JumpRequest& request) {
    const GridCell* start = grid.cell(request.from);
    const GridCell* end = grid.cell(request.to);
    if (end == nullptr) {
        return jumpFailure("Invalid destination");
    }
    if (end->terrain == TerrainKind::Impassable) {
        return jumpFailure("Cannot land on impassable terrain");
    }
    if (end->occupant && *end->occupant != request.jumper) {
        return jumpFailure("Cannot land on occupied space");
    }

    const int32_t distance = chebyshevSquares(request.from, request.to) * kFeetPerSquare;
    const int32_t rise = start != nullptr ? end->elevation - start->elevation : 0;
    const int32_t maxHeight = highJumpHeight(request.strengthModifier, request.runningStart);

    if (rise > 0 && rise * kFeetPerSquare > maxHeight) {
        return jumpFailure("Cannot jump high enough (" +
                           std::to_string(rise * kFeetPerSquare) + "ft needed, " +
                           std::to_string(maxHeight) + "ft max)");
    }
    if (request.kind == JumpKind::Long) {
        const int32_t maxDistance = longJumpDistance(request.strengthScore, request.runningStart);
        if (distance > maxDistance) {
            return jumpFailure("Distance too far (" + std::to_string(distance) + "ft, max " +
                               std::to_string(maxDistance) + "ft)");
        }
    }

    JumpResult result;
    result.success = true;
    result.distanceFeet = distance;
    result.movementCost = distance + (request.runningStart ? kRunningStartFeet : 0);

    for (const GridPos& p : Pathfinder::lineOfSight(grid, request.from, request.to).cells) {
        if (p == request.from || p == request.to) {
            continue;
        }
        const GridCell* c = grid.cell(p);
        if (c != nullptr && (c->hazard.has_value() || c->terrain == TerrainKind::Pit)) {
            result.clearedHazards.push_back(p);
        }
    }

    result.description = "Jumped " + std::to_string(distance) + "ft";
    if (!result.clearedHazards.empty()) {
        result.description +=
            ", cleared " + std::to_string(result.clearedHazards.size()) + " hazards";
    }
    return result;
}

} // namespace tcc::grid
