#pragma once

/// @file tactical_queries.hpp
/// @brief Reach triggers, elevation, range, hazards and jumping.
///
/// These answer "what does this movement or position imply" questions
/// for the session layer. They never mutate the grid and never roll dice:
/// hazards report a damage notation for the rules layer to roll.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tcc/grid/combat_grid.hpp"
#include "tcc/grid/grid_types.hpp"

namespace tcc::grid {

/// Default pit depth in feet when a pit cell declares none.
inline constexpr int32_t kDefaultPitDepth = 10;

/// Falling damage cap: 20d6.
inline constexpr int32_t kMaxFallDice = 20;

/// What an enemy brings to a reach check.
struct ThreatProfile {
    CombatantId id;
    int32_t reachFeet = kFeetPerSquare;
    bool sentinel = false;       ///< Ignores Disengage
    bool polearmMaster = false;  ///< Reacts to creatures entering reach
};

/// Movement-relevant state of the creature that is moving.
struct MoverState {
    bool disengaged = false;
    bool mobile = false;                        ///< Mobile feat
    std::vector<CombatantId> attackedThisTurn;  ///< Consulted only with mobile
};

struct ElevationModifier {
    int32_t attackBonus = 0;
    std::string reason;
};

struct RangeCheck {
    bool inRange = false;
    bool longRange = false;  ///< Beyond normal range: attack at disadvantage
    int32_t distanceFeet = 0;
};

/// Damage implied by entering a cell.
struct HazardEffect {
    std::string damageNotation;
    std::string damageType;
    std::string description;
};

enum class JumpKind : uint8_t {
    Long,
    High
};

struct JumpRequest {
    CombatantId jumper;
    GridPos from;
    GridPos to;
    int32_t strengthScore = 10;
    int32_t strengthModifier = 0;
    bool runningStart = true;
    JumpKind kind = JumpKind::Long;
};

struct JumpResult {
    bool success = false;
    int32_t distanceFeet = 0;
    int32_t movementCost = 0;  ///< Includes the 10 ft run-up when taken
    std::string description;
    std::vector<GridPos> clearedHazards;  ///< Hazard and pit cells passed over
};

class TacticalQueries {
public:
    TacticalQueries() = delete;

    /// Enemies whose reach the mover was inside at @p from and is outside
    /// of at @p to. Disengage suppresses everyone except Sentinel holders.
    /// With Mobile, enemies the mover attacked this turn do not react.
    [[nodiscard]] static std::vector<CombatantId>
    opportunityAttackTriggers(const CombatGrid& grid, GridPos from, GridPos to,
                              const std::vector<ThreatProfile>& enemies,
                              const MoverState& mover = {});

    /// Polearm Master holders whose 10 ft reach the mover enters.
    [[nodiscard]] static std::vector<CombatantId>
    polearmMasterTriggers(const CombatGrid& grid, GridPos from, GridPos to,
                          const std::vector<ThreatProfile>& enemies);

    /// +2 to hit when the attacker stands higher than the target.
    [[nodiscard]] static ElevationModifier elevationAttackModifier(const CombatGrid& grid,
                                                                   GridPos attacker,
                                                                   GridPos target);

    /// +5 ft of range per full 10 ft of height advantage.
    [[nodiscard]] static int32_t elevationRangeBonus(const CombatGrid& grid,
                                                     GridPos attacker, GridPos target);

    /// Range check using the grid's diagonal policy.
    /// @param longRangeFeet 0 means four times the normal range.
    [[nodiscard]] static RangeCheck isInRange(const CombatGrid& grid, GridPos attacker,
                                              GridPos target, int32_t normalRangeFeet,
                                              int32_t longRangeFeet = 0);

    /// Declared hazard of the cell, else pit fall damage, else nothing.
    [[nodiscard]] static std::optional<HazardEffect> hazardOnEnter(const CombatGrid& grid,
                                                                   GridPos pos);

    [[nodiscard]] static int32_t longJumpDistance(int32_t strengthScore, bool runningStart);
    [[nodiscard]] static int32_t highJumpHeight(int32_t strengthModifier, bool runningStart);

    [[nodiscard]] static JumpResult attemptJump(const CombatGrid& grid,
                                                const JumpRequest& request);
};

} // namespace tcc::grid
