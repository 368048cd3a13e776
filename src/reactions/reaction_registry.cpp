/// @file reaction_registry.cpp
/// @brief Per-combatant reaction availability and round refresh.

#include "tcc/reactions/reaction_registry.hpp"

#include "tcc/foundation/game_logger.hpp"

namespace tcc::reactions {

using foundation::LogCategory;

std::string_view reactionTriggerName(ReactionTrigger trigger) noexcept {
    switch (trigger) {
        case ReactionTrigger::EnemyLeavesReach: return "enemy_leaves_reach";
        case ReactionTrigger::EnemyEntersReach: return "enemy_enters_reach";
        case ReactionTrigger::BeingAttacked:    return "being_attacked";
        case ReactionTrigger::BeingHit:         return "being_hit";
        case ReactionTrigger::TakingDamage:     return "taking_damage";
        case ReactionTrigger::EnemyCastsSpell:  return "enemy_casts_spell";
        case ReactionTrigger::AllyAttacked:     return "ally_attacked";
        case ReactionTrigger::Custom:           return "custom";
    }
    return "unknown";
}

void ReactionRegistry::registerCombatant(CombatantId id) {
    records_.try_emplace(id, ReactionRecord{id, true, std::nullopt});
}

bool ReactionRegistry::unregisterCombatant(CombatantId id) {
    return records_.erase(id) > 0;
}

bool ReactionRegistry::isRegistered(CombatantId id) const {
    return records_.find(id) != records_.end();
}

bool ReactionRegistry::hasReaction(CombatantId id) const {
    auto it = records_.find(id);
    return it != records_.end() && it->second.available;
}

bool ReactionRegistry::useReaction(CombatantId id) {
    auto it = records_.find(id);
    if (it == records_.end() || !it->second.available) {
        return false;
    }
    it->second.available = false;
    TCC_LOG_DEBUG(LogCategory::Reactions,
                  "combatant " + std::to_string(id.value()) + " used reaction");
    return true;
}

bool ReactionRegistry::resetForTurn(CombatantId id) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }
    it->second.available = true;
    return true;
}

bool ReactionRegistry::setReadiedAction(CombatantId id, ReadiedAction action) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }
    it->second.readied = std::move(action);
    return true;
}

bool ReactionRegistry::clearReadiedAction(CombatantId id) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return false;
    }
    it->second.readied.reset();
    return true;
}

std::optional<ReadiedAction> ReactionRegistry::readiedAction(CombatantId id) const {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second.readied;
}

std::optional<ReadiedAction> ReactionRegistry::triggerReadiedAction(CombatantId id) {
    auto it = records_.find(id);
    if (it == records_.end() || !it->second.readied || !it->second.available) {
        return std::nullopt;
    }
    it->second.available = false;
    std::optional<ReadiedAction> fired = std::move(it->second.readied);
    it->second.readied.reset();
    return fired;
}

std::vector<CombatantId>
ReactionRegistry::eligibleReactors(const std::vector<CombatantId>& candidates) const {
    std::vector<CombatantId> eligible;
    for (const auto& id : candidates) {
        if (hasReaction(id)) {
            eligible.push_back(id);
        }
    }
    return eligible;
}

const ReactionRecord* ReactionRegistry::record(CombatantId id) const {
    auto it = records_.find(id);
    return it == records_.end() ? nullptr : &it->second;
}

} // namespace tcc::reactions
