#pragma once

/// @file rules_config.hpp
/// @brief Ruleset variant toggles and their named presets.

#include <cstdint>
#include <string>
#include <string_view>

#include "tcc/foundation/game_result.hpp"

namespace tcc::foundation {
class ConfigManager;
}

namespace tcc::rules {

using foundation::GameResult;

enum class BaseRuleset : uint8_t {
    Rules2014,
    Rules2024
};

/// Ruleset options that change how the Resolution Engine and the status
/// machines behave. A plain value; copy it freely.
///
/// Presets:
/// | Name          | Base | Player-only crits |
/// |---------------|------|-------------------|
/// | bg3_style     | 2014 | off               |
/// | classic_2014  | 2014 | off               |
/// | full_2024     | 2024 | on                |
struct RulesConfig {
    std::string presetName = "full_2024";
    BaseRuleset baseRuleset = BaseRuleset::Rules2024;

    /// Non-player criticals still hit but deal ordinary damage.
    bool playerOnlyCriticals = true;

    /// Overflow damage >= max HP kills outright instead of dropping to 0.
    bool massiveDamageInstantDeath = true;

    /// @return the named preset, or UnknownPreset.
    static GameResult<RulesConfig> preset(std::string_view name);

    /// Build from "rules.*" keys: rules.preset picks the starting point,
    /// then rules.base_ruleset, rules.player_only_criticals and
    /// rules.massive_damage_instant_death override it when present.
    /// Changing the base ruleset without an explicit player_only_criticals
    /// resets that toggle to the base ruleset's default.
    static GameResult<RulesConfig> fromConfig(const foundation::ConfigManager& config);

    /// "2014" / "2024".
    static GameResult<BaseRuleset> parseBaseRuleset(std::string_view text);
};

[[nodiscard]] std::string_view baseRulesetName(BaseRuleset ruleset) noexcept;

} // namespace tcc::rules
