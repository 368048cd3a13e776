/// @file rules_config.cpp
/// @brief Named rules presets and the YAML overrides applied over them.

#include "tcc/rules/rules_config.hpp"

#include "tcc/foundation/config_manager.hpp"
#include "tcc/foundation/game_logger.hpp"

namespace tcc::rules {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::LogCategory;

std::string_view baseRulesetName(BaseRuleset ruleset) noexcept {
    switch (ruleset) {
        case BaseRuleset::Rules2014: return "2014";
        case BaseRuleset::Rules2024: return "2024";
    }
    return "unknown";
}

GameResult<BaseRuleset> RulesConfig::parseBaseRuleset(std::string_view text) {
    if (text == "2014") {
        return GameResult<BaseRuleset>::ok(BaseRuleset::Rules2014);
    }
    if (text == "2024") {
        return GameResult<BaseRuleset>::ok(BaseRuleset::Rules2024);
    }
    return GameResult<BaseRuleset>::err(
        GameError(ErrorCode::InvalidArgument,
                  "unknown base ruleset: " + std::string(text)));
}

GameResult<RulesConfig> RulesConfig::preset(std::string_view name) {
    RulesConfig config;
    config.presetName = std::string(name);

    if (name == "bg3_style" || name == "classic_2014") {
        config.baseRuleset = BaseRuleset::Rules2014;
        config.playerOnlyCriticals = false;
    } else if (name == "full_2024") {
        config.baseRuleset = BaseRuleset::Rules2024;
        config.playerOnlyCriticals = true;
    } else {
        return GameResult<RulesConfig>::err(
            GameError(ErrorCode::UnknownPreset, "unknown rules preset: " + std::string(name)));
    }
    return GameResult<RulesConfig>::ok(std::move(config));
}

GameResult<RulesConfig> RulesConfig::fromConfig(const foundation::ConfigManager& config) {
    auto base = preset(config.getOr<std::string>("rules.preset", "full_2024"));
    if (!base) {
        return base;
    }
    RulesConfig rules = std::move(base).value();

    if (config.hasKey("rules.base_ruleset")) {
        std::string text;
        if (auto r = config.readIfPresent("rules.base_ruleset", text); !r) {
            return GameResult<RulesConfig>::err(r.error());
        }
        auto ruleset = parseBaseRuleset(text);
        if (!ruleset) {
            return GameResult<RulesConfig>::err(ruleset.error());
        }
        rules.baseRuleset = ruleset.value();
        rules.playerOnlyCriticals = rules.baseRuleset == BaseRuleset::Rules2024;
    }

    if (auto r = config.readIfPresent("rules.player_only_criticals", rules.playerOnlyCriticals);
        !r) {
        return GameResult<RulesConfig>::err(r.error());
    }
    if (auto r = config.readIfPresent("rules.massive_damage_instant_death",
                                      rules.massiveDamageInstantDeath);
        !r) {
        return GameResult<RulesConfig>::err(r.error());
    }

    TCC_LOG_INFO(LogCategory::Core,
                 "rules preset " + rules.presetName + ", base " +
                     std::string(baseRulesetName(rules.baseRuleset)));
    return GameResult<RulesConfig>::ok(std::move(rules));
}

} // namespace tcc::rules
