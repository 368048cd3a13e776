#pragma once

/// @file rules_registry.hpp
/// @brief Immutable rule data: ruleset options plus weapon, armor and
///        monster descriptors.
///
/// Built once at startup and shared as std::shared_ptr<const RulesRegistry>
/// by every ResolutionEngine. There is no global instance.

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "tcc/foundation/game_result.hpp"
#include "tcc/rules/combat_math.hpp"
#include "tcc/rules/rules_config.hpp"

namespace tcc::foundation {
class ConfigManager;
}

namespace tcc::rules {

struct WeaponDescriptor {
    std::string id;
    std::string name;
    std::string damageNotation;  ///< Validated at build time
    std::string damageType;
    bool finesse = false;
    bool ranged = false;
    int32_t reachFeet = 5;
    int32_t normalRangeFeet = 5;
    int32_t longRangeFeet = 0;   ///< 0 for melee weapons
};

struct ArmorDescriptor {
    std::string id;
    std::string name;
    std::string armorClassText;
    ArmorClassFormula armorClass;  ///< Parsed from armorClassText
};

struct MonsterDescriptor {
    std::string id;
    std::string name;
    int32_t armorClass = 10;
    int32_t maxHp = 1;
    int32_t speedFeet = 30;
    int32_t attackBonus = 0;
    std::string damageNotation;
    std::string damageType;
    std::vector<std::string> resistances;
    std::vector<std::string> vulnerabilities;
    std::vector<std::string> immunities;

    [[nodiscard]] DamageTraits traitsFor(std::string_view damageType) const;
};

class RulesRegistry {
public:
    /// Collects descriptors and validates them on build().
    ///
    /// Example:
    /// @code
    ///   auto registry = RulesRegistry::Builder()
    ///       .config(RulesConfig::preset("classic_2014").value())
    ///       .addWeapon({"longsword", "Longsword", "1d8", "slashing"})
    ///       .addArmor("chain_mail", "Chain Mail", "16")
    ///       .build();
    /// @endcode
    class Builder {
    public:
        Builder& config(RulesConfig config);
        Builder& addWeapon(WeaponDescriptor weapon);
        Builder& addArmor(std::string id, std::string name, std::string armorClassText);
        Builder& addMonster(MonsterDescriptor monster);

        /// Fails with the first invalid damage notation or AC formula.
        GameResult<std::shared_ptr<const RulesRegistry>> build();

    private:
        RulesConfig config_;
        std::vector<WeaponDescriptor> weapons_;
        std::vector<ArmorDescriptor> armor_;
        std::vector<MonsterDescriptor> monsters_;
    };

    /// Registry holding @p config and no descriptors.
    static std::shared_ptr<const RulesRegistry> withConfig(RulesConfig config);

    /// Read weapons / armor / monsters from a YAML data file.
    static GameResult<std::shared_ptr<const RulesRegistry>>
    loadFromFile(const std::filesystem::path& path, RulesConfig config);

    /// RulesConfig::fromConfig(), plus rule data from "rules.data_file"
    /// when that key is present.
    static GameResult<std::shared_ptr<const RulesRegistry>>
    fromConfig(const foundation::ConfigManager& config);

    [[nodiscard]] const RulesConfig& config() const noexcept { return config_; }

    /// nullptr when unknown.
    [[nodiscard]] const WeaponDescriptor* weapon(std::string_view id) const;
    [[nodiscard]] const ArmorDescriptor* armor(std::string_view id) const;
    [[nodiscard]] const MonsterDescriptor* monster(std::string_view id) const;

    [[nodiscard]] std::size_t weaponCount() const noexcept { return weapons_.size(); }
    [[nodiscard]] std::size_t armorCount() const noexcept { return armor_.size(); }
    [[nodiscard]] std::size_t monsterCount() const noexcept { return monsters_.size(); }

private:
    // Only the factories can name it, so every registry lives in a shared_ptr.
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    explicit RulesRegistry(ConstructionKey) {}

private:

    RulesConfig config_;
    std::map<std::string, WeaponDescriptor, std::less<>> weapons_;
    std::map<std::string, ArmorDescriptor, std::less<>> armor_;
    std::map<std::string, MonsterDescriptor, std::less<>> monsters_;
};

} // namespace tcc::rules
