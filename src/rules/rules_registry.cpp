/// @file rules_registry.cpp
/// @brief RulesRegistry construction and YAML rule-data loading.

#include "tcc/rules/rules_registry.hpp"

#include <algorithm>
#include <memory>

#include <yaml-cpp/yaml.h>

#include "tcc/foundation/config_manager.hpp"
#include "tcc/foundation/game_logger.hpp"
#include "tcc/rules/dice.hpp"

namespace tcc::rules {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::LogCategory;

using RegistryResult = GameResult<std::shared_ptr<const RulesRegistry>>;

namespace {

constexpr int32_t kReachWeaponFeet = 10;

bool contains(const std::vector<std::string>& values, std::string_view needle) {
    return std::find(values.begin(), values.end(), needle) != values.end();
}

std::vector<std::string> stringList(const YAML::Node& node) {
    std::vector<std::string> out;
    if (node && node.IsSequence()) {
        for (const auto& item : node) {
            out.push_back(item.as<std::string>());
        }
    }
    return out;
}

WeaponDescriptor readWeapon(const YAML::Node& node) {
    WeaponDescriptor w;
    w.id = node["id"].as<std::string>();
    w.name = node["name"].as<std::string>(w.id);
    w.damageNotation = node["damage"].as<std::string>();
    w.damageType = node["damage_type"].as<std::string>("");

    const auto properties = stringList(node["properties"]);
    w.finesse = contains(properties, "finesse");
    w.ranged = contains(properties, "ranged") || contains(properties, "ammunition");
    if (contains(properties, "reach")) {
        w.reachFeet = kReachWeaponFeet;
    }

    if (const auto range = node["range"]; range && range.IsSequence() && range.size() == 2) {
        w.normalRangeFeet = range[0].as<int32_t>();
        w.longRangeFeet = range[1].as<int32_t>();
    } else {
        w.normalRangeFeet = w.reachFeet;
    }
    return w;
}

MonsterDescriptor readMonster(const YAML::Node& node) {
    MonsterDescriptor m;
    m.id = node["id"].as<std::string>();
    m.name = node["name"].as<std::string>(m.id);
    m.armorClass = node["armor_class"].as<int32_t>(10);
    m.maxHp = node["hit_points"].as<int32_t>(1);
    m.speedFeet = node["speed"].as<int32_t>(30);
    m.attackBonus = node["attack_bonus"].as<int32_t>(0);
    m.damageNotation = node["damage"].as<std::string>("");
    m.damageType = node["damage_type"].as<std::string>("");
    m.resistances = stringList(node["resistances"]);
    m.vulnerabilities = stringList(node["vulnerabilities"]);
    m.immunities = stringList(node["immunities"]);
    return m;
}

} // namespace

// ── MonsterDescriptor ──────────────────────────────────────────────────

DamageTraits MonsterDescriptor::traitsFor(std::string_view damageType) const {
    DamageTraits traits;
    traits.resistance = contains(resistances, damageType);
    traits.vulnerability = contains(vulnerabilities, damageType);
    traits.immunity = contains(immunities, damageType);
    return traits;
}

// ── Builder ────────────────────────────────────────────────────────────

RulesRegistry::Builder& RulesRegistry::Builder::config(RulesConfig config) {
    config_ = std::move(config);
    return *this;
}

RulesRegistry::Builder& RulesRegistry::Builder::addWeapon(WeaponDescriptor weapon) {
    weapons_.push_back(std::move(weapon));
    return *this;
}

RulesRegistry::Builder& RulesRegistry::Builder::addArmor(std::string id, std::string name,
                                                         std::string armorClassText) {
    ArmorDescriptor armor;
    armor.id = std::move(id);
    armor.name = std::move(name);
    armor.armorClassText = std::move(armorClassText);
    armor_.push_back(std::move(armor));
    return *this;
}

RulesRegistry::Builder& RulesRegistry::Builder::addMonster(MonsterDescriptor monster) {
    monsters_.push_back(std::move(monster));
    return *this;
}

RegistryResult RulesRegistry::Builder::build() {
    auto registry = std::make_shared<RulesRegistry>(ConstructionKey{});
    registry->config_ = config_;

    for (auto& w : weapons_) {
        auto terms = Dice::parseDiceNotation(w.damageNotation);
        if (!terms) {
            return RegistryResult::err(GameError(
                terms.error().code(),
                "weapon '" + w.id + "': " + std::string(terms.error().message())));
        }
        registry->weapons_.insert_or_assign(w.id, w);
    }

    for (auto& a : armor_) {
        auto formula = CombatMath::parseArmorClass(a.armorClassText);
        if (!formula) {
            return RegistryResult::err(GameError(
                ErrorCode::InvalidArmorClass,
                "armor '" + a.id + "': " + std::string(formula.error().message())));
        }
        a.armorClass = formula.value();
        registry->armor_.insert_or_assign(a.id, a);
    }

    for (auto& m : monsters_) {
        if (!m.damageNotation.empty()) {
            auto terms = Dice::parseDiceNotation(m.damageNotation);
            if (!terms) {
                return RegistryResult::err(GameError(
                    terms.error().code(),
                    "monster '" + m.id + "': " + std::string(terms.error().message())));
            }
        }
        registry->monsters_.insert_or_assign(m.id, m);
    }

    TCC_LOG_INFO(LogCategory::Core,
                 "rules registry built: " + std::to_string(registry->weapons_.size()) +
                     " weapons, " + std::to_string(registry->armor_.size()) + " armor, " +
                     std::to_string(registry->monsters_.size()) + " monsters");
    return RegistryResult::ok(std::move(registry));
}

// ── RulesRegistry ──────────────────────────────────────────────────────

std::shared_ptr<const RulesRegistry> RulesRegistry::withConfig(RulesConfig config) {
    auto registry = std::make_shared<RulesRegistry>(ConstructionKey{});
    registry->config_ = std::move(config);
    return registry;
}

RegistryResult RulesRegistry::loadFromFile(const std::filesystem::path& path,
                                           RulesConfig config) {
    Builder builder;
    builder.config(std::move(config));

    try {
        const YAML::Node root = YAML::LoadFile(path.string());
        if (const auto weapons = root["weapons"]) {
            for (const auto& node : weapons) {
                builder.addWeapon(readWeapon(node));
            }
        }
        if (const auto armor = root["armor"]) {
            for (const auto& node : armor) {
                const auto id = node["id"].as<std::string>();
                builder.addArmor(id, node["name"].as<std::string>(id),
                                 node["armor_class"].as<std::string>());
            }
        }
        if (const auto monsters = root["monsters"]) {
            for (const auto& node : monsters) {
                builder.addMonster(readMonster(node));
            }
        }
    } catch (const YAML::Exception& e) {
        TCC_LOG_ERROR(LogCategory::Core, "rule data " + path.string() + ": " + e.what());
        return RegistryResult::err(
            GameError(ErrorCode::RulesDataLoadFailed,
                      "failed to load rule data " + path.string() + ": " + e.what()));
    }

    auto built = builder.build();
    if (!built) {
        return RegistryResult::err(GameError(ErrorCode::RulesDataLoadFailed,
                                             std::string(built.error().message())));
    }
    return built;
}

RegistryResult RulesRegistry::fromConfig(const foundation::ConfigManager& config) {
    auto rules = RulesConfig::fromConfig(config);
    if (!rules) {
        return RegistryResult::err(rules.error());
    }
    if (!config.hasKey("rules.data_file")) {
        return RegistryResult::ok(withConfig(std::move(rules).value()));
    }
    auto path = config.get<std::string>("rules.data_file");
    if (!path) {
        return RegistryResult::err(path.error());
    }
    return loadFromFile(path.value(), std::move(rules).value());
}

const WeaponDescriptor* RulesRegistry::weapon(std::string_view id) const {
    auto it = weapons_.find(id);
    return it == weapons_.end() ? nullptr : &it->second;
}

const ArmorDescriptor* RulesRegistry::armor(std::string_view id) const {
    auto it = armor_.find(id);
    return it == armor_.end() ? nullptr : &it->second;
}

const MonsterDescriptor* RulesRegistry::monster(std::string_view id) const {
    auto it = monsters_.find(id);
    return it == monsters_.end() ? nullptr : &it->second;
}

} // namespace tcc::rules
