// Core RPG value types: rarity, stats, slots, classes, affixes and equipment.
#pragma once

#include <array>
#include <optional>
#include <string>

#include "../../engine/core/Random.h"

namespace Quest::RPG {

enum class Rarity { Common, Uncommon, Rare, Epic, Legendary };
constexpr int kRarityCount = 5;

enum class StatType { Strength, Wisdom, Charisma, Dexterity, Luck, Defense };
constexpr int kStatCount = 6;
constexpr std::array<StatType, kStatCount> kAllStats{StatType::Strength, StatType::Wisdom, StatType::Charisma,
                                                     StatType::Dexterity, StatType::Luck, StatType::Defense};

enum class EquipmentSlot { Weapon, Armor, Accessory, Trinket };
constexpr std::array<EquipmentSlot, 4> kAllSlots{EquipmentSlot::Weapon, EquipmentSlot::Armor, EquipmentSlot::Accessory,
                                                 EquipmentSlot::Trinket};

enum class CharacterClass { Warrior, Mage, Archer, Berserker, Paladin, Sorcerer, Enchanter, Ranger, Trickster };

// Starter class each advanced class evolved from; used for class-gated rooms.
enum class ClassLine { Warrior, Mage, Archer };

enum class AffixType { Prefix, Suffix };

// Index helpers throw std::out_of_range for values outside the enum.
int rarityIndex(Rarity r);
Rarity rarityFromIndex(int index);
std::optional<Rarity> nextRarity(Rarity r);
Rarity maxRarity(Rarity a, Rarity b);

const char* rarityKey(Rarity r);
const char* statKey(StatType s);
const char* slotKey(EquipmentSlot s);
const char* classKey(CharacterClass c);
const char* affixTypeKey(AffixType t);

// Lenient parsers for content files; keys are matched case-insensitively.
std::optional<Rarity> rarityFromKey(const std::string& key);
std::optional<StatType> statFromKey(const std::string& key);
std::optional<EquipmentSlot> slotFromKey(const std::string& key);
std::optional<CharacterClass> classFromKey(const std::string& key);
std::optional<AffixType> affixTypeFromKey(const std::string& key);

StatType classPrimaryStat(CharacterClass c);
ClassLine classLine(CharacterClass c);

struct Affix {
    AffixType type{AffixType::Prefix};
    std::string definitionId;
    std::string name;
    std::string bonusType;  // e.g. "exp_physical_percent"
    double value{0.0};
    bool isGreater{false};
};

struct AffixDefinition {
    std::string id;
    std::string name;
    AffixType type{AffixType::Prefix};
    std::string bonusType;
    std::string description;
    double minValue{0.0};
    double maxValue{0.0};
    Rarity minItemRarity{Rarity::Common};
    std::string category;
    bool active{true};
};

constexpr int kMaxEnhancementLevel = 10;

struct EquipmentItem {
    std::string id;
    std::string name;
    std::string description;
    std::string templateId;  // empty for procedural items
    std::string baseType;
    EquipmentSlot slot{EquipmentSlot::Weapon};
    Rarity rarity{Rarity::Common};
    StatType primaryStat{StatType::Strength};
    int statBonus{1};
    std::optional<StatType> secondaryStat;
    int secondaryStatBonus{0};
    int levelRequirement{1};
    int enhancementLevel{0};
    std::optional<Affix> prefix;
    std::optional<Affix> suffix;

    int effectivePrimaryBonus() const { return statBonus + enhancementLevel; }
    std::string displayName() const;
};

// Raises the enhancement level by one. Returns false once the cap is reached.
bool enhance(EquipmentItem& item);

std::string makeItemId(Engine::RandomSource& rng);

}  // namespace Quest::RPG
