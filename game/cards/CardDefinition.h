// Monster card content rows and their enum keys.
#pragma once

#include <optional>
#include <string>

#include "../rpg/RPGTypes.h"

namespace Quest::Cards {

using Quest::RPG::Rarity;

enum class CardBonusType { ExpPercent, GoldPercent, DungeonSuccess, LootChance, MissionSpeed, FlatDefense };
constexpr int kCardBonusTypeCount = 6;

enum class CardSource { Dungeon, Arena, Expedition, Raid };

const char* cardBonusKey(CardBonusType type);
std::optional<CardBonusType> cardBonusFromKey(const std::string& key);
const char* cardSourceKey(CardSource source);
std::optional<CardSource> cardSourceFromKey(const std::string& key);

// Flat bonuses are not fractions; everything else is a fraction (0.01 = 1%).
inline bool isPercentBonus(CardBonusType type) { return type != CardBonusType::FlatDefense; }

struct CardDefinition {
    std::string id;
    std::string name;
    std::string description;
    std::string theme;  // dungeon theme for dungeon cards, e.g. "Cave"
    Rarity rarity{Rarity::Common};
    CardBonusType bonusType{CardBonusType::ExpPercent};
    double bonusValue{0.0};
    CardSource source{CardSource::Dungeon};
    std::string sourceName;
    double dropChance{0.0};
    bool active{true};
};

}  // namespace Quest::Cards
