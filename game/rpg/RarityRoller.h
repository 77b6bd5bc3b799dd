// Tier/luck driven rarity rolls and per-rarity stat bonus rolls.
#pragma once

#include <array>
#include <optional>
#include <vector>

#include "RPGTypes.h"

namespace Quest::RPG {

// Epic results below a tier must pass a luck-scaled keep roll or be downgraded.
struct EpicSoftCap {
    int tier{1};
    double keepChance{0.0};
    double keepChancePerLuck{0.0};
    Rarity downgradeTo{Rarity::Rare};
};

struct RarityTable {
    // Minimum adjusted roll for Legendary, Epic, Rare, Uncommon.
    std::array<double, 4> thresholds{95.0, 82.0, 65.0, 40.0};
    double luckWeight{0.5};
    double tierWeight{3.0};
    int legendaryMinTier{4};
    std::vector<EpicSoftCap> epicSoftCaps;
    std::array<std::array<int, 2>, kRarityCount> statBonus{};
    std::array<double, kRarityCount> secondaryChance{};
    std::array<std::array<int, 2>, kRarityCount> secondaryBonus{};
};

RarityTable makeDefaultRarityTable();
const RarityTable& defaultRarityTable();

struct RarityRoll {
    Rarity rarity{Rarity::Common};
    bool downgraded{false};  // a hard or soft cap lowered the raw result
};

// Throws std::invalid_argument when tier < 1.
RarityRoll rollRarityDetailed(int tier, int luck, Engine::RandomSource& rng,
                              const RarityTable& table = defaultRarityTable());
Rarity rollRarity(int tier, int luck, Engine::RandomSource& rng, const RarityTable& table = defaultRarityTable());

std::array<int, 2> statBonusRange(Rarity rarity, const RarityTable& table = defaultRarityTable());
int rollStatBonus(Rarity rarity, Engine::RandomSource& rng, const RarityTable& table = defaultRarityTable());

struct SecondaryStatRoll {
    StatType stat{StatType::Strength};
    int bonus{0};
};

std::optional<SecondaryStatRoll> rollSecondaryStat(Rarity rarity, StatType excluding, Engine::RandomSource& rng,
                                                   const RarityTable& table = defaultRarityTable());

}  // namespace Quest::RPG
