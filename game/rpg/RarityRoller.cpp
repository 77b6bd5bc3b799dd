#include "RarityRoller.h"

#include <stdexcept>
#include <string>

namespace Quest::RPG {

RarityTable makeDefaultRarityTable() {
    RarityTable t;
    t.epicSoftCaps = {
        {1, 0.02, 0.003, Rarity::Uncommon},
        {2, 0.05, 0.005, Rarity::Rare},
    };
    t.statBonus = {{{1, 3}, {2, 5}, {4, 8}, {7, 12}, {10, 18}}};
    t.secondaryChance = {0.0, 0.3, 0.6, 0.8, 1.0};
    t.secondaryBonus = {{{0, 0}, {1, 2}, {2, 4}, {3, 6}, {5, 10}}};
    return t;
}

const RarityTable& defaultRarityTable() {
    static const RarityTable table = makeDefaultRarityTable();
    return table;
}

RarityRoll rollRarityDetailed(int tier, int luck, Engine::RandomSource& rng, const RarityTable& table) {
    if (tier < 1) throw std::invalid_argument("rollRarity: tier must be >= 1, got " + std::to_string(tier));

    const double adjusted = rng.uniform(0.0, 100.0) + luck * table.luckWeight + tier * table.tierWeight;

    RarityRoll out;
    if (adjusted >= table.thresholds[0]) {
        out.rarity = Rarity::Legendary;
    } else if (adjusted >= table.thresholds[1]) {
        out.rarity = Rarity::Epic;
    } else if (adjusted >= table.thresholds[2]) {
        out.rarity = Rarity::Rare;
    } else if (adjusted >= table.thresholds[3]) {
        out.rarity = Rarity::Uncommon;
    }

    if (out.rarity == Rarity::Legendary && tier < table.legendaryMinTier) {
        out.rarity = Rarity::Epic;
        out.downgraded = true;
    }

    if (out.rarity == Rarity::Epic) {
        for (const auto& cap : table.epicSoftCaps) {
            if (cap.tier != tier) continue;
            if (!rng.chance(cap.keepChance + luck * cap.keepChancePerLuck)) {
                out.rarity = cap.downgradeTo;
                out.downgraded = true;
            }
            break;
        }
    }
    return out;
}

Rarity rollRarity(int tier, int luck, Engine::RandomSource& rng, const RarityTable& table) {
    return rollRarityDetailed(tier, luck, rng, table).rarity;
}

std::array<int, 2> statBonusRange(Rarity rarity, const RarityTable& table) {
    return table.statBonus[static_cast<std::size_t>(rarityIndex(rarity))];
}

int rollStatBonus(Rarity rarity, Engine::RandomSource& rng, const RarityTable& table) {
    const auto r = statBonusRange(rarity, table);
    return rng.range(r[0], r[1]);
}

std::optional<SecondaryStatRoll> rollSecondaryStat(Rarity rarity, StatType excluding, Engine::RandomSource& rng,
                                                   const RarityTable& table) {
    const auto idx = static_cast<std::size_t>(rarityIndex(rarity));
    if (!rng.chance(table.secondaryChance[idx])) return std::nullopt;

    std::vector<StatType> candidates;
    for (StatType s : kAllStats) {
        if (s != excluding) candidates.push_back(s);
    }
    if (candidates.empty()) return std::nullopt;

    SecondaryStatRoll roll;
    roll.stat = candidates[rng.index(candidates.size())];
    const auto& r = table.secondaryBonus[idx];
    roll.bonus = rng.range(r[0], r[1]);
    if (roll.bonus <= 0) return std::nullopt;
    return roll;
}

}  // namespace Quest::RPG
