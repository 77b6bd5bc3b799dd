#include "AffixRoller.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace Quest::RPG {

namespace {
double roundToTenth(double v) { return std::round(v * 10.0) / 10.0; }

const AffixDefinition& pickDefinition(const std::vector<AffixDefinition>& pool,
                                      std::optional<CharacterClass> characterClass, Engine::RandomSource& rng,
                                      const AffixTable& table) {
    if (pool.empty()) throw std::invalid_argument("rollAffixes: empty affix pool");
    if (!characterClass) return pool[rng.index(pool.size())];

    const AffixWeightTable weights = classAffinityWeights(*characterClass, pool.size(), table);
    std::vector<double> w;
    w.reserve(pool.size());
    for (const auto& def : pool) w.push_back(weights.weightFor(def));
    return pool[Engine::pickWeightedIndex(w, rng)];
}

std::optional<Affix> rollOne(double presenceChance, const std::vector<AffixDefinition>& pool, Rarity rarity,
                             std::optional<CharacterClass> characterClass, int itemLevel, Engine::RandomSource& rng,
                             const AffixTable& table) {
    if (!rng.chance(presenceChance)) return std::nullopt;
    const AffixDefinition& def = pickDefinition(pool, characterClass, rng, table);
    return rollAffixValue(def, rarity, itemLevel, rng, table);
}
}  // namespace

const AffixTable& defaultAffixTable() {
    static const AffixTable table{};
    return table;
}

double AffixWeightTable::weightFor(const AffixDefinition& def) const {
    double weight = 1.0;
    for (const auto& [keyword, multiplier] : keywordMultipliers) {
        if (def.bonusType.find(keyword) != std::string::npos) weight = std::max(weight, multiplier);
    }
    return weight;
}

const std::vector<std::string>& statAffixKeywords(StatType stat) {
    static const std::vector<std::string> strength{"physical", "strength"};
    static const std::vector<std::string> wisdom{"mental", "wisdom", "mission_speed"};
    static const std::vector<std::string> charisma{"social", "charisma", "party_bond"};
    static const std::vector<std::string> dexterity{"mission_duration", "dexterity", "haste"};
    static const std::vector<std::string> luck{"loot", "luck", "drop_chance", "fortune"};
    static const std::vector<std::string> defense{"defense", "dungeon_success", "warding"};
    switch (stat) {
        case StatType::Strength: return strength;
        case StatType::Wisdom: return wisdom;
        case StatType::Charisma: return charisma;
        case StatType::Dexterity: return dexterity;
        case StatType::Luck: return luck;
        case StatType::Defense: return defense;
    }
    throw std::out_of_range("statAffixKeywords: invalid stat");
}

bool affixMatchesStat(const AffixDefinition& def, StatType stat) {
    for (const auto& keyword : statAffixKeywords(stat)) {
        if (def.bonusType.find(keyword) != std::string::npos) return true;
    }
    return false;
}

AffixWeightTable classAffinityWeights(CharacterClass characterClass, std::size_t poolSize, const AffixTable& table) {
    const double extra = std::max(1.0, std::floor(static_cast<double>(poolSize) * table.classAffinityShare));
    AffixWeightTable weights;
    for (const auto& keyword : statAffixKeywords(classPrimaryStat(characterClass))) {
        weights.keywordMultipliers[keyword] = 1.0 + extra;
    }
    return weights;
}

Affix rollAffixValue(const AffixDefinition& def, Rarity rarity, int itemLevel, Engine::RandomSource& rng,
                     const AffixTable& table) {
    const auto idx = static_cast<std::size_t>(rarityIndex(rarity));
    double value = rng.uniform(def.minValue, def.maxValue);
    value *= 1.0 + itemLevel * table.levelScalePerLevel;
    value *= table.rarityScale[idx];

    Affix affix;
    affix.type = def.type;
    affix.definitionId = def.id;
    affix.name = def.name;
    affix.bonusType = def.bonusType;
    if (rarity == Rarity::Legendary && rng.unit() < table.greaterChance) {
        value *= table.greaterMultiplier;
        affix.isGreater = true;
    }
    affix.value = roundToTenth(value);
    return affix;
}

AffixRoll rollAffixes(Rarity rarity, std::optional<CharacterClass> characterClass, int itemLevel,
                      const std::vector<AffixDefinition>& prefixPool, const std::vector<AffixDefinition>& suffixPool,
                      Engine::RandomSource& rng, const AffixTable& table) {
    const auto idx = static_cast<std::size_t>(rarityIndex(rarity));
    AffixRoll out;
    out.prefix = rollOne(table.prefixChance[idx], prefixPool, rarity, characterClass, itemLevel, rng, table);
    out.suffix = rollOne(table.suffixChance[idx], suffixPool, rarity, characterClass, itemLevel, rng, table);
    return out;
}

}  // namespace Quest::RPG
