// Prefix/suffix rolls: rarity-gated presence, class-weighted pick, level and rarity scaled value.
#pragma once

#include <array>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "RPGTypes.h"

namespace Quest::RPG {

struct AffixTable {
    std::array<double, kRarityCount> prefixChance{0.0, 0.2, 0.5, 0.8, 1.0};
    std::array<double, kRarityCount> suffixChance{0.0, 0.0, 0.3, 0.6, 0.8};
    std::array<double, kRarityCount> rarityScale{0.5, 0.75, 1.0, 1.25, 1.5};
    double levelScalePerLevel{0.02};
    double greaterChance{0.10};
    double greaterMultiplier{1.5};
    // Share of the pool added as extra weight to definitions matching the class stat.
    double classAffinityShare{0.10};
};

const AffixTable& defaultAffixTable();

// Bonus-type keyword -> weight multiplier. Definitions with no matching keyword weigh 1.
struct AffixWeightTable {
    std::unordered_map<std::string, double> keywordMultipliers;

    double weightFor(const AffixDefinition& def) const;
};

// Keywords in an affix bonus type that tie it to a stat ("physical" -> Strength).
const std::vector<std::string>& statAffixKeywords(StatType stat);
bool affixMatchesStat(const AffixDefinition& def, StatType stat);

AffixWeightTable classAffinityWeights(CharacterClass characterClass, std::size_t poolSize,
                                      const AffixTable& table = defaultAffixTable());

struct AffixRoll {
    std::optional<Affix> prefix;
    std::optional<Affix> suffix;
};

Affix rollAffixValue(const AffixDefinition& def, Rarity rarity, int itemLevel, Engine::RandomSource& rng,
                     const AffixTable& table = defaultAffixTable());

// Pools must be non-empty for any affix kind whose presence roll passes;
// an empty pool at that point throws std::invalid_argument.
AffixRoll rollAffixes(Rarity rarity, std::optional<CharacterClass> characterClass, int itemLevel,
                      const std::vector<AffixDefinition>& prefixPool, const std::vector<AffixDefinition>& suffixPool,
                      Engine::RandomSource& rng, const AffixTable& table = defaultAffixTable());

}  // namespace Quest::RPG
