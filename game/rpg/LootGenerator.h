// Equipment drop generation: template or procedural item, affixes, optional pity wrapping.
#pragma once

#include <optional>

#include "AffixRoller.h"
#include "ContentCatalog.h"
#include "PityTracker.h"
#include "RarityRoller.h"

namespace Quest::RPG {

struct LootRules {
    double templateChance{0.8};
    int levelPerTier{5};
    int levelHeadroom{5};  // drops never require more than playerLevel + headroom
};

struct LootTables {
    RarityTable rarity{makeDefaultRarityTable()};
    AffixTable affixes{};
    PityRules pity{};
    LootRules rules{};
};

const LootTables& defaultLootTables();

struct LootRequest {
    int tier{1};
    int luck{0};
    std::optional<EquipmentSlot> slot;
    std::optional<Rarity> forcedRarity;
    std::optional<Rarity> minimumRarity;
    std::optional<CharacterClass> characterClass;
    std::optional<int> playerLevel;
};

struct GeneratedLoot {
    EquipmentItem item;
    bool fromTemplate{false};
    bool downgraded{false};
};

GeneratedLoot generateDetailed(const LootRequest& request, const ContentCatalog& catalog, Engine::RandomSource& rng,
                               const LootTables& tables = defaultLootTables());

// Throws std::invalid_argument when request.tier < 1.
EquipmentItem generate(const LootRequest& request, const ContentCatalog& catalog, Engine::RandomSource& rng,
                       const LootTables& tables = defaultLootTables());

struct PityLootResult {
    std::optional<EquipmentItem> item;
    PityCounters counters;
    bool pityForced{false};
};

// Rolls a pity-protected drop. A roll-based drop downgraded by a rarity cap counts as a dry run.
PityLootResult rollPityLoot(const LootRequest& request, double baseChance, PityContent content,
                            const PityCounters& counters, const ContentCatalog& catalog, Engine::RandomSource& rng,
                            const LootTables& tables = defaultLootTables());

}  // namespace Quest::RPG
