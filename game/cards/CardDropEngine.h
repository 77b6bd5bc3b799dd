// Monster card drop rolls per content source, with rarity-weighted card selection.
#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "../../engine/core/Random.h"
#include "CardDefinition.h"

namespace Quest::Cards {

struct CardDropRules {
    double dungeonChance{0.10};
    double bossChance{0.15};
    double arenaChance{0.20};
    double expeditionChance{0.15};
    int arenaMinWave{15};
    std::array<double, RPG::kRarityCount> rarityWeights{5.0, 3.0, 1.5, 0.5, 0.1};
    // Duplicate counts at which an owned card climbs one rarity step.
    std::array<int, 4> upgradeThresholds{3, 7, 12, 18};
    double bonusPerDuplicate{0.25};
};

const CardDropRules& defaultCardDropRules();

struct CardDropContext {
    std::string theme;         // dungeon theme
    bool bossRoom{false};
    int arenaWave{0};
    std::string raidBossName;
};

bool isArenaMilestoneWave(int wave, const CardDropRules& rules = defaultCardDropRules());

// Cards from the pool that a source/context can drop.
std::vector<CardDefinition> eligibleCards(CardSource source, const CardDropContext& context,
                                          const std::vector<CardDefinition>& pool);

// Chance of a drop for this source; the pool's average configured drop chance wins when positive.
double cardDropChance(CardSource source, const CardDropContext& context, const std::vector<CardDefinition>& eligible,
                      const CardDropRules& rules = defaultCardDropRules());

std::optional<CardDefinition> weightedRandomCard(const std::vector<CardDefinition>& cards, Engine::RandomSource& rng,
                                                 const CardDropRules& rules = defaultCardDropRules());

std::optional<CardDefinition> rollCardDrop(CardSource source, const CardDropContext& context,
                                           const std::vector<CardDefinition>& pool, Engine::RandomSource& rng,
                                           const CardDropRules& rules = defaultCardDropRules());

}  // namespace Quest::Cards
