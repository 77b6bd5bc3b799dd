// End-of-run rewards: per-room loot, performance grade and secret room discovery.
#pragma once

#include <optional>
#include <vector>

#include "../rpg/LootGenerator.h"
#include "DungeonRun.h"

namespace Quest::Dungeon {

struct PerformanceRating {
    char grade{'F'};
    double score{0.0};
    double lootMultiplier{0.5};
};

// Weighted blend of rooms cleared, HP left and stat readiness.
PerformanceRating ratePerformance(const DungeonRun& run, double statReadiness);
PerformanceRating gradeForScore(double score);

struct CompletionContext {
    DungeonDifficulty difficulty{DungeonDifficulty::Normal};
    int lootTier{1};
    int luck{0};
    std::optional<CharacterClass> characterClass;
    std::optional<int> playerLevel;
    double classLootBonus{0.0};
    double statReadiness{1.0};
    int baseGoldReward{0};
};

struct SecretDiscovery {
    int bonusGold{0};
    int materials{0};
    std::optional<RPG::EquipmentItem> item;
};

struct RunCompletion {
    PerformanceRating rating;
    int expAwarded{0};
    int goldAwarded{0};
    std::vector<RPG::EquipmentItem> loot;
    std::optional<SecretDiscovery> secret;
    RPG::PityCounters counters;
    int pityForcedDrops{0};
};

double secretDiscoveryChance(int luck);

// Throws std::logic_error when the run is still in progress.
RunCompletion completeRun(const DungeonRun& run, const CompletionContext& context, const RPG::PityCounters& counters,
                          const RPG::ContentCatalog& catalog, Engine::RandomSource& rng,
                          const RPG::LootTables& tables = RPG::defaultLootTables());

}  // namespace Quest::Dungeon
