#include "DungeonRewards.h"

#include <algorithm>
#include <array>
#include <stdexcept>

#include "../../engine/core/Logger.h"

namespace Quest::Dungeon {

namespace {
constexpr double kRoomLootBase = 0.15;
constexpr double kRoomLootPerTier = 0.05;
constexpr double kFlaggedRoomBonus = 0.30;
constexpr double kRoomLootCap = 0.80;
constexpr double kSecretItemChance = 0.25;

struct GradeStep {
    double minScore;
    char grade;
    double lootMultiplier;
};

constexpr std::array<GradeStep, 5> kGrades{{
    {0.95, 'S', 1.5},
    {0.85, 'A', 1.25},
    {0.70, 'B', 1.10},
    {0.50, 'C', 1.0},
    {0.30, 'D', 0.8},
}};
}  // namespace

PerformanceRating gradeForScore(double score) {
    for (const auto& step : kGrades) {
        if (score >= step.minScore) return PerformanceRating{step.grade, score, step.lootMultiplier};
    }
    return PerformanceRating{'F', score, 0.5};
}

PerformanceRating ratePerformance(const DungeonRun& run, double statReadiness) {
    const double cleared = static_cast<double>(run.roomsCleared()) / run.totalRooms();
    const double hp = static_cast<double>(run.partyHp()) / run.maxPartyHp();
    const double score = 0.5 * cleared + 0.3 * hp + 0.2 * std::clamp(statReadiness, 0.0, 1.0);
    return gradeForScore(score);
}

double secretDiscoveryChance(int luck) { return std::min(0.03 + luck * 0.002, 0.15); }

RunCompletion completeRun(const DungeonRun& run, const CompletionContext& context, const RPG::PityCounters& counters,
                          const RPG::ContentCatalog& catalog, Engine::RandomSource& rng,
                          const RPG::LootTables& tables) {
    if (!run.isTerminal()) throw std::logic_error("completeRun: run " + run.dungeonId() + " is still in progress");

    RunCompletion out;
    out.counters = counters;
    out.rating = ratePerformance(run, context.statReadiness);
    out.expAwarded = static_cast<int>(run.totalExp() * out.rating.lootMultiplier);
    out.goldAwarded = static_cast<int>(run.totalGold() * out.rating.lootMultiplier);
    if (run.status() == RunStatus::Abandoned) return out;

    RPG::LootRequest request;
    request.tier = std::max(1, context.lootTier);
    request.luck = context.luck;
    request.characterClass = context.characterClass;
    request.playerLevel = context.playerLevel;

    for (const auto& result : run.roomResults()) {
        if (!result.success) continue;
        double base = kRoomLootBase + request.tier * kRoomLootPerTier + context.classLootBonus;
        if (result.lootDropped) base += kFlaggedRoomBonus;
        base = std::min(kRoomLootCap, base);

        RPG::PityLootResult roll =
            RPG::rollPityLoot(request, base, RPG::PityContent::Dungeons, out.counters, catalog, rng, tables);
        out.counters = roll.counters;
        if (roll.pityForced) ++out.pityForcedDrops;
        if (roll.item) out.loot.push_back(std::move(*roll.item));
    }

    if (run.status() == RunStatus::Completed && context.difficulty != DungeonDifficulty::Normal) {
        RPG::LootRequest bonus = request;
        bonus.tier = request.tier + 1;
        out.loot.push_back(RPG::generate(bonus, catalog, rng, tables));
    }

    if (run.status() == RunStatus::Completed && rng.chance(secretDiscoveryChance(context.luck))) {
        SecretDiscovery secret;
        secret.bonusGold = static_cast<int>(context.baseGoldReward * 2 * run.difficulty().rewardMultiplier);
        secret.materials = rng.range(2, 3);
        if (rng.chance(kSecretItemChance)) {
            RPG::LootRequest rare = request;
            rare.minimumRarity = RPG::Rarity::Rare;
            secret.item = RPG::generate(rare, catalog, rng, tables);
        }
        out.goldAwarded += secret.bonusGold;
        Engine::logInfo("Dungeon: secret room discovered in " + run.dungeonId());
        out.secret = std::move(secret);
    }
    return out;
}

}  // namespace Quest::Dungeon
