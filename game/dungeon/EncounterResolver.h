// Single-room resolution: power vs. requirement, success roll, damage and rewards.
#pragma once

#include <optional>
#include <vector>

#include "../../engine/core/Random.h"
#include "../cards/CardDropEngine.h"
#include "DungeonTypes.h"

namespace Quest::Dungeon {

struct EncounterRules {
    double successCeiling{0.95};
    double readinessPenalty{0.40};
    int minBaseDamage{5};
    double paladinDamageReduction{0.5};
    double rangerDamageReduction{0.0};
    double maxDamageReduction{0.75};
    double failureExpShare{0.02};
    double bossRewardMultiplier{2.0};
    double riskyApproachThreshold{1.1};
    double riskyRewardShare{0.5};
    double lootBaseChance{0.15};
    double lootPerTier{0.05};
    double lootPerLuck{0.005};
    double tricksterLootBonus{0.25};
    double enchanterPartyBonus{0.20};
    // Each member past the first adds this share of a room's rating to its requirement.
    double partySizeScaling{0.5};
};

const EncounterRules& defaultEncounterRules();

// Everything about the run and party a room roll needs besides the room itself.
struct EncounterContext {
    int lootTier{1};
    int luck{0};
    std::vector<CharacterClass> partyClasses;
    double successBonus{0.0};   // additive, from cards and affixes
    double statReadiness{1.0};  // 0..1 share of stat requirements met
    int baseExpReward{0};
    int baseGoldReward{0};
    int roomCount{1};
    int roomIndex{0};
    int partySize{1};
    std::string dungeonTheme;
    const std::vector<Cards::CardDefinition>* cardPool{nullptr};
    Cards::CardDropRules cardRules{};
};

// Class bonus applied to a member's stat when the room plays to the class.
std::optional<EncounterType> classBonusEncounter(CharacterClass c);
double classEncounterMultiplier(CharacterClass c);

int partyPower(const std::vector<PartyMember>& party, const DungeonRoom& room,
               std::optional<StatType> statOverride = std::nullopt,
               const EncounterRules& rules = defaultEncounterRules());

RoomApproach autoSelectBestApproach(const std::vector<PartyMember>& party, const DungeonRoom& room,
                                    const EncounterRules& rules = defaultEncounterRules());

// Rating scaled by difficulty and by party size (co-op grows slower than summed power).
double requiredPower(const DungeonRoom& room, const DifficultyProfile& difficulty, int partySize = 1,
                     const EncounterRules& rules = defaultEncounterRules());

// Combined paladin and ranger reduction present in the party, capped.
double partyDamageReduction(const std::vector<CharacterClass>& partyClasses,
                            const EncounterRules& rules = defaultEncounterRules());

double successChance(double effectivePower, double required, const DifficultyProfile& difficulty,
                     double successBonus = 0.0, double statReadiness = 1.0,
                     const EncounterRules& rules = defaultEncounterRules());

double roomLootChance(const DungeonRoom& room, const DifficultyProfile& difficulty, int lootTier, int luck,
                      bool tricksterInParty, const EncounterRules& rules = defaultEncounterRules());

// Failure is a normal outcome reported in the result.
RoomResult resolve(const DungeonRoom& room, const RoomApproach& approach, int characterPower,
                   const DifficultyProfile& difficulty, const EncounterContext& context, Engine::RandomSource& rng,
                   const EncounterRules& rules = defaultEncounterRules());

}  // namespace Quest::Dungeon
