#include "EncounterResolver.h"

#include <algorithm>
#include <cmath>

namespace Quest::Dungeon {

namespace {
bool hasClass(const std::vector<CharacterClass>& classes, CharacterClass c) {
    return std::find(classes.begin(), classes.end(), c) != classes.end();
}
}  // namespace

const EncounterRules& defaultEncounterRules() {
    static const EncounterRules rules{};
    return rules;
}

std::optional<EncounterType> classBonusEncounter(CharacterClass c) {
    switch (c) {
        case CharacterClass::Warrior:
        case CharacterClass::Berserker:
            return EncounterType::Combat;
        case CharacterClass::Mage:
        case CharacterClass::Sorcerer:
            return EncounterType::Puzzle;
        case CharacterClass::Archer:
        case CharacterClass::Ranger:
            return EncounterType::Trap;
        default:
            return std::nullopt;
    }
}

double classEncounterMultiplier(CharacterClass c) {
    switch (c) {
        case CharacterClass::Warrior: return 0.25;
        case CharacterClass::Mage: return 0.25;
        case CharacterClass::Archer: return 0.20;
        case CharacterClass::Berserker: return 0.40;
        case CharacterClass::Sorcerer: return 0.40;
        case CharacterClass::Ranger: return 0.30;
        default: return 0.0;
    }
}

int partyPower(const std::vector<PartyMember>& party, const DungeonRoom& room, std::optional<StatType> statOverride,
               const EncounterRules& rules) {
    const StatType stat = statOverride.value_or(room.primaryStat);
    int total = 0;
    for (const auto& member : party) {
        const int value = member.stat(stat);
        int memberPower = value;
        if (member.characterClass) {
            const CharacterClass c = *member.characterClass;
            const auto bonus = classBonusEncounter(c);
            const bool bossWarrior = room.encounter == EncounterType::Boss && c == CharacterClass::Warrior;
            if ((bonus && *bonus == room.encounter) || bossWarrior) {
                memberPower += static_cast<int>(value * classEncounterMultiplier(c));
            }
        }
        total += memberPower;
    }
    if (partyHasClass(party, CharacterClass::Enchanter)) {
        total += static_cast<int>(total * rules.enchanterPartyBonus);
    }
    return total;
}

RoomApproach autoSelectBestApproach(const std::vector<PartyMember>& party, const DungeonRoom& room,
                                    const EncounterRules& rules) {
    const auto& approaches = approachesFor(room.encounter);
    if (approaches.empty()) return RoomApproach{"direct", "Direct", room.primaryStat, 1.0, 1.0};

    const RoomApproach* best = &approaches.front();
    double bestPower = -1.0;
    for (const auto& a : approaches) {
        const double power = partyPower(party, room, a.primaryStat, rules) * a.powerModifier;
        if (power > bestPower) {
            bestPower = power;
            best = &a;
        }
    }
    return *best;
}

double requiredPower(const DungeonRoom& room, const DifficultyProfile& difficulty, int partySize,
                     const EncounterRules& rules) {
    const double partyScale = 1.0 + rules.partySizeScaling * (std::max(1, partySize) - 1);
    return room.difficultyRating * difficulty.powerScalar * partyScale;
}

double partyDamageReduction(const std::vector<CharacterClass>& partyClasses, const EncounterRules& rules) {
    double reduction = 0.0;
    if (hasClass(partyClasses, CharacterClass::Paladin)) reduction += rules.paladinDamageReduction;
    if (hasClass(partyClasses, CharacterClass::Ranger)) reduction += rules.rangerDamageReduction;
    return std::clamp(reduction, 0.0, rules.maxDamageReduction);
}

double successChance(double effectivePower, double required, const DifficultyProfile& difficulty,
                     double successBonus, double statReadiness, const EncounterRules& rules) {
    double chance = required > 0.0 ? effectivePower / required : rules.successCeiling;
    chance += successBonus;
    chance -= (1.0 - std::clamp(statReadiness, 0.0, 1.0)) * rules.readinessPenalty;
    return std::clamp(chance, difficulty.successFloor, rules.successCeiling);
}

double roomLootChance(const DungeonRoom& room, const DifficultyProfile& difficulty, int lootTier, int luck,
                      bool tricksterInParty, const EncounterRules& rules) {
    double chance = rules.lootBaseChance + lootTier * rules.lootPerTier + luck * rules.lootPerLuck + room.bonusLootChance;
    if (tricksterInParty) chance += rules.tricksterLootBonus;
    return std::min(difficulty.dropChanceCap, chance);
}

RoomResult resolve(const DungeonRoom& room, const RoomApproach& approach, int characterPower,
                   const DifficultyProfile& difficulty, const EncounterContext& context, Engine::RandomSource& rng,
                   const EncounterRules& rules) {
    const double required = requiredPower(room, difficulty, context.partySize, rules);
    const double effective = characterPower * approach.powerModifier;

    RoomResult result;
    result.roomIndex = context.roomIndex;
    result.roomId = room.id;
    result.encounter = room.encounter;
    result.approachId = approach.id;
    result.playerPower = static_cast<int>(effective);
    result.requiredPower = static_cast<int>(required);
    result.successChance =
        successChance(effective, required, difficulty, context.successBonus, context.statReadiness, rules);
    result.success = rng.chance(result.successChance);

    if (!result.success) {
        const double baseDamage = std::max(static_cast<double>(rules.minBaseDamage), required - effective);
        double damage = baseDamage * difficulty.damageMultiplier * approach.riskModifier;
        damage *= 1.0 - partyDamageReduction(context.partyClasses, rules);
        result.hpLost = std::max(1, static_cast<int>(damage));
        result.expEarned = static_cast<int>(context.baseExpReward * rules.failureExpShare);
        return result;
    }

    const int rooms = std::max(1, context.roomCount);
    double multiplier = difficulty.rewardMultiplier / rooms;
    if (room.isBossRoom) multiplier *= rules.bossRewardMultiplier;
    if (approach.powerModifier > rules.riskyApproachThreshold) {
        multiplier *= 1.0 + (approach.powerModifier - 1.0) * rules.riskyRewardShare;
    }
    result.expEarned = static_cast<int>(context.baseExpReward * multiplier);
    result.goldEarned = static_cast<int>(context.baseGoldReward * multiplier);

    const bool trickster = hasClass(context.partyClasses, CharacterClass::Trickster);
    result.lootDropped = rng.chance(roomLootChance(room, difficulty, context.lootTier, context.luck, trickster, rules));

    if (context.cardPool) {
        Cards::CardDropContext cardContext;
        cardContext.theme = context.dungeonTheme;
        cardContext.bossRoom = room.isBossRoom;
        result.cardDropped =
            Cards::rollCardDrop(Cards::CardSource::Dungeon, cardContext, *context.cardPool, rng, context.cardRules);
    }
    return result;
}

}  // namespace Quest::Dungeon
