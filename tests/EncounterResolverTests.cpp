#include <cassert>
#include <cmath>
#include <vector>

#include "../game/dungeon/EncounterResolver.h"
#include "support/ScriptedRandom.h"

using namespace Quest::Dungeon;
using Quest::RPG::CharacterClass;
using QuestTest::ScriptedRandom;

namespace {
DungeonRoom makeRoom(EncounterType type, StatType stat, int rating, bool boss = false) {
    DungeonRoom r;
    r.id = "room";
    r.encounter = type;
    r.primaryStat = stat;
    r.difficultyRating = rating;
    r.isBossRoom = boss;
    return r;
}

PartyMember makeMember(std::optional<CharacterClass> c, StatType stat, int value) {
    PartyMember m;
    m.characterClass = c;
    m.stats[static_cast<std::size_t>(stat)] = value;
    return m;
}

const RoomApproach& approachById(EncounterType type, const std::string& id) {
    for (const auto& a : approachesFor(type)) {
        if (a.id == id) return a;
    }
    return approachesFor(type).front();
}

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }
}  // namespace

int main() {
    const DifficultyProfile& normal = difficultyProfile(DungeonDifficulty::Normal);
    const DifficultyProfile& hard = difficultyProfile(DungeonDifficulty::Hard);
    const DifficultyProfile& mythic = difficultyProfile(DungeonDifficulty::Mythic);

    // Required power scales with difficulty.
    {
        const DungeonRoom room = makeRoom(EncounterType::Combat, StatType::Strength, 20);
        assert(near(requiredPower(room, normal), 20.0));
        assert(near(requiredPower(room, hard), 30.0));
        assert(near(requiredPower(room, mythic), 80.0));
    }

    // Success chance: ratio clamped to the per-difficulty floor and the 95% ceiling.
    {
        assert(near(successChance(1.0, 100.0, normal), 0.25));
        assert(near(successChance(1.0, 100.0, mythic), 0.05));
        assert(near(successChance(1000.0, 100.0, normal), 0.95));
        assert(near(successChance(60.0, 100.0, normal), 0.60));
        assert(near(successChance(60.0, 100.0, normal, 0.05), 0.65));
        assert(near(successChance(50.0, 100.0, normal, 0.0, 0.5), 0.30));
    }

    // Failure: damage from the power gap, risk and difficulty, halved for paladins.
    {
        const DungeonRoom room = makeRoom(EncounterType::Combat, StatType::Strength, 40);
        const RoomApproach& aggressive = approachById(EncounterType::Combat, "aggressive_strike");
        EncounterContext context;
        context.baseExpReward = 1000;

        ScriptedRandom rng({0.9});
        const RoomResult fail = resolve(room, aggressive, 16, normal, context, rng);
        assert(!fail.success);
        assert(near(fail.successChance, 0.5));
        assert(fail.playerPower == 20);
        assert(fail.requiredPower == 40);
        assert(fail.hpLost == 30);
        assert(fail.expEarned == 20);
        assert(fail.goldEarned == 0);
        assert(!fail.lootDropped);
        assert(fail.approachId == "aggressive_strike");

        context.partyClasses = {CharacterClass::Paladin};
        ScriptedRandom rng2({0.9});
        assert(resolve(room, aggressive, 16, normal, context, rng2).hpLost == 15);

        // Near-miss still costs the minimum base damage.
        ScriptedRandom rng3({0.99});
        context.partyClasses.clear();
        const RoomResult close = resolve(room, aggressive, 31, normal, context, rng3);
        assert(!close.success);
        assert(close.hpLost == 7);  // 5 * 1.5

        ScriptedRandom rng4({0.99});
        assert(resolve(room, aggressive, 16, hard, context, rng4).hpLost == 90);  // (60-20) * 1.5 * 1.5
    }

    // Requirement grows by half a rating per extra member, so a second member does not double the odds.
    {
        const DungeonRoom room = makeRoom(EncounterType::Trap, StatType::Dexterity, 20);
        assert(near(requiredPower(room, normal, 1), 20.0));
        assert(near(requiredPower(room, normal, 2), 30.0));
        assert(near(requiredPower(room, normal, 4), 50.0));
        assert(near(requiredPower(room, normal, 0), 20.0));
        assert(near(requiredPower(room, hard, 3), 60.0));

        const std::vector<PartyMember> duo{makeMember(std::nullopt, StatType::Dexterity, 10),
                                           makeMember(std::nullopt, StatType::Dexterity, 10)};
        const int power = partyPower(duo, room);
        assert(power == 20);
        assert(near(successChance(power, requiredPower(room, normal, 2), normal), 20.0 / 30.0));

        const RoomApproach direct{"direct", "Direct", StatType::Dexterity, 1.0, 1.0};
        EncounterContext context;
        context.partySize = 2;
        ScriptedRandom rng({0.9});
        const RoomResult r = resolve(room, direct, power, normal, context, rng);
        assert(!r.success);
        assert(r.requiredPower == 30);
        assert(near(r.successChance, 20.0 / 30.0));
        assert(r.hpLost == 10);
    }

    // Paladin and ranger reductions stack up to the cap.
    {
        assert(near(partyDamageReduction({}), 0.0));
        assert(near(partyDamageReduction({CharacterClass::Paladin}), 0.5));
        assert(near(partyDamageReduction({CharacterClass::Ranger}), 0.0));

        EncounterRules rules;
        rules.rangerDamageReduction = 0.5;
        assert(near(partyDamageReduction({CharacterClass::Ranger}, rules), 0.5));
        assert(near(partyDamageReduction({CharacterClass::Paladin, CharacterClass::Ranger}, rules), 0.75));

        const DungeonRoom room = makeRoom(EncounterType::Combat, StatType::Strength, 40);
        const RoomApproach& aggressive = approachById(EncounterType::Combat, "aggressive_strike");
        EncounterContext context;
        context.partyClasses = {CharacterClass::Paladin, CharacterClass::Ranger};
        ScriptedRandom rng({0.9});
        assert(resolve(room, aggressive, 16, normal, context, rng, rules).hpLost == 7);  // 30 * 0.25
    }

    // Success: rewards per room share, doubled for bosses, boosted for risky approaches.
    {
        const RoomApproach& tactical = approachById(EncounterType::Combat, "tactical_maneuver");
        const RoomApproach& aggressive = approachById(EncounterType::Combat, "aggressive_strike");
        EncounterContext context;
        context.baseExpReward = 600;
        context.baseGoldReward = 300;
        context.roomCount = 4;

        const DungeonRoom room = makeRoom(EncounterType::Combat, StatType::Strength, 10);
        ScriptedRandom rng({0.1, 0.5});
        const RoomResult ok = resolve(room, tactical, 100, normal, context, rng);
        assert(ok.success);
        assert(ok.hpLost == 0);
        assert(ok.expEarned == 150);
        assert(ok.goldEarned == 75);
        assert(!ok.lootDropped);  // 0.5 > 0.20
        assert(!ok.cardDropped.has_value());

        const DungeonRoom boss = makeRoom(EncounterType::Combat, StatType::Strength, 10, true);
        ScriptedRandom rng2({0.1, 0.5});
        assert(resolve(boss, tactical, 100, normal, context, rng2).expEarned == 300);

        ScriptedRandom rng3({0.1, 0.5});
        assert(resolve(room, aggressive, 100, normal, context, rng3).expEarned == 168);  // 150 * 1.125

        ScriptedRandom rng4({0.1, 0.15});
        assert(resolve(room, tactical, 100, normal, context, rng4).lootDropped);
    }

    // Loot chance grows with tier and luck, capped per difficulty; tricksters add 25%.
    {
        DungeonRoom room = makeRoom(EncounterType::Treasure, StatType::Luck, 10);
        assert(near(roomLootChance(room, normal, 1, 0, false), 0.20));
        assert(near(roomLootChance(room, normal, 2, 10, false), 0.30));
        assert(near(roomLootChance(room, normal, 1, 0, true), 0.40));
        assert(near(roomLootChance(room, normal, 10, 100, true), 0.40));
        assert(near(roomLootChance(room, mythic, 10, 100, true), 0.80));
        room.bonusLootChance = 0.1;
        assert(near(roomLootChance(room, hard, 1, 0, false), 0.30));
    }

    // Party power: class encounter bonuses and the enchanter buff.
    {
        const DungeonRoom combat = makeRoom(EncounterType::Combat, StatType::Strength, 10);
        const DungeonRoom puzzle = makeRoom(EncounterType::Puzzle, StatType::Strength, 10);
        const DungeonRoom boss = makeRoom(EncounterType::Boss, StatType::Strength, 10, true);

        const std::vector<PartyMember> warrior{makeMember(CharacterClass::Warrior, StatType::Strength, 20)};
        assert(partyPower(warrior, combat) == 25);
        assert(partyPower(warrior, puzzle) == 20);
        assert(partyPower(warrior, boss) == 25);

        const std::vector<PartyMember> berserker{makeMember(CharacterClass::Berserker, StatType::Strength, 20)};
        assert(partyPower(berserker, combat) == 28);
        assert(partyPower(berserker, boss) == 20);

        std::vector<PartyMember> party = warrior;
        party.push_back(makeMember(CharacterClass::Enchanter, StatType::Strength, 10));
        assert(partyPower(party, combat) == 42);  // (25 + 10) * 1.2

        // Stat override reads a different stat.
        assert(partyPower(warrior, combat, StatType::Wisdom) == 0);
    }

    // Auto-selection picks the approach with the highest effective power.
    {
        PartyMember m = makeMember(std::nullopt, StatType::Strength, 30);
        m.stats[static_cast<std::size_t>(StatType::Defense)] = 5;
        m.stats[static_cast<std::size_t>(StatType::Dexterity)] = 5;
        const DungeonRoom combat = makeRoom(EncounterType::Combat, StatType::Strength, 10);
        assert(autoSelectBestApproach({m}, combat).id == "aggressive_strike");

        PartyMember sage = makeMember(std::nullopt, StatType::Wisdom, 30);
        const DungeonRoom boss = makeRoom(EncounterType::Boss, StatType::Strength, 10, true);
        assert(autoSelectBestApproach({sage}, boss).id == "exploit_weakness");
        assert(approachesFor(EncounterType::Treasure).size() == 3);
    }

    // A successful room can drop a themed card.
    {
        Quest::Cards::CardDefinition card;
        card.id = "card_cave_test";
        card.theme = "Cave";
        card.source = Quest::Cards::CardSource::Dungeon;
        card.dropChance = 1.0;
        const std::vector<Quest::Cards::CardDefinition> pool{card};

        EncounterContext context;
        context.dungeonTheme = "cave";
        context.cardPool = &pool;
        const DungeonRoom room = makeRoom(EncounterType::Combat, StatType::Strength, 10);
        ScriptedRandom rng({0.1, 0.9});
        const RoomResult r = resolve(room, approachesFor(EncounterType::Combat)[2], 100, normal, context, rng);
        assert(r.success);
        assert(r.cardDropped.has_value());
        assert(r.cardDropped->id == "card_cave_test");
    }

    return 0;
}
