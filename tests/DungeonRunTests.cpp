#include <algorithm>
#include <cassert>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "../game/dungeon/DungeonRewards.h"
#include "../game/dungeon/DungeonRun.h"
#include "support/ScriptedRandom.h"

using namespace Quest::Dungeon;
using Quest::RPG::CharacterClass;
using QuestTest::ScriptedRandom;

namespace {
std::vector<DungeonRoom> makeRooms(int count) {
    std::vector<DungeonRoom> rooms;
    for (int i = 0; i < count; ++i) {
        DungeonRoom r;
        r.id = "room_" + std::to_string(i);
        r.difficultyRating = 10;
        rooms.push_back(r);
    }
    return rooms;
}

RoomResult cleared(int exp, int gold, int hpLost = 0) {
    RoomResult r;
    r.success = true;
    r.expEarned = exp;
    r.goldEarned = gold;
    r.hpLost = hpLost;
    return r;
}

RoomResult failed(int hpLost) {
    RoomResult r;
    r.success = false;
    r.hpLost = hpLost;
    return r;
}

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

const Engine::TimePoint kStart = Engine::TimePoint{} + std::chrono::hours(1000);
}  // namespace

int main() {
    const DifficultyProfile& normal = difficultyProfile(DungeonDifficulty::Normal);
    const DifficultyProfile& hard = difficultyProfile(DungeonDifficulty::Hard);

    // Three cleared rooms complete the run and accumulate rewards.
    {
        DungeonRun run("cave", makeRooms(3), normal, 100, kStart);
        assert(run.status() == RunStatus::InProgress);
        run.recordStageResult(cleared(10, 5, 20));
        run.recordStageResult(cleared(10, 5));
        assert(!run.isTerminal());
        assert(run.nextRoom().id == "room_2");
        run.recordStageResult(cleared(10, 5));
        assert(run.status() == RunStatus::Completed);
        assert(run.currentRoomIndex() == 3);
        assert(run.totalExp() == 30);
        assert(run.totalGold() == 15);
        assert(run.partyHp() == 80);
        assert(run.roomsCleared() == 3);

        bool threw = false;
        try {
            run.nextRoom();
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
    }

    // HP reaching zero fails the run; further rooms are rejected.
    {
        DungeonRun run("cave", makeRooms(4), normal, 50, kStart);
        run.recordStageResult(failed(30));
        assert(run.status() == RunStatus::InProgress);
        run.recordStageResult(failed(30));
        assert(run.status() == RunStatus::Failed);
        assert(run.partyHp() == 0);
        assert(run.currentRoomIndex() == 2);

        bool threw = false;
        try {
            run.recordStageResult(cleared(10, 10));
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
        assert(run.currentRoomIndex() == 2);
        assert(run.roomResults().size() == 2);
    }

    // Negative HP loss is rejected without touching the run.
    {
        DungeonRun run("cave", makeRooms(2), normal, 100, kStart);
        bool threw = false;
        try {
            run.recordStageResult(cleared(10, 10, -5));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        assert(run.partyHp() == 100);
        assert(run.currentRoomIndex() == 0);
        assert(run.totalExp() == 0);
    }

    // Abandon only works once, and only on a live run.
    {
        DungeonRun run("cave", makeRooms(2), normal, 100, kStart);
        assert(run.abandon());
        assert(run.status() == RunStatus::Abandoned);
        assert(!run.abandon());
        assert(!run.isNextRoomDue(kStart + std::chrono::hours(5)));
    }

    // Construction rejects empty room lists and non-positive HP.
    {
        bool threw = false;
        try {
            DungeonRun run("empty", {}, normal, 100, kStart);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            DungeonRun run("dead", makeRooms(1), normal, 0, kStart);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // Room timers run back to back from the start time.
    {
        DungeonRun run("cave", makeRooms(3), normal, 100, kStart);
        assert(!run.isNextRoomDue(Engine::addSeconds(kStart, 599)));
        assert(run.isNextRoomDue(Engine::addSeconds(kStart, 600)));
        assert(run.completesAt() == Engine::addSeconds(kStart, 1800));
        assert(near(run.timerProgress(Engine::addSeconds(kStart, 900)), 0.5));
        assert(near(run.timerProgress(kStart - std::chrono::seconds(10)), 0.0));
        assert(near(run.timerProgress(Engine::addSeconds(kStart, 5000)), 1.0));

        DungeonRun slow("keep", makeRooms(2), hard, 100, kStart);
        assert(slow.roomCompletesAt(1) == Engine::addSeconds(kStart, 1800));
    }

    // advanceRun resolves one due room per call.
    {
        PartyMember hero;
        hero.characterClass = CharacterClass::Warrior;
        hero.stats.fill(50);
        const std::vector<PartyMember> party{hero};

        DungeonRun run("cave", makeRooms(3), normal, 100, kStart);
        EncounterContext context;
        context.baseExpReward = 300;
        context.baseGoldReward = 150;
        ScriptedRandom rng({}, 0.1);

        assert(!advanceRun(run, party, context, Engine::addSeconds(kStart, 10), rng).has_value());
        assert(rng.unitDraws() == 0);

        const auto first = advanceRun(run, party, context, Engine::addSeconds(kStart, 600), rng);
        assert(first.has_value());
        assert(first->success);
        assert(first->roomIndex == 0);
        assert(first->expEarned == 112);  // aggressive approach on a third of the run
        assert(!advanceRun(run, party, context, Engine::addSeconds(kStart, 601), rng).has_value());

        const Engine::TimePoint late = Engine::addSeconds(kStart, 1800);
        assert(advanceRun(run, party, context, late, rng)->roomIndex == 1);
        assert(advanceRun(run, party, context, late, rng)->roomIndex == 2);
        assert(run.status() == RunStatus::Completed);
        assert(!advanceRun(run, party, context, late, rng).has_value());
    }

    // advanceRun scales room requirements by party size.
    {
        PartyMember member;
        member.stats.fill(10);
        const std::vector<PartyMember> duo{member, member};
        std::vector<DungeonRoom> rooms = makeRooms(1);
        rooms[0].difficultyRating = 20;

        DungeonRun run("cave", rooms, normal, 100, kStart);
        ScriptedRandom rng({}, 0.1);
        const auto result = advanceRun(run, duo, EncounterContext{}, Engine::addSeconds(kStart, 600), rng);
        assert(result.has_value());
        assert(result->approachId == "aggressive_strike");
        assert(result->playerPower == 25);
        assert(result->requiredPower == 30);
        assert(near(result->successChance, 25.0 / 30.0));
    }

    // Overall estimate averages the rooms the party can actually face.
    {
        std::vector<DungeonRoom> rooms = makeRooms(2);
        rooms[1].difficultyRating = 40;
        DungeonRoom bonus;
        bonus.id = "bonus";
        bonus.isBonusRoom = true;
        bonus.difficultyRating = 1;
        rooms.push_back(bonus);
        DungeonRoom gated;
        gated.id = "gated";
        gated.difficultyRating = 1;
        gated.classGate = Quest::RPG::ClassLine::Mage;
        rooms.push_back(gated);
        rooms[0].difficultyRating = 20;

        PartyMember solo;
        solo.stats[static_cast<std::size_t>(Quest::RPG::StatType::Strength)] = 8;
        assert(near(overallSuccessEstimate({solo}, rooms, normal), (0.5 + 0.25) / 2.0));
        assert(near(overallSuccessEstimate({solo, solo}, rooms, normal), (20.0 / 30.0 + 20.0 / 60.0) / 2.0));
        assert(near(overallSuccessEstimate({solo}, {bonus, gated}, normal), 0.0));
    }

    // Room selection keeps the boss last and drops rooms gated to absent classes.
    {
        std::vector<DungeonRoom> all = makeRooms(6);
        DungeonRoom boss;
        boss.id = "boss";
        boss.isBossRoom = true;
        boss.encounter = EncounterType::Boss;
        all.insert(all.begin(), boss);
        DungeonRoom vault;
        vault.id = "vault";
        vault.isBonusRoom = true;
        vault.classGate = Quest::RPG::ClassLine::Archer;
        all.push_back(vault);

        PartyMember warrior;
        warrior.characterClass = CharacterClass::Warrior;
        ScriptedRandom rng({}, 0.1);
        const auto picked = selectRoomsForRun(all, {warrior}, rng);
        assert(picked.size() == 6);
        assert(picked.back().id == "boss");
        assert(std::none_of(picked.begin(), picked.end(), [](const DungeonRoom& r) { return r.id == "vault"; }));
        assert(!partyCanEnter(vault, {warrior}));

        PartyMember ranger;
        ranger.characterClass = CharacterClass::Ranger;
        ScriptedRandom rng2({}, 0.1);
        const auto withVault = selectRoomsForRun(all, {ranger}, rng2);
        assert(withVault.size() == 6);
        assert(withVault.back().id == "boss");
        assert(std::any_of(withVault.begin(), withVault.end(), [](const DungeonRoom& r) { return r.id == "vault"; }));

        ScriptedRandom rng3({}, 0.9);
        const auto noVault = selectRoomsForRun(all, {ranger}, rng3);
        assert(std::none_of(noVault.begin(), noVault.end(), [](const DungeonRoom& r) { return r.id == "vault"; }));

        ScriptedRandom rng4({}, 0.1);
        assert(selectRoomsForRun(all, {ranger}, rng4, 3).size() == 3);
    }

    // Performance grades.
    {
        assert(gradeForScore(1.0).grade == 'S');
        assert(gradeForScore(0.85).grade == 'A');
        assert(gradeForScore(0.5).grade == 'C');
        assert(gradeForScore(0.30).grade == 'D');
        assert(gradeForScore(0.29).grade == 'F');
        assert(near(gradeForScore(0.29).lootMultiplier, 0.5));

        DungeonRun run("cave", makeRooms(3), normal, 100, kStart);
        run.recordStageResult(cleared(0, 0));
        run.recordStageResult(failed(50));
        run.recordStageResult(cleared(0, 0));
        assert(ratePerformance(run, 1.0).grade == 'C');

        DungeonRun perfect("cave", makeRooms(1), normal, 100, kStart);
        perfect.recordStageResult(cleared(0, 0));
        assert(ratePerformance(perfect, 1.0).grade == 'S');
    }

    const auto catalog = Quest::RPG::ContentCatalog::builtIn();

    // Completion rejects live runs.
    {
        DungeonRun run("cave", makeRooms(2), normal, 100, kStart);
        ScriptedRandom rng;
        bool threw = false;
        try {
            completeRun(run, CompletionContext{}, {}, catalog, rng);
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);
    }

    // Hard completions add a guaranteed drop; dry rooms advance the dungeon pity counter.
    {
        DungeonRun run("keep", makeRooms(3), hard, 100, kStart);
        for (int i = 0; i < 3; ++i) run.recordStageResult(cleared(100, 50));
        CompletionContext context;
        context.difficulty = DungeonDifficulty::Hard;
        ScriptedRandom rng({}, 0.99);
        const RunCompletion done = completeRun(run, context, {}, catalog, rng);
        assert(done.rating.grade == 'S');
        assert(done.expAwarded == 450);
        assert(done.goldAwarded == 225);
        assert(done.loot.size() == 1);
        assert(done.counters.count(Quest::RPG::PityContent::Dungeons) == 3);
        assert(done.pityForcedDrops == 0);
        assert(!done.secret.has_value());
    }

    // Abandoned runs pay out what was earned but roll no loot.
    {
        DungeonRun run("keep", makeRooms(3), hard, 100, kStart);
        run.recordStageResult(cleared(100, 50));
        run.abandon();
        CompletionContext context;
        context.difficulty = DungeonDifficulty::Hard;
        Quest::RPG::PityCounters counters;
        counters.set(Quest::RPG::PityContent::Dungeons, 12);
        ScriptedRandom rng({}, 0.01);
        const RunCompletion done = completeRun(run, context, counters, catalog, rng);
        assert(done.loot.empty());
        assert(done.counters.count(Quest::RPG::PityContent::Dungeons) == 12);
        assert(rng.unitDraws() == 0);
        assert(done.expAwarded > 0);
    }

    // A full pity counter forces a Rare-or-better drop on the first cleared room.
    {
        DungeonRun run("cave", makeRooms(3), normal, 100, kStart);
        for (int i = 0; i < 3; ++i) run.recordStageResult(cleared(10, 10));
        Quest::RPG::PityCounters counters;
        counters.set(Quest::RPG::PityContent::Dungeons, 12);
        ScriptedRandom rng({}, 0.99);
        const RunCompletion done = completeRun(run, CompletionContext{}, counters, catalog, rng);
        assert(done.pityForcedDrops == 1);
        assert(done.loot.size() == 1);
        assert(Quest::RPG::rarityIndex(done.loot.front().rarity) >= Quest::RPG::rarityIndex(Quest::RPG::Rarity::Rare));
        assert(done.counters.count(Quest::RPG::PityContent::Dungeons) == 2);
    }

    // Failed runs keep room loot but never get completion bonuses.
    {
        DungeonRun run("keep", makeRooms(3), hard, 10, kStart);
        run.recordStageResult(failed(20));
        CompletionContext context;
        context.difficulty = DungeonDifficulty::Hard;
        ScriptedRandom rng({}, 0.01);
        const RunCompletion done = completeRun(run, context, {}, catalog, rng);
        assert(run.status() == RunStatus::Failed);
        assert(done.loot.empty());
        assert(!done.secret.has_value());
    }

    // Secret rooms: luck-scaled chance, doubled base gold and two or three materials.
    {
        assert(near(secretDiscoveryChance(0), 0.03));
        assert(near(secretDiscoveryChance(10), 0.05));
        assert(near(secretDiscoveryChance(100), 0.15));

        DungeonRun run("cave", makeRooms(1), normal, 100, kStart);
        run.recordStageResult(failed(10));
        assert(run.status() == RunStatus::Completed);
        CompletionContext context;
        context.baseGoldReward = 100;
        ScriptedRandom rng({0.01}, 0.99, {3});
        const RunCompletion done = completeRun(run, context, {}, catalog, rng);
        assert(done.secret.has_value());
        assert(done.secret->bonusGold == 200);
        assert(done.secret->materials == 3);
        assert(!done.secret->item.has_value());
        assert(done.goldAwarded == 200);
        assert(done.loot.empty());
    }

    return 0;
}
