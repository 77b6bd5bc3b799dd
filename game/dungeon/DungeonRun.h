// Dungeon run state machine: sequential timed rooms, party HP and reward accumulation.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../../engine/core/Random.h"
#include "../../engine/core/Time.h"
#include "DungeonTypes.h"
#include "EncounterResolver.h"

namespace Quest::Dungeon {

enum class RunStatus { InProgress, Completed, Failed, Abandoned };

const char* runStatusKey(RunStatus status);

class DungeonRun {
public:
    // Throws std::invalid_argument for an empty room list or non-positive max HP.
    DungeonRun(std::string dungeonId, std::vector<DungeonRoom> rooms, DifficultyProfile difficulty, int maxPartyHp,
               Engine::TimePoint startedAt);

    const std::string& dungeonId() const { return dungeonId_; }
    RunStatus status() const { return status_; }
    bool isTerminal() const { return status_ != RunStatus::InProgress; }

    int currentRoomIndex() const { return currentRoomIndex_; }
    int totalRooms() const { return static_cast<int>(rooms_.size()); }
    const std::vector<DungeonRoom>& rooms() const { return rooms_; }
    const std::vector<RoomResult>& roomResults() const { return results_; }
    const DifficultyProfile& difficulty() const { return difficulty_; }

    int partyHp() const { return partyHp_; }
    int maxPartyHp() const { return maxPartyHp_; }
    int totalExp() const { return totalExp_; }
    int totalGold() const { return totalGold_; }
    int roomsCleared() const;

    Engine::TimePoint startedAt() const { return startedAt_; }
    Engine::TimePoint roomCompletesAt(int index) const;
    Engine::TimePoint completesAt() const { return roomCompletesAt(totalRooms() - 1); }
    bool isNextRoomDue(Engine::TimePoint now) const;
    double timerProgress(Engine::TimePoint now) const;

    // Throws std::logic_error when the run is already terminal.
    const DungeonRoom& nextRoom() const;
    // Also throws std::invalid_argument for a negative hpLost.
    void recordStageResult(const RoomResult& result);

    // Returns false when the run had already ended.
    bool abandon();

private:
    std::string dungeonId_;
    std::vector<DungeonRoom> rooms_;
    DifficultyProfile difficulty_;
    Engine::TimePoint startedAt_;
    RunStatus status_{RunStatus::InProgress};
    int currentRoomIndex_{0};
    int partyHp_{0};
    int maxPartyHp_{0};
    int totalExp_{0};
    int totalGold_{0};
    std::vector<RoomResult> results_;
};

// Resolves the next room when its timer has elapsed; returns nothing otherwise.
std::optional<RoomResult> advanceRun(DungeonRun& run, const std::vector<PartyMember>& party, EncounterContext context,
                                     Engine::TimePoint now, Engine::RandomSource& rng,
                                     const EncounterRules& rules = defaultEncounterRules());

bool partyCanEnter(const DungeonRoom& room, const std::vector<PartyMember>& party);

// Mean success chance over the rooms the party can enter, bonus rooms excluded; 0 when none qualify.
double overallSuccessEstimate(const std::vector<PartyMember>& party, const std::vector<DungeonRoom>& rooms,
                              const DifficultyProfile& difficulty, double successBonus = 0.0,
                              const EncounterRules& rules = defaultEncounterRules());

std::vector<DungeonRoom> selectRoomsForRun(const std::vector<DungeonRoom>& allRooms,
                                           const std::vector<PartyMember>& party, Engine::RandomSource& rng,
                                           std::optional<int> targetRoomCount = std::nullopt);

}  // namespace Quest::Dungeon
