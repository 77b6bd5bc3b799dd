#include "DungeonRun.h"

#include <algorithm>
#include <stdexcept>

#include "../../engine/core/Logger.h"

namespace Quest::Dungeon {

namespace {
constexpr double kBonusRoomChance = 0.30;
}

const char* runStatusKey(RunStatus status) {
    switch (status) {
        case RunStatus::InProgress: return "in_progress";
        case RunStatus::Completed: return "completed";
        case RunStatus::Failed: return "failed";
        case RunStatus::Abandoned: return "abandoned";
    }
    throw std::out_of_range("runStatusKey: invalid status");
}

DungeonRun::DungeonRun(std::string dungeonId, std::vector<DungeonRoom> rooms, DifficultyProfile difficulty,
                       int maxPartyHp, Engine::TimePoint startedAt)
    : dungeonId_(std::move(dungeonId)),
      rooms_(std::move(rooms)),
      difficulty_(difficulty),
      startedAt_(startedAt),
      partyHp_(maxPartyHp),
      maxPartyHp_(maxPartyHp) {
    if (rooms_.empty()) throw std::invalid_argument("DungeonRun: a run needs at least one room");
    if (maxPartyHp_ <= 0) throw std::invalid_argument("DungeonRun: party HP must be positive");
}

int DungeonRun::roomsCleared() const {
    return static_cast<int>(std::count_if(results_.begin(), results_.end(), [](const RoomResult& r) { return r.success; }));
}

Engine::TimePoint DungeonRun::roomCompletesAt(int index) const {
    return Engine::addSeconds(startedAt_, difficulty_.secondsPerRoom * (index + 1));
}

bool DungeonRun::isNextRoomDue(Engine::TimePoint now) const {
    return !isTerminal() && now >= roomCompletesAt(currentRoomIndex_);
}

double DungeonRun::timerProgress(Engine::TimePoint now) const {
    const double total = Engine::secondsBetween(startedAt_, completesAt());
    if (total <= 0.0) return 1.0;
    return std::clamp(Engine::secondsBetween(startedAt_, now) / total, 0.0, 1.0);
}

const DungeonRoom& DungeonRun::nextRoom() const {
    if (isTerminal()) throw std::logic_error("DungeonRun: run has ended");
    return rooms_[static_cast<std::size_t>(currentRoomIndex_)];
}

void DungeonRun::recordStageResult(const RoomResult& result) {
    if (isTerminal()) {
        throw std::logic_error(std::string("DungeonRun: cannot record a room on a ") + runStatusKey(status_) + " run");
    }
    if (result.hpLost < 0) {
        throw std::invalid_argument("DungeonRun: hpLost must be non-negative, got " + std::to_string(result.hpLost));
    }

    results_.push_back(result);
    currentRoomIndex_ = static_cast<int>(results_.size());
    partyHp_ = std::max(0, partyHp_ - result.hpLost);
    totalExp_ += result.expEarned;
    totalGold_ += result.goldEarned;

    if (partyHp_ <= 0) {
        status_ = RunStatus::Failed;
        Engine::logInfo("DungeonRun: " + dungeonId_ + " failed in room " + std::to_string(currentRoomIndex_));
    } else if (currentRoomIndex_ >= totalRooms()) {
        status_ = RunStatus::Completed;
        Engine::logInfo("DungeonRun: " + dungeonId_ + " completed with " + std::to_string(partyHp_) + "/" +
                        std::to_string(maxPartyHp_) + " HP");
    }
}

bool DungeonRun::abandon() {
    if (isTerminal()) return false;
    status_ = RunStatus::Abandoned;
    Engine::logInfo("DungeonRun: " + dungeonId_ + " abandoned at room " + std::to_string(currentRoomIndex_));
    return true;
}

std::optional<RoomResult> advanceRun(DungeonRun& run, const std::vector<PartyMember>& party, EncounterContext context,
                                     Engine::TimePoint now, Engine::RandomSource& rng, const EncounterRules& rules) {
    if (!run.isNextRoomDue(now)) return std::nullopt;

    const DungeonRoom& room = run.nextRoom();
    const RoomApproach approach = autoSelectBestApproach(party, room, rules);
    const int power = partyPower(party, room, approach.primaryStat, rules);

    context.roomIndex = run.currentRoomIndex();
    context.roomCount = run.totalRooms();
    context.partySize = static_cast<int>(party.size());
    RoomResult result = resolve(room, approach, power, run.difficulty(), context, rng, rules);
    run.recordStageResult(result);
    return result;
}

bool partyCanEnter(const DungeonRoom& room, const std::vector<PartyMember>& party) {
    if (!room.classGate) return true;
    return std::any_of(party.begin(), party.end(), [&room](const PartyMember& m) {
        return m.characterClass && RPG::classLine(*m.characterClass) == *room.classGate;
    });
}

double overallSuccessEstimate(const std::vector<PartyMember>& party, const std::vector<DungeonRoom>& rooms,
                              const DifficultyProfile& difficulty, double successBonus, const EncounterRules& rules) {
    double total = 0.0;
    int counted = 0;
    for (const auto& room : rooms) {
        if (room.isBonusRoom || !partyCanEnter(room, party)) continue;
        const RoomApproach approach = autoSelectBestApproach(party, room, rules);
        const double power = partyPower(party, room, approach.primaryStat, rules) * approach.powerModifier;
        const double required = requiredPower(room, difficulty, static_cast<int>(party.size()), rules);
        total += successChance(power, required, difficulty, successBonus, 1.0, rules);
        ++counted;
    }
    return counted > 0 ? total / counted : 0.0;
}

std::vector<DungeonRoom> selectRoomsForRun(const std::vector<DungeonRoom>& allRooms,
                                           const std::vector<PartyMember>& party, Engine::RandomSource& rng,
                                           std::optional<int> targetRoomCount) {
    std::vector<DungeonRoom> selected;
    std::vector<DungeonRoom> bonus;
    std::vector<DungeonRoom> regular;
    for (const auto& room : allRooms) {
        if (room.isBossRoom) {
            selected.push_back(room);
        } else if (!partyCanEnter(room, party)) {
            continue;
        } else if (room.isBonusRoom) {
            bonus.push_back(room);
        } else {
            regular.push_back(room);
        }
    }

    const int roomCount = static_cast<int>(allRooms.size());
    const int target = targetRoomCount.value_or(std::min(7, std::max(5, roomCount - 2)));

    Engine::shuffleInPlace(bonus, rng);
    for (auto& room : bonus) {
        if (rng.chance(kBonusRoomChance)) selected.push_back(std::move(room));
    }

    Engine::shuffleInPlace(regular, rng);
    const int remaining = std::max(0, target - static_cast<int>(selected.size()));
    for (int i = 0; i < remaining && i < static_cast<int>(regular.size()); ++i) {
        selected.push_back(regular[static_cast<std::size_t>(i)]);
    }

    std::vector<DungeonRoom> ordered;
    std::vector<DungeonRoom> bosses;
    for (auto& room : selected) {
        (room.isBossRoom ? bosses : ordered).push_back(std::move(room));
    }
    Engine::shuffleInPlace(ordered, rng);
    ordered.insert(ordered.end(), bosses.begin(), bosses.end());
    return ordered;
}

}  // namespace Quest::Dungeon
