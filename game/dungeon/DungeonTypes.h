// Dungeon content model: encounter types, difficulty profiles, rooms, approaches and room results.
#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "../cards/CardDefinition.h"
#include "../rpg/RPGTypes.h"

namespace Quest::Dungeon {

using RPG::CharacterClass;
using RPG::ClassLine;
using RPG::StatType;

enum class EncounterType { Combat, Puzzle, Trap, Treasure, Boss };
enum class DungeonDifficulty { Normal, Hard, Heroic, Mythic };

const char* encounterKey(EncounterType type);
std::optional<EncounterType> encounterFromKey(const std::string& key);
const char* difficultyKey(DungeonDifficulty difficulty);
std::optional<DungeonDifficulty> difficultyFromKey(const std::string& key);

struct DifficultyProfile {
    double powerScalar{1.0};  // multiplies a room's difficulty rating
    double rewardMultiplier{1.0};
    double secondsPerRoom{600.0};
    double dropChanceCap{0.40};
    double damageMultiplier{1.0};
    double successFloor{0.25};
};

using DifficultyTable = std::array<DifficultyProfile, 4>;

const DifficultyTable& defaultDifficultyTable();
const DifficultyProfile& difficultyProfile(DungeonDifficulty difficulty,
                                           const DifficultyTable& table = defaultDifficultyTable());

struct DungeonRoom {
    std::string id;
    std::string name;
    EncounterType encounter{EncounterType::Combat};
    StatType primaryStat{StatType::Strength};
    int difficultyRating{10};
    bool isBossRoom{false};
    bool isBonusRoom{false};
    double bonusLootChance{0.0};
    std::optional<ClassLine> classGate;
};

struct RoomApproach {
    std::string id;
    std::string name;
    StatType primaryStat{StatType::Strength};
    double powerModifier{1.0};
    double riskModifier{1.0};
};

const std::vector<RoomApproach>& approachesFor(EncounterType type);

struct Dungeon {
    std::string id;
    std::string name;
    std::string theme;  // matches card themes, e.g. "Cave"
    DungeonDifficulty difficulty{DungeonDifficulty::Normal};
    int lootTier{1};
    int baseExpReward{100};
    int baseGoldReward{50};
    std::vector<DungeonRoom> rooms;
};

struct RoomResult {
    int roomIndex{0};
    std::string roomId;
    EncounterType encounter{EncounterType::Combat};
    std::string approachId;
    bool success{false};
    int playerPower{0};
    int requiredPower{0};
    double successChance{0.0};
    int expEarned{0};
    int goldEarned{0};
    int hpLost{0};
    bool lootDropped{false};
    std::optional<Cards::CardDefinition> cardDropped;
};

// Party member snapshot as seen by dungeon resolution.
struct PartyMember {
    std::string name;
    std::optional<CharacterClass> characterClass;
    int level{1};
    std::array<int, RPG::kStatCount> stats{};

    int stat(StatType s) const { return stats[static_cast<std::size_t>(s)]; }
};

bool partyHasClass(const std::vector<PartyMember>& party, CharacterClass c);

}  // namespace Quest::Dungeon
