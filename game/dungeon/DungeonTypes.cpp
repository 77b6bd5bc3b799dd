#include "DungeonTypes.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace Quest::Dungeon {

namespace {
std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

RoomApproach approach(const char* id, const char* name, StatType stat, double power, double risk) {
    return RoomApproach{id, name, stat, power, risk};
}
}  // namespace

const char* encounterKey(EncounterType type) {
    switch (type) {
        case EncounterType::Combat: return "combat";
        case EncounterType::Puzzle: return "puzzle";
        case EncounterType::Trap: return "trap";
        case EncounterType::Treasure: return "treasure";
        case EncounterType::Boss: return "boss";
    }
    throw std::out_of_range("encounterKey: invalid encounter type");
}

std::optional<EncounterType> encounterFromKey(const std::string& key) {
    const std::string k = lower(key);
    for (int i = 0; i <= static_cast<int>(EncounterType::Boss); ++i) {
        const auto t = static_cast<EncounterType>(i);
        if (k == encounterKey(t)) return t;
    }
    return std::nullopt;
}

const char* difficultyKey(DungeonDifficulty difficulty) {
    switch (difficulty) {
        case DungeonDifficulty::Normal: return "normal";
        case DungeonDifficulty::Hard: return "hard";
        case DungeonDifficulty::Heroic: return "heroic";
        case DungeonDifficulty::Mythic: return "mythic";
    }
    throw std::out_of_range("difficultyKey: invalid difficulty");
}

std::optional<DungeonDifficulty> difficultyFromKey(const std::string& key) {
    const std::string k = lower(key);
    for (int i = 0; i <= static_cast<int>(DungeonDifficulty::Mythic); ++i) {
        const auto d = static_cast<DungeonDifficulty>(i);
        if (k == difficultyKey(d)) return d;
    }
    return std::nullopt;
}

const DifficultyTable& defaultDifficultyTable() {
    //                                 scalar reward secs   cap   dmg  floor
    static const DifficultyTable table{{{1.0, 1.0, 600.0, 0.40, 1.0, 0.25},
                                        {1.5, 1.5, 900.0, 0.55, 1.5, 0.15},
                                        {2.5, 2.5, 1200.0, 0.70, 2.5, 0.10},
                                        {4.0, 4.0, 1800.0, 0.80, 4.0, 0.05}}};
    return table;
}

const DifficultyProfile& difficultyProfile(DungeonDifficulty difficulty, const DifficultyTable& table) {
    const auto idx = static_cast<std::size_t>(difficulty);
    if (idx >= table.size()) throw std::out_of_range("difficultyProfile: invalid difficulty");
    return table[idx];
}

const std::vector<RoomApproach>& approachesFor(EncounterType type) {
    using S = StatType;
    static const std::vector<RoomApproach> combat{
        approach("aggressive_strike", "Aggressive Strike", S::Strength, 1.25, 1.5),
        approach("defensive_stance", "Defensive Stance", S::Defense, 0.9, 0.7),
        approach("tactical_maneuver", "Tactical Maneuver", S::Dexterity, 1.1, 1.0),
    };
    static const std::vector<RoomApproach> puzzle{
        approach("analyze", "Analyze", S::Wisdom, 1.0, 0.8),
        approach("intuition", "Intuition", S::Luck, 1.3, 1.5),
        approach("negotiate", "Negotiate", S::Charisma, 1.05, 1.0),
    };
    static const std::vector<RoomApproach> trap{
        approach("disarm", "Disarm", S::Dexterity, 1.1, 1.0),
        approach("tank_through", "Tank Through", S::Defense, 0.85, 0.6),
        approach("alternate_route", "Find Alternate Route", S::Wisdom, 1.2, 1.3),
    };
    static const std::vector<RoomApproach> treasure{
        approach("open_carefully", "Open Carefully", S::Dexterity, 1.0, 0.7),
        approach("detect_magic", "Detect Magic", S::Wisdom, 1.1, 1.0),
        approach("just_grab_it", "Just Grab It", S::Luck, 1.35, 1.6),
    };
    static const std::vector<RoomApproach> boss{
        approach("all_out_assault", "All-Out Assault", S::Strength, 1.3, 1.6),
        approach("endurance_battle", "Endurance Battle", S::Defense, 0.95, 0.7),
        approach("exploit_weakness", "Exploit Weakness", S::Wisdom, 1.2, 1.2),
    };
    switch (type) {
        case EncounterType::Combat: return combat;
        case EncounterType::Puzzle: return puzzle;
        case EncounterType::Trap: return trap;
        case EncounterType::Treasure: return treasure;
        case EncounterType::Boss: return boss;
    }
    throw std::out_of_range("approachesFor: invalid encounter type");
}

bool partyHasClass(const std::vector<PartyMember>& party, CharacterClass c) {
    return std::any_of(party.begin(), party.end(),
                       [c](const PartyMember& m) { return m.characterClass && *m.characterClass == c; });
}

}  // namespace Quest::Dungeon
