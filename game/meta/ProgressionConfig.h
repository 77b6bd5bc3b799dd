// Tunable progression tables with JSON overrides (rarity, affixes, pity, cards, difficulty).
#pragma once

#include <string>

#include "../../engine/core/Logger.h"
#include "../cards/CardDropEngine.h"
#include "../dungeon/DungeonTypes.h"
#include "../dungeon/EncounterResolver.h"
#include "../rpg/LootGenerator.h"

namespace Quest::Meta {

struct ProgressionConfig {
    RPG::LootTables loot{};
    Cards::CardDropRules cards{};
    Dungeon::DifficultyTable difficulties{Dungeon::defaultDifficultyTable()};
    Dungeon::EncounterRules encounter{};
    Engine::LogLevel logLevel{Engine::LogLevel::Info};
};

ProgressionConfig defaultProgressionConfig();

// Starts from defaults and overrides only the keys present. Per-rarity tables are arrays
// ordered common..legendary. Missing or malformed files leave the defaults in place.
ProgressionConfig loadProgressionConfig(const std::string& path);

}  // namespace Quest::Meta
