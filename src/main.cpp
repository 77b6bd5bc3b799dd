#include <algorithm>
#include <array>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "../engine/core/Logger.h"
#include "../engine/core/Random.h"
#include "../engine/core/Time.h"
#include "../game/cards/MonsterCard.h"
#include "../game/dungeon/DungeonRewards.h"
#include "../game/dungeon/DungeonRun.h"
#include "../game/meta/ProgressionConfig.h"
#include "../game/rpg/ContentCatalog.h"

namespace {

using namespace Quest;

struct Options {
    std::string catalogPath{"data/content/catalog.json"};
    std::string configPath{"data/config/progression.json"};
    std::optional<std::uint32_t> seed;
    int runs{3};
};

bool parseOptions(int argc, char** argv, Options& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool hasValue = i + 1 < argc;
        if (arg == "--catalog" && hasValue) {
            out.catalogPath = argv[++i];
        } else if (arg == "--config" && hasValue) {
            out.configPath = argv[++i];
        } else if (arg == "--seed" && hasValue) {
            out.seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--runs" && hasValue) {
            out.runs = std::max(1, std::stoi(argv[++i]));
        } else {
            Engine::logError("usage: questcore_sim [--catalog path] [--config path] [--seed n] [--runs n]");
            return false;
        }
    }
    return true;
}

Dungeon::PartyMember member(const char* name, RPG::CharacterClass c, int level, std::array<int, RPG::kStatCount> stats) {
    Dungeon::PartyMember m;
    m.name = name;
    m.characterClass = c;
    m.level = level;
    m.stats = stats;
    return m;
}

Dungeon::DungeonRoom room(const char* id, const char* name, Dungeon::EncounterType type, RPG::StatType stat,
                          int rating, bool boss = false, double bonusLoot = 0.0) {
    Dungeon::DungeonRoom r;
    r.id = id;
    r.name = name;
    r.encounter = type;
    r.primaryStat = stat;
    r.difficultyRating = rating;
    r.isBossRoom = boss;
    r.bonusLootChance = bonusLoot;
    return r;
}

Dungeon::Dungeon sampleDungeon() {
    using E = Dungeon::EncounterType;
    using S = RPG::StatType;
    Dungeon::Dungeon d;
    d.id = "crystal_caverns";
    d.name = "Crystal Caverns";
    d.theme = "Cave";
    d.difficulty = Dungeon::DungeonDifficulty::Hard;
    d.lootTier = 2;
    d.baseExpReward = 400;
    d.baseGoldReward = 150;
    d.rooms = {
        room("cc_entry", "Glittering Entrance", E::Combat, S::Strength, 20),
        room("cc_riddle", "Echoing Riddle", E::Puzzle, S::Wisdom, 22),
        room("cc_pit", "Collapsing Floor", E::Trap, S::Dexterity, 24),
        room("cc_cache", "Forgotten Cache", E::Treasure, S::Luck, 18, false, 0.2),
        room("cc_golems", "Golem Gallery", E::Combat, S::Defense, 26),
        room("cc_mirror", "Hall of Mirrors", E::Puzzle, S::Charisma, 25),
    };
    auto secret = room("cc_vault", "Hidden Vault", E::Treasure, S::Luck, 20, false, 0.3);
    secret.isBonusRoom = true;
    secret.classGate = RPG::ClassLine::Archer;
    d.rooms.push_back(secret);
    d.rooms.push_back(room("cc_wyrm", "Lair of the Deeprock Wyrm", E::Boss, S::Strength, 34, true, 0.25));
    return d;
}

std::string describe(const RPG::EquipmentItem& item) {
    std::ostringstream oss;
    oss << item.displayName() << " [" << RPG::rarityKey(item.rarity) << ", " << RPG::slotKey(item.slot) << "] +"
        << item.statBonus << ' ' << RPG::statKey(item.primaryStat);
    if (item.secondaryStat) oss << ", +" << item.secondaryStatBonus << ' ' << RPG::statKey(*item.secondaryStat);
    oss << " (lvl " << item.levelRequirement << ')';
    return oss.str();
}

void simulateRun(const Dungeon::Dungeon& dungeon, const std::vector<Dungeon::PartyMember>& party,
                 const Meta::ProgressionConfig& config, const RPG::ContentCatalog& catalog,
                 RPG::PityCounters& counters, Cards::CardCollection& collection, Engine::RandomSource& rng) {
    const auto& profile = Dungeon::difficultyProfile(dungeon.difficulty, config.difficulties);
    auto rooms = Dungeon::selectRoomsForRun(dungeon.rooms, party, rng);
    const auto start = Engine::Clock::now();
    Dungeon::DungeonRun run(dungeon.id, rooms, profile, 300, start);

    const auto cards = catalog.cards();
    Dungeon::EncounterContext context;
    context.lootTier = dungeon.lootTier;
    context.luck = party.front().stat(RPG::StatType::Luck);
    for (const auto& m : party) {
        if (m.characterClass) context.partyClasses.push_back(*m.characterClass);
    }
    context.successBonus = collection.totalBonuses().total(Cards::CardBonusType::DungeonSuccess);
    context.baseExpReward = dungeon.baseExpReward;
    context.baseGoldReward = dungeon.baseGoldReward;
    context.dungeonTheme = dungeon.theme;
    context.cardPool = &cards;
    context.cardRules = config.cards;

    Engine::logInfo("Run: " + dungeon.name + " (" + Dungeon::difficultyKey(dungeon.difficulty) + ", " +
                    std::to_string(run.totalRooms()) + " rooms)");
    int tick = 0;
    while (!run.isTerminal()) {
        ++tick;
        const auto now = Engine::addSeconds(start, profile.secondsPerRoom * tick);
        auto result = Dungeon::advanceRun(run, party, context, now, rng, config.encounter);
        if (!result) continue;

        std::ostringstream oss;
        oss << "  room " << result->roomIndex + 1 << ' ' << result->roomId << " via " << result->approachId << ": "
            << (result->success ? "success" : "failure") << " (power " << result->playerPower << " vs "
            << result->requiredPower << ", chance " << static_cast<int>(result->successChance * 100) << "%)";
        if (result->hpLost > 0) oss << " -" << result->hpLost << " HP";
        if (result->lootDropped) oss << " loot!";
        Engine::logInfo(oss.str());

        if (result->cardDropped) {
            const auto collected = collection.collect(*result->cardDropped);
            Engine::logInfo("  card: " + collected.card.name +
                            (collected.outcome == Cards::CollectOutcome::NewCard ? " (new)" : " (duplicate)"));
        }
    }

    Dungeon::CompletionContext completion;
    completion.difficulty = dungeon.difficulty;
    completion.lootTier = dungeon.lootTier;
    completion.luck = context.luck;
    completion.characterClass = party.front().characterClass;
    completion.playerLevel = party.front().level;
    completion.baseGoldReward = dungeon.baseGoldReward;
    const auto reward = Dungeon::completeRun(run, completion, counters, catalog, rng, config.loot);
    counters = reward.counters;

    Engine::logInfo(std::string("Result: ") + Dungeon::runStatusKey(run.status()) + ", grade " + reward.rating.grade +
                    ", " + std::to_string(reward.expAwarded) + " EXP, " + std::to_string(reward.goldAwarded) +
                    " gold, dungeon pity " + std::to_string(counters.count(RPG::PityContent::Dungeons)));
    for (const auto& item : reward.loot) Engine::logInfo("  loot: " + describe(item));
    if (reward.secret) {
        Engine::logInfo("  secret room: +" + std::to_string(reward.secret->bonusGold) + " gold, " +
                        std::to_string(reward.secret->materials) + " materials");
        if (reward.secret->item) Engine::logInfo("  secret loot: " + describe(*reward.secret->item));
    }
}

}  // namespace

int main(int argc, char** argv) {
    Options options;
    try {
        if (!parseOptions(argc, argv, options)) return 1;
    } catch (const std::exception& e) {
        Engine::logError(std::string("invalid argument: ") + e.what());
        return 1;
    }

    const auto config = Quest::Meta::loadProgressionConfig(options.configPath);
    Engine::Logger::setMinLevel(config.logLevel);
    const auto catalog = Quest::RPG::loadContentCatalog(options.catalogPath);

    std::unique_ptr<Engine::RandomSource> rng;
    if (options.seed) {
        rng = std::make_unique<Engine::MersenneRandom>(*options.seed);
    } else {
        rng = std::make_unique<Engine::MersenneRandom>();
    }

    using Quest::RPG::CharacterClass;
    const std::vector<Quest::Dungeon::PartyMember> party{
        member("Aria", CharacterClass::Ranger, 14, {14, 10, 9, 22, 12, 11}),
        member("Bram", CharacterClass::Paladin, 13, {20, 8, 12, 15, 6, 21}),
    };
    const auto dungeon = sampleDungeon();

    Quest::RPG::PityCounters counters;
    Quest::Cards::CardCollection collection("aria");
    try {
        for (int i = 0; i < options.runs; ++i) {
            simulateRun(dungeon, party, config, catalog, counters, collection, *rng);
        }
    } catch (const std::exception& e) {
        Engine::logError(std::string("simulation aborted: ") + e.what());
        return 1;
    }

    const auto bonuses = collection.totalBonuses();
    Engine::logInfo("Cards collected: " + std::to_string(collection.uniqueCount()) + ", power score bonus " +
                    std::to_string(bonuses.powerScoreBonus()));
    return 0;
}
