#include "ProgressionConfig.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

namespace Quest::Meta {

using nlohmann::json;

namespace {

template <std::size_t N>
void readDoubles(const json& j, const char* key, std::array<double, N>& out) {
    if (!j.contains(key) || !j[key].is_array()) return;
    const auto& arr = j[key];
    const std::size_t count = std::min(arr.size(), N);
    for (std::size_t i = 0; i < count; ++i) {
        if (arr[i].is_number()) out[i] = arr[i].get<double>();
    }
}

template <std::size_t N>
void readRanges(const json& j, const char* key, std::array<std::array<int, 2>, N>& out) {
    if (!j.contains(key) || !j[key].is_array()) return;
    const auto& arr = j[key];
    const std::size_t count = std::min(arr.size(), N);
    for (std::size_t i = 0; i < count; ++i) {
        const auto& entry = arr[i];
        if (entry.is_array() && entry.size() >= 2) {
            out[i][0] = entry[0].get<int>();
            out[i][1] = entry[1].get<int>();
        } else if (entry.is_object()) {
            out[i][0] = entry.value("min", out[i][0]);
            out[i][1] = entry.value("max", out[i][1]);
        }
        if (out[i][1] < out[i][0]) std::swap(out[i][0], out[i][1]);
    }
}

void readRarity(const json& j, RPG::RarityTable& t) {
    if (j.contains("thresholds") && j["thresholds"].is_object()) {
        const auto& th = j["thresholds"];
        t.thresholds[0] = th.value("legendary", t.thresholds[0]);
        t.thresholds[1] = th.value("epic", t.thresholds[1]);
        t.thresholds[2] = th.value("rare", t.thresholds[2]);
        t.thresholds[3] = th.value("uncommon", t.thresholds[3]);
    }
    t.luckWeight = j.value("luckWeight", t.luckWeight);
    t.tierWeight = j.value("tierWeight", t.tierWeight);
    t.legendaryMinTier = std::max(1, j.value("legendaryMinTier", t.legendaryMinTier));
    if (j.contains("epicSoftCaps") && j["epicSoftCaps"].is_array()) {
        t.epicSoftCaps.clear();
        for (const auto& cap : j["epicSoftCaps"]) {
            RPG::EpicSoftCap c;
            c.tier = cap.value("tier", 1);
            c.keepChance = cap.value("keepChance", 0.0);
            c.keepChancePerLuck = cap.value("keepChancePerLuck", 0.0);
            auto down = RPG::rarityFromKey(cap.value("downgradeTo", "rare"));
            if (!down) {
                Engine::logWarn("ProgressionConfig: unknown downgradeTo in epicSoftCaps, entry skipped");
                continue;
            }
            c.downgradeTo = *down;
            t.epicSoftCaps.push_back(c);
        }
    }
    readRanges(j, "statBonus", t.statBonus);
    readDoubles(j, "secondaryChance", t.secondaryChance);
    readRanges(j, "secondaryBonus", t.secondaryBonus);
}

void readAffixes(const json& j, RPG::AffixTable& t) {
    readDoubles(j, "prefixChance", t.prefixChance);
    readDoubles(j, "suffixChance", t.suffixChance);
    readDoubles(j, "rarityScale", t.rarityScale);
    t.levelScalePerLevel = j.value("levelScalePerLevel", t.levelScalePerLevel);
    t.greaterChance = j.value("greaterChance", t.greaterChance);
    t.greaterMultiplier = j.value("greaterMultiplier", t.greaterMultiplier);
    t.classAffinityShare = j.value("classAffinityShare", t.classAffinityShare);
}

void readPity(const json& j, RPG::PityRules& rules) {
    rules.luckScaling = j.value("luckScaling", rules.luckScaling);
    for (RPG::PityContent content : RPG::kAllPityContent) {
        const char* key = RPG::pityContentKey(content);
        if (!j.contains(key) || !j[key].is_object()) continue;
        auto& rule = rules.rule(content);
        rule.threshold = std::max(1, j[key].value("threshold", rule.threshold));
        if (auto min = RPG::rarityFromKey(j[key].value("minRarity", RPG::rarityKey(rule.forcedMinRarity)))) {
            rule.forcedMinRarity = *min;
        } else {
            Engine::logWarn(std::string("ProgressionConfig: unknown pity minRarity for ") + key);
        }
    }
}

void readCards(const json& j, Cards::CardDropRules& rules) {
    rules.dungeonChance = j.value("dungeonChance", rules.dungeonChance);
    rules.bossChance = j.value("bossChance", rules.bossChance);
    rules.arenaChance = j.value("arenaChance", rules.arenaChance);
    rules.expeditionChance = j.value("expeditionChance", rules.expeditionChance);
    rules.arenaMinWave = j.value("arenaMinWave", rules.arenaMinWave);
    rules.bonusPerDuplicate = j.value("bonusPerDuplicate", rules.bonusPerDuplicate);
    readDoubles(j, "rarityWeights", rules.rarityWeights);
    if (j.contains("upgradeThresholds") && j["upgradeThresholds"].is_array()) {
        const auto& arr = j["upgradeThresholds"];
        const std::size_t count = std::min(arr.size(), rules.upgradeThresholds.size());
        for (std::size_t i = 0; i < count; ++i) rules.upgradeThresholds[i] = arr[i].get<int>();
        std::sort(rules.upgradeThresholds.begin(), rules.upgradeThresholds.end());
    }
}

void readDifficulties(const json& j, Dungeon::DifficultyTable& table) {
    for (std::size_t i = 0; i < table.size(); ++i) {
        const char* key = Dungeon::difficultyKey(static_cast<Dungeon::DungeonDifficulty>(i));
        if (!j.contains(key) || !j[key].is_object()) continue;
        const auto& d = j[key];
        auto& p = table[i];
        p.powerScalar = d.value("powerScalar", p.powerScalar);
        p.rewardMultiplier = d.value("rewardMultiplier", p.rewardMultiplier);
        p.secondsPerRoom = d.value("secondsPerRoom", p.secondsPerRoom);
        p.dropChanceCap = d.value("dropChanceCap", p.dropChanceCap);
        p.damageMultiplier = d.value("damageMultiplier", p.damageMultiplier);
        p.successFloor = d.value("successFloor", p.successFloor);
    }
}

void readEncounter(const json& j, Dungeon::EncounterRules& r) {
    r.successCeiling = j.value("successCeiling", r.successCeiling);
    r.readinessPenalty = j.value("readinessPenalty", r.readinessPenalty);
    r.minBaseDamage = j.value("minBaseDamage", r.minBaseDamage);
    r.paladinDamageReduction = j.value("paladinDamageReduction", r.paladinDamageReduction);
    r.rangerDamageReduction = j.value("rangerDamageReduction", r.rangerDamageReduction);
    r.maxDamageReduction = j.value("maxDamageReduction", r.maxDamageReduction);
    r.partySizeScaling = j.value("partySizeScaling", r.partySizeScaling);
    r.failureExpShare = j.value("failureExpShare", r.failureExpShare);
    r.bossRewardMultiplier = j.value("bossRewardMultiplier", r.bossRewardMultiplier);
    r.tricksterLootBonus = j.value("tricksterLootBonus", r.tricksterLootBonus);
    r.enchanterPartyBonus = j.value("enchanterPartyBonus", r.enchanterPartyBonus);
}

}  // namespace

ProgressionConfig defaultProgressionConfig() { return ProgressionConfig{}; }

ProgressionConfig loadProgressionConfig(const std::string& path) {
    ProgressionConfig out = defaultProgressionConfig();
    if (!std::filesystem::exists(path)) {
        Engine::logDebug("ProgressionConfig: " + path + " not found, using defaults");
        return out;
    }
    std::ifstream f(path);
    if (!f.is_open()) {
        Engine::logWarn("ProgressionConfig: cannot open " + path);
        return out;
    }

    try {
        json j;
        f >> j;
        if (j.contains("logLevel") && j["logLevel"].is_string()) {
            if (auto level = Engine::logLevelFromKey(j["logLevel"].get<std::string>())) out.logLevel = *level;
        }
        if (j.contains("rarity")) readRarity(j["rarity"], out.loot.rarity);
        if (j.contains("affixes")) readAffixes(j["affixes"], out.loot.affixes);
        if (j.contains("loot")) {
            out.loot.rules.templateChance = j["loot"].value("templateChance", out.loot.rules.templateChance);
            out.loot.rules.levelPerTier = j["loot"].value("levelPerTier", out.loot.rules.levelPerTier);
            out.loot.rules.levelHeadroom = j["loot"].value("levelHeadroom", out.loot.rules.levelHeadroom);
        }
        if (j.contains("pity")) readPity(j["pity"], out.loot.pity);
        if (j.contains("cards")) readCards(j["cards"], out.cards);
        if (j.contains("difficulties")) readDifficulties(j["difficulties"], out.difficulties);
        if (j.contains("encounter")) readEncounter(j["encounter"], out.encounter);
    } catch (const json::exception& e) {
        Engine::logWarn("ProgressionConfig: failed to parse " + path + ": " + e.what());
        return defaultProgressionConfig();
    }
    return out;
}

}  // namespace Quest::Meta
