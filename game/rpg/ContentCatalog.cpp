#include "ContentCatalog.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <type_traits>

#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"

namespace Quest::RPG {

using nlohmann::json;
using Cards::CardDefinition;
using Cards::CardSource;
using Cards::CardBonusType;

namespace {

EquipmentTemplate tmpl(const char* id, const char* name, const char* baseType, EquipmentSlot slot, Rarity rarity,
                       StatType primary, int bonus, std::optional<StatType> secondary, int secondaryBonus, int level,
                       const char* description) {
    EquipmentTemplate t;
    t.id = id;
    t.name = name;
    t.baseType = baseType;
    t.slot = slot;
    t.rarity = rarity;
    t.primaryStat = primary;
    t.statBonus = bonus;
    t.secondaryStat = secondary;
    t.secondaryStatBonus = secondary ? secondaryBonus : 0;
    t.levelRequirement = level;
    t.description = description;
    return t;
}

AffixDefinition affix(AffixType type, const char* id, const char* name, const char* bonusType, double min, double max,
                      const char* category) {
    AffixDefinition d;
    d.type = type;
    d.id = id;
    d.name = name;
    d.bonusType = bonusType;
    d.minValue = min;
    d.maxValue = max;
    d.category = category;
    return d;
}

CardDefinition card(const char* id, const char* name, const char* theme, Rarity rarity, CardBonusType bonus,
                    double value, CardSource source, const char* sourceName, double dropChance) {
    CardDefinition c;
    c.id = id;
    c.name = name;
    c.theme = theme;
    c.rarity = rarity;
    c.bonusType = bonus;
    c.bonusValue = value;
    c.source = source;
    c.sourceName = sourceName;
    c.dropChance = dropChance;
    return c;
}

std::optional<EquipmentTemplate> parseEquipment(const json& j) {
    const std::string id = j.value("id", "");
    const auto slot = slotFromKey(j.value("slot", ""));
    const auto rarity = rarityFromKey(j.value("rarity", ""));
    const auto primary = statFromKey(j.value("primary_stat", ""));
    if (id.empty() || !slot || !rarity || !primary) {
        Engine::logWarn("ContentCatalog: skipping equipment row with missing or unknown keys '" + id + "'");
        return std::nullopt;
    }
    EquipmentTemplate t;
    t.id = id;
    t.name = j.value("name", id);
    t.description = j.value("description", "");
    t.baseType = j.value("base_type", "");
    t.slot = *slot;
    t.rarity = *rarity;
    t.primaryStat = *primary;
    t.statBonus = j.value("stat_bonus", 0);
    t.levelRequirement = std::max(1, j.value("level_requirement", 1));
    t.active = j.value("active", true);
    if (t.statBonus <= 0) {
        Engine::logWarn("ContentCatalog: skipping equipment '" + id + "' with non-positive stat_bonus");
        return std::nullopt;
    }
    if (j.contains("secondary_stat") && j["secondary_stat"].is_string()) {
        auto secondary = statFromKey(j["secondary_stat"].get<std::string>());
        const int bonus = j.value("secondary_stat_bonus", 0);
        if (secondary && *secondary != t.primaryStat && bonus > 0) {
            t.secondaryStat = secondary;
            t.secondaryStatBonus = bonus;
        }
    }
    return t;
}

std::optional<AffixDefinition> parseAffix(const json& j) {
    const std::string id = j.value("id", "");
    const auto type = affixTypeFromKey(j.value("affix_type", ""));
    if (id.empty() || !type) {
        Engine::logWarn("ContentCatalog: skipping affix row with missing id or affix_type '" + id + "'");
        return std::nullopt;
    }
    AffixDefinition d;
    d.id = id;
    d.type = *type;
    d.name = j.value("name", id);
    d.bonusType = j.value("bonus_type", "");
    d.description = j.value("effect_description", "");
    d.minValue = j.value("min_value", 0.0);
    d.maxValue = j.value("max_value", 0.0);
    d.category = j.value("category", "");
    d.active = j.value("active", true);
    d.minItemRarity = rarityFromKey(j.value("min_item_rarity", "common")).value_or(Rarity::Common);
    if (d.minValue > d.maxValue) {
        Engine::logWarn("ContentCatalog: skipping affix '" + id + "' with min_value > max_value");
        return std::nullopt;
    }
    return d;
}

std::optional<CardDefinition> parseCard(const json& j) {
    const std::string id = j.value("id", "");
    const auto rarity = rarityFromKey(j.value("rarity", ""));
    const auto bonus = Cards::cardBonusFromKey(j.value("bonus_type", ""));
    const auto source = Cards::cardSourceFromKey(j.value("source_type", ""));
    if (id.empty() || !rarity || !bonus || !source) {
        Engine::logWarn("ContentCatalog: skipping card row with missing or unknown keys '" + id + "'");
        return std::nullopt;
    }
    CardDefinition c;
    c.id = id;
    c.name = j.value("name", id);
    c.description = j.value("description", "");
    c.theme = j.value("theme", "");
    c.rarity = *rarity;
    c.bonusType = *bonus;
    c.bonusValue = j.value("bonus_value", 0.0);
    c.source = *source;
    c.sourceName = j.value("source_name", "");
    c.dropChance = j.value("drop_chance", 0.0);
    c.active = j.value("active", true);
    return c;
}

template <typename T, typename Parser>
void parseArray(const json& root, const char* key, std::vector<T>& out, Parser parse) {
    if (!root.contains(key)) return;
    const auto& arr = root[key];
    if (!arr.is_array()) {
        Engine::logWarn(std::string("ContentCatalog: '") + key + "' is not an array");
        return;
    }
    for (const auto& row : arr) {
        if (!row.is_object()) continue;
        try {
            if (auto parsed = parse(row)) out.push_back(std::move(*parsed));
        } catch (const json::exception& e) {
            const std::string id = row.contains("id") && row["id"].is_string() ? row["id"].get<std::string>() : "?";
            Engine::logWarn(std::string("ContentCatalog: skipping ") + key + " row '" + id + "': " + e.what());
        }
    }
}

}  // namespace

EquipmentItem EquipmentTemplate::toItem(std::string itemId) const {
    EquipmentItem item;
    item.id = std::move(itemId);
    item.templateId = id;
    item.name = name;
    item.description = description;
    item.baseType = baseType;
    item.slot = slot;
    item.rarity = rarity;
    item.primaryStat = primaryStat;
    item.statBonus = statBonus;
    item.secondaryStat = secondaryStat;
    item.secondaryStatBonus = secondaryStat ? secondaryStatBonus : 0;
    item.levelRequirement = levelRequirement;
    return item;
}

const std::vector<EquipmentTemplate>& staticEquipmentTemplates() {
    using S = StatType;
    using R = Rarity;
    using E = EquipmentSlot;
    static const std::vector<EquipmentTemplate> templates{
        tmpl("wep_sword_common_01", "Iron Shortsword", "sword", E::Weapon, R::Common, S::Strength, 2, std::nullopt, 0, 1,
             "A plain blade for a first adventure."),
        tmpl("wep_staff_rare_01", "Oakheart Staff", "staff", E::Weapon, R::Rare, S::Wisdom, 6, S::Luck, 2, 8,
             "Carved from a tree that remembers every spell cast beneath it."),
        tmpl("wep_bow_epic_01", "Galeforce Longbow", "bow", E::Weapon, R::Epic, S::Dexterity, 10, S::Luck, 4, 18,
             "Arrows loosed from it ride the wind."),
        tmpl("wep_axe_legendary_01", "Worldsplitter", "axe", E::Weapon, R::Legendary, S::Strength, 16, S::Defense, 7, 22,
             "Said to have cleaved a mountain pass."),
        tmpl("arm_vest_common_01", "Padded Vest", "vest", E::Armor, R::Common, S::Defense, 2, std::nullopt, 0, 1,
             "Quilted cloth that turns a glancing blow."),
        tmpl("arm_chain_uncommon_01", "Riveted Chainmail", "chainmail", E::Armor, R::Uncommon, S::Defense, 4, S::Strength,
             1, 5, "Heavy, reliable, and a little noisy."),
        tmpl("arm_robe_epic_01", "Starwoven Robe", "robe", E::Armor, R::Epic, S::Wisdom, 9, S::Charisma, 4, 16,
             "Threads of night sky stitched into silk."),
        tmpl("arm_plate_legendary_01", "Aegis of the Dawn", "plate", E::Armor, R::Legendary, S::Defense, 15, S::Strength,
             6, 24, "Warm to the touch even in the deepest dungeon."),
        tmpl("acc_ring_common_01", "Copper Band", "ring", E::Accessory, R::Common, S::Luck, 1, std::nullopt, 0, 1,
             "Someone lost it. Now it is yours."),
        tmpl("acc_amulet_rare_01", "Moonstone Pendant", "amulet", E::Accessory, R::Rare, S::Charisma, 5, S::Wisdom, 3, 10,
             "Glows faintly whenever friends are near."),
        tmpl("acc_ring_legendary_01", "Band of Endless Fortune", "ring", E::Accessory, R::Legendary, S::Luck, 14,
             S::Charisma, 5, 20, "Coins seem to find their way to its wearer."),
        tmpl("trk_charm_uncommon_01", "Lucky Rabbit Charm", "charm", E::Trinket, R::Uncommon, S::Luck, 3, std::nullopt, 0, 3,
             "Worn smooth by nervous thumbs."),
        tmpl("trk_totem_epic_01", "Ember Totem", "totem", E::Trinket, R::Epic, S::Strength, 8, S::Defense, 3, 15,
             "Holds the last coal of a forge-spirit."),
        tmpl("trk_orb_legendary_01", "Orb of the Cosmos", "orb", E::Trinket, R::Legendary, S::Wisdom, 12, S::Luck, 8, 25,
             "Galaxies turn slowly inside the glass."),
    };
    return templates;
}

const std::vector<AffixDefinition>& staticAffixPool(AffixType type) {
    static const std::vector<AffixDefinition> prefixes{
        affix(AffixType::Prefix, "affix_blazing", "Blazing", "exp_physical_percent", 3, 10, "task-specific"),
        affix(AffixType::Prefix, "affix_scholarly", "Scholarly", "exp_mental_percent", 3, 10, "task-specific"),
        affix(AffixType::Prefix, "affix_social", "Social", "exp_social_percent", 3, 10, "task-specific"),
        affix(AffixType::Prefix, "affix_industrious", "Industrious", "exp_household_percent", 3, 10, "task-specific"),
        affix(AffixType::Prefix, "affix_mindful", "Mindful", "exp_wellness_percent", 3, 10, "task-specific"),
        affix(AffixType::Prefix, "affix_inspired", "Inspired", "exp_creative_percent", 3, 10, "task-specific"),
        affix(AffixType::Prefix, "affix_swift", "Swift", "mission_duration_reduction", 3, 8, "idle-bonus"),
        affix(AffixType::Prefix, "affix_prosperous", "Prosperous", "gold_percent", 3, 8, "economy"),
        affix(AffixType::Prefix, "affix_lucky", "Lucky", "rare_drop_chance", 2, 6, "meta-loot"),
        affix(AffixType::Prefix, "affix_resilient", "Resilient", "streak_shield_chance", 3, 8, "protection"),
    };
    static const std::vector<AffixDefinition> suffixes{
        affix(AffixType::Suffix, "affix_vigilant", "Vigilant", "dungeon_success_percent", 3, 8, "combat"),
        affix(AffixType::Suffix, "affix_of_fortune", "of Fortune", "loot_drop_chance_percent", 2, 6, "meta-loot"),
        affix(AffixType::Suffix, "affix_of_scholar", "of the Scholar", "mission_speed_percent", 3, 8, "idle-bonus"),
        affix(AffixType::Suffix, "affix_of_devotion", "of Devotion", "party_bond_exp_percent", 3, 8, "social"),
        affix(AffixType::Suffix, "affix_of_persistence", "of Persistence", "habit_streak_bonus_percent", 3, 8, "habit"),
        affix(AffixType::Suffix, "affix_of_pathfinder", "of the Pathfinder", "expedition_reward_percent", 3, 8,
              "expedition"),
        affix(AffixType::Suffix, "affix_of_warding", "of Warding", "defense_flat", 2, 6, "combat"),
        affix(AffixType::Suffix, "affix_of_haste", "of Haste", "dungeon_room_time_reduction", 3, 8, "combat"),
    };
    return type == AffixType::Prefix ? prefixes : suffixes;
}

const std::vector<CardDefinition>& staticCardDefinitions() {
    using R = Rarity;
    using B = CardBonusType;
    using S = CardSource;
    static const std::vector<CardDefinition> cards{
        card("card_cave_01", "Cave Crawler", "Cave", R::Common, B::ExpPercent, 0.005, S::Dungeon, "Dungeon: Crystal Caverns", 0.10),
        card("card_cave_02", "Stalactite Horror", "Cave", R::Common, B::FlatDefense, 1.0, S::Dungeon, "Dungeon: Crystal Caverns", 0.10),
        card("card_cave_03", "Glowworm Swarm", "Cave", R::Uncommon, B::GoldPercent, 0.008, S::Dungeon, "Dungeon: Crystal Caverns", 0.08),
        card("card_cave_05", "Blind Basilisk", "Cave", R::Rare, B::LootChance, 0.010, S::Dungeon, "Dungeon: Gemstone Depths", 0.05),
        card("card_cave_07", "Deeprock Wyrm", "Cave", R::Epic, B::ExpPercent, 0.015, S::Dungeon, "Dungeon: Spore Hollow", 0.03),
        card("card_forest_01", "Thornback Wolf", "Forest", R::Common, B::ExpPercent, 0.005, S::Dungeon, "Dungeon: Whispering Woods", 0.10),
        card("card_forest_04", "Elder Stag", "Forest", R::Uncommon, B::MissionSpeed, 0.008, S::Dungeon, "Dungeon: Verdant Maze", 0.08),
        card("card_forest_05", "Moss Golem", "Forest", R::Rare, B::DungeonSuccess, 0.010, S::Dungeon, "Dungeon: Verdant Maze", 0.05),
        card("card_fort_01", "Iron Sentinel", "Fortress", R::Common, B::FlatDefense, 1.5, S::Dungeon, "Dungeon: Iron Bastion", 0.10),
        card("card_fort_06", "Warden of the Gate", "Fortress", R::Epic, B::DungeonSuccess, 0.015, S::Dungeon, "Dungeon: Fallen Keep", 0.03),
        card("card_arena_01", "Gladiator's Spirit", "arena", R::Common, B::ExpPercent, 0.005, S::Arena, "Arena Wave 15", 0.20),
        card("card_arena_02", "Pit Champion", "arena", R::Uncommon, B::DungeonSuccess, 0.010, S::Arena, "Arena Wave 25", 0.20),
        card("card_arena_04", "Arena Warlord", "arena", R::Rare, B::GoldPercent, 0.012, S::Arena, "Arena Wave 35", 0.15),
        card("card_exped_01", "Trailblazer Hawk", "expedition", R::Common, B::MissionSpeed, 0.005, S::Expedition, "Expedition: The Long Road", 0.15),
        card("card_exped_03", "Desert Mirage", "expedition", R::Uncommon, B::GoldPercent, 0.008, S::Expedition, "Expedition: Sands of Time", 0.12),
        card("card_exped_04", "Mountain Yeti", "expedition", R::Uncommon, B::DungeonSuccess, 0.008, S::Expedition, "Expedition: Frozen Summit", 0.12),
        card("card_raid_01", "Gorethane the Undying", "raid", R::Epic, B::FlatDefense, 4.0, S::Raid, "Raid: Gorethane", 1.0),
        card("card_raid_02", "Queen Venomara", "raid", R::Epic, B::ExpPercent, 0.020, S::Raid, "Raid: Venomara", 1.0),
        card("card_raid_03", "Frostlord Kaelthas", "raid", R::Epic, B::DungeonSuccess, 0.020, S::Raid, "Raid: Kaelthas", 1.0),
        card("card_raid_04", "The Crimson Wyrm", "raid", R::Legendary, B::LootChance, 0.025, S::Raid, "Raid: Crimson Wyrm", 1.0),
    };
    return cards;
}

ContentCatalog ContentCatalog::builtIn() { return ContentCatalog(StaticCatalog{}); }

ContentCatalog ContentCatalog::remote(RemoteCatalog content) { return ContentCatalog(std::move(content)); }

std::vector<EquipmentTemplate> ContentCatalog::equipmentTemplates(EquipmentSlot slot, Rarity rarity,
                                                                  std::optional<int> maxLevel) const {
    const auto& all = std::visit(
        [](const auto& src) -> const std::vector<EquipmentTemplate>& {
            using T = std::decay_t<decltype(src)>;
            if constexpr (std::is_same_v<T, RemoteCatalog>) {
                return src.equipment;
            } else {
                return staticEquipmentTemplates();
            }
        },
        source_);

    std::vector<EquipmentTemplate> out;
    for (const auto& t : all) {
        if (!t.active || t.slot != slot || t.rarity != rarity) continue;
        if (maxLevel && t.levelRequirement > *maxLevel) continue;
        out.push_back(t);
    }
    return out;
}

std::vector<AffixDefinition> ContentCatalog::affixDefinitions(AffixType type, Rarity rarity) const {
    std::vector<AffixDefinition> out;
    if (const auto* remote = std::get_if<RemoteCatalog>(&source_)) {
        for (const auto& d : remote->affixes) {
            if (!d.active || d.type != type) continue;
            if (rarityIndex(d.minItemRarity) > rarityIndex(rarity)) continue;
            out.push_back(d);
        }
    }
    if (out.empty()) out = staticAffixPool(type);
    return out;
}

std::vector<CardDefinition> ContentCatalog::cards() const {
    std::vector<CardDefinition> out;
    if (const auto* remote = std::get_if<RemoteCatalog>(&source_)) {
        for (const auto& c : remote->cards) {
            if (c.active) out.push_back(c);
        }
    }
    if (out.empty()) {
        for (const auto& c : staticCardDefinitions()) {
            if (c.active) out.push_back(c);
        }
    }
    return out;
}

ContentCatalog loadContentCatalog(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Engine::logWarn("ContentCatalog: " + path + " not found, using built-in content");
        return ContentCatalog::builtIn();
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        Engine::logWarn("ContentCatalog: cannot open " + path + ", using built-in content");
        return ContentCatalog::builtIn();
    }

    RemoteCatalog content;
    try {
        json root;
        in >> root;
        if (!root.is_object()) {
            Engine::logWarn("ContentCatalog: " + path + " is not a JSON object, using built-in content");
            return ContentCatalog::builtIn();
        }
        parseArray(root, "equipment", content.equipment, parseEquipment);
        parseArray(root, "affixes", content.affixes, parseAffix);
        parseArray(root, "cards", content.cards, parseCard);
    } catch (const json::exception& e) {
        Engine::logWarn("ContentCatalog: failed to parse " + path + ": " + e.what());
        return ContentCatalog::builtIn();
    }

    Engine::logInfo("ContentCatalog: loaded " + std::to_string(content.equipment.size()) + " equipment, " +
                    std::to_string(content.affixes.size()) + " affixes, " + std::to_string(content.cards.size()) +
                    " cards from " + path);
    return ContentCatalog::remote(std::move(content));
}

}  // namespace Quest::RPG
