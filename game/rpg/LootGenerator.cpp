#include "LootGenerator.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace Quest::RPG {

namespace {
const std::vector<std::string>& baseTypesFor(EquipmentSlot slot) {
    static const std::vector<std::string> weapons{"sword", "axe", "staff", "bow", "dagger"};
    static const std::vector<std::string> armor{"plate", "chainmail", "robe", "leather"};
    static const std::vector<std::string> accessories{"ring", "amulet", "bracelet"};
    static const std::vector<std::string> trinkets{"charm", "totem", "orb"};
    switch (slot) {
        case EquipmentSlot::Weapon: return weapons;
        case EquipmentSlot::Armor: return armor;
        case EquipmentSlot::Accessory: return accessories;
        case EquipmentSlot::Trinket: return trinkets;
    }
    throw std::out_of_range("baseTypesFor: invalid slot");
}

const char* rarityAdjective(Rarity r) {
    static const std::array<const char*, kRarityCount> names{"Worn", "Sturdy", "Fine", "Exalted", "Mythforged"};
    return names[static_cast<std::size_t>(rarityIndex(r))];
}

std::string capitalized(std::string s) {
    if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

EquipmentItem proceduralItem(const LootRequest& request, EquipmentSlot slot, Rarity rarity, Engine::RandomSource& rng,
                             const LootTables& tables) {
    EquipmentItem item;
    item.slot = slot;
    item.rarity = rarity;
    item.primaryStat = kAllStats[rng.index(kAllStats.size())];
    item.statBonus = rollStatBonus(rarity, rng, tables.rarity);
    if (auto secondary = rollSecondaryStat(rarity, item.primaryStat, rng, tables.rarity)) {
        item.secondaryStat = secondary->stat;
        item.secondaryStatBonus = secondary->bonus;
    }

    int level = (request.tier - 1) * tables.rules.levelPerTier + item.statBonus / 2;
    if (request.playerLevel) level = std::min(level, *request.playerLevel + tables.rules.levelHeadroom);
    item.levelRequirement = std::max(1, level);

    const auto& bases = baseTypesFor(slot);
    item.baseType = bases[rng.index(bases.size())];
    item.name = std::string(rarityAdjective(rarity)) + " " + capitalized(item.baseType);
    return item;
}
}  // namespace

const LootTables& defaultLootTables() {
    static const LootTables tables{};
    return tables;
}

GeneratedLoot generateDetailed(const LootRequest& request, const ContentCatalog& catalog, Engine::RandomSource& rng,
                               const LootTables& tables) {
    if (request.tier < 1) {
        throw std::invalid_argument("LootGenerator: tier must be >= 1, got " + std::to_string(request.tier));
    }

    GeneratedLoot out;
    Rarity rarity;
    if (request.forcedRarity) {
        rarity = *request.forcedRarity;
    } else {
        const RarityRoll roll = rollRarityDetailed(request.tier, request.luck, rng, tables.rarity);
        rarity = roll.rarity;
        out.downgraded = roll.downgraded;
    }
    if (request.minimumRarity && rarityIndex(rarity) < rarityIndex(*request.minimumRarity)) {
        rarity = *request.minimumRarity;
        out.downgraded = false;
    }

    const EquipmentSlot slot = request.slot ? *request.slot : kAllSlots[rng.index(kAllSlots.size())];

    std::optional<int> maxLevel;
    if (request.playerLevel) maxLevel = *request.playerLevel + tables.rules.levelHeadroom;

    bool built = false;
    if (rng.chance(tables.rules.templateChance)) {
        const auto templates = catalog.equipmentTemplates(slot, rarity, maxLevel);
        if (!templates.empty()) {
            out.item = templates[rng.index(templates.size())].toItem({});
            out.fromTemplate = true;
            built = true;
        }
    }
    if (!built) out.item = proceduralItem(request, slot, rarity, rng, tables);

    const AffixRoll affixes = rollAffixes(rarity, request.characterClass, out.item.levelRequirement,
                                          catalog.affixDefinitions(AffixType::Prefix, rarity),
                                          catalog.affixDefinitions(AffixType::Suffix, rarity), rng, tables.affixes);
    out.item.prefix = affixes.prefix;
    out.item.suffix = affixes.suffix;
    out.item.id = makeItemId(rng);
    return out;
}

EquipmentItem generate(const LootRequest& request, const ContentCatalog& catalog, Engine::RandomSource& rng,
                       const LootTables& tables) {
    return generateDetailed(request, catalog, rng, tables).item;
}

PityLootResult rollPityLoot(const LootRequest& request, double baseChance, PityContent content,
                            const PityCounters& counters, const ContentCatalog& catalog, Engine::RandomSource& rng,
                            const LootTables& tables) {
    const PityDecision decision = shouldDrop(baseChance, request.luck, counters, content, rng, tables.pity);

    PityLootResult out;
    out.counters = decision.counters;
    out.pityForced = decision.forced;
    if (!decision.dropped) return out;

    LootRequest req = request;
    if (decision.forcedMinRarity) {
        req.minimumRarity = req.minimumRarity ? maxRarity(*req.minimumRarity, *decision.forcedMinRarity)
                                              : *decision.forcedMinRarity;
    }
    GeneratedLoot loot = generateDetailed(req, catalog, rng, tables);
    if (loot.downgraded && !decision.forced) {
        out.counters = counters;
        out.counters.increment(content);
    }
    out.item = std::move(loot.item);
    return out;
}

}  // namespace Quest::RPG
