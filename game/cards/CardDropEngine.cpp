#include "CardDropEngine.h"

#include <algorithm>
#include <cctype>

namespace Quest::Cards {

namespace {
std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return false;
    return lower(haystack).find(lower(needle)) != std::string::npos;
}
}  // namespace

const CardDropRules& defaultCardDropRules() {
    static const CardDropRules rules{};
    return rules;
}

bool isArenaMilestoneWave(int wave, const CardDropRules& rules) {
    return wave >= rules.arenaMinWave && wave % 10 == 5;
}

std::vector<CardDefinition> eligibleCards(CardSource source, const CardDropContext& context,
                                          const std::vector<CardDefinition>& pool) {
    std::vector<CardDefinition> out;
    for (const auto& c : pool) {
        if (!c.active || c.source != source) continue;
        if (source == CardSource::Dungeon && lower(c.theme) != lower(context.theme)) continue;
        out.push_back(c);
    }
    if (source == CardSource::Raid) {
        std::vector<CardDefinition> named;
        for (const auto& c : out) {
            if (containsIgnoreCase(c.sourceName, context.raidBossName)) named.push_back(c);
        }
        if (!named.empty()) return named;
    }
    return out;
}

double cardDropChance(CardSource source, const CardDropContext& context, const std::vector<CardDefinition>& eligible,
                      const CardDropRules& rules) {
    if (source == CardSource::Raid) return 1.0;
    if (source == CardSource::Arena && !isArenaMilestoneWave(context.arenaWave, rules)) return 0.0;

    double fallback = 0.0;
    switch (source) {
        case CardSource::Dungeon:
            fallback = context.bossRoom ? rules.bossChance : rules.dungeonChance;
            break;
        case CardSource::Arena:
            fallback = rules.arenaChance;
            break;
        case CardSource::Expedition:
            fallback = rules.expeditionChance;
            break;
        case CardSource::Raid:
            break;
    }

    if (eligible.empty()) return fallback;
    double sum = 0.0;
    for (const auto& c : eligible) sum += c.dropChance;
    const double average = sum / static_cast<double>(eligible.size());
    return average > 0.0 ? average : fallback;
}

std::optional<CardDefinition> weightedRandomCard(const std::vector<CardDefinition>& cards, Engine::RandomSource& rng,
                                                 const CardDropRules& rules) {
    if (cards.empty()) return std::nullopt;
    std::vector<double> weights;
    weights.reserve(cards.size());
    for (const auto& c : cards) weights.push_back(rules.rarityWeights[static_cast<std::size_t>(RPG::rarityIndex(c.rarity))]);
    return cards[Engine::pickWeightedIndex(weights, rng)];
}

std::optional<CardDefinition> rollCardDrop(CardSource source, const CardDropContext& context,
                                           const std::vector<CardDefinition>& pool, Engine::RandomSource& rng,
                                           const CardDropRules& rules) {
    const auto eligible = eligibleCards(source, context, pool);
    if (eligible.empty()) return std::nullopt;

    const double chance = cardDropChance(source, context, eligible, rules);
    if (!rng.chance(chance)) return std::nullopt;
    return weightedRandomCard(eligible, rng, rules);
}

}  // namespace Quest::Cards
