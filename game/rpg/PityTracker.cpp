#include "PityTracker.h"

#include <stdexcept>

#include "../../engine/core/Logger.h"

namespace Quest::RPG {

const char* pityContentKey(PityContent content) {
    switch (content) {
        case PityContent::Tasks: return "tasks";
        case PityContent::Dungeons: return "dungeons";
        case PityContent::Missions: return "missions";
        case PityContent::Expeditions: return "expeditions";
    }
    throw std::out_of_range("pityContentKey: invalid content type");
}

std::optional<PityContent> pityContentFromKey(const std::string& key) {
    for (PityContent c : kAllPityContent) {
        if (key == pityContentKey(c)) return c;
    }
    return std::nullopt;
}

const PityRule& PityRules::rule(PityContent content) const {
    const auto idx = static_cast<std::size_t>(content);
    if (idx >= rules.size()) throw std::out_of_range("PityRules::rule: invalid content type");
    return rules[idx];
}

PityRule& PityRules::rule(PityContent content) {
    const auto idx = static_cast<std::size_t>(content);
    if (idx >= rules.size()) throw std::out_of_range("PityRules::rule: invalid content type");
    return rules[idx];
}

const PityRules& defaultPityRules() {
    static const PityRules rules{};
    return rules;
}

int PityCounters::count(PityContent content) const {
    auto it = counts_.find(pityContentKey(content));
    return it == counts_.end() ? 0 : it->second;
}

void PityCounters::set(PityContent content, int value) {
    if (value < 0) throw std::invalid_argument("PityCounters::set: negative count");
    counts_[pityContentKey(content)] = value;
}

void PityCounters::increment(PityContent content) { ++counts_[pityContentKey(content)]; }

void PityCounters::reset(PityContent content) { counts_[pityContentKey(content)] = 0; }

PityDecision shouldDrop(double baseChance, int luck, const PityCounters& counters, PityContent content,
                        Engine::RandomSource& rng, const PityRules& rules) {
    const PityRule& rule = rules.rule(content);
    PityDecision out;
    out.counters = counters;

    if (counters.count(content) >= rule.threshold) {
        out.dropped = true;
        out.forced = true;
        out.forcedMinRarity = rule.forcedMinRarity;
        out.counters.reset(content);
        Engine::logDebug(std::string("Pity: forced ") + rarityKey(rule.forcedMinRarity) + " drop for " +
                         pityContentKey(content));
        return out;
    }

    if (rng.chance(baseChance + luck * rules.luckScaling)) {
        out.dropped = true;
        out.counters.reset(content);
        return out;
    }

    out.counters.increment(content);
    return out;
}

}  // namespace Quest::RPG
