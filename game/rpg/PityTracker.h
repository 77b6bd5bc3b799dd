// Bad-luck protection: per-content dry-run counters that force a drop at a threshold.
#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>

#include "RPGTypes.h"

namespace Quest::RPG {

enum class PityContent { Tasks, Dungeons, Missions, Expeditions };
constexpr std::array<PityContent, 4> kAllPityContent{PityContent::Tasks, PityContent::Dungeons, PityContent::Missions,
                                                     PityContent::Expeditions};

const char* pityContentKey(PityContent content);
std::optional<PityContent> pityContentFromKey(const std::string& key);

struct PityRule {
    int threshold{1};
    Rarity forcedMinRarity{Rarity::Uncommon};
};

struct PityRules {
    std::array<PityRule, 4> rules{{
        {20, Rarity::Uncommon},  // tasks
        {12, Rarity::Rare},      // dungeons
        {5, Rarity::Rare},       // missions
        {3, Rarity::Epic},       // expeditions
    }};
    double luckScaling{0.003};

    const PityRule& rule(PityContent content) const;
    PityRule& rule(PityContent content);
};

const PityRules& defaultPityRules();

// One character's dry-run counters, keyed by content type ("tasks", "dungeons", ...).
class PityCounters {
public:
    int count(PityContent content) const;
    void set(PityContent content, int value);
    void increment(PityContent content);
    void reset(PityContent content);

    const std::map<std::string, int>& values() const { return counts_; }

private:
    std::map<std::string, int> counts_;
};

struct PityDecision {
    bool dropped{false};
    bool forced{false};
    std::optional<Rarity> forcedMinRarity;
    PityCounters counters;  // counters after this roll
};

PityDecision shouldDrop(double baseChance, int luck, const PityCounters& counters, PityContent content,
                        Engine::RandomSource& rng, const PityRules& rules = defaultPityRules());

}  // namespace Quest::RPG
