#include "CardDefinition.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace Quest::Cards {

namespace {
std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
}  // namespace

const char* cardBonusKey(CardBonusType type) {
    switch (type) {
        case CardBonusType::ExpPercent: return "exp_percent";
        case CardBonusType::GoldPercent: return "gold_percent";
        case CardBonusType::DungeonSuccess: return "dungeon_success";
        case CardBonusType::LootChance: return "loot_chance";
        case CardBonusType::MissionSpeed: return "mission_speed";
        case CardBonusType::FlatDefense: return "flat_defense";
    }
    throw std::out_of_range("cardBonusKey: invalid bonus type");
}

std::optional<CardBonusType> cardBonusFromKey(const std::string& key) {
    const std::string k = lower(key);
    for (int i = 0; i < kCardBonusTypeCount; ++i) {
        const auto t = static_cast<CardBonusType>(i);
        if (k == cardBonusKey(t)) return t;
    }
    return std::nullopt;
}

const char* cardSourceKey(CardSource source) {
    switch (source) {
        case CardSource::Dungeon: return "dungeon";
        case CardSource::Arena: return "arena";
        case CardSource::Expedition: return "expedition";
        case CardSource::Raid: return "raid";
    }
    throw std::out_of_range("cardSourceKey: invalid source");
}

std::optional<CardSource> cardSourceFromKey(const std::string& key) {
    const std::string k = lower(key);
    if (k == "dungeon") return CardSource::Dungeon;
    if (k == "arena") return CardSource::Arena;
    if (k == "expedition") return CardSource::Expedition;
    if (k == "raid") return CardSource::Raid;
    return std::nullopt;
}

}  // namespace Quest::Cards
