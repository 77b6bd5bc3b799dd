#include "MonsterCard.h"

#include <algorithm>

#include "../../engine/core/Logger.h"

namespace Quest::Cards {

MonsterCard MonsterCard::fromDefinition(const CardDefinition& def, std::string id) {
    MonsterCard card;
    card.id = std::move(id);
    card.cardId = def.id;
    card.name = def.name;
    card.theme = def.theme;
    card.rarity = def.rarity;
    card.bonusType = def.bonusType;
    card.bonusValue = def.bonusValue;
    card.baseBonusValue = def.bonusValue;
    card.source = def.source;
    return card;
}

int crossedThresholds(int duplicateCount, const CardDropRules& rules) {
    return static_cast<int>(std::count_if(rules.upgradeThresholds.begin(), rules.upgradeThresholds.end(),
                                           [duplicateCount](int t) { return duplicateCount >= t; }));
}

bool absorbDuplicate(MonsterCard& card, const CardDropRules& rules) {
    ++card.duplicateCount;
    card.bonusValue = card.baseBonusValue * (1.0 + rules.bonusPerDuplicate * card.duplicateCount);

    const int target = crossedThresholds(card.duplicateCount, rules);
    if (target <= card.upgradeLevel) return false;

    card.upgradeLevel = target;
    const auto next = RPG::nextRarity(card.rarity);
    if (!next) return false;
    card.rarity = *next;
    return true;
}

int CardBonusSummary::powerScoreBonus() const {
    double percent = 0.0;
    for (int i = 0; i < kCardBonusTypeCount; ++i) {
        const auto type = static_cast<CardBonusType>(i);
        if (isPercentBonus(type)) percent += total(type);
    }
    return static_cast<int>(percent * 100.0 + total(CardBonusType::FlatDefense) * 5.0);
}

const std::vector<CollectionMilestone>& collectionMilestones() {
    static const std::vector<CollectionMilestone> milestones{
        {10, CardBonusType::ExpPercent, 0.02},
        {25, CardBonusType::GoldPercent, 0.02},
        {50, CardBonusType::LootChance, 0.03},
        {75, CardBonusType::DungeonSuccess, 0.03},
        {100, CardBonusType::ExpPercent, 0.05},
    };
    return milestones;
}

CardCollection::CardCollection(std::string ownerId, CardDropRules rules)
    : ownerId_(std::move(ownerId)), rules_(rules) {}

CollectResult CardCollection::collect(const CardDefinition& def) {
    CollectResult result;
    auto it = std::find_if(cards_.begin(), cards_.end(), [&def](const MonsterCard& c) { return c.cardId == def.id; });
    if (it == cards_.end()) {
        cards_.push_back(MonsterCard::fromDefinition(def, ownerId_ + ":" + def.id));
        result.outcome = CollectOutcome::NewCard;
        result.card = cards_.back();
        return result;
    }

    result.outcome = CollectOutcome::DuplicateAbsorbed;
    result.rarityUpgraded = absorbDuplicate(*it, rules_);
    if (result.rarityUpgraded) {
        Engine::logInfo("Cards: " + it->name + " upgraded to " + RPG::rarityKey(it->rarity) + " after " +
                        std::to_string(it->duplicateCount) + " duplicates");
    }
    result.card = *it;
    return result;
}

const MonsterCard* CardCollection::find(const std::string& cardId) const {
    auto it = std::find_if(cards_.begin(), cards_.end(), [&cardId](const MonsterCard& c) { return c.cardId == cardId; });
    return it == cards_.end() ? nullptr : &*it;
}

CardBonusSummary CardCollection::totalBonuses() const {
    CardBonusSummary summary;
    for (const auto& c : cards_) summary.add(c.bonusType, c.bonusValue);
    for (const auto& m : reachedMilestones()) summary.add(m.bonusType, m.bonusValue);
    return summary;
}

std::vector<CollectionMilestone> CardCollection::reachedMilestones() const {
    std::vector<CollectionMilestone> out;
    for (const auto& m : collectionMilestones()) {
        if (static_cast<int>(cards_.size()) >= m.cardsRequired) out.push_back(m);
    }
    return out;
}

}  // namespace Quest::Cards
