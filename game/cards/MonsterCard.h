// Owned monster cards: duplicate absorption, collection bookkeeping and bonus totals.
#pragma once

#include <array>
#include <string>
#include <vector>

#include "CardDropEngine.h"

namespace Quest::Cards {

struct MonsterCard {
    std::string id;
    std::string cardId;  // content card this copy came from
    std::string name;
    std::string theme;
    Rarity rarity{Rarity::Common};
    CardBonusType bonusType{CardBonusType::ExpPercent};
    double bonusValue{0.0};
    double baseBonusValue{0.0};
    CardSource source{CardSource::Dungeon};
    int duplicateCount{0};
    int upgradeLevel{0};

    static MonsterCard fromDefinition(const CardDefinition& def, std::string id);
};

// Number of ladder thresholds reached at a duplicate count.
int crossedThresholds(int duplicateCount, const CardDropRules& rules = defaultCardDropRules());

// Adds one duplicate and rescales the bonus. Returns true only when the rarity went up a step.
bool absorbDuplicate(MonsterCard& card, const CardDropRules& rules = defaultCardDropRules());

class CardBonusSummary {
public:
    void add(CardBonusType type, double value) { totals_[static_cast<std::size_t>(type)] += value; }
    double total(CardBonusType type) const { return totals_[static_cast<std::size_t>(type)]; }

    // Percent bonuses count 100 per 1.0, flat defense 5 per point.
    int powerScoreBonus() const;

private:
    std::array<double, kCardBonusTypeCount> totals_{};
};

struct CollectionMilestone {
    int cardsRequired{0};
    CardBonusType bonusType{CardBonusType::ExpPercent};
    double bonusValue{0.0};
};

const std::vector<CollectionMilestone>& collectionMilestones();

enum class CollectOutcome { NewCard, DuplicateAbsorbed };

struct CollectResult {
    CollectOutcome outcome{CollectOutcome::NewCard};
    bool rarityUpgraded{false};
    MonsterCard card;
};

class CardCollection {
public:
    explicit CardCollection(std::string ownerId, CardDropRules rules = defaultCardDropRules());

    CollectResult collect(const CardDefinition& def);

    const std::vector<MonsterCard>& cards() const { return cards_; }
    const MonsterCard* find(const std::string& cardId) const;
    std::size_t uniqueCount() const { return cards_.size(); }

    // Sum of card bonuses plus any reached collection milestones.
    CardBonusSummary totalBonuses() const;
    std::vector<CollectionMilestone> reachedMilestones() const;

private:
    std::string ownerId_;
    CardDropRules rules_;
    std::vector<MonsterCard> cards_;
};

}  // namespace Quest::Cards
