// Content catalog: remote (loaded) content or the built-in static fallback, behind one query surface.
#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../cards/CardDefinition.h"
#include "RPGTypes.h"

namespace Quest::RPG {

struct EquipmentTemplate {
    std::string id;
    std::string name;
    std::string description;
    std::string baseType;  // "sword", "staff", ...
    EquipmentSlot slot{EquipmentSlot::Weapon};
    Rarity rarity{Rarity::Common};
    StatType primaryStat{StatType::Strength};
    int statBonus{1};
    std::optional<StatType> secondaryStat;
    int secondaryStatBonus{0};
    int levelRequirement{1};
    bool active{true};

    EquipmentItem toItem(std::string itemId) const;
};

struct RemoteCatalog {
    std::vector<EquipmentTemplate> equipment;
    std::vector<AffixDefinition> affixes;
    std::vector<Cards::CardDefinition> cards;
};

// Marker for the content compiled into the binary.
struct StaticCatalog {};

using CatalogSource = std::variant<RemoteCatalog, StaticCatalog>;

const std::vector<EquipmentTemplate>& staticEquipmentTemplates();
const std::vector<AffixDefinition>& staticAffixPool(AffixType type);
const std::vector<Cards::CardDefinition>& staticCardDefinitions();

class ContentCatalog {
public:
    static ContentCatalog builtIn();
    static ContentCatalog remote(RemoteCatalog content);

    bool isRemote() const { return std::holds_alternative<RemoteCatalog>(source_); }
    const CatalogSource& source() const { return source_; }

    // Active templates for a slot and rarity, optionally limited to a maximum level requirement.
    std::vector<EquipmentTemplate> equipmentTemplates(EquipmentSlot slot, Rarity rarity,
                                                      std::optional<int> maxLevel = std::nullopt) const;
    // Active definitions usable at a rarity; falls back to the static pool when remote content has none.
    std::vector<AffixDefinition> affixDefinitions(AffixType type, Rarity rarity) const;
    // Active cards; falls back to the built-in set when remote content has none.
    std::vector<Cards::CardDefinition> cards() const;

private:
    explicit ContentCatalog(CatalogSource source) : source_(std::move(source)) {}

    CatalogSource source_;
};

// Loads a remote catalog from JSON. Missing or malformed files yield ContentCatalog::builtIn().
ContentCatalog loadContentCatalog(const std::string& path);

}  // namespace Quest::RPG
