#include "RPGTypes.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Quest::RPG {

namespace {
std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
}  // namespace

int rarityIndex(Rarity r) {
    const int idx = static_cast<int>(r);
    if (idx < 0 || idx >= kRarityCount) throw std::out_of_range("rarityIndex: invalid rarity");
    return idx;
}

Rarity rarityFromIndex(int index) {
    if (index < 0 || index >= kRarityCount) throw std::out_of_range("rarityFromIndex: " + std::to_string(index));
    return static_cast<Rarity>(index);
}

std::optional<Rarity> nextRarity(Rarity r) {
    const int idx = rarityIndex(r);
    if (idx + 1 >= kRarityCount) return std::nullopt;
    return static_cast<Rarity>(idx + 1);
}

Rarity maxRarity(Rarity a, Rarity b) { return rarityIndex(a) >= rarityIndex(b) ? a : b; }

const char* rarityKey(Rarity r) {
    switch (r) {
        case Rarity::Common: return "common";
        case Rarity::Uncommon: return "uncommon";
        case Rarity::Rare: return "rare";
        case Rarity::Epic: return "epic";
        case Rarity::Legendary: return "legendary";
    }
    throw std::out_of_range("rarityKey: invalid rarity");
}

const char* statKey(StatType s) {
    switch (s) {
        case StatType::Strength: return "strength";
        case StatType::Wisdom: return "wisdom";
        case StatType::Charisma: return "charisma";
        case StatType::Dexterity: return "dexterity";
        case StatType::Luck: return "luck";
        case StatType::Defense: return "defense";
    }
    throw std::out_of_range("statKey: invalid stat");
}

const char* slotKey(EquipmentSlot s) {
    switch (s) {
        case EquipmentSlot::Weapon: return "weapon";
        case EquipmentSlot::Armor: return "armor";
        case EquipmentSlot::Accessory: return "accessory";
        case EquipmentSlot::Trinket: return "trinket";
    }
    throw std::out_of_range("slotKey: invalid slot");
}

const char* classKey(CharacterClass c) {
    switch (c) {
        case CharacterClass::Warrior: return "warrior";
        case CharacterClass::Mage: return "mage";
        case CharacterClass::Archer: return "archer";
        case CharacterClass::Berserker: return "berserker";
        case CharacterClass::Paladin: return "paladin";
        case CharacterClass::Sorcerer: return "sorcerer";
        case CharacterClass::Enchanter: return "enchanter";
        case CharacterClass::Ranger: return "ranger";
        case CharacterClass::Trickster: return "trickster";
    }
    throw std::out_of_range("classKey: invalid class");
}

const char* affixTypeKey(AffixType t) { return t == AffixType::Prefix ? "prefix" : "suffix"; }

std::optional<Rarity> rarityFromKey(const std::string& key) {
    const std::string k = lower(key);
    for (int i = 0; i < kRarityCount; ++i) {
        if (k == rarityKey(static_cast<Rarity>(i))) return static_cast<Rarity>(i);
    }
    return std::nullopt;
}

std::optional<StatType> statFromKey(const std::string& key) {
    const std::string k = lower(key);
    for (StatType s : kAllStats) {
        if (k == statKey(s)) return s;
    }
    return std::nullopt;
}

std::optional<EquipmentSlot> slotFromKey(const std::string& key) {
    const std::string k = lower(key);
    for (EquipmentSlot s : kAllSlots) {
        if (k == slotKey(s)) return s;
    }
    // Older content used "cloak" for the armor slot.
    if (k == "cloak") return EquipmentSlot::Armor;
    return std::nullopt;
}

std::optional<CharacterClass> classFromKey(const std::string& key) {
    const std::string k = lower(key);
    for (int i = 0; i <= static_cast<int>(CharacterClass::Trickster); ++i) {
        const auto c = static_cast<CharacterClass>(i);
        if (k == classKey(c)) return c;
    }
    return std::nullopt;
}

std::optional<AffixType> affixTypeFromKey(const std::string& key) {
    const std::string k = lower(key);
    if (k == "prefix") return AffixType::Prefix;
    if (k == "suffix") return AffixType::Suffix;
    return std::nullopt;
}

StatType classPrimaryStat(CharacterClass c) {
    switch (c) {
        case CharacterClass::Warrior:
        case CharacterClass::Berserker:
            return StatType::Strength;
        case CharacterClass::Mage:
        case CharacterClass::Sorcerer:
            return StatType::Wisdom;
        case CharacterClass::Archer:
        case CharacterClass::Ranger:
        case CharacterClass::Paladin:
            return StatType::Dexterity;
        case CharacterClass::Enchanter:
            return StatType::Charisma;
        case CharacterClass::Trickster:
            return StatType::Luck;
    }
    throw std::out_of_range("classPrimaryStat: invalid class");
}

ClassLine classLine(CharacterClass c) {
    switch (c) {
        case CharacterClass::Warrior:
        case CharacterClass::Berserker:
        case CharacterClass::Paladin:
            return ClassLine::Warrior;
        case CharacterClass::Mage:
        case CharacterClass::Sorcerer:
        case CharacterClass::Enchanter:
            return ClassLine::Mage;
        case CharacterClass::Archer:
        case CharacterClass::Ranger:
        case CharacterClass::Trickster:
            return ClassLine::Archer;
    }
    throw std::out_of_range("classLine: invalid class");
}

std::string EquipmentItem::displayName() const {
    std::string out;
    if (prefix) out += prefix->name + " ";
    out += name;
    if (suffix) out += " " + suffix->name;
    if (enhancementLevel > 0) out += " +" + std::to_string(enhancementLevel);
    return out;
}

bool enhance(EquipmentItem& item) {
    if (item.enhancementLevel >= kMaxEnhancementLevel) return false;
    ++item.enhancementLevel;
    return true;
}

std::string makeItemId(Engine::RandomSource& rng) {
    std::ostringstream oss;
    oss << "itm-" << std::hex << std::setfill('0');
    for (int i = 0; i < 4; ++i) oss << std::setw(4) << rng.range(0, 0xFFFF);
    return oss.str();
}

}  // namespace Quest::RPG
