#include <cassert>
#include <stdexcept>

#include "../game/rpg/LootGenerator.h"
#include "../game/rpg/PityTracker.h"
#include "support/ScriptedRandom.h"

using namespace Quest::RPG;
using QuestTest::ScriptedRandom;

int main() {
    // Twelve dry dungeon runs, then the 13th call is forced to at least rare.
    {
        Engine::MersenneRandom rng(21);
        PityCounters counters;
        for (int i = 0; i < 12; ++i) {
            const PityDecision d = shouldDrop(0.0, 0, counters, PityContent::Dungeons, rng);
            assert(!d.dropped);
            counters = d.counters;
            assert(counters.count(PityContent::Dungeons) == i + 1);
        }
        const PityDecision forced = shouldDrop(0.0, 0, counters, PityContent::Dungeons, rng);
        assert(forced.dropped);
        assert(forced.forced);
        assert(forced.forcedMinRarity == Rarity::Rare);
        assert(forced.counters.count(PityContent::Dungeons) == 0);
        // Input counters are untouched.
        assert(counters.count(PityContent::Dungeons) == 12);
    }

    // A normal successful roll resets without forcing a rarity.
    {
        Engine::MersenneRandom rng(22);
        PityCounters counters;
        counters.set(PityContent::Missions, 3);
        const PityDecision d = shouldDrop(1.0, 0, counters, PityContent::Missions, rng);
        assert(d.dropped);
        assert(!d.forced);
        assert(!d.forcedMinRarity.has_value());
        assert(d.counters.count(PityContent::Missions) == 0);
    }

    // Luck adds 0.3% per point to the base chance.
    {
        PityCounters counters;
        ScriptedRandom hit({0.12});
        assert(shouldDrop(0.1, 10, counters, PityContent::Tasks, hit).dropped);
        ScriptedRandom miss({0.14});
        const PityDecision d = shouldDrop(0.1, 10, counters, PityContent::Tasks, miss);
        assert(!d.dropped);
        assert(d.counters.count(PityContent::Tasks) == 1);
    }

    // Per-type thresholds and forced rarities.
    {
        Engine::MersenneRandom rng(23);
        PityCounters counters;
        counters.set(PityContent::Tasks, 20);
        counters.set(PityContent::Missions, 5);
        counters.set(PityContent::Expeditions, 3);
        assert(shouldDrop(0.0, 0, counters, PityContent::Tasks, rng).forcedMinRarity == Rarity::Uncommon);
        assert(shouldDrop(0.0, 0, counters, PityContent::Missions, rng).forcedMinRarity == Rarity::Rare);
        assert(shouldDrop(0.0, 0, counters, PityContent::Expeditions, rng).forcedMinRarity == Rarity::Epic);

        counters.set(PityContent::Expeditions, 2);
        assert(!shouldDrop(0.0, 0, counters, PityContent::Expeditions, rng).dropped);
    }

    // Content types count independently and never pass the threshold.
    {
        Engine::MersenneRandom rng(24);
        PityCounters counters;
        counters.set(PityContent::Tasks, 7);
        for (int i = 0; i < 1000; ++i) {
            counters = shouldDrop(0.0, 0, counters, PityContent::Dungeons, rng).counters;
            assert(counters.count(PityContent::Dungeons) <= 12);
        }
        assert(counters.count(PityContent::Tasks) == 7);
        assert(counters.values().count("dungeons") == 1);
    }

    // Counters reject negative values.
    {
        PityCounters counters;
        bool threw = false;
        try {
            counters.set(PityContent::Tasks, -1);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        assert(pityContentFromKey("expeditions") == PityContent::Expeditions);
        assert(!pityContentFromKey("raids").has_value());
    }

    // Pity-wrapped loot: a forced drop honours the minimum rarity and resets.
    {
        Engine::MersenneRandom rng(25);
        const ContentCatalog catalog = ContentCatalog::builtIn();
        LootRequest request;
        request.tier = 1;
        for (int i = 0; i < 50; ++i) {
            PityCounters counters;
            counters.set(PityContent::Dungeons, 12);
            const PityLootResult r = rollPityLoot(request, 0.0, PityContent::Dungeons, counters, catalog, rng);
            assert(r.pityForced);
            assert(r.item.has_value());
            assert(rarityIndex(r.item->rarity) >= rarityIndex(Rarity::Rare));
            assert(r.counters.count(PityContent::Dungeons) == 0);
        }
    }

    // A rolled drop that a rarity cap downgraded counts as a dry run.
    {
        // 0.85 -> epic at tier 1, 0.9 fails the keep roll, the rest skip templates and affixes.
        ScriptedRandom rng({0.85, 0.9}, 0.99);
        const ContentCatalog catalog = ContentCatalog::builtIn();
        LootRequest request;
        request.tier = 1;
        request.slot = EquipmentSlot::Weapon;
        PityCounters counters;
        counters.set(PityContent::Dungeons, 4);
        const PityLootResult r = rollPityLoot(request, 1.0, PityContent::Dungeons, counters, catalog, rng);
        assert(r.item.has_value());
        assert(r.item->rarity == Rarity::Uncommon);
        assert(!r.pityForced);
        assert(r.counters.count(PityContent::Dungeons) == 5);
    }

    // No drop leaves no item and bumps the counter.
    {
        Engine::MersenneRandom rng(26);
        const ContentCatalog catalog = ContentCatalog::builtIn();
        LootRequest request;
        request.tier = 2;
        const PityLootResult r = rollPityLoot(request, 0.0, PityContent::Missions, PityCounters{}, catalog, rng);
        assert(!r.item.has_value());
        assert(r.counters.count(PityContent::Missions) == 1);
    }

    return 0;
}
