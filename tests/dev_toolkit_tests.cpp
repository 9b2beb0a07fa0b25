#include <doctest/doctest.h>

#include "realm/action/Action.h"
#include "realm/tools/DevToolkit.h"
#include "realm/world/WorldState.h"

#include <stdexcept>
#include <string>

using namespace realm;
using nlohmann::json;

namespace {

struct Toolbench
{
    world::WorldState w;
    tools::MethodLibrary methods;
    tools::DevToolkit kit{w, methods};
};

} // namespace

TEST_CASE("DevToolkit: authoring helpers register into the world")
{
    Toolbench t;

    t.kit.createArea("Camp", "A small camp", {"Ridge"}, {{"wood", 3}, {"stone", -4}});
    t.kit.createArea("Ridge", "Windy", {"Camp"});
    t.kit.spawnEntity("scout", "Scout", "Camp", {"player"});
    t.kit.addQuest("logs", "Logs", "Bring logs", {{"gather:wood", 2}});
    t.kit.addItem("plank", "Plank", "Cut wood");
    t.kit.addFaction("guild", "Guild", "Crafters");

    REQUIRE(t.w.getArea("Camp") != nullptr);
    CHECK(t.w.areaResource("Camp", "wood") == 3);
    CHECK(t.w.areaResource("Camp", "stone") == 0);

    const world::Entity* scout = t.w.getEntity("scout");
    REQUIRE(scout != nullptr);
    CHECK(scout->name == "Scout");
    CHECK(scout->hasTag("player"));

    CHECK(t.kit.assignQuestToEntity("scout", "logs"));
    CHECK_FALSE(t.kit.assignQuestToEntity("scout", "missing"));
    CHECK(scout->questLog.count("logs") == 1);

    REQUIRE(t.w.getItem("plank") != nullptr);
    CHECK(t.w.getItem("plank")->stackable);
    REQUIRE(t.w.getFaction("guild") != nullptr);
    CHECK(t.w.adjustReputation("guild", "scout", 5) == 5);
}

TEST_CASE("DevToolkit: addResourceNode seeds on top of existing stock")
{
    Toolbench t;
    t.kit.createArea("Camp", "", {}, {{"wood", 3}});

    CHECK(t.kit.addResourceNode("Camp", "wood", 4) == 7);
    CHECK(t.kit.addResourceNode("Camp", "ore", 2) == 2);
    CHECK(t.kit.addResourceNode("Nowhere", "ore", 2) == 0);
}

TEST_CASE("DevToolkit: methods registered through the toolkit are runnable")
{
    Toolbench t;
    t.kit.registerMethod("ping", "", {"debug"}, [](world::WorldState&, const json&) { return json("pong"); });

    CHECK(&t.kit.methods() == &t.methods);
    CHECK(t.methods.run("ping", t.w).get<std::string>() == "pong");
}

TEST_CASE("DevToolkit: built-in skill effects")
{
    Toolbench t;
    t.kit.createArea("Arena", "", {});
    world::Entity& mage = t.kit.spawnEntity("mage", "Mage", "Arena");
    world::Entity& dummy = t.kit.spawnEntity("dummy", "Dummy", "Arena");
    mage.hp = 40;

    const auto burn = tools::MakeDamageEffect(15);
    CHECK(burn(t.w, mage, &dummy) == "damaged:dummy:15");
    CHECK(dummy.hp == 85);
    CHECK(burn(t.w, mage, nullptr) == "no_target");

    const auto mend = tools::MakeHealEffect(25);
    CHECK(mend(t.w, mage, nullptr) == "healed:mage:25");
    CHECK(mage.hp == 65);
    CHECK(mend(t.w, mage, &dummy) == "healed:dummy:25");
    CHECK(dummy.hp == world::kMaxHp);
}

TEST_CASE("DevToolkit: skills added through the toolkit drive UseSkill")
{
    Toolbench t;
    t.kit.createArea("Arena", "", {});
    t.kit.spawnEntity("mage", "Mage", "Arena");
    t.kit.spawnEntity("dummy", "Dummy", "Arena");
    t.kit.addSkill("bolt", "Bolt", 10, tools::MakeDamageEffect(20));

    const auto r = action::Execute(action::UseSkill{"mage", std::string("dummy"), "bolt"}, t.w);
    CHECK(r.ok());
    CHECK(r.detail == "skill:bolt:damaged:dummy:20");
    CHECK(t.w.getEntity("dummy")->hp == 80);
    CHECK(t.w.getEntity("mage")->mana == world::kMaxMana - 10);
}

TEST_CASE("LoadScenario: builds a world from json")
{
    const json scenario = json::parse(R"({
        "areas": [
            { "name": "Village", "description": "Home", "neighbors": ["Forest"], "resources": { "wood": 0 } },
            { "name": "Forest", "neighbors": ["Village"], "resources": { "wood": 5, "berries": 2 } }
        ],
        "entities": [
            { "id": "hero", "name": "Hero", "area": "Village", "tags": ["player"],
              "hp": 250, "mana": 20, "inventory": { "coin": 3 } },
            { "id": "wolf", "area": "Forest", "tags": ["mob"] }
        ],
        "quests": [ { "id": "woodcutter", "title": "Woodcutter", "objectives": { "gather:wood": 3 } } ],
        "items": [ { "id": "coin", "name": "Coin", "stackable": true } ],
        "factions": [ { "id": "village", "name": "Villagers" } ],
        "skills": [
            { "id": "bolt", "manaCost": 10, "effect": { "type": "damage", "amount": 12 } },
            { "id": "mend", "name": "Mend", "manaCost": 5, "effect": { "type": "heal", "amount": 8 } },
            { "id": "wave", "manaCost": 0 }
        ],
        "assignments": [ { "entity": "hero", "quest": "woodcutter" }, { "entity": "hero", "quest": "nope" } ]
    })");

    Toolbench t;
    tools::LoadScenario(scenario, t.kit);

    CHECK(t.w.areas().size() == 2);
    CHECK(t.w.areaResource("Forest", "berries") == 2);

    const world::Entity* hero = t.w.getEntity("hero");
    REQUIRE(hero != nullptr);
    CHECK(hero->name == "Hero");
    CHECK(hero->hp == world::kMaxHp);
    CHECK(hero->mana == 20);
    CHECK(hero->itemCount("coin") == 3);
    CHECK(hero->questLog.count("woodcutter") == 1);
    CHECK(hero->questLog.count("nope") == 0);

    REQUIRE(t.w.getEntity("wolf") != nullptr);
    CHECK(t.w.getEntity("wolf")->name == "wolf");

    REQUIRE(t.w.getSkill("mend") != nullptr);
    CHECK(t.w.getSkill("mend")->manaCost == 5);
    CHECK(static_cast<bool>(t.w.getSkill("bolt")->effect));
    CHECK_FALSE(static_cast<bool>(t.w.getSkill("wave")->effect));
    CHECK(t.w.getSkill("wave")->name == "wave");

    CHECK(t.w.getItem("coin") != nullptr);
    CHECK(t.w.getFaction("village") != nullptr);
    CHECK(t.w.getQuest("woodcutter") != nullptr);
}

TEST_CASE("LoadScenario: every section is optional")
{
    Toolbench t;
    tools::LoadScenario(json::object(), t.kit);
    CHECK(t.w.areas().empty());
    CHECK(t.w.entities().empty());
}

TEST_CASE("LoadScenario: unknown skill effect types are rejected")
{
    const json scenario = json::parse(R"({
        "skills": [ { "id": "warp", "manaCost": 3, "effect": { "type": "teleport" } } ]
    })");

    Toolbench t;
    CHECK_THROWS_AS(tools::LoadScenario(scenario, t.kit), std::runtime_error);
}

TEST_CASE("LoadScenarioFile: missing file throws")
{
    Toolbench t;
    CHECK_THROWS_AS(tools::LoadScenarioFile("definitely/not/here/scenario.json", t.kit), std::runtime_error);
}
