#include <doctest/doctest.h>

#include "realm/tools/MethodLibrary.h"
#include "realm/world/WorldState.h"
#include "test_support/WorldFixtures.h"

#include <string>

using namespace realm;
using nlohmann::json;

TEST_CASE("MethodLibrary: run passes world and args to the handler")
{
    world::WorldState w;
    realm::test::AddVillageAndForest(w);

    tools::MethodLibrary lib;
    lib.registerMethod("seed", "Adds resources to an area", {"mechanic"},
                       [](world::WorldState& world, const json& args) {
                           const int total = world.adjustAreaResource(args.at("area").get<std::string>(),
                                                                      args.at("resource").get<std::string>(),
                                                                      args.value("amount", 1));
                           return json{{"total", total}};
                       });

    const json out = lib.run("seed", w, json{{"area", "Village"}, {"resource", "stone"}, {"amount", 3}});
    CHECK(out.at("total").get<int>() == 3);
    CHECK(w.areaResource("Village", "stone") == 3);
}

TEST_CASE("MethodLibrary: unknown names throw UnknownMethod")
{
    world::WorldState w;
    tools::MethodLibrary lib;

    CHECK_THROWS_AS(lib.run("nope", w), tools::UnknownMethod);

    try
    {
        (void)lib.run("nope", w);
    }
    catch (const tools::UnknownMethod& e)
    {
        CHECK(e.name() == "nope");
    }

    lib.registerMethod("hollow", "", {}, nullptr);
    CHECK(lib.contains("hollow"));
    CHECK_THROWS_AS(lib.run("hollow", w), tools::UnknownMethod);
}

TEST_CASE("MethodLibrary: listByTag keeps registration order")
{
    tools::MethodLibrary lib;
    const auto noop = [](world::WorldState&, const json&) { return json(); };

    lib.registerMethod("flank", "", {"tactic", "combat"}, noop);
    lib.registerMethod("harvest", "", {"mechanic"}, noop);
    lib.registerMethod("ambush", "", {"combat"}, noop);

    const auto combat = lib.listByTag("combat");
    REQUIRE(combat.size() == 2);
    CHECK(combat[0]->name == "flank");
    CHECK(combat[1]->name == "ambush");

    CHECK(lib.listByTag("stealth").empty());
    CHECK(lib.size() == 3);
}

TEST_CASE("MethodLibrary: re-registering overwrites the entry")
{
    world::WorldState w;
    tools::MethodLibrary lib;

    lib.registerMethod("answer", "v1", {"a"}, [](world::WorldState&, const json&) { return json(1); });
    lib.registerMethod("other", "", {}, [](world::WorldState&, const json&) { return json(); });
    lib.registerMethod("answer", "v2", {"b"}, [](world::WorldState&, const json&) { return json(2); });

    CHECK(lib.size() == 2);
    CHECK(lib.run("answer", w).get<int>() == 2);
    REQUIRE(lib.find("answer") != nullptr);
    CHECK(lib.find("answer")->description == "v2");
    CHECK(lib.listByTag("a").empty());
    CHECK(lib.listByTag("b").size() == 1);
}

TEST_CASE("MethodLibrary: a handler may replace its own entry while running")
{
    world::WorldState w;
    tools::MethodLibrary lib;

    lib.registerMethod("once", "", {}, [&lib](world::WorldState&, const json&) {
        lib.registerMethod("once", "", {}, [](world::WorldState&, const json&) { return json("later"); });
        return json("first");
    });

    CHECK(lib.run("once", w).get<std::string>() == "first");
    CHECK(lib.run("once", w).get<std::string>() == "later");
}
