#include <catch2/catch_test_macros.hpp>
#include "advisor/advisor.hpp"
#include "data/dex.hpp"
#include "data/landmark_registry.hpp"
#include "data/type_chart.hpp"
#include "lua/lua_state.hpp"
#include "planning/goal_tree.hpp"

using namespace rp;
using namespace rp::advisor;
using world::BattleKind;
using world::WorldSnapshot;

namespace {

struct Rig {
    data::LandmarkRegistry landmarks;
    data::TypeChart chart;
    data::Dex dex;
    planning::GoalTree goals;
    nav::Navigator navigator{landmarks};
    battle::BattleTracker battle{chart, dex};

    Rig() {
        lua::LuaState state;
        REQUIRE(state.do_string(R"(
            Landmarks = {
                [0] = {
                    name = "Pallet Town",
                    hint = "Go UP to Route 1.",
                    landmarks = {
                        { key = "oak_lab", x = 16, y = 13, label = "Oak's Lab" },
                    },
                },
            }
        )").ok());
        REQUIRE(landmarks.load_from_state(state).ok());

        chart.set("Water", "Fire", 2.0);
        dex.add_species("Charmander", {"Fire"});
        dex.add_move("Water Gun", "Water");
        dex.add_move("Tackle", "Normal");
    }
};

WorldSnapshot at(i32 x, i32 y, u32 hp = 20, BattleKind kind = BattleKind::None) {
    WorldSnapshot snap;
    snap.player = {x, y};
    snap.map_id = 0;
    snap.money = 500;
    snap.battle = kind;
    snap.party.push_back({"Squirtle", 7, hp, 20, {"Tackle", "Water Gun"}});
    return snap;
}

} // namespace

TEST_CASE("Advisor tick order and walking hints", "[advisor]") {
    Rig rig;
    rig.goals.add_goal("Get starter", "Visit Oak");
    Advisor advisor(rig.goals, rig.navigator, rig.battle);

    REQUIRE(advisor.handle_goto("GOTO_OAK_LAB", 0));
    CHECK(rig.navigator.active());

    auto advice = advisor.tick(at(10, 13));
    CHECK(advice.tick == 1);
    CHECK(advice.direction == nav::Direction::Right);
    CHECK_FALSE(advice.battle_event.any());
    CHECK(advice.goal_context.find("Current goal: Get starter") == 0);
    CHECK(advice.extra_context.find("NAVIGATION: Go UP to Route 1.") != std::string::npos);
    CHECK(advice.extra_context.find("  GOTO_OAK_LAB = walk to Oak's Lab") != std::string::npos);
    CHECK(advice.extra_context.find("Walking to Oak's Lab (6 tiles away)") != std::string::npos);
    CHECK(advisor.tick_count() == 1);
}

TEST_CASE("Advisor holds movement during battle", "[advisor]") {
    Rig rig;
    Advisor advisor(rig.goals, rig.navigator, rig.battle);
    REQUIRE(advisor.handle_goto("GOTO_OAK_LAB", 0));

    auto snap = at(10, 13, 20, BattleKind::Wild);
    snap.opponent = "Charmander";

    auto advice = advisor.tick(snap);
    CHECK(advice.battle_event.started == BattleKind::Wild);
    CHECK_FALSE(advice.direction.has_value());
    CHECK(advice.extra_context.find("IN BATTLE (WILD) - Turn 0") != std::string::npos);
    CHECK(advice.extra_context.find("Vs Charmander: Use Water Gun (super effective x2!)") !=
          std::string::npos);
    CHECK(advice.extra_context.find("Walk targets") == std::string::npos);

    // Navigation resumes where it left off once the battle is over
    advice = advisor.tick(at(10, 13));
    CHECK(advice.battle_event.ended == battle::BattleOutcome::Won);
    CHECK(advice.direction == nav::Direction::Right);
}

TEST_CASE("Advisor HP warnings", "[advisor]") {
    Rig rig;
    Advisor advisor(rig.goals, rig.navigator, rig.battle);

    auto advice = advisor.tick(at(1, 1, 4));
    CHECK(advice.extra_context.find("CRITICAL HP WARNING: Squirtle is at 4/20 HP (20%)") !=
          std::string::npos);
    CHECK(advice.extra_context.find("EMERGENCY: ALL POKEMON ARE LOW HP") != std::string::npos);

    advice = advisor.tick(at(1, 1, 0));
    CHECK(advice.extra_context.find("CRITICAL: Squirtle has FAINTED!") != std::string::npos);

    advice = advisor.tick(at(1, 1, 20));
    CHECK(advice.extra_context.find("CRITICAL") == std::string::npos);
    CHECK(advice.extra_context.find("EMERGENCY") == std::string::npos);
}

TEST_CASE("Advisor appends the goal tree periodically", "[advisor]") {
    Rig rig;
    rig.goals.add_goal("Explore", "");
    AdvisorConfig config;
    config.review_interval = 3;
    Advisor advisor(rig.goals, rig.navigator, rig.battle, config);

    CHECK(advisor.tick(at(1, 1)).extra_context.find("Goal Tree:") == std::string::npos);
    CHECK(advisor.tick(at(1, 1)).extra_context.find("Goal Tree:") == std::string::npos);
    auto third = advisor.tick(at(1, 1)).extra_context;
    CHECK(third.find("Goal Tree:\n[>] Explore (active)") != std::string::npos);
}

TEST_CASE("Advisor goal updates", "[advisor]") {
    Rig rig;
    auto id = rig.goals.add_goal("Beat Brock", "");
    Advisor advisor(rig.goals, rig.navigator, rig.battle);

    CHECK_FALSE(advisor.apply_goal_update(""));
    CHECK_FALSE(advisor.apply_goal_update("null"));
    CHECK_FALSE(advisor.apply_goal_update("walked around"));

    REQUIRE(advisor.apply_goal_update("Making progress: Lv.11"));
    CHECK(rig.goals.find(id)->notes.back() == "Making progress: Lv.11");

    REQUIRE(advisor.apply_goal_update("Failed: Onix too strong"));
    CHECK(rig.goals.find(id)->attempts == 1);

    REQUIRE(advisor.apply_goal_update("Brock defeated, goal COMPLETE"));
    CHECK(rig.goals.find(id)->status == planning::GoalStatus::Completed);
    CHECK_FALSE(advisor.apply_goal_update("complete again"));
}

TEST_CASE("Advisor GOTO commands", "[advisor]") {
    Rig rig;
    Advisor advisor(rig.goals, rig.navigator, rig.battle);

    CHECK_FALSE(advisor.handle_goto("GOTO_", 0));
    CHECK_FALSE(advisor.handle_goto("WALK_OAK_LAB", 0));
    CHECK_FALSE(advisor.handle_goto("GOTO_GYM", 0));
    CHECK_FALSE(advisor.handle_goto("GOTO_OAK_LAB", 3));
    CHECK_FALSE(rig.navigator.active());

    REQUIRE(advisor.handle_goto("GOTO_oak_lab", 0));
    CHECK(rig.navigator.target_label() == "Oak's Lab");
}
