#include <catch2/catch_test_macros.hpp>
#include "data/landmark_registry.hpp"
#include "lua/lua_state.hpp"
#include "nav/navigator.hpp"

#include <algorithm>

using namespace rp;
using namespace rp::nav;

namespace {

data::LandmarkRegistry make_registry() {
    lua::LuaState state;
    auto result = state.do_string(R"(
        Landmarks = {
            [0] = {
                name = "Pallet Town",
                hint = "Go north to Route 1.",
                landmarks = {
                    { key = "oak_lab", x = 16, y = 13, label = "Professor Oak's Lab" },
                    { key = "far_east", x = 1000, y = 10, label = "Far East" },
                    { key = "corner", x = 5, y = 5 },
                },
            },
            [1] = { name = "Viridian City", landmarks = {} },
        }
    )");
    REQUIRE(result.ok());
    data::LandmarkRegistry registry;
    REQUIRE(registry.load_from_state(state).ok());
    return registry;
}

/// Move `pos` one tile in `dir`.
TilePos step(TilePos pos, Direction dir) {
    switch (dir) {
    case Direction::Up: return {pos.x, pos.y - 1};
    case Direction::Down: return {pos.x, pos.y + 1};
    case Direction::Left: return {pos.x - 1, pos.y};
    case Direction::Right: return {pos.x + 1, pos.y};
    }
    return pos;
}

} // namespace

TEST_CASE("Direction names", "[nav]") {
    CHECK(std::string(direction_name(Direction::Up)) == "UP");
    CHECK(parse_direction("LEFT") == Direction::Left);
    CHECK_FALSE(parse_direction("left").has_value());
}

TEST_CASE("Setting an unknown target changes nothing", "[nav]") {
    auto registry = make_registry();
    Navigator nav(registry);

    CHECK_FALSE(nav.set_target(0, "nowhere"));
    CHECK_FALSE(nav.set_target(42, "oak_lab"));
    CHECK_FALSE(nav.active());
    CHECK_FALSE(nav.target().has_value());
    CHECK_FALSE(nav.next_direction({1, 1}, 0).has_value());

    REQUIRE(nav.set_target(0, "oak_lab"));
    CHECK_FALSE(nav.set_target(0, "nowhere"));
    CHECK(nav.active());
    CHECK(nav.target_label() == "Professor Oak's Lab");
}

TEST_CASE("Greedy step closes the larger gap", "[nav]") {
    auto registry = make_registry();
    Navigator nav(registry);
    REQUIRE(nav.set_target(0, "corner")); // (5, 5)

    CHECK(nav.next_direction({0, 3}, 0) == Direction::Right); // dx 5 > dy 2
    CHECK(nav.next_direction({4, 0}, 0) == Direction::Down);  // dy 5 > dx 1
    CHECK(nav.next_direction({8, 8}, 0) == Direction::Up);    // tie goes vertical
    CHECK(nav.next_direction({2, 2}, 0) == Direction::Down);  // tie goes vertical
    CHECK(nav.next_direction({9, 5}, 0) == Direction::Left);  // dy 0
}

TEST_CASE("Arrival within one tile deactivates", "[nav]") {
    auto registry = make_registry();
    Navigator nav(registry);
    REQUIRE(nav.set_target(0, "oak_lab")); // (16, 13)

    CHECK(nav.next_direction({10, 13}, 0) == Direction::Right);
    CHECK_FALSE(nav.next_direction({15, 14}, 0).has_value());
    CHECK_FALSE(nav.active());
    // The target itself is kept for display
    CHECK(nav.target().has_value());
    CHECK_FALSE(nav.next_direction({10, 13}, 0).has_value());
}

TEST_CASE("Changing maps cancels navigation", "[nav]") {
    auto registry = make_registry();
    Navigator nav(registry);
    REQUIRE(nav.set_target(0, "oak_lab"));

    CHECK(nav.next_direction({10, 13}, 0).has_value());
    CHECK_FALSE(nav.next_direction({10, 13}, 1).has_value());
    CHECK_FALSE(nav.active());
    CHECK_FALSE(nav.target().has_value());
    CHECK(nav.target_map() == -1);
}

TEST_CASE("Three unmoved ticks start a detour", "[nav]") {
    auto registry = make_registry();
    Navigator nav(registry);
    REQUIRE(nav.set_target(0, "far_east")); // dx dominates: detour is vertical

    TilePos wall{10, 10};
    CHECK(nav.next_direction(wall, 0) == Direction::Right); // first sight
    CHECK(nav.next_direction(wall, 0) == Direction::Right); // stuck 1
    CHECK(nav.next_direction(wall, 0) == Direction::Right); // stuck 2
    CHECK(nav.next_direction(wall, 0) == Direction::Up);    // stuck 3: detour
    CHECK(nav.total_stuck() == 1);
    CHECK(nav.detour_ticks_remaining() == 5);

    // Moving along the detour keeps it going for its full length
    TilePos pos = wall;
    for (int i = 0; i < 4; i++) {
        pos = step(pos, Direction::Up);
        CHECK(nav.next_direction(pos, 0) == Direction::Up);
    }
    pos = step(pos, Direction::Up);
    CHECK(nav.next_direction(pos, 0) == Direction::Right);
    CHECK(nav.detour_ticks_remaining() == 0);
}

TEST_CASE("A blocked detour flips to the other side", "[nav]") {
    auto registry = make_registry();
    Navigator nav(registry);
    REQUIRE(nav.set_target(0, "far_east"));

    TilePos pit{10, 10};
    for (int i = 0; i < 3; i++) nav.next_direction(pit, 0);
    CHECK(nav.next_direction(pit, 0) == Direction::Up);

    // Up is blocked too: try Down straight away, then Up again
    CHECK(nav.next_direction(pit, 0) == Direction::Down);
    CHECK(nav.next_direction(pit, 0) == Direction::Up);
    CHECK(nav.next_direction(pit, 0) == Direction::Down);
    CHECK(nav.total_stuck() == 1);
}

TEST_CASE("Detour axis follows the dominant delta", "[nav]") {
    auto registry = make_registry();
    Navigator nav(registry);
    REQUIRE(nav.set_target(0, "corner")); // (5, 5)

    TilePos pos{4, 40}; // dy dominates: detour is horizontal
    for (int i = 0; i < 3; i++) CHECK(nav.next_direction(pos, 0) == Direction::Up);
    CHECK(nav.next_direction(pos, 0) == Direction::Left);
}

TEST_CASE("Detour length grows and caps", "[nav]") {
    NavigatorConfig config;
    std::vector<u32> lengths;
    for (u32 stuck = 0; stuck <= 7; stuck++) {
        lengths.push_back(Navigator::detour_length(stuck, config));
    }
    CHECK(lengths == std::vector<u32>{3, 5, 7, 9, 11, 12, 12, 12});
}

TEST_CASE("Navigation gives up after repeated stuck events", "[nav]") {
    auto registry = make_registry();
    Navigator nav(registry);
    REQUIRE(nav.set_target(0, "far_east"));

    // A wall to the east: vertical moves work, horizontal ones do not
    TilePos pos{10, 500};
    u32 max_stuck = 0;
    int ticks = 0;
    for (; ticks < 5000 && nav.active(); ticks++) {
        auto dir = nav.next_direction(pos, 0);
        max_stuck = std::max(max_stuck, nav.total_stuck());
        if (dir && (*dir == Direction::Up || *dir == Direction::Down)) {
            pos = step(pos, *dir);
        }
    }

    CHECK_FALSE(nav.active());
    CHECK_FALSE(nav.target().has_value());
    CHECK(max_stuck == 15);
    CHECK(ticks < 5000);
}

TEST_CASE("Cancel is idempotent", "[nav]") {
    auto registry = make_registry();
    Navigator nav(registry);

    nav.cancel();
    CHECK_FALSE(nav.active());

    REQUIRE(nav.set_target(0, "oak_lab"));
    nav.cancel();
    nav.cancel();
    CHECK_FALSE(nav.active());
    CHECK_FALSE(nav.target().has_value());
    CHECK(nav.total_stuck() == 0);
    CHECK(nav.detour_ticks_remaining() == 0);
}

TEST_CASE("Setting a new target resets stuck counters", "[nav]") {
    auto registry = make_registry();
    Navigator nav(registry);
    REQUIRE(nav.set_target(0, "far_east"));

    TilePos pos{10, 10};
    for (int i = 0; i < 4; i++) nav.next_direction(pos, 0);
    REQUIRE(nav.total_stuck() == 1);

    REQUIRE(nav.set_target(0, "oak_lab"));
    CHECK(nav.total_stuck() == 0);
    CHECK(nav.detour_ticks_remaining() == 0);
    CHECK_FALSE(nav.detour_direction().has_value());
}

TEST_CASE("Distance and target listings", "[nav]") {
    auto registry = make_registry();
    Navigator nav(registry);

    CHECK(nav.distance_remaining({3, 3}) == 0);
    REQUIRE(nav.set_target(0, "corner"));
    CHECK(nav.distance_remaining({3, 9}) == 6);

    CHECK(nav.available_targets(0) ==
          std::vector<std::string>{"oak_lab", "far_east", "corner"});
    CHECK(nav.available_targets(7).empty());

    CHECK(nav.targets_text(0) ==
          "  GOTO_OAK_LAB = walk to Professor Oak's Lab\n"
          "  GOTO_FAR_EAST = walk to Far East\n"
          "  GOTO_CORNER = walk to corner");
    CHECK(nav.targets_text(1).empty());

    CHECK(nav.map_hint(0) == "Go north to Route 1.");
    CHECK(nav.map_hint(1).empty());
}
