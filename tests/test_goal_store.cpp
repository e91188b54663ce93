#include <catch2/catch_test_macros.hpp>
#include "lua/lua_state.hpp"
#include "planning/goal_store.hpp"
#include "planning/goal_tree.hpp"

#include <chrono>
#include <fstream>

using namespace rp;
using namespace rp::planning;

namespace {

/// Scratch directory removed at scope exit.
struct TempDir {
    fs::path path;

    TempDir() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() /
               ("redplan_test_" + std::to_string(stamp));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

void write_file(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary);
    out << text;
}

} // namespace

TEST_CASE("Goal store save and load", "[goals][store]") {
    TempDir dir;
    GoalStore store(dir.path / "plans" / "active_plans.lua");
    CHECK_FALSE(store.exists());

    {
        GoalTree tree(&store);
        auto root = tree.add_goal("Beat \"Brock\"", "Use Water\nor Grass", 2);
        auto child = tree.add_goal("Train", "", 5, root);
        tree.add_goal("Later", "", 7, std::nullopt, {child});
        tree.current_goal();
        tree.add_note(child, "Lv.10 \\ almost");
        tree.complete_goal(child, "reached Lv.12");
    }

    REQUIRE(store.exists());
    CHECK_FALSE(fs::exists(dir.path / "plans" / "active_plans.lua.tmp"));

    GoalTree reloaded(&store);
    reloaded.load();
    REQUIRE(reloaded.size() == 3);
    CHECK(reloaded.counter() == 3);

    const auto* root = reloaded.find("goal_1");
    REQUIRE(root != nullptr);
    CHECK(root->name == "Beat \"Brock\"");
    CHECK(root->description == "Use Water\nor Grass");
    CHECK(root->priority == 2);
    CHECK(root->children_ids == std::vector<std::string>{"goal_2"});
    // Completing the only child cascaded to the root
    CHECK(root->status == GoalStatus::Completed);

    const auto* child = reloaded.find("goal_2");
    REQUIRE(child != nullptr);
    CHECK(child->parent_id == std::string("goal_1"));
    CHECK(child->status == GoalStatus::Completed);
    CHECK(child->completed_at.has_value());
    REQUIRE(child->notes.size() == 2);
    CHECK(child->notes[0] == "Lv.10 \\ almost");
    CHECK(child->notes[1] == "Completed: reached Lv.12");

    const auto* later = reloaded.find("goal_3");
    REQUIRE(later != nullptr);
    CHECK(later->prerequisites == std::vector<std::string>{"goal_2"});
    CHECK(later->status == GoalStatus::Pending);

    // Ids keep counting from the stored counter
    CHECK(reloaded.add_goal("Next", "") == "goal_4");
}

TEST_CASE("Goal store preserves creation order", "[goals][store]") {
    GoalDocument doc;
    doc.counter = 12;
    for (int i = 12; i >= 1; i--) {
        Goal g;
        g.id = "goal_" + std::to_string(i);
        g.name = "G" + std::to_string(i);
        doc.goals.push_back(g);
    }

    lua::LuaState state;
    REQUIRE(state.do_string(GoalStore::serialize(doc)).ok());
    auto parsed = GoalStore::parse(state);
    REQUIRE(parsed.ok());
    REQUIRE(parsed.value().goals.size() == 12);
    CHECK(parsed.value().goals.front().id == "goal_12");
    CHECK(parsed.value().goals.back().id == "goal_1");
}

TEST_CASE("Missing goal document starts empty", "[goals][store]") {
    TempDir dir;
    GoalStore store(dir.path / "none.lua");

    CHECK_FALSE(store.load().ok());

    GoalTree tree(&store);
    tree.load();
    CHECK(tree.empty());
    CHECK(tree.counter() == 0);
}

TEST_CASE("Corrupt goal document starts empty", "[goals][store]") {
    TempDir dir;
    auto path = dir.path / "broken.lua";
    write_file(path, "GoalDocument = { counter = 3, goals = { {id = \"goal_1\"");

    GoalStore store(path);
    CHECK_FALSE(store.load().ok());

    GoalTree tree(&store);
    tree.load();
    CHECK(tree.empty());
}

TEST_CASE("Goal document tolerates bad records", "[goals][store]") {
    lua::LuaState state;
    REQUIRE(state.do_string(R"(
        GoalDocument = {
            counter = 2,
            goals = {
                { id = "goal_1", name = "Ok", status = "teleported", priority = 3 },
                { name = "No id" },
                { id = "goal_2", attempts = -5 },
            },
        }
    )").ok());

    auto doc = GoalStore::parse(state);
    REQUIRE(doc.ok());
    REQUIRE(doc.value().goals.size() == 2);
    CHECK(doc.value().goals[0].status == GoalStatus::Pending);
    CHECK(doc.value().goals[0].priority == 3);
    CHECK(doc.value().goals[1].name == "goal_2");
    CHECK(doc.value().goals[1].attempts == 0);
}

TEST_CASE("Goal document without the global is rejected", "[goals][store]") {
    lua::LuaState state;
    REQUIRE(state.do_string("Goals = {}").ok());
    CHECK_FALSE(GoalStore::parse(state).ok());
}

TEST_CASE("Save replaces the previous document", "[goals][store]") {
    TempDir dir;
    auto path = dir.path / "plans.lua";
    GoalStore store(path);

    GoalDocument first;
    first.counter = 1;
    Goal g;
    g.id = "goal_1";
    g.name = "First";
    first.goals.push_back(g);
    REQUIRE(store.save(first).ok());

    GoalDocument second = first;
    second.goals[0].name = "Second";
    REQUIRE(store.save(second).ok());

    auto loaded = store.load();
    REQUIRE(loaded.ok());
    CHECK(loaded.value().goals[0].name == "Second");
    CHECK_FALSE(fs::exists(dir.path / "plans.lua.tmp"));
}
