#include "planning/goal_store.hpp"
#include "lua/lua_state.hpp"
#include "lua/table_reader.hpp"

#include <fstream>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <system_error>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace rp::planning {

namespace {

void append_string_list(std::string& out, const char* key,
                        const std::vector<std::string>& items) {
    out += fmt::format("            {} = {{", key);
    for (size_t i = 0; i < items.size(); i++) {
        out += (i == 0) ? " " : ", ";
        out += lua::quote_string(items[i]);
    }
    out += items.empty() ? "},\n" : " },\n";
}

/// Parse one goal record from the table at the top of the stack.
std::optional<Goal> read_goal(lua_State* L, int goal_idx) {
    Goal goal;
    goal.id = lua::read_string_field(L, goal_idx, "id");
    if (goal.id.empty()) {
        spdlog::warn("Goal document: record without id, skipping");
        return std::nullopt;
    }

    goal.name = lua::read_string_field(L, goal_idx, "name", goal.id);
    goal.description = lua::read_string_field(L, goal_idx, "description");

    auto status_name = lua::read_string_field(L, goal_idx, "status", "pending");
    auto status = parse_goal_status(status_name);
    if (!status) {
        spdlog::warn("Goal document: {} has unknown status '{}', using pending",
                     goal.id, status_name);
    }
    goal.status = status.value_or(GoalStatus::Pending);

    goal.priority = static_cast<i32>(lua::read_int_field(L, goal_idx, "priority", 5));

    auto parent = lua::read_string_field(L, goal_idx, "parent_id");
    if (!parent.empty()) goal.parent_id = std::move(parent);

    goal.children_ids = lua::read_string_list(L, goal_idx, "children_ids");
    goal.prerequisites = lua::read_string_list(L, goal_idx, "prerequisites");
    goal.notes = lua::read_string_list(L, goal_idx, "notes");

    auto attempts = lua::read_int_field(L, goal_idx, "attempts", 0);
    auto max_attempts = lua::read_int_field(L, goal_idx, "max_attempts", 10);
    goal.attempts = static_cast<u32>(attempts < 0 ? 0 : attempts);
    goal.max_attempts = static_cast<u32>(max_attempts < 0 ? 0 : max_attempts);

    goal.created_at = lua::read_number_field(L, goal_idx, "created_at", 0.0);
    goal.completed_at = lua::read_optional_number(L, goal_idx, "completed_at");
    return goal;
}

} // namespace

GoalStore::GoalStore(fs::path path) : path_(std::move(path)) {}

bool GoalStore::exists() const {
    std::error_code ec;
    return fs::exists(path_, ec);
}

Result<GoalDocument> GoalStore::load() const {
    if (!exists()) {
        return Error("Goal document not found: " + path_.string());
    }

    lua::LuaState state;
    auto exec = state.do_file(path_);
    if (!exec) {
        return exec.error().with_context("Goal document unreadable");
    }
    return parse(state);
}

Result<GoalDocument> GoalStore::parse(lua::LuaState& state) {
    lua_State* L = state.raw();

    lua_getglobal(L, "GoalDocument");
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return Error("GoalDocument global not set");
    }
    int doc_idx = lua_gettop(L);

    GoalDocument doc;
    auto counter = lua::read_int_field(L, doc_idx, "counter", 0);
    doc.counter = static_cast<u64>(counter < 0 ? 0 : counter);

    lua_pushstring(L, "goals");
    lua_gettable(L, doc_idx);
    if (lua_istable(L, -1)) {
        int goals_idx = lua_gettop(L);
        for (int i = 1; ; i++) {
            lua_pushnumber(L, i);
            lua_gettable(L, goals_idx);
            if (lua_isnil(L, -1)) {
                lua_pop(L, 1);
                break;
            }
            if (lua_istable(L, -1)) {
                auto goal = read_goal(L, lua_gettop(L));
                if (goal) doc.goals.push_back(std::move(*goal));
            }
            lua_pop(L, 1);
        }
    }
    lua_pop(L, 2); // goals, GoalDocument

    return doc;
}

std::string GoalStore::serialize(const GoalDocument& doc) {
    std::string out;
    out += "-- redplan goal document. Rewritten after every change.\n";
    out += "GoalDocument = {\n";
    out += fmt::format("    counter = {},\n", doc.counter);
    out += "    goals = {\n";

    for (const auto& g : doc.goals) {
        out += "        {\n";
        out += fmt::format("            id = {},\n", lua::quote_string(g.id));
        out += fmt::format("            name = {},\n", lua::quote_string(g.name));
        out += fmt::format("            description = {},\n",
                           lua::quote_string(g.description));
        out += fmt::format("            status = \"{}\",\n", goal_status_name(g.status));
        out += fmt::format("            priority = {},\n", g.priority);
        if (g.parent_id) {
            out += fmt::format("            parent_id = {},\n",
                               lua::quote_string(*g.parent_id));
        }
        append_string_list(out, "children_ids", g.children_ids);
        append_string_list(out, "prerequisites", g.prerequisites);
        append_string_list(out, "notes", g.notes);
        out += fmt::format("            attempts = {},\n", g.attempts);
        out += fmt::format("            max_attempts = {},\n", g.max_attempts);
        out += fmt::format("            created_at = {:.6f},\n", g.created_at);
        if (g.completed_at) {
            out += fmt::format("            completed_at = {:.6f},\n",
                               *g.completed_at);
        }
        out += "        },\n";
    }

    out += "    },\n";
    out += "}\n";
    return out;
}

Result<void> GoalStore::save(const GoalDocument& doc) const {
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            return Error("Cannot create " + path_.parent_path().string() +
                         ": " + ec.message());
        }
    }

    fs::path tmp = path_;
    tmp += ".tmp";

    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return Error("Failed to open for writing: " + tmp.string());
        }
        auto text = serialize(doc);
        file.write(text.data(), static_cast<std::streamsize>(text.size()));
        file.flush();
        if (!file) {
            file.close();
            fs::remove(tmp, ec);
            return Error("Failed to write: " + tmp.string());
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return Error("Failed to replace " + path_.string() + ": " + ec.message());
    }

    spdlog::debug("Saved {} goals to {}", doc.goals.size(), path_.string());
    return {};
}

} // namespace rp::planning
