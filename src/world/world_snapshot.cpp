#include "world/world_snapshot.hpp"
#include "lua/lua_state.hpp"
#include "lua/table_reader.hpp"

#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace rp::world {

const char* battle_kind_name(BattleKind kind) {
    switch (kind) {
    case BattleKind::None: return "none";
    case BattleKind::Wild: return "wild";
    case BattleKind::Trainer: return "trainer";
    }
    return "none";
}

BattleKind battle_kind_from_code(i64 code) {
    switch (code) {
    case 1: return BattleKind::Wild;
    case 2: return BattleKind::Trainer;
    default: return BattleKind::None;
    }
}

namespace {

u32 non_negative(i64 v) {
    return v < 0 ? 0u : static_cast<u32>(v);
}

PartyMember read_member(lua_State* L, int mon_idx) {
    PartyMember mon;
    mon.species = lua::read_string_field(L, mon_idx, "species", "Unknown");
    mon.level = non_negative(lua::read_int_field(L, mon_idx, "level"));
    mon.hp_current = non_negative(lua::read_int_field(L, mon_idx, "hp_current"));
    mon.hp_max = non_negative(lua::read_int_field(L, mon_idx, "hp_max"));

    for (auto& move : lua::read_string_list(L, mon_idx, "moves")) {
        if (!move.empty() && move != "---") {
            mon.moves.push_back(std::move(move));
        }
    }
    return mon;
}

/// Snapshot from the table at `idx`.
WorldSnapshot read_snapshot_table(lua_State* L, int idx) {
    idx = lua::absolute_index(L, idx);

    WorldSnapshot snap;
    snap.player.x = static_cast<i32>(lua::read_int_field(L, idx, "player_x"));
    snap.player.y = static_cast<i32>(lua::read_int_field(L, idx, "player_y"));
    snap.map_id = static_cast<MapId>(lua::read_int_field(L, idx, "map_id"));
    snap.money = non_negative(lua::read_int_field(L, idx, "money"));
    snap.battle = battle_kind_from_code(lua::read_int_field(L, idx, "in_battle"));
    snap.opponent = lua::read_string_field(L, idx, "opponent");

    lua_pushstring(L, "party");
    lua_gettable(L, idx);
    if (lua_istable(L, -1)) {
        int party_idx = lua_gettop(L);
        for (int i = 1; ; i++) {
            lua_pushnumber(L, i);
            lua_gettable(L, party_idx);
            if (lua_isnil(L, -1)) {
                lua_pop(L, 1);
                break;
            }
            if (lua_istable(L, -1)) {
                snap.party.push_back(read_member(L, lua_gettop(L)));
            }
            lua_pop(L, 1);
        }
    }
    lua_pop(L, 1); // party

    return snap;
}

} // namespace

Result<WorldSnapshot> parse_snapshot(lua::LuaState& state) {
    lua_State* L = state.raw();
    lua_getglobal(L, "GameState");
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return Error("GameState global not set");
    }
    auto snap = read_snapshot_table(L, -1);
    lua_pop(L, 1);
    return snap;
}

WorldSnapshot read_snapshot(const fs::path& path, const WorldSnapshot& previous) {
    lua::LuaState state;
    auto exec = state.do_file(path);
    if (!exec) {
        // The emulator script rewrites the file every frame; a failed read
        // is usually a torn write and the next tick will succeed.
        spdlog::debug("Game state read glitch: {}", exec.error().message);
        return previous;
    }

    auto snap = parse_snapshot(state);
    if (!snap) {
        spdlog::debug("Game state read glitch: {}", snap.error().message);
    }
    return snap.value_or(previous);
}

Result<std::vector<WorldSnapshot>> parse_trace(lua::LuaState& state) {
    lua_State* L = state.raw();
    lua_getglobal(L, "Trace");
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return Error("Trace global not set");
    }
    int trace_idx = lua_gettop(L);

    std::vector<WorldSnapshot> ticks;
    for (int i = 1; ; i++) {
        lua_pushnumber(L, i);
        lua_gettable(L, trace_idx);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            break;
        }
        if (lua_istable(L, -1)) {
            ticks.push_back(read_snapshot_table(L, -1));
        } else {
            spdlog::warn("Trace entry {} is not a table, skipping", i);
        }
        lua_pop(L, 1);
    }
    lua_pop(L, 1); // Trace

    return ticks;
}

Result<std::vector<WorldSnapshot>> load_trace(const fs::path& path) {
    lua::LuaState state;
    state.register_log_functions();
    auto exec = state.do_file(path);
    if (!exec) {
        return exec.error().with_context("Failed to load trace");
    }
    return parse_trace(state);
}

} // namespace rp::world
