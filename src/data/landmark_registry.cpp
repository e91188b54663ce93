#include "data/landmark_registry.hpp"
#include "lua/lua_state.hpp"
#include "lua/table_reader.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace rp::data {

namespace {

/// Parse `landmarks = { { key = ..., x = ..., y = ..., label = ... }, ... }`
/// from the map table at `map_idx`.
std::vector<Landmark> read_landmarks(lua_State* L, int map_idx) {
    std::vector<Landmark> out;

    lua_pushstring(L, "landmarks");
    lua_gettable(L, map_idx);
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return out;
    }
    int list_idx = lua_gettop(L);

    for (int i = 1; ; i++) {
        lua_pushnumber(L, i);
        lua_gettable(L, list_idx);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            break;
        }
        if (lua_istable(L, -1)) {
            int lm_idx = lua_gettop(L);
            Landmark lm;
            lm.key = lua::read_string_field(L, lm_idx, "key");
            lm.pos.x = static_cast<i32>(lua::read_int_field(L, lm_idx, "x"));
            lm.pos.y = static_cast<i32>(lua::read_int_field(L, lm_idx, "y"));
            lm.label = lua::read_string_field(L, lm_idx, "label", lm.key);
            if (lm.key.empty()) {
                spdlog::warn("Landmark #{} has no key, skipping", i);
            } else {
                out.push_back(std::move(lm));
            }
        }
        lua_pop(L, 1);
    }

    lua_pop(L, 1); // landmarks list
    return out;
}

} // namespace

Result<void> LandmarkRegistry::load_file(const fs::path& path) {
    maps_.clear();

    lua::LuaState state;
    state.register_log_functions();
    auto exec = state.do_file(path);
    if (!exec) {
        return exec.error().with_context("Landmark data unavailable");
    }
    return load_from_state(state);
}

Result<void> LandmarkRegistry::load_from_state(lua::LuaState& state) {
    maps_.clear();
    lua_State* L = state.raw();

    lua_getglobal(L, "Landmarks");
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return Error("Landmarks global not set by data file");
    }
    int root_idx = lua_gettop(L);

    lua_pushnil(L);
    while (lua_next(L, root_idx) != 0) {
        // key at -2, value at -1. Map ids may be written as [3] or ["3"].
        std::optional<MapId> id;
        if (lua_type(L, -2) == LUA_TNUMBER) {
            id = static_cast<MapId>(lua_tonumber(L, -2));
        } else if (lua_type(L, -2) == LUA_TSTRING) {
            try {
                id = static_cast<MapId>(std::stoi(lua_tostring(L, -2)));
            } catch (const std::exception&) {
                spdlog::warn("Landmarks: ignoring non-numeric map key '{}'",
                             lua_tostring(L, -2));
            }
        }

        if (id && lua_istable(L, -1)) {
            int map_idx = lua_gettop(L);
            MapEntry entry;
            entry.id = *id;
            entry.name = lua::read_string_field(L, map_idx, "name");
            entry.hint = lua::read_string_field(L, map_idx, "hint");
            entry.landmarks = read_landmarks(L, map_idx);
            maps_[entry.id] = std::move(entry);
        }
        lua_pop(L, 1); // pop value, keep key for next iteration
    }

    lua_pop(L, 1); // Landmarks

    spdlog::info("Loaded {} landmarks across {} maps", landmark_count(),
                 maps_.size());
    return {};
}

const MapEntry* LandmarkRegistry::find_map(MapId map) const {
    auto it = maps_.find(map);
    return (it != maps_.end()) ? &it->second : nullptr;
}

const Landmark* LandmarkRegistry::find(MapId map, std::string_view key) const {
    const auto* entry = find_map(map);
    if (!entry) return nullptr;
    for (const auto& lm : entry->landmarks) {
        if (lm.key == key) return &lm;
    }
    return nullptr;
}

size_t LandmarkRegistry::landmark_count() const {
    size_t n = 0;
    for (const auto& [id, entry] : maps_) {
        n += entry.landmarks.size();
    }
    return n;
}

} // namespace rp::data
