#include "data/dex.hpp"
#include "lua/lua_state.hpp"
#include "lua/table_reader.hpp"

#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace rp::data {

namespace {

const std::vector<std::string> kNoTypes;

} // namespace

Result<void> Dex::load_file(const fs::path& path) {
    species_.clear();
    moves_.clear();

    lua::LuaState state;
    state.register_log_functions();
    auto exec = state.do_file(path);
    if (!exec) {
        return exec.error().with_context("Dex data unavailable");
    }
    return load_from_state(state);
}

Result<void> Dex::load_from_state(lua::LuaState& state) {
    species_.clear();
    moves_.clear();
    lua_State* L = state.raw();

    if (!state.has_global_table("Species") && !state.has_global_table("Moves")) {
        return Error("Neither Species nor Moves global set by data file");
    }

    // Species = { Name = { "TypeA", "TypeB" }, ... }
    lua_getglobal(L, "Species");
    if (lua_istable(L, -1)) {
        int species_idx = lua_gettop(L);
        lua_pushnil(L);
        while (lua_next(L, species_idx) != 0) {
            if (lua_type(L, -2) == LUA_TSTRING && lua_istable(L, -1)) {
                auto types = lua::read_string_array(L, -1);
                if (types.empty() || types.size() > 2) {
                    spdlog::warn("Species '{}' has {} types, expected 1-2, skipping",
                                 lua_tostring(L, -2), types.size());
                } else {
                    add_species(lua_tostring(L, -2), std::move(types));
                }
            }
            lua_pop(L, 1);
        }
    }
    lua_pop(L, 1);

    // Moves = { ["Move Name"] = "Type", ... }
    lua_getglobal(L, "Moves");
    if (lua_istable(L, -1)) {
        int moves_idx = lua_gettop(L);
        lua_pushnil(L);
        while (lua_next(L, moves_idx) != 0) {
            if (lua_type(L, -2) == LUA_TSTRING &&
                lua_type(L, -1) == LUA_TSTRING) {
                add_move(lua_tostring(L, -2), lua_tostring(L, -1));
            }
            lua_pop(L, 1);
        }
    }
    lua_pop(L, 1);

    spdlog::info("Loaded dex: {} species, {} moves", species_.size(),
                 moves_.size());
    return {};
}

void Dex::add_species(const std::string& name, std::vector<std::string> types) {
    species_[name] = std::move(types);
}

void Dex::add_move(const std::string& name, const std::string& type) {
    moves_[name] = type;
}

const std::vector<std::string>& Dex::species_types(std::string_view species) const {
    auto it = species_.find(std::string(species));
    return (it != species_.end()) ? it->second : kNoTypes;
}

std::optional<std::string> Dex::move_type(std::string_view move) const {
    auto it = moves_.find(std::string(move));
    if (it == moves_.end()) return std::nullopt;
    return it->second;
}

} // namespace rp::data
