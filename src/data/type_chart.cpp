#include "data/type_chart.hpp"
#include "lua/lua_state.hpp"

#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace rp::data {

Result<void> TypeChart::load_file(const fs::path& path) {
    rows_.clear();

    lua::LuaState state;
    state.register_log_functions();
    auto exec = state.do_file(path);
    if (!exec) {
        return exec.error().with_context("Type chart unavailable");
    }
    return load_from_state(state);
}

Result<void> TypeChart::load_from_state(lua::LuaState& state) {
    rows_.clear();
    lua_State* L = state.raw();

    lua_getglobal(L, "TypeChart");
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return Error("TypeChart global not set by data file");
    }
    int chart_idx = lua_gettop(L);

    size_t pairs = 0;
    lua_pushnil(L);
    while (lua_next(L, chart_idx) != 0) {
        if (lua_type(L, -2) == LUA_TSTRING && lua_istable(L, -1)) {
            std::string attack = lua_tostring(L, -2);
            int row_idx = lua_gettop(L);

            lua_pushnil(L);
            while (lua_next(L, row_idx) != 0) {
                if (lua_type(L, -2) == LUA_TSTRING &&
                    lua_type(L, -1) == LUA_TNUMBER) {
                    set(attack, lua_tostring(L, -2), lua_tonumber(L, -1));
                    ++pairs;
                }
                lua_pop(L, 1);
            }
        }
        lua_pop(L, 1);
    }

    lua_pop(L, 1); // TypeChart

    spdlog::info("Loaded type chart: {} attacking types, {} matchups",
                 rows_.size(), pairs);
    return {};
}

void TypeChart::set(const std::string& attack, const std::string& defend,
                    f64 factor) {
    rows_[attack][defend] = factor;
}

std::optional<f64> TypeChart::factor(std::string_view attack,
                                     std::string_view defend) const {
    auto row = rows_.find(std::string(attack));
    if (row == rows_.end()) return std::nullopt;
    auto cell = row->second.find(std::string(defend));
    if (cell == row->second.end()) return std::nullopt;
    return cell->second;
}

f64 TypeChart::effectiveness(std::string_view attack,
                             const std::vector<std::string>& defend_types) const {
    if (rows_.empty() || attack.empty()) return 1.0;

    auto row = rows_.find(std::string(attack));
    if (row == rows_.end()) return 1.0;

    f64 multiplier = 1.0;
    for (const auto& defend : defend_types) {
        auto cell = row->second.find(defend);
        if (cell != row->second.end()) {
            multiplier *= cell->second;
        }
    }
    return multiplier;
}

} // namespace rp::data
