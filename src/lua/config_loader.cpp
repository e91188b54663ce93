#include "lua/config_loader.hpp"
#include "lua/lua_state.hpp"
#include "lua/table_reader.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace rp::lua {

fs::path Config::landmarks_path() const {
    return landmarks_file.empty() ? data_dir / "landmarks.lua" : landmarks_file;
}

fs::path Config::type_chart_path() const {
    return type_chart_file.empty() ? data_dir / "type_chart.lua" : type_chart_file;
}

fs::path Config::dex_path() const {
    return dex_file.empty() ? data_dir / "dex.lua" : dex_file;
}

namespace {

void apply_path(lua_State* L, int idx, const char* key, fs::path& out) {
    auto value = read_string_field(L, idx, key);
    if (!value.empty()) out = value;
}

/// Overwrite `out` only if the field is present and a finite number in
/// the u32 range.
void apply_count(lua_State* L, int idx, const char* key, u32& out) {
    auto value = read_optional_number(L, idx, key);
    if (!value) return;
    if (!std::isfinite(*value)) {
        spdlog::warn("Config: {} is not a finite number, keeping {}", key, out);
        return;
    }
    if (*value < 0) {
        spdlog::warn("Config: {} must not be negative, keeping {}", key, out);
        return;
    }
    if (*value > static_cast<f64>(std::numeric_limits<u32>::max())) {
        spdlog::warn("Config: {} is too large, keeping {}", key, out);
        return;
    }
    out = static_cast<u32>(*value);
}

void apply_navigator(lua_State* L, int config_idx, nav::NavigatorConfig& nav) {
    lua_pushstring(L, "navigator");
    lua_gettable(L, config_idx);
    if (lua_istable(L, -1)) {
        int idx = lua_gettop(L);
        apply_count(L, idx, "stuck_ticks", nav.stuck_ticks);
        apply_count(L, idx, "give_up_events", nav.give_up_events);
        apply_count(L, idx, "detour_base", nav.detour_base);
        apply_count(L, idx, "detour_step", nav.detour_step);
        apply_count(L, idx, "detour_max", nav.detour_max);

        u32 radius = static_cast<u32>(nav.arrival_radius);
        apply_count(L, idx, "arrival_radius", radius);
        nav.arrival_radius = static_cast<i32>(radius);
    }
    lua_pop(L, 1);
}

void apply_battle(lua_State* L, int config_idx, battle::BattleConfig& battle) {
    lua_pushstring(L, "battle");
    lua_gettable(L, config_idx);
    if (lua_istable(L, -1)) {
        apply_count(L, lua_gettop(L), "drag_on_turns", battle.drag_on_turns);
    }
    lua_pop(L, 1);
}

Result<void> apply_config(LuaState& state, Config& config) {
    lua_State* L = state.raw();

    lua_getglobal(L, "Config");
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return Error("Config global not set by config file");
    }
    int idx = lua_gettop(L);

    apply_path(L, idx, "data_dir", config.data_dir);
    apply_path(L, idx, "landmarks_file", config.landmarks_file);
    apply_path(L, idx, "type_chart_file", config.type_chart_file);
    apply_path(L, idx, "dex_file", config.dex_file);
    apply_path(L, idx, "plans_file", config.plans_file);
    apply_path(L, idx, "log_file", config.log_file);
    config.log_level = read_string_field(L, idx, "log_level", config.log_level);
    apply_path(L, idx, "trace_file", config.trace_file);
    apply_count(L, idx, "goal_max_attempts", config.goal_max_attempts);
    apply_count(L, idx, "review_interval", config.review_interval);
    apply_navigator(L, idx, config.navigator);
    apply_battle(L, idx, config.battle);

    lua_pop(L, 1); // Config
    return {};
}

} // namespace

Result<void> load_config(const fs::path& path, Config& config) {
    LuaState state;
    state.register_log_functions();
    auto exec = state.do_file(path);
    if (!exec) {
        return exec.error().with_context("Failed to load config");
    }
    return apply_config(state, config);
}

Result<void> load_config_string(std::string_view code, Config& config) {
    LuaState state;
    state.register_log_functions();
    auto exec = state.do_buffer(code.data(), code.size(), "=config");
    if (!exec) {
        return exec.error().with_context("Failed to load config");
    }
    return apply_config(state, config);
}

} // namespace rp::lua
