#include "lua/table_reader.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdio>
#include <limits>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace rp::lua {

int absolute_index(lua_State* L, int idx) {
    if (idx > 0 || idx <= LUA_REGISTRYINDEX) return idx;
    return lua_gettop(L) + idx + 1;
}

std::string read_string_field(lua_State* L, int table_idx, const char* key,
                              const std::string& fallback) {
    table_idx = absolute_index(L, table_idx);
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    std::string result = fallback;
    if (lua_type(L, -1) == LUA_TSTRING) {
        result.assign(lua_tostring(L, -1), lua_strlen(L, -1));
    }
    lua_pop(L, 1);
    return result;
}

f64 read_number_field(lua_State* L, int table_idx, const char* key,
                      f64 fallback) {
    table_idx = absolute_index(L, table_idx);
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    f64 result = fallback;
    if (lua_type(L, -1) == LUA_TNUMBER) {
        result = lua_tonumber(L, -1);
    }
    lua_pop(L, 1);
    return result;
}

i64 read_int_field(lua_State* L, int table_idx, const char* key,
                   i64 fallback) {
    constexpr f64 lo = std::numeric_limits<i32>::min();
    constexpr f64 hi = std::numeric_limits<i32>::max();

    f64 value = read_number_field(L, table_idx, key, static_cast<f64>(fallback));
    if (!std::isfinite(value)) {
        spdlog::warn("Field '{}' is not a finite number, using {}", key, fallback);
        return fallback;
    }
    if (value < lo || value > hi) {
        spdlog::warn("Field '{}' = {} is out of range, clamping", key, value);
        value = value < lo ? lo : hi;
    }
    return static_cast<i64>(value);
}

bool read_bool_field(lua_State* L, int table_idx, const char* key,
                     bool fallback) {
    table_idx = absolute_index(L, table_idx);
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    bool result = fallback;
    if (lua_isboolean(L, -1)) {
        result = lua_toboolean(L, -1) != 0;
    }
    lua_pop(L, 1);
    return result;
}

std::optional<f64> read_optional_number(lua_State* L, int table_idx,
                                        const char* key) {
    table_idx = absolute_index(L, table_idx);
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    std::optional<f64> result;
    if (lua_type(L, -1) == LUA_TNUMBER) {
        result = lua_tonumber(L, -1);
    }
    lua_pop(L, 1);
    return result;
}

std::vector<std::string> read_string_array(lua_State* L, int list_idx) {
    list_idx = absolute_index(L, list_idx);
    std::vector<std::string> out;
    for (int i = 1; ; i++) {
        lua_pushnumber(L, i);
        lua_gettable(L, list_idx);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            break;
        }
        if (lua_type(L, -1) == LUA_TSTRING) {
            out.emplace_back(lua_tostring(L, -1), lua_strlen(L, -1));
        }
        lua_pop(L, 1);
    }
    return out;
}

std::vector<std::string> read_string_list(lua_State* L, int table_idx,
                                          const char* key) {
    table_idx = absolute_index(L, table_idx);
    lua_pushstring(L, key);
    lua_gettable(L, table_idx);
    std::vector<std::string> out;
    if (lua_istable(L, -1)) {
        out = read_string_array(L, -1);
    }
    lua_pop(L, 1);
    return out;
}

std::string quote_string(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (unsigned char c : s) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (c < 0x20 || c == 0x7F) {
                // Lua decimal escape, always three digits so a following
                // digit cannot be absorbed into the escape.
                char buf[5];
                std::snprintf(buf, sizeof(buf), "\\%03u", static_cast<unsigned>(c));
                out += buf;
            } else {
                out += static_cast<char>(c);
            }
        }
    }
    out += '"';
    return out;
}

} // namespace rp::lua
