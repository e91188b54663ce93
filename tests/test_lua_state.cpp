#include <catch2/catch_test_macros.hpp>
#include "lua/lua_state.hpp"
#include "lua/table_reader.hpp"

#include <limits>

extern "C" {
#include <lua.h>
}

using namespace rp::lua;

TEST_CASE("LuaState creation and basic execution", "[lua]") {
    LuaState state;
    REQUIRE(state.raw() != nullptr);

    auto result = state.do_string("x = 1 + 2");
    REQUIRE(result.ok());

    lua_getglobal(state.raw(), "x");
    CHECK(lua_tonumber(state.raw(), -1) == 3);
    lua_pop(state.raw(), 1);
}

TEST_CASE("LuaState reports syntax and runtime errors", "[lua]") {
    LuaState state;

    auto syntax = state.do_string("x = = 1");
    REQUIRE_FALSE(syntax.ok());
    CHECK_FALSE(syntax.error().message.empty());

    auto runtime = state.do_string("local t = nil; y = t.field");
    REQUIRE_FALSE(runtime.ok());

    // The stack is clean after a failure
    CHECK(lua_gettop(state.raw()) == 0);
}

TEST_CASE("LuaState register and call C function", "[lua]") {
    LuaState state;

    static int called = 0;
    state.register_function("test_fn", [](lua_State* L) -> int {
        called++;
        lua_pushnumber(L, 42);
        return 1;
    });

    called = 0;
    auto result = state.do_string("result = test_fn()");
    REQUIRE(result.ok());
    CHECK(called == 1);

    lua_getglobal(state.raw(), "result");
    CHECK(lua_tonumber(state.raw(), -1) == 42);
    lua_pop(state.raw(), 1);
}

TEST_CASE("LuaState log functions are callable from data files", "[lua]") {
    LuaState state;
    state.register_log_functions();

    auto result = state.do_string(R"(
        LOG("loading", 3, "maps")
        WARN("missing label for", nil)
        SPEW({})
        ALERT(true)
    )");
    CHECK(result.ok());
}

TEST_CASE("LuaState keeps host libraries closed", "[lua]") {
    LuaState state;

    auto result = state.do_string(R"(
        has_io = io ~= nil
        has_os = os ~= nil
        has_string = string ~= nil
    )");
    REQUIRE(result.ok());

    lua_getglobal(state.raw(), "has_io");
    CHECK(lua_toboolean(state.raw(), -1) == 0);
    lua_pop(state.raw(), 1);

    lua_getglobal(state.raw(), "has_os");
    CHECK(lua_toboolean(state.raw(), -1) == 0);
    lua_pop(state.raw(), 1);

    lua_getglobal(state.raw(), "has_string");
    CHECK(lua_toboolean(state.raw(), -1) == 1);
    lua_pop(state.raw(), 1);
}

TEST_CASE("LuaState strips a UTF-8 BOM", "[lua]") {
    LuaState state;

    const char code[] = "\xEF\xBB\xBFvalue = 7";
    auto result = state.do_buffer(code, sizeof(code) - 1, "=bom");
    REQUIRE(result.ok());

    lua_getglobal(state.raw(), "value");
    CHECK(lua_tonumber(state.raw(), -1) == 7);
    lua_pop(state.raw(), 1);
}

TEST_CASE("LuaState move leaves the source empty", "[lua]") {
    LuaState a;
    REQUIRE(a.do_string("Marker = {}").ok());

    LuaState b(std::move(a));
    CHECK(a.raw() == nullptr);
    CHECK(b.has_global_table("Marker"));

    // A moved-from state refuses to run code instead of crashing
    CHECK_FALSE(a.do_string("x = 1").ok());
}

TEST_CASE("LuaState do_file on a missing path", "[lua]") {
    LuaState state;
    auto result = state.do_file("/nonexistent/redplan/file.lua");
    REQUIRE_FALSE(result.ok());
    CHECK(result.error().message.find("Failed to open") != std::string::npos);
}

TEST_CASE("Table reader typed fields", "[lua]") {
    LuaState state;
    REQUIRE(state.do_string(R"(
        T = { name = "Brock", level = 12.9, ok = true, list = { "a", "b", 3 } }
    )").ok());

    lua_State* L = state.raw();
    lua_getglobal(L, "T");
    int idx = lua_gettop(L);

    CHECK(read_string_field(L, idx, "name") == "Brock");
    CHECK(read_string_field(L, idx, "missing", "dflt") == "dflt");
    CHECK(read_number_field(L, idx, "level") == 12.9);
    CHECK(read_int_field(L, idx, "level") == 12);
    CHECK(read_int_field(L, idx, "name", -1) == -1);
    CHECK(read_bool_field(L, idx, "ok"));
    CHECK_FALSE(read_optional_number(L, idx, "missing").has_value());

    auto list = read_string_list(L, idx, "list");
    REQUIRE(list.size() == 2); // non-strings skipped
    CHECK(list[0] == "a");
    CHECK(list[1] == "b");

    CHECK(lua_gettop(L) == idx);
    lua_pop(L, 1);
}

TEST_CASE("Table reader integer fields reject unrepresentable numbers", "[lua]") {
    LuaState state;
    REQUIRE(state.do_string(R"(
        T = { inf = 1/0, ninf = -1/0, nan = 0/0, big = 1e30, small = -1e30, neg = -7.8 }
    )").ok());

    lua_State* L = state.raw();
    lua_getglobal(L, "T");
    int idx = lua_gettop(L);

    CHECK(read_int_field(L, idx, "inf", 5) == 5);
    CHECK(read_int_field(L, idx, "ninf", 5) == 5);
    CHECK(read_int_field(L, idx, "nan", 5) == 5);
    CHECK(read_int_field(L, idx, "big") == std::numeric_limits<rp::i32>::max());
    CHECK(read_int_field(L, idx, "small") == std::numeric_limits<rp::i32>::min());
    CHECK(read_int_field(L, idx, "neg") == -7);

    CHECK(lua_gettop(L) == idx);
    lua_pop(L, 1);
}

TEST_CASE("quote_string survives the Lua parser", "[lua]") {
    const std::string tricky = "say \"hi\"\\ then\nnew line\ttab \x01 end";

    LuaState state;
    auto result = state.do_string("S = " + quote_string(tricky));
    REQUIRE(result.ok());

    lua_getglobal(state.raw(), "S");
    CHECK(std::string(lua_tostring(state.raw(), -1),
                      lua_strlen(state.raw(), -1)) == tricky);
    lua_pop(state.raw(), 1);
}
