#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

struct lua_State;

namespace rp::lua {

// Helpers for pulling typed fields out of a Lua table sitting on the
// stack. All of them leave the stack exactly as they found it.

/// Read a string field. Returns `fallback` if missing or not a string.
std::string read_string_field(lua_State* L, int table_idx, const char* key,
                              const std::string& fallback = {});

/// Read a numeric field. Returns `fallback` if missing or not a number.
f64 read_number_field(lua_State* L, int table_idx, const char* key,
                      f64 fallback = 0.0);

/// Read an integer field (truncating). Values beyond the 32-bit range are
/// clamped to it; NaN and infinities yield `fallback`.
i64 read_int_field(lua_State* L, int table_idx, const char* key,
                   i64 fallback = 0);

/// Read a boolean field. Non-boolean values yield `fallback`.
bool read_bool_field(lua_State* L, int table_idx, const char* key,
                     bool fallback = false);

/// Read an optional numeric field (nil -> nullopt).
std::optional<f64> read_optional_number(lua_State* L, int table_idx,
                                        const char* key);

/// Read the array part {"a", "b", ...} of a string-list field.
std::vector<std::string> read_string_list(lua_State* L, int table_idx,
                                          const char* key);

/// Read the array part of the table at `list_idx` as strings.
std::vector<std::string> read_string_array(lua_State* L, int list_idx);

/// Convert a relative stack index to an absolute one.
int absolute_index(lua_State* L, int idx);

/// Quote a string as a Lua literal, escaping quotes, backslashes and
/// control characters so the result round-trips through the parser.
std::string quote_string(const std::string& s);

} // namespace rp::lua
