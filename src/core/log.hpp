#pragma once

#include <filesystem>
#include <optional>
#include <string_view>
#include <spdlog/spdlog.h>

// Forward declare lua_State to avoid pulling in Lua headers everywhere
struct lua_State;

namespace rp::log {

/// Initialize logging with console + file sinks.
void init(const std::filesystem::path& log_file = "redplan.log",
          spdlog::level::level_enum level = spdlog::level::debug);

/// Level for a name such as "info" or "warn". Unknown names yield nullopt.
std::optional<spdlog::level::level_enum> parse_level(std::string_view name);

/// Flush and shutdown logging.
void shutdown();

// Logging functions exposed to Lua data and config files
int l_LOG(lua_State* L);
int l_WARN(lua_State* L);
int l_SPEW(lua_State* L);
int l_ALERT(lua_State* L);

} // namespace rp::log
