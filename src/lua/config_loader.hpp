#pragma once

#include "battle/battle_tracker.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "nav/navigator.hpp"

#include <string>
#include <string_view>

namespace rp::lua {

/// Runtime configuration. Every field has a usable default; a config file
/// only needs to name what it changes.
struct Config {
    fs::path data_dir = "data";
    fs::path landmarks_file;  ///< Defaults to <data_dir>/landmarks.lua
    fs::path type_chart_file; ///< Defaults to <data_dir>/type_chart.lua
    fs::path dex_file;        ///< Defaults to <data_dir>/dex.lua
    fs::path plans_file = "plans/active_plans.lua";
    fs::path log_file = "redplan.log";
    std::string log_level = "debug"; ///< spdlog level name
    fs::path trace_file;      ///< Replay input for the driver

    nav::NavigatorConfig navigator;
    battle::BattleConfig battle;
    u32 goal_max_attempts = 10;
    u32 review_interval = 25; ///< Ticks between goal-tree dumps

    fs::path landmarks_path() const;
    fs::path type_chart_path() const;
    fs::path dex_path() const;
};

/// Apply the `Config` table of a Lua file on top of `config`:
///
///     Config = {
///         data_dir = "data",
///         plans_file = "plans/active_plans.lua",
///         navigator = { stuck_ticks = 3, give_up_events = 15 },
///         battle = { drag_on_turns = 25 },
///     }
///
/// Relative paths in the file are taken relative to the working directory.
Result<void> load_config(const fs::path& path, Config& config);

/// Same, from source text (chunk name "=config").
Result<void> load_config_string(std::string_view code, Config& config);

} // namespace rp::lua
