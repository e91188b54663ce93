#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rp::data {
class LandmarkRegistry;
}

namespace rp::nav {

enum class Direction : u8 { Up, Down, Left, Right };

/// Canonical button token: "UP", "DOWN", "LEFT", "RIGHT".
const char* direction_name(Direction dir);
std::optional<Direction> parse_direction(std::string_view name);

struct NavigatorConfig {
    u32 stuck_ticks = 3;      ///< Unmoved ticks before a detour starts
    u32 give_up_events = 15;  ///< Stuck events before navigation is abandoned
    u32 detour_base = 3;      ///< Detour length at zero stuck events
    u32 detour_step = 2;      ///< Extra detour ticks per stuck event
    u32 detour_max = 12;
    i32 arrival_radius = 1;   ///< Chebyshev distance that counts as arrived
};

/// Walks toward a landmark one directional hint per tick.
///
/// No path search: movement is greedy along the larger axis, and a blocked
/// walk is routed around by committing to a perpendicular detour whose
/// length grows with every stuck event. Must be called exactly once per
/// tick, in order; the stuck and detour counters count calls.
class Navigator {
public:
    explicit Navigator(const data::LandmarkRegistry& landmarks,
                       NavigatorConfig config = {});

    /// Target a landmark. Returns false (state untouched) if the map or the
    /// key is unknown.
    bool set_target(MapId map, std::string_view landmark_key);

    /// Direction to press this tick, or nullopt when inactive, arrived,
    /// on another map, or giving up.
    std::optional<Direction> next_direction(TilePos pos, MapId map);

    /// Drop the target and every counter. Safe to call when inactive.
    void cancel();

    /// Manhattan distance to the target, 0 with no target.
    i32 distance_remaining(TilePos pos) const;

    std::vector<std::string> available_targets(MapId map) const;

    /// "  GOTO_<KEY> = walk to <label>" per landmark, newline separated.
    std::string targets_text(MapId map) const;

    /// Free-text hint the registry carries for the map, if any.
    std::string map_hint(MapId map) const;

    /// Detour length after `total_stuck` stuck events.
    static u32 detour_length(u32 total_stuck, const NavigatorConfig& config);

    bool active() const { return active_; }
    const std::optional<TilePos>& target() const { return target_; }
    const std::string& target_label() const { return target_label_; }
    MapId target_map() const { return target_map_; }
    u32 total_stuck() const { return total_stuck_; }
    u32 detour_ticks_remaining() const { return detour_ticks_; }
    std::optional<Direction> detour_direction() const { return detour_dir_; }
    const NavigatorConfig& config() const { return config_; }

private:
    Direction start_detour(i32 dx, i32 dy);
    static Direction greedy_step(i32 dx, i32 dy);

    const data::LandmarkRegistry& landmarks_;
    NavigatorConfig config_;

    std::optional<TilePos> target_;
    std::string target_label_;
    MapId target_map_ = -1;
    bool active_ = false;

    std::optional<TilePos> prev_pos_;
    u32 stuck_ticks_ = 0;  ///< Consecutive calls without movement
    u32 total_stuck_ = 0;  ///< Stuck events since set_target()
    u32 detour_side_ = 0;  ///< Indexes the two perpendicular options

    std::optional<Direction> detour_dir_;
    u32 detour_ticks_ = 0;
};

} // namespace rp::nav
