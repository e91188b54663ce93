#pragma once

#include "battle/battle_tracker.hpp"
#include "core/types.hpp"
#include "nav/navigator.hpp"
#include "world/world_snapshot.hpp"

#include <optional>
#include <string>

namespace rp::planning {
class GoalTree;
}

namespace rp::advisor {

struct AdvisorConfig {
    u32 review_interval = 25; ///< Append the goal tree every N ticks (0 = never)
    u32 low_hp_percent = 25;  ///< Lead HP below this triggers a warning
};

/// Everything produced for the decision-maker on one tick.
struct TickAdvice {
    u64 tick = 0;
    battle::BattleEvent battle_event;
    std::optional<nav::Direction> direction; ///< Movement hint, if navigating
    std::string goal_context;
    std::string extra_context;
};

/// Runs the per-tick sequence over the three advisory components. It owns
/// none of them and adds no decisions of its own beyond text assembly.
class Advisor {
public:
    Advisor(planning::GoalTree& goals, nav::Navigator& navigator,
            battle::BattleTracker& battle, AdvisorConfig config = {});

    /// Feed one snapshot. Call once per tick, in order.
    TickAdvice tick(const world::WorldSnapshot& snap);

    /// Apply a free-text goal update from the decision-maker: text
    /// mentioning "complete", "fail" or "progress" completes, fails or
    /// annotates the current goal. Returns true if the tree changed.
    bool apply_goal_update(const std::string& update);

    /// Handle "GOTO_<KEY>" by targeting that landmark on `map`.
    bool handle_goto(const std::string& command, MapId map);

    u64 tick_count() const { return tick_; }

private:
    std::string extra_context(const world::WorldSnapshot& snap) const;

    planning::GoalTree& goals_;
    nav::Navigator& navigator_;
    battle::BattleTracker& battle_;
    AdvisorConfig config_;
    u64 tick_ = 0;
};

} // namespace rp::advisor
