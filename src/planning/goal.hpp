#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rp::planning {

enum class GoalStatus : u8 {
    Pending,
    Active,
    InProgress,
    Completed,
    Failed,
    Blocked,
};

/// Operations that move a goal between statuses. Every status change in
/// GoalTree goes through can_transition() first.
enum class GoalTransition : u8 {
    Activate, ///< pending -> active (prerequisites checked by the tree)
    Start,    ///< active -> in_progress
    Complete, ///< any non-terminal -> completed
    Fail,     ///< pending/active/in_progress -> pending (retry) or failed
    Block,    ///< pending/active/in_progress -> blocked
    Unblock,  ///< blocked -> pending
};

const char* goal_status_name(GoalStatus status);
const char* goal_status_glyph(GoalStatus status);
const char* goal_transition_name(GoalTransition transition);
std::optional<GoalStatus> parse_goal_status(std::string_view name);

/// Completed and failed goals never change again.
inline bool is_terminal(GoalStatus s) {
    return s == GoalStatus::Completed || s == GoalStatus::Failed;
}

/// Active or in progress: the goal is what the caller is working on.
inline bool is_underway(GoalStatus s) {
    return s == GoalStatus::Active || s == GoalStatus::InProgress;
}

bool can_transition(GoalStatus from, GoalTransition transition);

/// One node of the goal forest. Relationships are stored as ids so the
/// forest can be serialized as-is and never holds dangling pointers.
struct Goal {
    std::string id;
    std::string name;
    std::string description;
    GoalStatus status = GoalStatus::Pending;
    i32 priority = 5; ///< Lower value = more urgent
    std::optional<std::string> parent_id;
    std::vector<std::string> children_ids; ///< Insertion order = sequence
    std::vector<std::string> prerequisites;
    std::vector<std::string> notes; ///< Append-only
    u32 attempts = 0;
    u32 max_attempts = 10;
    f64 created_at = 0.0; ///< Seconds since the Unix epoch
    std::optional<f64> completed_at;
};

/// Wall-clock time in seconds since the Unix epoch.
f64 now_seconds();

} // namespace rp::planning
